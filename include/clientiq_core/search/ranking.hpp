#pragma once

#include <vector>

#include "clientiq_core/types/embedding_record.hpp"

namespace clientiq_core {

/**
 * Scores every candidate against `reference` with cosine similarity, keeps
 * those with score >= threshold, orders them by score descending (ties by
 * ascending record id) and returns at most `limit` of them.
 *
 * Returned records carry no vector; metadata is passed through untouched.
 * A candidate whose dimension differs from the reference aborts the whole
 * batch with DimensionMismatchError.
 */
std::vector<ScoredRecord> rank_candidates(const std::vector<float> &reference,
                                          std::vector<EmbeddingRecord> candidates,
                                          double threshold,
                                          int limit);

}  // namespace clientiq_core
