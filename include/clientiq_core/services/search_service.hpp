#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "clientiq_core/llm/embedding_client.hpp"
#include "clientiq_core/search/candidate_source.hpp"
#include "clientiq_core/types/embedding_record.hpp"

namespace clientiq_core {

struct SearchOptions {
  // Upper bound on records scored per query. Ranking is exact only within this window.
  int candidate_cap = 1000;
  double default_threshold = 0.7;
  int default_limit = 5;
};

class SearchService {
 public:
  SearchService(std::shared_ptr<EmbeddingClient> embedding_client,
                std::shared_ptr<CandidateSource> candidate_source,
                SearchOptions options = {});

  /**
   * Natural-language semantic search over stored research.
   *
   * Embeds query_text, scores the candidate window (at most
   * options.candidate_cap records, newest first) and returns up to `limit`
   * records with score >= threshold, best first. Records owned by
   * exclude_owner_id are never candidates.
   *
   * @throws EmbeddingGenerationError if the query cannot be embedded
   * @throws DimensionMismatchError if the query embedding does not have the source's
   *         dimension, or if any candidate's dimension differs from the query's
   */
  std::vector<ScoredRecord> search(const std::string &query_text,
                                   int limit,
                                   double threshold,
                                   const std::optional<std::string> &exclude_owner_id = std::nullopt);

  // Same as above with the configured default limit and threshold
  std::vector<ScoredRecord> search(const std::string &query_text);

  const SearchOptions &options() const { return options_; }

 private:
  std::vector<float> embed_query(const std::string &query);

  std::shared_ptr<EmbeddingClient> embedding_client_;
  std::shared_ptr<CandidateSource> candidate_source_;
  SearchOptions options_;
};

}  // namespace clientiq_core
