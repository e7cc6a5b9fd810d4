#include "clientiq_core/search/ranking.hpp"

#include <algorithm>

#include "clientiq_core/similarity/vector_math.hpp"

namespace clientiq_core {

std::vector<ScoredRecord> rank_candidates(const std::vector<float> &reference,
                                          std::vector<EmbeddingRecord> candidates,
                                          double threshold,
                                          int limit) {
  std::vector<ScoredRecord> scored;
  if (limit <= 0) {
    return scored;
  }

  // Score everything first so a bad vector fails the batch before any result is built
  std::vector<double> scores;
  scores.reserve(candidates.size());
  for (const auto &candidate : candidates) {
    scores.push_back(cosine_similarity(reference, candidate.vector));
  }

  for (size_t i = 0; i < candidates.size(); ++i) {
    if (scores[i] < threshold) {
      continue;
    }
    ScoredRecord result;
    result.record = std::move(candidates[i]);
    result.record.vector.clear();
    result.record.vector.shrink_to_fit();
    result.score = scores[i];
    scored.push_back(std::move(result));
  }

  std::sort(scored.begin(), scored.end(), [](const ScoredRecord &a, const ScoredRecord &b) {
    if (a.score != b.score) {
      return a.score > b.score;
    }
    return a.record.id < b.record.id;
  });

  if (scored.size() > static_cast<size_t>(limit)) {
    scored.resize(static_cast<size_t>(limit));
  }
  return scored;
}

}  // namespace clientiq_core
