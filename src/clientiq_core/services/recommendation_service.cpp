#include "clientiq_core/services/recommendation_service.hpp"

#include <stdexcept>

#include "clientiq_core/search/ranking.hpp"
#include "clientiq_core/similarity/vector_math.hpp"

namespace clientiq_core {

RecommendationService::RecommendationService(std::shared_ptr<EmbeddingStore> embedding_store,
                                             std::shared_ptr<CandidateSource> candidate_source,
                                             RecommendationOptions options)
    : embedding_store_(std::move(embedding_store)),
      candidate_source_(std::move(candidate_source)),
      options_(options) {
  if (options_.history_size <= 0) {
    throw std::invalid_argument("Recommendation history size must be greater than 0");
  }
  if (options_.candidate_cap <= 0) {
    throw std::invalid_argument("Recommendation candidate cap must be greater than 0");
  }
}

std::vector<float> RecommendationService::build_profile_vector(const std::string &owner_id) {
  std::vector<EmbeddingRecord> history =
      embedding_store_->recent_by_owner(owner_id, options_.history_size);

  std::vector<std::vector<float>> vectors;
  vectors.reserve(history.size());
  for (auto &record : history) {
    vectors.push_back(std::move(record.vector));
  }
  return average_vectors(vectors);
}

std::vector<ScoredRecord> RecommendationService::recommend(const std::string &owner_id,
                                                           int limit) {
  if (owner_id.empty()) {
    throw std::invalid_argument("owner_id cannot be empty");
  }

  std::vector<float> profile = build_profile_vector(owner_id);
  if (profile.empty() || limit <= 0) {
    return {};
  }

  std::vector<EmbeddingRecord> candidates =
      candidate_source_->fetch(owner_id, options_.candidate_cap);

  // The owner's own records are never recommended back to them
  std::vector<EmbeddingRecord> others;
  others.reserve(candidates.size());
  for (auto &candidate : candidates) {
    if (candidate.owner_id != owner_id) {
      others.push_back(std::move(candidate));
    }
  }
  return rank_candidates(profile, std::move(others), options_.threshold, limit);
}

std::vector<ScoredRecord> RecommendationService::recommend(const std::string &owner_id) {
  return recommend(owner_id, options_.default_limit);
}

}  // namespace clientiq_core
