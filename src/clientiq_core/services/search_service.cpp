#include "clientiq_core/services/search_service.hpp"

#include <stdexcept>

#include "clientiq_core/search/ranking.hpp"
#include "clientiq_core/similarity/vector_math.hpp"

namespace clientiq_core {

SearchService::SearchService(std::shared_ptr<EmbeddingClient> embedding_client,
                             std::shared_ptr<CandidateSource> candidate_source,
                             SearchOptions options)
    : embedding_client_(std::move(embedding_client)),
      candidate_source_(std::move(candidate_source)),
      options_(options) {
  if (options_.candidate_cap <= 0) {
    throw std::invalid_argument("Search candidate cap must be greater than 0");
  }
}

std::vector<ScoredRecord> SearchService::search(const std::string &query_text,
                                                int limit,
                                                double threshold,
                                                const std::optional<std::string> &exclude_owner_id) {
  if (query_text.empty()) {
    throw std::invalid_argument("Search query is required");
  }

  if (limit <= 0) {
    return {};
  }
  std::vector<float> query_embedding = embed_query(query_text);
  const int expected_dimension = candidate_source_->dimension();
  if (expected_dimension > 0 &&
      query_embedding.size() != static_cast<size_t>(expected_dimension)) {
    throw DimensionMismatchError(static_cast<size_t>(expected_dimension),
                                 query_embedding.size(), "search query");
  }

  std::vector<EmbeddingRecord> candidates =
      candidate_source_->fetch(exclude_owner_id, options_.candidate_cap);
  return rank_candidates(query_embedding, std::move(candidates), threshold, limit);
}

std::vector<ScoredRecord> SearchService::search(const std::string &query_text) {
  return search(query_text, options_.default_limit, options_.default_threshold);
}

std::vector<float> SearchService::embed_query(const std::string &query) {
  if (!embedding_client_) {
    throw EmbeddingGenerationError("No embedding client is configured");
  }
  return embedding_client_->get_embedding(query);
}

}  // namespace clientiq_core
