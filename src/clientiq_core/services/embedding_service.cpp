#include "clientiq_core/services/embedding_service.hpp"

#include <stdexcept>

namespace clientiq_core {

EmbeddingService::EmbeddingService(std::shared_ptr<EmbeddingStore> embedding_store,
                                   std::shared_ptr<EmbeddingClient> embedding_client)
    : embedding_store_(std::move(embedding_store)),
      embedding_client_(std::move(embedding_client)) {}

EmbeddingRecord EmbeddingService::store_embedding(const std::string &company_name,
                                                  const std::string &source_text,
                                                  const std::string &owner_id,
                                                  const nlohmann::json &metadata) {
  if (company_name.empty() || source_text.empty()) {
    throw std::invalid_argument("Company name and source text are required");
  }
  if (owner_id.empty()) {
    throw std::invalid_argument("owner_id cannot be empty");
  }

  std::vector<float> embedding = embed(source_text);
  return embedding_store_->put(company_name, source_text, embedding, owner_id, metadata);
}

std::optional<EmbeddingRecord> EmbeddingService::update_embedding(
    int id, const std::string &new_source_text) {
  if (new_source_text.empty()) {
    throw std::invalid_argument("New source text cannot be empty");
  }
  if (!embedding_store_->exists(id)) {
    return std::nullopt;
  }

  std::vector<float> embedding = embed(new_source_text);
  // The record may have been deleted while we were embedding; update reports that as nullopt
  return embedding_store_->update(id, new_source_text, embedding);
}

std::vector<float> EmbeddingService::embed(const std::string &text) {
  if (!embedding_client_) {
    throw EmbeddingGenerationError("No embedding client is configured");
  }
  return embedding_client_->get_embedding(text);
}

bool EmbeddingService::delete_embedding(int id) {
  return embedding_store_->remove(id);
}

RecordPage EmbeddingService::list_by_owner(const std::string &owner_id, int limit, int page) {
  return embedding_store_->list_by_owner(owner_id, limit, page);
}

std::vector<EmbeddingRecord> EmbeddingService::search_by_name(
    const std::string &pattern, const std::optional<std::string> &owner_id) {
  if (pattern.empty()) {
    throw std::invalid_argument("Company name pattern is required");
  }
  return embedding_store_->find_by_name_substring(pattern, owner_id);
}

}  // namespace clientiq_core
