#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "clientiq_core/db/embedding_store.hpp"
#include "clientiq_core/llm/embedding_client.hpp"

namespace clientiq_core {

// Write and lookup operations over stored research embeddings.
// The embedding client may be null when only list, name search and delete are needed.
class EmbeddingService {
 public:
  EmbeddingService(std::shared_ptr<EmbeddingStore> embedding_store,
                   std::shared_ptr<EmbeddingClient> embedding_client);

  // Embeds source_text and stores a new record.
  EmbeddingRecord store_embedding(const std::string &company_name,
                                  const std::string &source_text,
                                  const std::string &owner_id,
                                  const nlohmann::json &metadata = nlohmann::json::object());

  // Re-embeds new_source_text in full. nullopt when no record has this id; the
  // embedding provider is not called in that case.
  std::optional<EmbeddingRecord> update_embedding(int id, const std::string &new_source_text);

  bool delete_embedding(int id);

  RecordPage list_by_owner(const std::string &owner_id, int limit = 20, int page = 1);

  std::vector<EmbeddingRecord> search_by_name(
      const std::string &pattern, const std::optional<std::string> &owner_id = std::nullopt);

 private:
  std::vector<float> embed(const std::string &text);

  std::shared_ptr<EmbeddingStore> embedding_store_;
  std::shared_ptr<EmbeddingClient> embedding_client_;
};

}  // namespace clientiq_core
