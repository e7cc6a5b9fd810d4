#pragma once

#include <string>
#include <vector>

#include "clientiq_core/llm/embedding_client.hpp"

namespace clientiq_core {

// Embedding provider backed by a local or remote Ollama server.
class OllamaClient : public EmbeddingClient {
 public:
  // Throws EmbeddingGenerationError when the server cannot be reached
  OllamaClient(const std::string &ollama_url, const std::string &embedding_model);
  ~OllamaClient() override = default;

  // Disable copy constructor and assignment
  OllamaClient(const OllamaClient &) = delete;
  OllamaClient &operator=(const OllamaClient &) = delete;

  std::vector<float> get_embedding(const std::string &text) override;

  bool is_server_available() override;

  const std::string &embedding_model() const { return embedding_model_; }

 private:
  std::string ollama_url_;
  std::string embedding_model_;

  void setup_server_connection();
};

}  // namespace clientiq_core
