#include "clientiq_core/llm/ollama_client.hpp"

#include <iostream>

#include "ollama.hpp"

namespace clientiq_core {

OllamaClient::OllamaClient(const std::string &ollama_url, const std::string &embedding_model)
    : ollama_url_(ollama_url), embedding_model_(embedding_model) {
  setup_server_connection();
}

void OllamaClient::setup_server_connection() {
  ollama::setServerURL(ollama_url_);
  if (!ollama::is_running()) {
    throw EmbeddingGenerationError("Ollama server is not running at " + ollama_url_);
  }
}

std::vector<float> OllamaClient::get_embedding(const std::string &text) {
  try {
    ollama::response response = ollama::generate_embeddings(embedding_model_, text);
    auto json_response = response.as_json();

    // /api/embed answers with "embeddings" (one array per input), the older
    // /api/embeddings endpoint with a flat "embedding"
    if (json_response.contains("embeddings")) {
      const auto &embeddings = json_response["embeddings"];
      if (!embeddings.is_array() || embeddings.empty()) {
        throw EmbeddingGenerationError("Embeddings field is not a non-empty array");
      }
      if (embeddings[0].is_array()) {
        return embeddings[0].get<std::vector<float>>();
      }
      return embeddings.get<std::vector<float>>();
    }

    if (json_response.contains("embedding") && json_response["embedding"].is_array()) {
      return json_response["embedding"].get<std::vector<float>>();
    }

    std::cerr << "Unexpected embedding response from " << ollama_url_ << ": "
              << json_response.dump().substr(0, 200) << std::endl;
    throw EmbeddingGenerationError("Response does not contain an embedding field");
  } catch (const ollama::exception &e) {
    throw EmbeddingGenerationError("Embedding generation failed: " + std::string(e.what()));
  } catch (const nlohmann::json::exception &e) {
    throw EmbeddingGenerationError("Malformed embedding payload: " + std::string(e.what()));
  }
}

bool OllamaClient::is_server_available() {
  return ollama::is_running();
}

}  // namespace clientiq_core
