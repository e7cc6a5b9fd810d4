#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace clientiq_core {

// Any failure of the upstream embedding provider: transport, quota, or a malformed reply.
// Callers decide whether to retry; nothing in the engine retries on its own.
class EmbeddingGenerationError : public std::exception {
 public:
  explicit EmbeddingGenerationError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Text to fixed-dimension vector.
class EmbeddingClient {
 public:
  virtual ~EmbeddingClient() = default;

  virtual std::vector<float> get_embedding(const std::string &text) = 0;

  virtual bool is_server_available() = 0;
};

}  // namespace clientiq_core
