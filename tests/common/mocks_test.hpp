#pragma once

#include <gmock/gmock.h>

#include <optional>
#include <string>
#include <vector>

#include "clientiq_core/llm/embedding_client.hpp"
#include "clientiq_core/search/candidate_source.hpp"

namespace clientiq_tests {

/**
 * Mock embedding provider. By default every text embeds to the same
 * non-zero vector of `dimension` components.
 */
class MockEmbeddingClient : public clientiq_core::EmbeddingClient {
 public:
  explicit MockEmbeddingClient(size_t dimension = 16) {
    std::vector<float> default_embedding(dimension, 0.1f);
    default_embedding[0] = 0.5f;

    ON_CALL(*this, get_embedding(testing::_))
        .WillByDefault(testing::Return(default_embedding));
    ON_CALL(*this, is_server_available()).WillByDefault(testing::Return(true));
  }

  MOCK_METHOD(std::vector<float>, get_embedding, (const std::string& text), (override));
  MOCK_METHOD(bool, is_server_available, (), (override));
};

/**
 * Mock candidate source to drive ranking without a database
 */
class MockCandidateSource : public clientiq_core::CandidateSource {
 public:
  MOCK_METHOD(std::vector<clientiq_core::EmbeddingRecord>, fetch,
              (const std::optional<std::string>& exclude_owner_id, int cap), (override));
};

}  // namespace clientiq_tests
