#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <limits>
#include <memory>
#include <vector>

#include "clientiq_core/search/candidate_source.hpp"
#include "clientiq_core/services/search_service.hpp"
#include "clientiq_core/similarity/vector_math.hpp"
#include "../../common/mocks_test.hpp"
#include "../../common/utilities_test.hpp"

namespace clientiq_core {

using clientiq_tests::kTestDimension;
using clientiq_tests::TestUtilities;
using testing::_;
using testing::Return;
using testing::Throw;

class SearchServiceTest : public clientiq_tests::EmbeddingStoreTestBase {
 protected:
  void SetUp() override {
    EmbeddingStoreTestBase::SetUp();

    mock_client_ = std::make_shared<testing::NiceMock<clientiq_tests::MockEmbeddingClient>>(
        kTestDimension);
    candidate_source_ = std::make_shared<RecentCandidateSource>(embedding_store_);
    search_service_ = std::make_unique<SearchService>(mock_client_, candidate_source_);

    setupTestData();
  }

  // Shared profile on dims 0..3, one industry-specific component per industry.
  // Same industry scores 1.0, different industries score 4 / 4.64 ~= 0.862.
  static std::vector<float> industry_vector(int industry) {
    std::vector<float> vector = TestUtilities::make_vector({1.0f, 1.0f, 1.0f, 1.0f});
    vector[4 + industry] = 0.8f;
    return vector;
  }

  void setupTestData() {
    techcorp_ = embedding_store_->put("TechCorp AI", "AI and machine learning research",
                                      industry_vector(0), "user-1",
                                      TestUtilities::create_test_metadata("Technology"));
    biotech_ = embedding_store_->put("Biotech Labs", "Drug discovery and genomics",
                                     industry_vector(1), "user-2",
                                     TestUtilities::create_test_metadata("Healthcare"));
    greentech_ = embedding_store_->put("GreenTech Solutions", "Solar and wind energy",
                                       industry_vector(2), "user-3",
                                       TestUtilities::create_test_metadata("Energy"));
  }

  std::shared_ptr<testing::NiceMock<clientiq_tests::MockEmbeddingClient>> mock_client_;
  std::shared_ptr<CandidateSource> candidate_source_;
  std::unique_ptr<SearchService> search_service_;
  EmbeddingRecord techcorp_;
  EmbeddingRecord biotech_;
  EmbeddingRecord greentech_;
};

TEST_F(SearchServiceTest, Search_RanksExactIndustryMatchFirst) {
  EXPECT_CALL(*mock_client_, get_embedding("AI companies"))
      .WillOnce(Return(industry_vector(0)));

  auto results = search_service_->search("AI companies", 5, 0.7);

  ASSERT_EQ(results.size(), 3u);
  EXPECT_EQ(results[0].record.id, techcorp_.id);
  EXPECT_NEAR(results[0].score, 1.0, 1e-6);
  EXPECT_NEAR(results[1].score, 4.0 / 4.64, 1e-5);
  EXPECT_NEAR(results[2].score, 4.0 / 4.64, 1e-5);
  // Equal scores fall back to ascending id
  EXPECT_LT(results[1].record.id, results[2].record.id);
  EXPECT_EQ(results[0].record.metadata["industry"], "Technology");
  EXPECT_TRUE(results[0].record.vector.empty());
}

TEST_F(SearchServiceTest, Search_NeverReturnsScoresBelowThreshold) {
  ON_CALL(*mock_client_, get_embedding(_)).WillByDefault(Return(industry_vector(1)));

  auto results = search_service_->search("genomics", 5, 0.9);

  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].record.company_name, "Biotech Labs");
  for (const auto& result : results) {
    EXPECT_GE(result.score, 0.9);
  }
}

TEST_F(SearchServiceTest, Search_RespectsLimit) {
  ON_CALL(*mock_client_, get_embedding(_)).WillByDefault(Return(industry_vector(2)));

  auto results = search_service_->search("energy", 2, 0.0);

  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[0].record.id, greentech_.id);
  EXPECT_GE(results[0].score, results[1].score);
}

TEST_F(SearchServiceTest, Search_ThresholdAboveOneReturnsNothing) {
  ON_CALL(*mock_client_, get_embedding(_)).WillByDefault(Return(industry_vector(0)));

  EXPECT_TRUE(search_service_->search("AI companies", 5, 1.1).empty());
}

TEST_F(SearchServiceTest, Search_ExcludesOwner) {
  ON_CALL(*mock_client_, get_embedding(_)).WillByDefault(Return(industry_vector(0)));

  auto results = search_service_->search("AI companies", 5, 0.0, std::string("user-1"));

  ASSERT_EQ(results.size(), 2u);
  for (const auto& result : results) {
    EXPECT_NE(result.record.owner_id, "user-1");
  }
}

TEST_F(SearchServiceTest, Search_DefaultsUseLimitFiveAndThresholdPointSeven) {
  for (int i = 0; i < 6; ++i) {
    embedding_store_->put("AI Startup " + std::to_string(i), "More AI research",
                          industry_vector(0), "user-4");
  }
  ON_CALL(*mock_client_, get_embedding(_)).WillByDefault(Return(industry_vector(0)));

  auto results = search_service_->search("AI companies");

  EXPECT_EQ(search_service_->options().default_limit, 5);
  EXPECT_DOUBLE_EQ(search_service_->options().default_threshold, 0.7);
  ASSERT_EQ(results.size(), 5u);
  for (const auto& result : results) {
    EXPECT_NEAR(result.score, 1.0, 1e-6);
  }
}

TEST_F(SearchServiceTest, Search_EmptyStoreReturnsNothing) {
  embedding_store_->remove(techcorp_.id);
  embedding_store_->remove(biotech_.id);
  embedding_store_->remove(greentech_.id);

  EXPECT_TRUE(search_service_->search("anything", 5, 0.0).empty());
}

TEST_F(SearchServiceTest, Search_PropagatesEmbeddingFailure) {
  EXPECT_CALL(*mock_client_, get_embedding(_))
      .WillOnce(Throw(EmbeddingGenerationError("quota exceeded")));

  EXPECT_THROW(search_service_->search("AI companies", 5, 0.7), EmbeddingGenerationError);
}

TEST_F(SearchServiceTest, Search_EmptyQueryIsRejectedWithoutEmbedding) {
  EXPECT_CALL(*mock_client_, get_embedding(_)).Times(0);

  EXPECT_THROW(search_service_->search("", 5, 0.7), std::invalid_argument);
}

TEST_F(SearchServiceTest, Search_NonPositiveLimitSkipsEmbedding) {
  EXPECT_CALL(*mock_client_, get_embedding(_)).Times(0);

  EXPECT_TRUE(search_service_->search("AI companies", 0, 0.7).empty());
}

TEST_F(SearchServiceTest, Search_QueryOfWrongDimensionFails) {
  ON_CALL(*mock_client_, get_embedding(_))
      .WillByDefault(Return(std::vector<float>(kTestDimension + 1, 0.5f)));

  EXPECT_THROW(search_service_->search("AI companies", 5, 0.0), DimensionMismatchError);
}

TEST_F(SearchServiceTest, Search_QueryOfWrongDimensionFailsOnEmptyStore) {
  embedding_store_->remove(techcorp_.id);
  embedding_store_->remove(biotech_.id);
  embedding_store_->remove(greentech_.id);
  ON_CALL(*mock_client_, get_embedding(_))
      .WillByDefault(Return(std::vector<float>(kTestDimension - 1, 0.5f)));

  EXPECT_EQ(candidate_source_->dimension(), kTestDimension);
  EXPECT_THROW(search_service_->search("AI companies", 5, 0.0), DimensionMismatchError);
}

TEST_F(SearchServiceTest, Search_NonFiniteQueryEmbeddingFails) {
  auto query = industry_vector(0);
  query[2] = std::numeric_limits<float>::quiet_NaN();
  ON_CALL(*mock_client_, get_embedding(_)).WillByDefault(Return(query));

  EXPECT_THROW(search_service_->search("AI companies", 5, 0.0), std::invalid_argument);
}

TEST_F(SearchServiceTest, Search_WithoutClientFails) {
  SearchService no_client(nullptr, candidate_source_);

  EXPECT_THROW(no_client.search("AI companies", 5, 0.7), EmbeddingGenerationError);
}

class SearchServiceCandidateTest : public ::testing::Test {
 protected:
  void SetUp() override {
    mock_client_ = std::make_shared<testing::NiceMock<clientiq_tests::MockEmbeddingClient>>(
        kTestDimension);
    mock_source_ = std::make_shared<clientiq_tests::MockCandidateSource>();
    ON_CALL(*mock_client_, get_embedding(_))
        .WillByDefault(Return(TestUtilities::unit_vector(0)));
  }

  std::shared_ptr<testing::NiceMock<clientiq_tests::MockEmbeddingClient>> mock_client_;
  std::shared_ptr<clientiq_tests::MockCandidateSource> mock_source_;
};

TEST_F(SearchServiceCandidateTest, FetchesDefaultCandidateWindow) {
  SearchService service(mock_client_, mock_source_);
  std::optional<std::string> no_exclusion;

  EXPECT_CALL(*mock_source_, fetch(no_exclusion, 1000))
      .WillOnce(Return(std::vector<EmbeddingRecord>{}));

  EXPECT_TRUE(service.search("anything", 5, 0.5).empty());
}

TEST_F(SearchServiceCandidateTest, PassesExclusionAndConfiguredCap) {
  SearchOptions options;
  options.candidate_cap = 25;
  SearchService service(mock_client_, mock_source_, options);
  std::optional<std::string> exclusion = std::string("user-9");

  EXPECT_CALL(*mock_source_, fetch(exclusion, 25))
      .WillOnce(Return(std::vector<EmbeddingRecord>{
          TestUtilities::make_record(3, "user-1", TestUtilities::unit_vector(0)),
          TestUtilities::make_record(4, "user-2", TestUtilities::unit_vector(1))}));

  auto results = service.search("anything", 5, 0.5, exclusion);

  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].record.id, 3);
}

TEST_F(SearchServiceCandidateTest, CandidateOfWrongDimensionAbortsSearch) {
  SearchService service(mock_client_, mock_source_);

  EXPECT_CALL(*mock_source_, fetch(_, _))
      .WillOnce(Return(std::vector<EmbeddingRecord>{
          TestUtilities::make_record(1, "user-1", TestUtilities::unit_vector(0)),
          TestUtilities::make_record(2, "user-2", std::vector<float>(4, 1.0f))}));

  EXPECT_THROW(service.search("anything", 5, 0.0), DimensionMismatchError);
}

TEST_F(SearchServiceCandidateTest, RejectsNonPositiveCandidateCap) {
  SearchOptions options;
  options.candidate_cap = 0;

  EXPECT_THROW({ SearchService service(mock_client_, mock_source_, options); },
               std::invalid_argument);
}

}  // namespace clientiq_core
