#pragma once

#include <memory>
#include <string>
#include <vector>

#include "clientiq_core/db/embedding_store.hpp"
#include "clientiq_core/search/candidate_source.hpp"
#include "clientiq_core/types/embedding_record.hpp"

namespace clientiq_core {

struct RecommendationOptions {
  // How many of the owner's newest records form the profile vector
  int history_size = 10;
  int candidate_cap = 500;
  double threshold = 0.6;
  int default_limit = 5;
};

// Recommends other users' research that resembles what an owner has been researching.
class RecommendationService {
 public:
  RecommendationService(std::shared_ptr<EmbeddingStore> embedding_store,
                        std::shared_ptr<CandidateSource> candidate_source,
                        RecommendationOptions options = {});

  // Empty when the owner has no records. Never returns the owner's own records.
  std::vector<ScoredRecord> recommend(const std::string &owner_id, int limit);
  std::vector<ScoredRecord> recommend(const std::string &owner_id);

  // Mean of the owner's history_size newest vectors; empty when there is no history
  std::vector<float> build_profile_vector(const std::string &owner_id);

  const RecommendationOptions &options() const { return options_; }

 private:
  std::shared_ptr<EmbeddingStore> embedding_store_;
  std::shared_ptr<CandidateSource> candidate_source_;
  RecommendationOptions options_;
};

}  // namespace clientiq_core
