#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "clientiq_core/db/embedding_store.hpp"
#include "clientiq_core/types/embedding_record.hpp"

namespace clientiq_core {

// Supplies the records that search and recommendation score against.
// Implementations must return vectors and honor the exclusion and the cap.
class CandidateSource {
 public:
  virtual ~CandidateSource() = default;

  virtual std::vector<EmbeddingRecord> fetch(const std::optional<std::string> &exclude_owner_id,
                                             int cap) = 0;

  // Dimension every fetched vector has, or 0 when the source does not fix one
  virtual int dimension() const { return 0; }
};

// Brute-force window over the store: the `cap` newest records.
// Results ranked from it are exact inside the window only.
class RecentCandidateSource : public CandidateSource {
 public:
  explicit RecentCandidateSource(std::shared_ptr<EmbeddingStore> store);

  std::vector<EmbeddingRecord> fetch(const std::optional<std::string> &exclude_owner_id,
                                     int cap) override;

  int dimension() const override;

 private:
  std::shared_ptr<EmbeddingStore> store_;
};

}  // namespace clientiq_core
