#include "clientiq_core/search/candidate_source.hpp"

#include <stdexcept>

namespace clientiq_core {

RecentCandidateSource::RecentCandidateSource(std::shared_ptr<EmbeddingStore> store)
    : store_(std::move(store)) {
  if (!store_) {
    throw std::invalid_argument("RecentCandidateSource requires an EmbeddingStore");
  }
}

std::vector<EmbeddingRecord> RecentCandidateSource::fetch(
    const std::optional<std::string> &exclude_owner_id, int cap) {
  return store_->scan_candidates(exclude_owner_id, cap);
}

int RecentCandidateSource::dimension() const {
  return store_->dimension();
}

}  // namespace clientiq_core
