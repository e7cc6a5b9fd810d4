#pragma once
#include <sqlite_modern_cpp.h>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "clientiq_core/db/database_manager.hpp"
#include "clientiq_core/db/sqlite_error_utils.hpp"
#include "clientiq_core/types/embedding_record.hpp"

namespace clientiq_core {

class EmbeddingStoreError : public std::exception {
 public:
  explicit EmbeddingStoreError(const std::string &message, DbErrorKind kind = DbErrorKind::Other)
      : message_(message), kind_(kind) {}

  // Wraps a SQLite failure raised while performing `operation`
  EmbeddingStoreError(const std::string &operation, const sqlite::sqlite_exception &e)
      : message_(describe_db_error(operation, e)), kind_(classify_sqlite_error(e)) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

  DbErrorKind kind() const noexcept { return kind_; }

 private:
  std::string message_;
  DbErrorKind kind_;
};

/**
 * Durable storage for company research embeddings.
 *
 * Every vector written or read must have exactly `dimension()` components; a
 * mismatch raises DimensionMismatchError, and a NaN or infinite component raises
 * std::invalid_argument. All SQLite failures are rethrown as
 * EmbeddingStoreError. Each method is atomic for the single record it touches.
 *
 * Ordering used by every multi-record read: created_at DESC, id DESC.
 */
class EmbeddingStore {
 public:
  static constexpr int DEFAULT_VECTOR_DIMENSION = 1024;

  explicit EmbeddingStore(DatabaseManager &db_manager,
                          int vector_dimension = DEFAULT_VECTOR_DIMENSION);
  ~EmbeddingStore() = default;

  EmbeddingStore(const EmbeddingStore &) = delete;
  EmbeddingStore &operator=(const EmbeddingStore &) = delete;

  int dimension() const { return vector_dimension_; }

  // Always inserts a new record, no deduplication.
  EmbeddingRecord put(const std::string &company_name,
                      const std::string &source_text,
                      const std::vector<float> &vector,
                      const std::string &owner_id,
                      const nlohmann::json &metadata = nlohmann::json::object());

  // Replaces text and vector in full and touches updated_at. nullopt if the id is unknown.
  std::optional<EmbeddingRecord> update(int id,
                                        const std::string &new_source_text,
                                        const std::vector<float> &new_vector);

  bool remove(int id);

  // Point lookup including the vector
  std::optional<EmbeddingRecord> get(int id);

  bool exists(int id);

  // Vectors are omitted from list results
  RecordPage list_by_owner(const std::string &owner_id, int limit, int page);

  int count_by_owner(const std::string &owner_id);

  // Case-insensitive (ASCII) substring match on company_name. Vectors omitted.
  std::vector<EmbeddingRecord> find_by_name_substring(
      const std::string &pattern, const std::optional<std::string> &owner_id = std::nullopt);

  // The owner's n newest records, with vectors
  std::vector<EmbeddingRecord> recent_by_owner(const std::string &owner_id, int n);

  // Up to `cap` newest records with vectors, optionally excluding one owner.
  // This is a scan bound, not a sample: older records beyond the cap are never seen.
  std::vector<EmbeddingRecord> scan_candidates(const std::optional<std::string> &exclude_owner_id,
                                               int cap);

 private:
  DatabaseManager &db_manager_;
  int vector_dimension_;

  void check_dimension(const std::vector<float> &vector, const std::string &context) const;
  std::vector<char> encode_vector(const std::vector<float> &vector) const;
  std::vector<float> decode_vector(int id, const std::vector<char> &blob) const;
  nlohmann::json parse_metadata(int id, const std::string &metadata_text) const;

  std::optional<EmbeddingRecord> fetch_by_id(sqlite::database &db, int id);

  static std::chrono::system_clock::time_point now_millis();
};

}  // namespace clientiq_core
