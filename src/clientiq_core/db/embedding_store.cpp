#include "clientiq_core/db/embedding_store.hpp"

#include <cmath>
#include <cstring>
#include <iostream>
#include <stdexcept>

#include "clientiq_core/db/pooled_connection.hpp"
#include "clientiq_core/db/transaction.hpp"
#include "clientiq_core/similarity/vector_math.hpp"

namespace clientiq_core {

namespace {

// Column lists shared by the queries below; the vector-free form bounds list payloads
const char *const kRecordColumns =
    "id, company_name, source_text, owner_id, metadata, created_at, updated_at";
const char *const kRecordColumnsWithVector =
    "id, company_name, source_text, owner_id, metadata, created_at, updated_at, vector_blob";

}  // namespace

EmbeddingStore::EmbeddingStore(DatabaseManager &db_manager, int vector_dimension)
    : db_manager_(db_manager), vector_dimension_(vector_dimension) {
  if (vector_dimension_ <= 0) {
    throw std::invalid_argument("Vector dimension must be greater than 0");
  }
}

std::chrono::system_clock::time_point EmbeddingStore::now_millis() {
  // Truncate so that what we return matches what a later read parses back
  return std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now());
}

void EmbeddingStore::check_dimension(const std::vector<float> &vector,
                                     const std::string &context) const {
  if (vector.size() != static_cast<size_t>(vector_dimension_)) {
    throw DimensionMismatchError(static_cast<size_t>(vector_dimension_), vector.size(), context);
  }
  for (size_t i = 0; i < vector.size(); ++i) {
    if (!std::isfinite(vector[i])) {
      throw std::invalid_argument(context + ": vector component " + std::to_string(i) +
                                  " is not a finite number");
    }
  }
}

std::vector<char> EmbeddingStore::encode_vector(const std::vector<float> &vector) const {
  std::vector<char> vector_blob(vector.size() * sizeof(float));
  std::memcpy(vector_blob.data(), vector.data(), vector_blob.size());
  return vector_blob;
}

std::vector<float> EmbeddingStore::decode_vector(int id, const std::vector<char> &blob) const {
  if (blob.size() != static_cast<size_t>(vector_dimension_) * sizeof(float)) {
    std::cerr << "Warning: record " << id << " holds a vector blob of " << blob.size()
              << " bytes, expected " << vector_dimension_ * sizeof(float) << " bytes."
              << std::endl;
    throw DimensionMismatchError(static_cast<size_t>(vector_dimension_),
                                 blob.size() / sizeof(float),
                                 "stored record " + std::to_string(id));
  }
  std::vector<float> vector(static_cast<size_t>(vector_dimension_));
  std::memcpy(vector.data(), blob.data(), blob.size());
  return vector;
}

nlohmann::json EmbeddingStore::parse_metadata(int id, const std::string &metadata_text) const {
  try {
    return nlohmann::json::parse(metadata_text);
  } catch (const nlohmann::json::parse_error &e) {
    throw EmbeddingStoreError(
        "Corrupt metadata for record " + std::to_string(id) + ": " + e.what(),
        DbErrorKind::WrongKeyOrCorrupt);
  }
}

EmbeddingRecord EmbeddingStore::put(const std::string &company_name,
                                    const std::string &source_text,
                                    const std::vector<float> &vector,
                                    const std::string &owner_id,
                                    const nlohmann::json &metadata) {
  if (company_name.empty()) {
    throw std::invalid_argument("company_name cannot be empty");
  }
  if (owner_id.empty()) {
    throw std::invalid_argument("owner_id cannot be empty");
  }
  check_dimension(vector, "put");

  EmbeddingRecord record;
  record.company_name = company_name;
  record.source_text = source_text;
  record.vector = vector;
  record.owner_id = owner_id;
  record.metadata = metadata.is_null() ? nlohmann::json::object() : metadata;
  record.created_at = now_millis();
  record.updated_at = record.created_at;

  try {
    const std::string timestamp = time_point_to_string(record.created_at);
    PooledConnection conn(db_manager_);
    *conn << "INSERT INTO company_embeddings (company_name, source_text, vector_blob, owner_id, "
             "metadata, created_at, updated_at) VALUES (?, ?, ?, ?, ?, ?, ?)"
          << record.company_name << record.source_text << encode_vector(record.vector)
          << record.owner_id << record.metadata.dump() << timestamp << timestamp;
    record.id = static_cast<int>(conn->last_insert_rowid());
  } catch (const sqlite::sqlite_exception &e) {
    throw EmbeddingStoreError("put", e);
  }
  return record;
}

std::optional<EmbeddingRecord> EmbeddingStore::update(int id,
                                                      const std::string &new_source_text,
                                                      const std::vector<float> &new_vector) {
  check_dimension(new_vector, "update of record " + std::to_string(id));

  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, TransactionMode::Immediate);

    *conn << "UPDATE company_embeddings SET source_text = ?, vector_blob = ?, updated_at = ? "
             "WHERE id = ?"
          << new_source_text << encode_vector(new_vector) << time_point_to_string(now_millis())
          << id;
    if (conn->rows_modified() == 0) {
      return std::nullopt;
    }

    auto updated = fetch_by_id(*conn, id);
    tx.commit();
    return updated;
  } catch (const sqlite::sqlite_exception &e) {
    throw EmbeddingStoreError("update", e);
  }
}

bool EmbeddingStore::remove(int id) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "DELETE FROM company_embeddings WHERE id = ?" << id;
    return conn->rows_modified() > 0;
  } catch (const sqlite::sqlite_exception &e) {
    throw EmbeddingStoreError("remove", e);
  }
}

std::optional<EmbeddingRecord> EmbeddingStore::get(int id) {
  try {
    PooledConnection conn(db_manager_);
    return fetch_by_id(*conn, id);
  } catch (const sqlite::sqlite_exception &e) {
    throw EmbeddingStoreError("get", e);
  }
}

bool EmbeddingStore::exists(int id) {
  try {
    bool found = false;
    PooledConnection conn(db_manager_);
    *conn << "SELECT 1 FROM company_embeddings WHERE id = ? LIMIT 1" << id >>
        [&](int /*dummy*/) { found = true; };
    return found;
  } catch (const sqlite::sqlite_exception &e) {
    throw EmbeddingStoreError("exists", e);
  }
}

std::optional<EmbeddingRecord> EmbeddingStore::fetch_by_id(sqlite::database &db, int id) {
  std::optional<EmbeddingRecord> result;
  db << std::string("SELECT ") + kRecordColumnsWithVector +
            " FROM company_embeddings WHERE id = ?"
     << id >>
      [&](int row_id, std::string company_name, std::string source_text, std::string owner_id,
          std::string metadata, std::string created_at, std::string updated_at,
          std::vector<char> vector_blob) {
        EmbeddingRecord record;
        record.id = row_id;
        record.company_name = std::move(company_name);
        record.source_text = std::move(source_text);
        record.owner_id = std::move(owner_id);
        record.metadata = parse_metadata(row_id, metadata);
        record.created_at = string_to_time_point(created_at);
        record.updated_at = string_to_time_point(updated_at);
        record.vector = decode_vector(row_id, vector_blob);
        result = std::move(record);
      };
  return result;
}

RecordPage EmbeddingStore::list_by_owner(const std::string &owner_id, int limit, int page) {
  if (limit <= 0) {
    throw std::invalid_argument("limit must be greater than 0");
  }
  if (page < 1) {
    throw std::invalid_argument("page must be at least 1");
  }

  RecordPage result;
  try {
    PooledConnection conn(db_manager_);
    const sqlite_int64 offset = static_cast<sqlite_int64>(page - 1) * limit;

    *conn << std::string("SELECT ") + kRecordColumns +
                 " FROM company_embeddings WHERE owner_id = ? "
                 "ORDER BY created_at DESC, id DESC LIMIT ? OFFSET ?"
          << owner_id << limit << offset >>
        [&](int id, std::string company_name, std::string source_text, std::string row_owner,
            std::string metadata, std::string created_at, std::string updated_at) {
          EmbeddingRecord record;
          record.id = id;
          record.company_name = std::move(company_name);
          record.source_text = std::move(source_text);
          record.owner_id = std::move(row_owner);
          record.metadata = parse_metadata(id, metadata);
          record.created_at = string_to_time_point(created_at);
          record.updated_at = string_to_time_point(updated_at);
          result.records.push_back(std::move(record));
        };

    int total = 0;
    *conn << "SELECT COUNT(*) FROM company_embeddings WHERE owner_id = ?" << owner_id >> total;

    result.pagination.total = total;
    result.pagination.page = page;
    result.pagination.limit = limit;
    result.pagination.pages = total / limit + (total % limit != 0 ? 1 : 0);
  } catch (const sqlite::sqlite_exception &e) {
    throw EmbeddingStoreError("list_by_owner", e);
  }
  return result;
}

int EmbeddingStore::count_by_owner(const std::string &owner_id) {
  try {
    int total = 0;
    PooledConnection conn(db_manager_);
    *conn << "SELECT COUNT(*) FROM company_embeddings WHERE owner_id = ?" << owner_id >> total;
    return total;
  } catch (const sqlite::sqlite_exception &e) {
    throw EmbeddingStoreError("count_by_owner", e);
  }
}

std::vector<EmbeddingRecord> EmbeddingStore::find_by_name_substring(
    const std::string &pattern, const std::optional<std::string> &owner_id) {
  std::vector<EmbeddingRecord> results;
  try {
    PooledConnection conn(db_manager_);
    // instr() instead of LIKE so '%' and '_' in the pattern match literally
    std::string sql = std::string("SELECT ") + kRecordColumns +
                      " FROM company_embeddings WHERE instr(lower(company_name), lower(?)) > 0";
    if (owner_id) {
      sql += " AND owner_id = ?";
    }
    sql += " ORDER BY created_at DESC, id DESC";

    auto statement = *conn << sql;
    statement << pattern;
    if (owner_id) {
      statement << *owner_id;
    }
    statement >> [&](int id, std::string company_name, std::string source_text,
                     std::string row_owner, std::string metadata, std::string created_at,
                     std::string updated_at) {
      EmbeddingRecord record;
      record.id = id;
      record.company_name = std::move(company_name);
      record.source_text = std::move(source_text);
      record.owner_id = std::move(row_owner);
      record.metadata = parse_metadata(id, metadata);
      record.created_at = string_to_time_point(created_at);
      record.updated_at = string_to_time_point(updated_at);
      results.push_back(std::move(record));
    };
  } catch (const sqlite::sqlite_exception &e) {
    throw EmbeddingStoreError("find_by_name_substring", e);
  }
  return results;
}

std::vector<EmbeddingRecord> EmbeddingStore::recent_by_owner(const std::string &owner_id, int n) {
  std::vector<EmbeddingRecord> results;
  if (n <= 0) {
    return results;
  }
  try {
    PooledConnection conn(db_manager_);
    *conn << std::string("SELECT ") + kRecordColumnsWithVector +
                 " FROM company_embeddings WHERE owner_id = ? "
                 "ORDER BY created_at DESC, id DESC LIMIT ?"
          << owner_id << n >>
        [&](int id, std::string company_name, std::string source_text, std::string row_owner,
            std::string metadata, std::string created_at, std::string updated_at,
            std::vector<char> vector_blob) {
          EmbeddingRecord record;
          record.id = id;
          record.company_name = std::move(company_name);
          record.source_text = std::move(source_text);
          record.owner_id = std::move(row_owner);
          record.metadata = parse_metadata(id, metadata);
          record.created_at = string_to_time_point(created_at);
          record.updated_at = string_to_time_point(updated_at);
          record.vector = decode_vector(id, vector_blob);
          results.push_back(std::move(record));
        };
  } catch (const sqlite::sqlite_exception &e) {
    throw EmbeddingStoreError("recent_by_owner", e);
  }
  return results;
}

std::vector<EmbeddingRecord> EmbeddingStore::scan_candidates(
    const std::optional<std::string> &exclude_owner_id, int cap) {
  std::vector<EmbeddingRecord> candidates;
  if (cap <= 0) {
    return candidates;
  }
  try {
    PooledConnection conn(db_manager_);
    std::string sql = std::string("SELECT ") + kRecordColumnsWithVector + " FROM company_embeddings";
    if (exclude_owner_id) {
      sql += " WHERE owner_id <> ?";
    }
    sql += " ORDER BY created_at DESC, id DESC LIMIT ?";

    auto statement = *conn << sql;
    if (exclude_owner_id) {
      statement << *exclude_owner_id;
    }
    statement << cap;
    statement >> [&](int id, std::string company_name, std::string source_text,
                     std::string row_owner, std::string metadata, std::string created_at,
                     std::string updated_at, std::vector<char> vector_blob) {
      EmbeddingRecord record;
      record.id = id;
      record.company_name = std::move(company_name);
      record.source_text = std::move(source_text);
      record.owner_id = std::move(row_owner);
      record.metadata = parse_metadata(id, metadata);
      record.created_at = string_to_time_point(created_at);
      record.updated_at = string_to_time_point(updated_at);
      record.vector = decode_vector(id, vector_blob);
      candidates.push_back(std::move(record));
    };
  } catch (const sqlite::sqlite_exception &e) {
    throw EmbeddingStoreError("scan_candidates", e);
  }
  return candidates;
}

}  // namespace clientiq_core
