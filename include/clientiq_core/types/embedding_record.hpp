#pragma once

#include <chrono>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace clientiq_core {

struct EmbeddingRecord {
  int id = 0;
  std::string company_name;
  std::string source_text;
  // Empty in list and name-search results
  std::vector<float> vector;
  std::string owner_id;
  // Opaque to the engine; industry, website, tags and anything else the caller attaches
  nlohmann::json metadata = nlohmann::json::object();
  std::chrono::system_clock::time_point created_at;
  std::chrono::system_clock::time_point updated_at;
};

struct Pagination {
  int total = 0;
  int page = 1;
  int limit = 0;
  int pages = 0;
};

struct RecordPage {
  std::vector<EmbeddingRecord> records;
  Pagination pagination;
};

struct ScoredRecord {
  EmbeddingRecord record;
  double score = 0.0;
};

// Timestamps travel as "YYYY-MM-DD HH:MM:SS.mmm" in UTC
std::string time_point_to_string(const std::chrono::system_clock::time_point &tp);
std::chrono::system_clock::time_point string_to_time_point(const std::string &time_str);

// JSON views for the calling layer. The raw vector is never serialized, only its length.
nlohmann::json to_json(const EmbeddingRecord &record);
nlohmann::json to_json(const RecordPage &page);
nlohmann::json to_json(const std::vector<ScoredRecord> &results);

}  // namespace clientiq_core
