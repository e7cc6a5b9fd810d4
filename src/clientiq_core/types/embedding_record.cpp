#include "clientiq_core/types/embedding_record.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace clientiq_core {

std::string time_point_to_string(const std::chrono::system_clock::time_point &tp) {
  auto time_t = std::chrono::system_clock::to_time_t(tp);
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()) %
                std::chrono::seconds(1);
  if (millis.count() < 0) {
    // to_time_t rounds toward zero for pre-epoch values
    millis += std::chrono::seconds(1);
    time_t -= 1;
  }
  std::tm tm_struct = {};
  gmtime_r(&time_t, &tm_struct);
  std::stringstream ss;
  ss << std::put_time(&tm_struct, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(3)
     << std::setfill('0') << millis.count();
  return ss.str();
}

std::chrono::system_clock::time_point string_to_time_point(const std::string &time_str) {
  std::tm tm_struct = {};
  std::stringstream ss(time_str);
  ss >> std::get_time(&tm_struct, "%Y-%m-%d %H:%M:%S");
  if (ss.fail()) {
    throw std::runtime_error("Failed to parse time string: " + time_str +
                             ". Expected format YYYY-MM-DD HH:MM:SS.mmm.");
  }
  int millis = 0;
  if (ss.peek() == '.') {
    ss.get();
    ss >> millis;
    if (ss.fail() || millis < 0 || millis > 999) {
      throw std::runtime_error("Failed to parse milliseconds in time string: " + time_str);
    }
  }
  // Stored as UTC
  return std::chrono::system_clock::from_time_t(timegm(&tm_struct)) +
         std::chrono::milliseconds(millis);
}

nlohmann::json to_json(const EmbeddingRecord &record) {
  return nlohmann::json{{"id", record.id},
                        {"company_name", record.company_name},
                        {"source_text", record.source_text},
                        {"owner_id", record.owner_id},
                        {"metadata", record.metadata},
                        {"vector_dimension", record.vector.size()},
                        {"created_at", time_point_to_string(record.created_at)},
                        {"updated_at", time_point_to_string(record.updated_at)}};
}

nlohmann::json to_json(const RecordPage &page) {
  nlohmann::json records = nlohmann::json::array();
  for (const auto &record : page.records) {
    records.push_back(to_json(record));
  }
  return nlohmann::json{{"records", records},
                        {"pagination",
                         {{"total", page.pagination.total},
                          {"page", page.pagination.page},
                          {"limit", page.pagination.limit},
                          {"pages", page.pagination.pages}}}};
}

nlohmann::json to_json(const std::vector<ScoredRecord> &results) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto &result : results) {
    nlohmann::json entry = to_json(result.record);
    entry["score"] = result.score;
    out.push_back(std::move(entry));
  }
  return out;
}

}  // namespace clientiq_core
