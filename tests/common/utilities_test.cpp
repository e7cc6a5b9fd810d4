#include "utilities_test.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <random>

#include <unistd.h>

namespace clientiq_tests {

std::filesystem::path TestUtilities::create_temp_test_db() {
  auto temp_dir = temp_db_directory();
  std::filesystem::create_directories(temp_dir);

  // Process id, timestamp and a random suffix; test processes may run in parallel
  auto now = std::chrono::system_clock::now();
  auto timestamp =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
  std::random_device rd;
  std::uniform_int_distribution<unsigned> dist;

  return temp_dir / (temp_db_prefix() + std::to_string(timestamp) + "_" +
                     std::to_string(dist(rd)) + ".db");
}

std::filesystem::path TestUtilities::temp_db_directory() {
  return std::filesystem::temp_directory_path() / "clientiq_tests";
}

std::string TestUtilities::temp_db_prefix() {
  return "test_" + std::to_string(::getpid()) + "_";
}

void TestUtilities::cleanup_temp_db(const std::filesystem::path& db_path) {
  std::error_code ec;
  std::filesystem::remove(db_path, ec);
  // WAL mode leaves side files next to the database
  std::filesystem::remove(db_path.string() + "-wal", ec);
  std::filesystem::remove(db_path.string() + "-shm", ec);
}

std::vector<float> TestUtilities::create_test_vector(const std::string& seed_text, int dimension) {
  std::vector<float> vector(dimension);

  std::hash<std::string> hasher;
  size_t seed_hash = hasher(seed_text);

  for (int i = 0; i < dimension; ++i) {
    vector[i] = static_cast<float>((seed_hash + i * 7919) % 1000) / 1000.0f - 0.5f;
  }
  // Never all zero
  vector[0] += 1.0f;
  return vector;
}

std::vector<float> TestUtilities::make_vector(std::initializer_list<float> head, int dimension) {
  std::vector<float> vector(dimension, 0.0f);
  int i = 0;
  for (float value : head) {
    if (i >= dimension) {
      break;
    }
    vector[i++] = value;
  }
  return vector;
}

std::vector<float> TestUtilities::unit_vector(int axis, int dimension) {
  std::vector<float> vector(dimension, 0.0f);
  vector[axis] = 1.0f;
  return vector;
}

clientiq_core::EmbeddingRecord TestUtilities::make_record(int id,
                                                          const std::string& owner_id,
                                                          const std::vector<float>& vector,
                                                          const std::string& company_name) {
  clientiq_core::EmbeddingRecord record;
  record.id = id;
  record.owner_id = owner_id;
  record.vector = vector;
  record.company_name = company_name.empty() ? "Company " + std::to_string(id) : company_name;
  record.source_text = "Research about " + record.company_name;
  record.created_at = std::chrono::system_clock::now();
  record.updated_at = record.created_at;
  return record;
}

nlohmann::json TestUtilities::create_test_metadata(const std::string& industry) {
  return nlohmann::json{{"industry", industry},
                        {"website", "https://example.com"},
                        {"tags", {"sales", "ai-research"}}};
}

}  // namespace clientiq_tests
