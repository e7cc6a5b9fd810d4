#pragma once

#include <cmath>
#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace clientiq_cli {

class Config {
 public:
  std::string database_path;
  std::string ollama_url;
  std::string embedding_model;
  int embedding_dimension;
  int pool_size;

  // Search and recommendation tuning
  int search_candidate_cap;
  int recommendation_candidate_cap;
  int recommendation_history_size;
  double recommendation_threshold;
  double default_search_threshold;
  int default_result_limit;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception& e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename + "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json& json_config) {
    if (!json_config.is_object()) {
      throw std::runtime_error("Configuration must be a JSON object");
    }
    Config config;

    config.database_path = json_config.value("database_path", std::string("./data/clientiq.db"));
    config.ollama_url = json_config.value("ollama_url", std::string("http://localhost:11434"));
    config.embedding_model = json_config.value("embedding_model", std::string("mxbai-embed-large"));

    config.embedding_dimension = int_or_default(json_config, "embedding_dimension", 1024);
    config.pool_size = int_or_default(json_config, "pool_size", 4);
    config.search_candidate_cap = int_or_default(json_config, "search_candidate_cap", 1000);
    config.recommendation_candidate_cap =
        int_or_default(json_config, "recommendation_candidate_cap", 500);
    config.recommendation_history_size =
        int_or_default(json_config, "recommendation_history_size", 10);
    config.default_result_limit = int_or_default(json_config, "default_result_limit", 5);

    config.recommendation_threshold =
        double_or_default(json_config, "recommendation_threshold", 0.6);
    config.default_search_threshold =
        double_or_default(json_config, "default_search_threshold", 0.7);

    config.validate();
    return config;
  }

 private:
  // Fallback to the default if the key is missing or has the wrong type
  static int int_or_default(const nlohmann::json& json_config, const char* key, int fallback) {
    try {
      if (json_config.contains(key)) {
        return json_config.at(key).get<int>();
      }
    } catch (const nlohmann::json::exception&) {
    }
    return fallback;
  }

  static double double_or_default(const nlohmann::json& json_config, const char* key,
                                  double fallback) {
    try {
      if (json_config.contains(key)) {
        return json_config.at(key).get<double>();
      }
    } catch (const nlohmann::json::exception&) {
    }
    return fallback;
  }

  void validate() const {
    if (database_path.empty()) {
      throw std::runtime_error("database_path cannot be empty");
    }
    if (ollama_url.empty()) {
      throw std::runtime_error("ollama_url cannot be empty");
    }
    if (embedding_model.empty()) {
      throw std::runtime_error("embedding_model cannot be empty");
    }
    if (embedding_dimension <= 0) {
      throw std::runtime_error("embedding_dimension must be greater than 0");
    }
    if (pool_size <= 0) {
      throw std::runtime_error("pool_size must be greater than 0");
    }
    if (search_candidate_cap <= 0) {
      throw std::runtime_error("search_candidate_cap must be greater than 0");
    }
    if (recommendation_candidate_cap <= 0) {
      throw std::runtime_error("recommendation_candidate_cap must be greater than 0");
    }
    if (recommendation_history_size <= 0) {
      throw std::runtime_error("recommendation_history_size must be greater than 0");
    }
    if (default_result_limit <= 0) {
      throw std::runtime_error("default_result_limit must be greater than 0");
    }
    if (!std::isfinite(recommendation_threshold)) {
      throw std::runtime_error("recommendation_threshold must be a finite number");
    }
    if (!std::isfinite(default_search_threshold)) {
      throw std::runtime_error("default_search_threshold must be a finite number");
    }
  }
};

}  // namespace clientiq_cli
