#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>

#include "clientiq_cli/cli_handler.hpp"
#include "clientiq_cli/config.hpp"
#include "clientiq_core/db/database_manager.hpp"
#include "clientiq_core/db/embedding_store.hpp"
#include "clientiq_core/llm/ollama_client.hpp"
#include "clientiq_core/search/candidate_source.hpp"
#include "clientiq_core/services/embedding_service.hpp"
#include "clientiq_core/services/recommendation_service.hpp"
#include "clientiq_core/services/search_service.hpp"

namespace {

clientiq_cli::Config load_config() {
  const char *config_env = std::getenv("CLIENTIQ_CONFIG");
  if (config_env) {
    return clientiq_cli::Config::from_file(config_env);
  }
  const std::string default_path = "clientiqrc.json";
  if (std::filesystem::exists(default_path)) {
    return clientiq_cli::Config::from_file(default_path);
  }
  std::cerr << "No " << default_path << " found, using default configuration." << std::endl;
  return clientiq_cli::Config::from_json(nlohmann::json::object());
}

}  // namespace

int main(int argc, char *argv[]) {
  try {
    clientiq_cli::CliOptions options = clientiq_cli::CliHandler::parse_arguments(argc, argv);
    if (options.command == clientiq_cli::Command::Help) {
      clientiq_cli::CliHandler::print_help(std::cout);
      return 0;
    }

    clientiq_cli::Config config = load_config();

    const char *db_key = std::getenv("CLIENTIQ_DB_KEY");
    if (!db_key || std::string(db_key).empty()) {
      throw std::runtime_error("CLIENTIQ_DB_KEY must be set to the database encryption key");
    }

    clientiq_core::DatabaseManager db_manager;
    db_manager.initialize(config.database_path, db_key, config.pool_size);
    auto embedding_store =
        std::make_shared<clientiq_core::EmbeddingStore>(db_manager, config.embedding_dimension);
    auto candidate_source = std::make_shared<clientiq_core::RecentCandidateSource>(embedding_store);

    // Only commands that embed text need the Ollama server to be up
    std::shared_ptr<clientiq_core::EmbeddingClient> embedding_client;
    if (clientiq_cli::command_needs_embedding(options.command)) {
      embedding_client =
          std::make_shared<clientiq_core::OllamaClient>(config.ollama_url, config.embedding_model);
    }

    clientiq_core::SearchOptions search_options;
    search_options.candidate_cap = config.search_candidate_cap;
    search_options.default_threshold = config.default_search_threshold;
    search_options.default_limit = config.default_result_limit;

    clientiq_core::RecommendationOptions recommendation_options;
    recommendation_options.history_size = config.recommendation_history_size;
    recommendation_options.candidate_cap = config.recommendation_candidate_cap;
    recommendation_options.threshold = config.recommendation_threshold;
    recommendation_options.default_limit = config.default_result_limit;

    auto embedding_service =
        std::make_shared<clientiq_core::EmbeddingService>(embedding_store, embedding_client);
    auto search_service = std::make_shared<clientiq_core::SearchService>(
        embedding_client, candidate_source, search_options);
    auto recommendation_service = std::make_shared<clientiq_core::RecommendationService>(
        embedding_store, candidate_source, recommendation_options);

    clientiq_cli::CliHandler handler(embedding_service, search_service, recommendation_service);
    handler.execute_command(options);

    db_manager.shutdown();
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
