#pragma once

#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "clientiq_core/services/embedding_service.hpp"
#include "clientiq_core/services/recommendation_service.hpp"
#include "clientiq_core/services/search_service.hpp"

namespace clientiq_cli
{

  enum class Command
  {
    Store,
    Update,
    Delete,
    List,
    Find,
    Search,
    Recommend,
    Help
  };

  struct CliOptions
  {
    Command command = Command::Help;
    int id = 0;
    std::string company_name;
    std::string source_text;
    std::string owner_id;
    std::string query;
    nlohmann::json metadata = nlohmann::json::object();
    std::optional<int> limit;
    int page = 1;
    std::optional<double> threshold;
    std::optional<std::string> exclude_owner;
  };

  // True for the commands that call the embedding provider
  bool command_needs_embedding(Command command);

  class CliError : public std::exception
  {
  public:
    explicit CliError(const std::string &message) : message_(message) {}

    const char *what() const noexcept override
    {
      return message_.c_str();
    }

  private:
    std::string message_;
  };

  class CliHandler
  {
  public:
    CliHandler(std::shared_ptr<clientiq_core::EmbeddingService> embedding_service,
               std::shared_ptr<clientiq_core::SearchService> search_service,
               std::shared_ptr<clientiq_core::RecommendationService> recommendation_service,
               std::ostream &out = std::cout);

    CliHandler(const CliHandler &) = delete;
    CliHandler &operator=(const CliHandler &) = delete;

    // Parse command line arguments
    static CliOptions parse_arguments(int argc, char *argv[]);

    // Execute command
    void execute_command(const CliOptions &options);

    static void print_help(std::ostream &out);

  private:
    std::shared_ptr<clientiq_core::EmbeddingService> embedding_service_;
    std::shared_ptr<clientiq_core::SearchService> search_service_;
    std::shared_ptr<clientiq_core::RecommendationService> recommendation_service_;
    std::ostream &out_;

    // Command handlers
    void handle_store_command(const CliOptions &options);
    void handle_update_command(const CliOptions &options);
    void handle_delete_command(const CliOptions &options);
    void handle_list_command(const CliOptions &options);
    void handle_find_command(const CliOptions &options);
    void handle_search_command(const CliOptions &options);
    void handle_recommend_command(const CliOptions &options);

    // Helper methods
    static std::unordered_map<std::string, std::string> collect_flags(int argc, char *argv[]);
    static int parse_int(const std::string &flag, const std::string &value);
    static double parse_double(const std::string &flag, const std::string &value);
    void print_json_response(const nlohmann::json &response);
  };

}
