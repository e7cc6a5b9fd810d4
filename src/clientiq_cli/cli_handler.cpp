#include "clientiq_cli/cli_handler.hpp"

#include <cmath>
#include <stdexcept>

namespace clientiq_cli {

bool command_needs_embedding(Command command) {
    return command == Command::Store || command == Command::Update || command == Command::Search;
}

CliHandler::CliHandler(std::shared_ptr<clientiq_core::EmbeddingService> embedding_service,
                       std::shared_ptr<clientiq_core::SearchService> search_service,
                       std::shared_ptr<clientiq_core::RecommendationService> recommendation_service,
                       std::ostream& out)
    : embedding_service_(std::move(embedding_service)),
      search_service_(std::move(search_service)),
      recommendation_service_(std::move(recommendation_service)),
      out_(out) {}

std::unordered_map<std::string, std::string> CliHandler::collect_flags(int argc, char* argv[]) {
    std::unordered_map<std::string, std::string> flags;
    for (int i = 2; i < argc; i += 2) {
        std::string flag = argv[i];
        if (flag.rfind("-", 0) != 0) {
            throw CliError("Unexpected argument '" + flag + "'. Flags must start with '-'.");
        }
        if (i + 1 >= argc) {
            throw CliError("Flag " + flag + " requires a value.");
        }
        flags[flag] = argv[i + 1];
    }
    return flags;
}

int CliHandler::parse_int(const std::string& flag, const std::string& value) {
    try {
        size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            throw CliError("Flag " + flag + " expects an integer, got '" + value + "'");
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw CliError("Flag " + flag + " expects an integer, got '" + value + "'");
    }
}

double CliHandler::parse_double(const std::string& flag, const std::string& value) {
    try {
        size_t consumed = 0;
        double parsed = std::stod(value, &consumed);
        if (consumed != value.size()) {
            throw CliError("Flag " + flag + " expects a number, got '" + value + "'");
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw CliError("Flag " + flag + " expects a number, got '" + value + "'");
    }
}

CliOptions CliHandler::parse_arguments(int argc, char* argv[]) {
    CliOptions options;

    if (argc < 2) {
        options.command = Command::Help;
        return options;
    }

    std::string command = argv[1];
    if (command == "help" || command == "--help" || command == "-h") {
        options.command = Command::Help;
        return options;
    }

    auto flags = collect_flags(argc, argv);
    auto flag_value = [&flags](const std::string& long_flag,
                               const std::string& short_flag) -> std::optional<std::string> {
        auto it = flags.find(long_flag);
        if (it == flags.end()) {
            it = flags.find(short_flag);
        }
        if (it == flags.end()) {
            return std::nullopt;
        }
        return it->second;
    };

    if (auto limit = flag_value("--limit", "-l")) {
        options.limit = parse_int("--limit", *limit);
    }

    if (command == "store") {
        options.command = Command::Store;
        options.company_name = flag_value("--name", "-n").value_or("");
        options.source_text = flag_value("--text", "-t").value_or("");
        options.owner_id = flag_value("--owner", "-o").value_or("");
        if (options.company_name.empty() || options.source_text.empty() || options.owner_id.empty()) {
            throw CliError("Store command requires a name, text and owner. Usage: store --name <company> --text <research> --owner <id> [--metadata <json>]");
        }
        if (auto metadata = flag_value("--metadata", "-m")) {
            try {
                options.metadata = nlohmann::json::parse(*metadata);
            } catch (const nlohmann::json::parse_error& e) {
                throw CliError("Metadata must be valid JSON: " + std::string(e.what()));
            }
            if (!options.metadata.is_object()) {
                throw CliError("Metadata must be a JSON object");
            }
        }
    } else if (command == "update") {
        options.command = Command::Update;
        auto id = flag_value("--id", "-i");
        options.source_text = flag_value("--text", "-t").value_or("");
        if (!id || options.source_text.empty()) {
            throw CliError("Update command requires an id and text. Usage: update --id <id> --text <research>");
        }
        options.id = parse_int("--id", *id);
    } else if (command == "delete") {
        options.command = Command::Delete;
        auto id = flag_value("--id", "-i");
        if (!id) {
            throw CliError("Delete command requires an id. Usage: delete --id <id>");
        }
        options.id = parse_int("--id", *id);
    } else if (command == "list") {
        options.command = Command::List;
        options.owner_id = flag_value("--owner", "-o").value_or("");
        if (options.owner_id.empty()) {
            throw CliError("List command requires an owner. Usage: list --owner <id> [--limit <n>] [--page <n>]");
        }
        if (auto page = flag_value("--page", "-p")) {
            options.page = parse_int("--page", *page);
        }
    } else if (command == "find") {
        options.command = Command::Find;
        options.query = flag_value("--name", "-n").value_or("");
        options.owner_id = flag_value("--owner", "-o").value_or("");
        if (options.query.empty()) {
            throw CliError("Find command requires a name. Usage: find --name <substring> [--owner <id>]");
        }
    } else if (command == "search") {
        options.command = Command::Search;
        options.query = flag_value("--query", "-q").value_or("");
        if (options.query.empty()) {
            throw CliError("Search command requires a query. Usage: search --query <query>");
        }
        if (auto threshold = flag_value("--threshold", "-s")) {
            options.threshold = parse_double("--threshold", *threshold);
            if (!std::isfinite(*options.threshold)) {
                throw CliError("Flag --threshold expects a finite number, got '" + *threshold + "'");
            }
        }
        options.exclude_owner = flag_value("--exclude-owner", "-x");
    } else if (command == "recommend") {
        options.command = Command::Recommend;
        options.owner_id = flag_value("--owner", "-o").value_or("");
        if (options.owner_id.empty()) {
            throw CliError("Recommend command requires an owner. Usage: recommend --owner <id> [--limit <n>]");
        }
    } else {
        throw CliError("Unknown command: " + command + ". Run 'help' for usage.");
    }

    return options;
}

void CliHandler::execute_command(const CliOptions& options) {
    switch (options.command) {
        case Command::Store:
            handle_store_command(options);
            break;
        case Command::Update:
            handle_update_command(options);
            break;
        case Command::Delete:
            handle_delete_command(options);
            break;
        case Command::List:
            handle_list_command(options);
            break;
        case Command::Find:
            handle_find_command(options);
            break;
        case Command::Search:
            handle_search_command(options);
            break;
        case Command::Recommend:
            handle_recommend_command(options);
            break;
        case Command::Help:
            print_help(out_);
            break;
    }
}

void CliHandler::handle_store_command(const CliOptions& options) {
    auto record = embedding_service_->store_embedding(options.company_name, options.source_text,
                                                      options.owner_id, options.metadata);
    print_json_response({{"message", "Embedding stored successfully"},
                         {"record", clientiq_core::to_json(record)}});
}

void CliHandler::handle_update_command(const CliOptions& options) {
    auto record = embedding_service_->update_embedding(options.id, options.source_text);
    if (!record) {
        throw CliError("Embedding " + std::to_string(options.id) + " not found");
    }
    print_json_response({{"message", "Embedding updated successfully"},
                         {"record", clientiq_core::to_json(*record)}});
}

void CliHandler::handle_delete_command(const CliOptions& options) {
    if (!embedding_service_->delete_embedding(options.id)) {
        throw CliError("Embedding " + std::to_string(options.id) + " not found");
    }
    print_json_response({{"message", "Embedding deleted"}, {"id", options.id}});
}

void CliHandler::handle_list_command(const CliOptions& options) {
    auto page = embedding_service_->list_by_owner(options.owner_id, options.limit.value_or(20),
                                                  options.page);
    print_json_response(clientiq_core::to_json(page));
}

void CliHandler::handle_find_command(const CliOptions& options) {
    std::optional<std::string> owner;
    if (!options.owner_id.empty()) {
        owner = options.owner_id;
    }
    auto records = embedding_service_->search_by_name(options.query, owner);
    nlohmann::json results = nlohmann::json::array();
    for (const auto& record : records) {
        results.push_back(clientiq_core::to_json(record));
    }
    print_json_response({{"results", results}, {"count", records.size()}});
}

void CliHandler::handle_search_command(const CliOptions& options) {
    const auto& defaults = search_service_->options();
    auto results = search_service_->search(options.query,
                                           options.limit.value_or(defaults.default_limit),
                                           options.threshold.value_or(defaults.default_threshold),
                                           options.exclude_owner);
    print_json_response({{"query", options.query},
                         {"results", clientiq_core::to_json(results)},
                         {"count", results.size()}});
}

void CliHandler::handle_recommend_command(const CliOptions& options) {
    auto results = recommendation_service_->recommend(
        options.owner_id,
        options.limit.value_or(recommendation_service_->options().default_limit));
    print_json_response({{"recommendations", clientiq_core::to_json(results)},
                         {"count", results.size()}});
}

void CliHandler::print_json_response(const nlohmann::json& response) {
    out_ << response.dump(2) << std::endl;
}

void CliHandler::print_help(std::ostream& out) {
    out << "ClientIQ semantic research engine\n\n"
        << "Usage: clientiq_cli <command> [options]\n\n"
        << "Commands:\n"
        << "  store      --name <company> --text <research> --owner <id> [--metadata <json>]\n"
        << "  update     --id <id> --text <research>\n"
        << "  delete     --id <id>\n"
        << "  list       --owner <id> [--limit <n>] [--page <n>]\n"
        << "  find       --name <substring> [--owner <id>]\n"
        << "  search     --query <text> [--limit <n>] [--threshold <score>] [--exclude-owner <id>]\n"
        << "  recommend  --owner <id> [--limit <n>]\n"
        << "  help\n\n"
        << "Search and recommendation score only the newest records up to the configured\n"
        << "candidate caps; older records outside that window are not considered.\n\n"
        << "Environment:\n"
        << "  CLIENTIQ_CONFIG   path to the JSON config (default: clientiqrc.json)\n"
        << "  CLIENTIQ_DB_KEY   database encryption key (required)\n";
}

}  // namespace clientiq_cli
