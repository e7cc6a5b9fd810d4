#pragma once

#include "clientiq_core/db/connection_pool.hpp"
#include <filesystem>
#include <memory>
#include <string>

namespace clientiq_core {

// Owns the schema and the connection pool for one database file.
// Constructed once at startup and shared by reference with the stores.
class DatabaseManager {
public:
    DatabaseManager() = default;
    ~DatabaseManager();

    // Creates the schema if needed and opens the pool. No-op when already initialized.
    // Throws if the key is empty or wrong, or the file has a newer schema version.
    void initialize(const std::filesystem::path& db_path, const std::string& db_key, int pool_size);

    // Used by PooledConnection; prefer the guard over calling these directly
    std::unique_ptr<sqlite::database> get_connection();
    void return_connection(std::unique_ptr<sqlite::database> conn);

    void shutdown();
    bool is_initialized() const { return is_initialized_; }

    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

private:
    void setup_schema(const std::filesystem::path& db_path, const std::string& db_key);

    std::unique_ptr<ConnectionPool> pool_;
    bool is_initialized_ = false;
};

} // namespace clientiq_core
