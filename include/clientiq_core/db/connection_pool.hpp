#pragma once
#include <sqlite_modern_cpp.h>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace clientiq_core {

// Fixed set of keyed SQLCipher connections opened up front. get_connection()
// blocks until one is idle; after shutdown() it throws instead.
class ConnectionPool {
public:
    ConnectionPool(const std::string& db_path, const std::string& db_key, int pool_size);

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    std::unique_ptr<sqlite::database> get_connection();

    // Connections handed back after shutdown() are closed instead of pooled.
    void return_connection(std::unique_ptr<sqlite::database> conn);
    void shutdown();

    size_t capacity() const { return capacity_; }
    size_t available();

private:
    std::unique_ptr<sqlite::database> open_keyed_connection() const;

    const std::string db_path_;
    const std::string db_key_;
    size_t capacity_ = 0;
    bool closed_ = false;
    // Used as a stack so the most recently returned connection is reused first
    std::vector<std::unique_ptr<sqlite::database>> idle_;
    std::mutex mtx_;
    std::condition_variable idle_cv_;
};

} // namespace clientiq_core
