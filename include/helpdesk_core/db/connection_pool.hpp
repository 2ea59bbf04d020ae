#pragma once

#include <sqlite_modern_cpp.h>

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace helpdesk_core {

/**
 * Fixed set of SQLite connections to the task database, shared by the API
 * handlers and the ingest workers. Every connection is opened with the same
 * pragmas so a checkout never has to care which one it got.
 */
class ConnectionPool {
 public:
  ConnectionPool(const std::string &db_path,
                 int pool_size,
                 std::chrono::milliseconds busy_timeout = std::chrono::milliseconds(5000));

  // Blocks until a connection is free. With a wait limit, returns nullptr when it
  // expires; after shutdown() always returns nullptr.
  std::unique_ptr<sqlite::database> acquire(
      std::optional<std::chrono::milliseconds> wait_limit = std::nullopt);

  // Connections handed back after shutdown() are closed instead of pooled.
  void release(std::unique_ptr<sqlite::database> conn);

  void shutdown();

  size_t idle_count() const;
  size_t size() const {
    return size_;
  }

 private:
  std::unique_ptr<sqlite::database> open_connection() const;

  std::string db_path_;
  size_t size_;
  std::chrono::milliseconds busy_timeout_;

  mutable std::mutex mtx_;
  std::condition_variable cv_;
  std::vector<std::unique_ptr<sqlite::database>> idle_;
  bool shutting_down_ = false;
};

}  // namespace helpdesk_core
