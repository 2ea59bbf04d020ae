#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "helpdesk_core/db/connection_pool.hpp"

namespace helpdesk_core {

// Owns the schema and connection pool of the ingest task database.
class DatabaseManager {
 public:
  DatabaseManager(const std::filesystem::path &db_path, int pool_size);
  ~DatabaseManager();

  // Used by the PooledConnection guard; nullptr once shut down or when the wait expires
  std::unique_ptr<sqlite::database> acquire_connection(
      std::optional<std::chrono::milliseconds> wait_limit = std::nullopt);
  void release_connection(std::unique_ptr<sqlite::database> conn);

  void shutdown();

  const std::filesystem::path &db_path() const {
    return db_path_;
  }

  DatabaseManager(const DatabaseManager &) = delete;
  DatabaseManager &operator=(const DatabaseManager &) = delete;

 private:
  void setup_schema();

  std::filesystem::path db_path_;
  std::unique_ptr<ConnectionPool> pool_;
};

}  // namespace helpdesk_core
