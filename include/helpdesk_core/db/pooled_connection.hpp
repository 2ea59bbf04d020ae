#pragma once

#include <sqlite_modern_cpp.h>

#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>

#include "helpdesk_core/db/database_manager.hpp"

namespace helpdesk_core {

// Scoped checkout of one task database connection; handed back on destruction.
class PooledConnection {
 public:
  explicit PooledConnection(DatabaseManager &manager,
                            std::optional<std::chrono::milliseconds> wait_limit = std::nullopt)
      : manager_(manager), conn_(manager.acquire_connection(wait_limit)) {
    if (!conn_) {
      throw std::runtime_error("No task database connection available: " +
                               manager.db_path().string() +
                               (wait_limit ? " is busy" : " has been shut down"));
    }
  }

  ~PooledConnection() {
    manager_.release_connection(std::move(conn_));
  }

  sqlite::database *operator->() const {
    return conn_.get();
  }
  sqlite::database &operator*() const {
    return *conn_;
  }

  PooledConnection(const PooledConnection &) = delete;
  PooledConnection &operator=(const PooledConnection &) = delete;

 private:
  DatabaseManager &manager_;
  std::unique_ptr<sqlite::database> conn_;
};

}  // namespace helpdesk_core
