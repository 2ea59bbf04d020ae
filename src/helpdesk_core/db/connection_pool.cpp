#include "helpdesk_core/db/connection_pool.hpp"

#include <stdexcept>

namespace helpdesk_core {

ConnectionPool::ConnectionPool(const std::string &db_path,
                               int pool_size,
                               std::chrono::milliseconds busy_timeout)
    : db_path_(db_path), size_(static_cast<size_t>(pool_size)), busy_timeout_(busy_timeout) {
  if (pool_size <= 0) {
    throw std::invalid_argument("Connection pool needs at least one connection.");
  }
  idle_.reserve(size_);
  for (size_t i = 0; i < size_; ++i) {
    idle_.push_back(open_connection());
  }
}

std::unique_ptr<sqlite::database> ConnectionPool::open_connection() const {
  auto db = std::make_unique<sqlite::database>(db_path_);
  if (!db->connection()) {
    throw std::runtime_error("Failed to open pooled connection to " + db_path_);
  }
  *db << "PRAGMA foreign_keys = ON;";
  *db << "PRAGMA busy_timeout = " + std::to_string(busy_timeout_.count()) + ";";
  // The schema setup switched the file to WAL, where NORMAL is durable enough
  *db << "PRAGMA synchronous = NORMAL;";
  return db;
}

std::unique_ptr<sqlite::database> ConnectionPool::acquire(
    std::optional<std::chrono::milliseconds> wait_limit) {
  std::unique_lock<std::mutex> lock(mtx_);
  auto ready = [this] { return shutting_down_ || !idle_.empty(); };
  if (wait_limit) {
    if (!cv_.wait_for(lock, *wait_limit, ready)) {
      return nullptr;
    }
  } else {
    cv_.wait(lock, ready);
  }

  if (shutting_down_) {
    return nullptr;
  }
  std::unique_ptr<sqlite::database> conn = std::move(idle_.back());
  idle_.pop_back();
  return conn;
}

void ConnectionPool::release(std::unique_ptr<sqlite::database> conn) {
  if (!conn) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (shutting_down_) {
      return;
    }
    idle_.push_back(std::move(conn));
  }
  cv_.notify_one();
}

void ConnectionPool::shutdown() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    shutting_down_ = true;
    idle_.clear();
  }
  cv_.notify_all();
}

size_t ConnectionPool::idle_count() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return idle_.size();
}

}  // namespace helpdesk_core
