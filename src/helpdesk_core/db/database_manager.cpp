#include "helpdesk_core/db/database_manager.hpp"

#include <stdexcept>

#include "helpdesk_core/db/sqlite_error_utils.hpp"

namespace helpdesk_core {

DatabaseManager::DatabaseManager(const std::filesystem::path& db_path, int pool_size)
    : db_path_(db_path) {
  if (db_path_.has_parent_path()) {
    std::filesystem::create_directories(db_path_.parent_path());
  }

  // Schema first, on a connection of its own, so pooled connections see the tables
  setup_schema();
  pool_ = std::make_unique<ConnectionPool>(db_path_.string(), pool_size);
}

DatabaseManager::~DatabaseManager() {
  shutdown();
}

void DatabaseManager::shutdown() {
  if (pool_) {
    pool_->shutdown();
  }
}

std::unique_ptr<sqlite::database> DatabaseManager::acquire_connection(
    std::optional<std::chrono::milliseconds> wait_limit) {
  return pool_->acquire(wait_limit);
}

void DatabaseManager::release_connection(std::unique_ptr<sqlite::database> conn) {
  pool_->release(std::move(conn));
}

void DatabaseManager::setup_schema() {
  // Use a temporary, single-use connection just for schema setup.
  try {
    sqlite::database db(db_path_.string());
    db << "PRAGMA foreign_keys = ON;";
    db << "PRAGMA journal_mode = WAL;";

    db << R"(
        CREATE TABLE IF NOT EXISTS ingest_tasks (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            source_kind TEXT NOT NULL,
            payload TEXT NOT NULL,
            status TEXT NOT NULL DEFAULT 'PENDING',
            priority INTEGER NOT NULL DEFAULT 10,
            error_message TEXT,
            created_at TEXT NOT NULL,
            updated_at TEXT NOT NULL
        )
      )";
    db << R"(
        CREATE TABLE IF NOT EXISTS task_progress (
            task_id INTEGER PRIMARY KEY,
            progress_percent REAL NOT NULL DEFAULT 0.0,
            status_message TEXT NOT NULL DEFAULT 'Initializing...',
            updated_at TEXT NOT NULL,
            FOREIGN KEY (task_id) REFERENCES ingest_tasks(id) ON DELETE CASCADE
        )
      )";
    db << R"(
        CREATE INDEX IF NOT EXISTS idx_ingest_tasks_status_priority
        ON ingest_tasks(status, priority, created_at)
      )";
  } catch (const sqlite::sqlite_exception& e) {
    throw std::runtime_error(format_db_error("setup_schema", e));
  }
}

}  // namespace helpdesk_core
