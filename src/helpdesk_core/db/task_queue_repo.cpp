#include "helpdesk_core/db/task_queue_repo.hpp"

#include <sqlite_modern_cpp.h>

#include "helpdesk_core/db/pooled_connection.hpp"
#include "helpdesk_core/db/sqlite_error_utils.hpp"
#include "helpdesk_core/db/transaction.hpp"
#include "helpdesk_core/types/document.hpp"

namespace helpdesk_core {

namespace {

constexpr const char* kTaskColumns =
    "SELECT id, source_kind, payload, status, priority, error_message, created_at, updated_at "
    "FROM ingest_tasks ";

TaskQueueRepoError repo_error(const std::string& operation, const sqlite::sqlite_exception& e) {
  return TaskQueueRepoError(format_db_error(operation, e), is_transient(e));
}

IngestTaskRecord make_record(long long id,
                             std::string source_kind,
                             std::string payload,
                             const std::string& status,
                             int priority,
                             std::optional<std::string> error_message,
                             const std::string& created_at,
                             const std::string& updated_at) {
  IngestTaskRecord task;
  task.id = id;
  task.source_kind = std::move(source_kind);
  task.payload = std::move(payload);
  task.status = task_status_from_string(status);
  task.priority = priority;
  task.error_message = std::move(error_message);
  task.created_at = parse_timestamp(created_at);
  task.updated_at = parse_timestamp(updated_at);
  return task;
}

}  // namespace

TaskQueueRepo::TaskQueueRepo(DatabaseManager& db_manager) : db_manager_(db_manager) {}

long long TaskQueueRepo::create_ingest_task(const std::string& source_kind,
                                            const std::string& payload,
                                            int priority) {
  try {
    PooledConnection conn(db_manager_);
    std::string now = format_timestamp(std::chrono::system_clock::now());
    *conn << "INSERT INTO ingest_tasks (source_kind, payload, status, priority, created_at, "
             "updated_at) VALUES (?,?,?,?,?,?)"
          << source_kind << payload << to_string(TaskStatus::PENDING) << priority << now << now;
    return static_cast<long long>(conn->last_insert_rowid());
  } catch (const sqlite::sqlite_exception& e) {
    throw repo_error("create_ingest_task", e);
  }
}

std::optional<IngestTaskRecord> TaskQueueRepo::fetch_and_claim_next_task() {
  std::optional<IngestTaskRecord> result;
  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, Transaction::Mode::Immediate);
    *conn << std::string(kTaskColumns) +
                 "WHERE status = ? ORDER BY priority ASC, created_at ASC, id ASC LIMIT 1"
          << to_string(TaskStatus::PENDING) >>
        [&](long long id, std::string source_kind, std::string payload, std::string status,
            int priority, std::optional<std::string> error_message, std::string created_at,
            std::string updated_at) {
          result = make_record(id, std::move(source_kind), std::move(payload), status, priority,
                               std::move(error_message), created_at, updated_at);
        };

    if (result) {
      auto now = std::chrono::system_clock::now();
      *conn << "UPDATE ingest_tasks SET status = ?, updated_at = ? WHERE id = ?"
            << to_string(TaskStatus::PROCESSING) << format_timestamp(now) << result->id;
      result->status = TaskStatus::PROCESSING;
      result->updated_at = now;
    }
    tx.commit();
    return result;
  } catch (const sqlite::sqlite_exception& e) {
    throw repo_error("fetch_and_claim_next_task", e);
  }
}

void TaskQueueRepo::update_task_status(long long task_id, TaskStatus new_status) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "UPDATE ingest_tasks SET status = ?, updated_at = ? WHERE id = ?"
          << to_string(new_status) << format_timestamp(std::chrono::system_clock::now())
          << task_id;
  } catch (const sqlite::sqlite_exception& e) {
    throw repo_error("update_task_status", e);
  }
}

void TaskQueueRepo::mark_task_as_failed(long long task_id, const std::string& error_message) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "UPDATE ingest_tasks SET status = ?, error_message = ?, updated_at = ? WHERE id = ?"
          << to_string(TaskStatus::FAILED) << error_message
          << format_timestamp(std::chrono::system_clock::now()) << task_id;
  } catch (const sqlite::sqlite_exception& e) {
    throw repo_error("mark_task_as_failed", e);
  }
}

std::optional<IngestTaskRecord> TaskQueueRepo::get_task(long long task_id) {
  std::optional<IngestTaskRecord> result;
  try {
    PooledConnection conn(db_manager_);
    *conn << std::string(kTaskColumns) + "WHERE id = ?" << task_id >>
        [&](long long id, std::string source_kind, std::string payload, std::string status,
            int priority, std::optional<std::string> error_message, std::string created_at,
            std::string updated_at) {
          result = make_record(id, std::move(source_kind), std::move(payload), status, priority,
                               std::move(error_message), created_at, updated_at);
        };
    return result;
  } catch (const sqlite::sqlite_exception& e) {
    throw repo_error("get_task", e);
  }
}

std::vector<IngestTaskRecord> TaskQueueRepo::get_tasks_by_status(TaskStatus status) {
  std::vector<IngestTaskRecord> tasks;
  try {
    PooledConnection conn(db_manager_);
    *conn << std::string(kTaskColumns) +
                 "WHERE status = ? ORDER BY priority ASC, created_at ASC, id ASC"
          << to_string(status) >>
        [&](long long id, std::string source_kind, std::string payload, std::string status_db,
            int priority, std::optional<std::string> error_message, std::string created_at,
            std::string updated_at) {
          tasks.push_back(make_record(id, std::move(source_kind), std::move(payload), status_db,
                                      priority, std::move(error_message), created_at,
                                      updated_at));
        };
    return tasks;
  } catch (const sqlite::sqlite_exception& e) {
    throw repo_error("get_tasks_by_status", e);
  }
}

std::vector<IngestTaskRecord> TaskQueueRepo::list_recent_tasks(int limit) {
  std::vector<IngestTaskRecord> tasks;
  try {
    PooledConnection conn(db_manager_);
    *conn << std::string(kTaskColumns) + "ORDER BY id DESC LIMIT ?" << limit >>
        [&](long long id, std::string source_kind, std::string payload, std::string status,
            int priority, std::optional<std::string> error_message, std::string created_at,
            std::string updated_at) {
          tasks.push_back(make_record(id, std::move(source_kind), std::move(payload), status,
                                      priority, std::move(error_message), created_at,
                                      updated_at));
        };
    return tasks;
  } catch (const sqlite::sqlite_exception& e) {
    throw repo_error("list_recent_tasks", e);
  }
}

void TaskQueueRepo::clear_completed_tasks(int older_than_days) {
  try {
    PooledConnection conn(db_manager_);
    auto cutoff_time = std::chrono::system_clock::now() - std::chrono::hours(24 * older_than_days);
    *conn << "DELETE FROM ingest_tasks WHERE status IN (?, ?) AND updated_at <= ?"
          << to_string(TaskStatus::COMPLETED) << to_string(TaskStatus::FAILED)
          << format_timestamp(cutoff_time);
  } catch (const sqlite::sqlite_exception& e) {
    throw repo_error("clear_completed_tasks", e);
  }
}

int TaskQueueRepo::requeue_interrupted_tasks() {
  try {
    PooledConnection conn(db_manager_);
    *conn << "UPDATE ingest_tasks SET status = ?, updated_at = ? WHERE status = ?"
          << to_string(TaskStatus::PENDING) << format_timestamp(std::chrono::system_clock::now())
          << to_string(TaskStatus::PROCESSING);
    return conn->rows_modified();
  } catch (const sqlite::sqlite_exception& e) {
    throw repo_error("requeue_interrupted_tasks", e);
  }
}

void TaskQueueRepo::upsert_task_progress(long long task_id, float percent, const std::string& message) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "INSERT INTO task_progress (task_id, progress_percent, status_message, updated_at) "
             "VALUES (?,?,?,?) ON CONFLICT(task_id) DO UPDATE SET "
             "progress_percent = excluded.progress_percent, "
             "status_message = excluded.status_message, updated_at = excluded.updated_at"
          << task_id << percent << message << format_timestamp(std::chrono::system_clock::now());
  } catch (const sqlite::sqlite_exception& e) {
    throw repo_error("upsert_task_progress", e);
  }
}

std::optional<TaskProgress> TaskQueueRepo::get_task_progress(long long task_id) {
  std::optional<TaskProgress> result;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT task_id, progress_percent, status_message, updated_at FROM task_progress "
             "WHERE task_id = ?"
          << task_id >>
        [&](long long id, double percent, std::string message, std::string updated_at) {
          result = TaskProgress{id, static_cast<float>(percent), std::move(message),
                                std::move(updated_at)};
        };
    return result;
  } catch (const sqlite::sqlite_exception& e) {
    throw repo_error("get_task_progress", e);
  }
}

}  // namespace helpdesk_core
