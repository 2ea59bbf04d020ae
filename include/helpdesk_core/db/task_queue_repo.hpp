#pragma once

#include <optional>
#include <string>
#include <vector>

#include "helpdesk_core/db/database_manager.hpp"
#include "helpdesk_core/db/task.hpp"

namespace helpdesk_core {

class TaskQueueRepoError : public std::exception {
 public:
  explicit TaskQueueRepoError(const std::string& message, bool transient = false)
      : message_(message), transient_(transient) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }
  // The database was busy; retrying later may succeed.
  bool transient() const {
    return transient_;
  }

 private:
  std::string message_;
  bool transient_;
};

class TaskQueueRepo {
 public:
  explicit TaskQueueRepo(DatabaseManager& db_manager);

  long long create_ingest_task(const std::string& source_kind,
                               const std::string& payload,
                               int priority = 10);

  // Atomically moves the oldest highest-priority PENDING task to PROCESSING.
  std::optional<IngestTaskRecord> fetch_and_claim_next_task();

  void update_task_status(long long task_id, TaskStatus new_status);
  void mark_task_as_failed(long long task_id, const std::string& error_message);
  std::optional<IngestTaskRecord> get_task(long long task_id);
  std::vector<IngestTaskRecord> get_tasks_by_status(TaskStatus status);
  // Newest first
  std::vector<IngestTaskRecord> list_recent_tasks(int limit = 50);
  void clear_completed_tasks(int older_than_days = 7);
  // Tasks left PROCESSING by a server that died mid-ingest go back to PENDING.
  int requeue_interrupted_tasks();

  void upsert_task_progress(long long task_id, float percent, const std::string& message);
  std::optional<TaskProgress> get_task_progress(long long task_id);

 private:
  DatabaseManager& db_manager_;
};

}  // namespace helpdesk_core
