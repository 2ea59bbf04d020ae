#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "helpdesk_core/db/task.hpp"
#include "helpdesk_core/types/progress.hpp"

namespace helpdesk_core {
class ServiceProvider;
}

namespace helpdesk_core {
class ITask {
 public:
  ITask(long long id,
        TaskStatus status,
        std::chrono::system_clock::time_point created_at,
        std::chrono::system_clock::time_point updated_at,
        std::optional<std::string> error_message)
      : id_(id),
        status_(status),
        created_at_(created_at),
        updated_at_(updated_at),
        error_message_(std::move(error_message)) {}

  virtual ~ITask() = default;

  // cancel is raised when the worker is shutting down; tasks check it between steps.
  virtual void execute(ServiceProvider& services,
                       const ProgressUpdater& on_progress,
                       const std::atomic<bool>& cancel) = 0;

  virtual const char* get_type() const = 0;

  long long get_id() const {
    return id_;
  }
  TaskStatus get_status() const {
    return status_;
  }

 protected:
  long long id_;
  TaskStatus status_;
  std::chrono::system_clock::time_point created_at_;
  std::chrono::system_clock::time_point updated_at_;
  std::optional<std::string> error_message_;
};

using ITaskPtr = std::unique_ptr<ITask>;
}  // namespace helpdesk_core
