#pragma once

#include "helpdesk_core/async/ITask.hpp"
#include "helpdesk_core/db/task.hpp"

namespace helpdesk_core {
class TaskFactory {
 public:
  // Throws std::runtime_error for unknown task types or unreadable payloads.
  static ITaskPtr create_task(const IngestTaskRecord& record);
};
}  // namespace helpdesk_core
