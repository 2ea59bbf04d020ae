#include "helpdesk_core/async/worker.hpp"

#include <iostream>
#include <stdexcept>

#include "helpdesk_core/async/ITask.hpp"
#include "helpdesk_core/async/service_provider.hpp"
#include "helpdesk_core/async/task_factory.hpp"
#include "helpdesk_core/db/task_queue_repo.hpp"
#include "helpdesk_core/errors.hpp"

namespace helpdesk_core {
namespace async {

Worker::Worker(int worker_id,
               std::shared_ptr<ServiceProvider> services,
               std::chrono::milliseconds poll_interval)
    : worker_id_(worker_id), services_(std::move(services)), poll_interval_(poll_interval) {
  std::cout << "Worker [" << worker_id_ << "] created." << std::endl;
}

Worker::~Worker() {
  stop();
  join();
  std::cout << "Worker [" << worker_id_ << "] joined and shut down." << std::endl;
}

void Worker::join() {
  // Blocks until the current task (if any) has finished or been cancelled.
  if (thread_.joinable()) {
    thread_.join();
  }
}

void Worker::start() {
  if (thread_.joinable()) {
    throw std::runtime_error("Worker is already running.");
  }
  should_stop_.store(false);
  thread_ = std::thread(&Worker::run_loop, this);
}

void Worker::stop() {
  should_stop_.store(true);
}

void Worker::run_loop() {
  std::cout << "Worker [" << worker_id_ << "] starting run loop." << std::endl;

  while (!should_stop_.load()) {
    bool found = false;
    try {
      found = run_one_task();
    } catch (const TaskQueueRepoError& e) {
      if (!e.transient()) {
        std::cerr << "Worker [" << worker_id_ << "] task queue error: " << e.what() << std::endl;
      }
    } catch (const std::exception& e) {
      std::cerr << "Worker [" << worker_id_ << "] ERROR polling task queue: " << e.what()
                << std::endl;
    }

    if (!found) {
      // Sleep in short steps so stop() is honoured promptly
      auto deadline = std::chrono::steady_clock::now() + poll_interval_;
      while (!should_stop_.load() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
      }
    }
  }
  std::cout << "Worker [" << worker_id_ << "] run loop terminated." << std::endl;
}

bool Worker::run_one_task() {
  TaskQueueRepo& task_repo = services_->get_task_queue_repo();
  std::optional<IngestTaskRecord> record = task_repo.fetch_and_claim_next_task();
  if (!record) {
    return false;
  }

  std::cout << "Worker [" << worker_id_ << "] claimed task " << record->id << " ("
            << record->source_kind << ")" << std::endl;
  try {
    ITaskPtr task = TaskFactory::create_task(*record);

    ProgressUpdater on_progress = [&](float p, const std::string& msg) {
      task_repo.upsert_task_progress(record->id, p, msg);
    };

    task->execute(*services_, on_progress, should_stop_);
    task_repo.update_task_status(record->id, TaskStatus::COMPLETED);
    std::cout << "Worker [" << worker_id_ << "] completed task " << record->id << std::endl;
  } catch (const IngestCancelled&) {
    std::cout << "Worker [" << worker_id_ << "] task " << record->id
              << " interrupted, returning it to the queue" << std::endl;
    task_repo.update_task_status(record->id, TaskStatus::PENDING);
  } catch (const std::exception& e) {
    std::cerr << "Worker [" << worker_id_ << "] ERROR processing task " << record->id << ": "
              << e.what() << std::endl;
    task_repo.mark_task_as_failed(record->id, e.what());
  }
  return true;
}

}  // namespace async
}  // namespace helpdesk_core
