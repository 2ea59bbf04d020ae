#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

namespace helpdesk_core {
class ServiceProvider;
}

namespace helpdesk_core {
namespace async {

/**
 * @class Worker
 * @brief A single background thread that processes ingest tasks from the queue.
 *
 * A Worker is a long-lived object that continuously polls the task queue for
 * pending jobs. When a job is found, the Worker fetches the task's documents
 * and runs them through the retrieval pipeline.
 *
 * This class is designed to be managed by a WorkerPool. It is non-copyable
 * and non-movable to ensure clear ownership of the underlying thread.
 */
class Worker {
 public:
  /**
   * @brief Constructs a Worker instance.
   * @param worker_id A unique identifier for this worker, used for logging.
   * @param services The shared service provider.
   * @param poll_interval How long to sleep when the queue is empty.
   */
  Worker(int worker_id,
         std::shared_ptr<ServiceProvider> services,
         std::chrono::milliseconds poll_interval = std::chrono::seconds(5));

  /**
   * @brief Destructor. Ensures the worker thread is stopped and joined cleanly.
   */
  ~Worker();

  /**
   * @brief Starts the worker's processing loop in a new background thread.
   *
   * This method will throw an exception if the worker is already running.
   */
  void start();

  /**
   * @brief Signals the worker to stop. A running ingest is cancelled between
   * embedding batches and its task goes back to PENDING.
   *
   * This method does NOT block; the destructor waits for the thread.
   */
  void stop();

  /**
   * @brief Blocks until the worker thread has exited. Call stop() first.
   */
  void join();

  /**
   * @brief Claims and executes at most one task on the calling thread.
   * @return true if a task was found (whether it succeeded or failed).
   */
  bool run_one_task();

  Worker(const Worker&) = delete;
  Worker& operator=(const Worker&) = delete;
  Worker(Worker&&) = delete;
  Worker& operator=(Worker&&) = delete;

 private:
  void run_loop();

  int worker_id_;
  std::shared_ptr<ServiceProvider> services_;
  std::chrono::milliseconds poll_interval_;
  std::atomic<bool> should_stop_{false};
  std::thread thread_;
};

}  // namespace async
}  // namespace helpdesk_core
