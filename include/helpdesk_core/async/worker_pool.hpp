#pragma once

#include <chrono>
#include <memory>
#include <vector>

#include "helpdesk_core/async/worker.hpp"

namespace helpdesk_core::async {

/**
 * @class WorkerPool
 * @brief Runs a fixed number of Workers against the shared ingest task queue.
 *
 * Each worker claims one task at a time, so num_threads is also the number of
 * sources ingested concurrently.
 */
class WorkerPool {
public:
    /**
     * @param num_threads The number of worker threads to create in the pool.
     * @param services The service provider shared by every worker.
     * @param poll_interval How long an idle worker sleeps before polling again.
     */
    WorkerPool(size_t num_threads, std::shared_ptr<ServiceProvider> services,
               std::chrono::milliseconds poll_interval = std::chrono::seconds(5));

    ~WorkerPool();

    void start();

    // Cancels in-flight ingests and waits for every worker to exit. Interrupted
    // tasks are back in PENDING when this returns.
    void stop();

    size_t size() const { return m_workers.size(); }
    bool is_running() const { return m_is_running; }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;
    WorkerPool(WorkerPool&&) = delete;
    WorkerPool& operator=(WorkerPool&&) = delete;

private:
    std::vector<std::unique_ptr<Worker>> m_workers;
    bool m_is_running = false;
};

} // namespace helpdesk_core::async
