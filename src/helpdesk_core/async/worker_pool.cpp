#include "helpdesk_core/async/worker_pool.hpp"

#include <iostream>
#include <stdexcept>

namespace helpdesk_core::async {

WorkerPool::WorkerPool(size_t num_threads, std::shared_ptr<ServiceProvider> services,
                       std::chrono::milliseconds poll_interval) {
    if (num_threads == 0) {
        throw std::invalid_argument("WorkerPool must have at least one thread.");
    }
    if (!services) {
        throw std::invalid_argument("WorkerPool requires a service provider.");
    }

    m_workers.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        m_workers.push_back(std::make_unique<Worker>(static_cast<int>(i), services, poll_interval));
    }
    std::cout << "[WorkerPool] " << num_threads << " ingest worker(s) ready." << std::endl;
}

WorkerPool::~WorkerPool() {
    stop();
}

void WorkerPool::start() {
    if (m_is_running) {
        std::cerr << "[WorkerPool] Warning: already running." << std::endl;
        return;
    }
    for (const auto& worker : m_workers) {
        worker->start();
    }
    m_is_running = true;
}

void WorkerPool::stop() {
    if (!m_is_running) {
        return;
    }
    // Signal everyone first so the cancellations overlap
    for (const auto& worker : m_workers) {
        worker->stop();
    }
    for (const auto& worker : m_workers) {
        worker->join();
    }
    m_is_running = false;
    std::cout << "[WorkerPool] All workers stopped." << std::endl;
}

} // namespace helpdesk_core::async
