#include <atomic>
#include <condition_variable>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>

#include "helpdesk_api/routes.hpp"
#include "helpdesk_api/server.hpp"
#include "helpdesk_core/async/service_provider.hpp"
#include "helpdesk_core/async/worker_pool.hpp"
#include "helpdesk_core/config.hpp"
#include "helpdesk_core/db/database_manager.hpp"
#include "helpdesk_core/db/task_queue_repo.hpp"
#include "helpdesk_core/llm/ollama_client.hpp"
#include "helpdesk_core/services/retrieval_pipeline.hpp"
#include "helpdesk_core/sources/source_factory.hpp"
#include "helpdesk_core/storage/vector_record_store.hpp"

std::atomic<bool> shutdown_requested = false;
std::mutex shutdown_mutex;
std::condition_variable shutdown_cv;

void signal_handler(int signal) {
  std::cout << "\nShutdown signal (" << signal << ") received. Initiating graceful shutdown..."
            << std::endl;
  shutdown_requested = true;
  shutdown_cv.notify_one();
}

int main(int argc, char *argv[]) {
  try {
    const std::string config_path = argc > 1 ? argv[1] : "helpdeskrc.json";
    helpdesk_core::Config config = helpdesk_core::Config::from_file(config_path);

    std::cout << "Starting AI Helpdesk API Server..." << std::endl;
    std::cout << "Server URL: " << config.api_base_url << std::endl;
    std::cout << "Store Directory: " << config.store_dir << std::endl;
    std::cout << "Task DB Path: " << config.tasks_db_path << std::endl;
    std::cout << "Ollama URL: " << config.ollama_url << std::endl;
    std::cout << "Embedding Model: " << config.embedding_model << std::endl;
    std::cout << "Chat Model: " << config.chat_model << std::endl;

    // --- 1. INITIALIZE CORE COMPONENTS ---
    auto ollama_client = std::make_shared<helpdesk_core::OllamaClient>(config.ollama_options());
    if (!ollama_client->is_server_available()) {
      std::cerr << "Warning: Ollama server at " << config.ollama_url
                << " is not reachable; chat and ingest will fail until it is." << std::endl;
    }

    auto store = std::make_shared<helpdesk_core::VectorRecordStore>(config.store_context());
    if (store->is_corrupt()) {
      std::cerr << "Record store is corrupt: " << store->corruption_message() << std::endl;
      std::cerr << "Run 'helpdesk_cli repair' before starting the server." << std::endl;
      return 1;
    }
    auto pipeline = std::make_shared<helpdesk_core::RetrievalPipeline>(
        store, ollama_client, ollama_client, config.pipeline_options());

    helpdesk_core::DatabaseManager db_manager(config.tasks_db_path, config.num_workers + 1);
    auto task_queue_repo = std::make_shared<helpdesk_core::TaskQueueRepo>(db_manager);
    const int requeued = task_queue_repo->requeue_interrupted_tasks();
    if (requeued > 0) {
      std::cout << "Requeued " << requeued << " interrupted ingest task(s)." << std::endl;
    }

    // Sources from the configuration file are queued once per start
    for (const auto &source : config.web) {
      task_queue_repo->create_ingest_task("web", helpdesk_core::to_json(source).dump());
    }
    for (const auto &source : config.notion) {
      task_queue_repo->create_ingest_task("notion", helpdesk_core::to_json(source).dump());
    }

    auto services = std::make_shared<helpdesk_core::ServiceProvider>(
        pipeline, task_queue_repo, helpdesk_core::make_document_source);
    auto worker_pool = std::make_shared<helpdesk_core::async::WorkerPool>(
        static_cast<size_t>(config.num_workers), services);

    auto [host, port] = helpdesk_api::parse_bind_address(config.api_base_url);
    helpdesk_api::Server server(host, port);
    helpdesk_api::Routes routes(pipeline, task_queue_repo);
    routes.register_routes(server);

    // --- 2. START BACKGROUND SERVICES ---
    server.get_app().signal_clear();

    worker_pool->start();
    server.start();
    std::cout << "Server started on " << host << ":" << port << ". Press Ctrl+C to exit."
              << std::endl;

    // --- 3. WAIT FOR SHUTDOWN SIGNAL ---
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    {
      std::unique_lock<std::mutex> lock(shutdown_mutex);
      shutdown_cv.wait(lock, [] { return shutdown_requested.load(); });
    }

    // --- 4. GRACEFUL SHUTDOWN SEQUENCE ---
    std::cout << "[1/3] Stopping API server to refuse new requests..." << std::endl;
    server.stop();

    std::cout << "[2/3] Stopping worker pool; in-flight ingests go back to the queue..." << std::endl;
    worker_pool->stop();

    std::cout << "[3/3] Shutting down database connections..." << std::endl;
    db_manager.shutdown();

    std::cout << "Shutdown complete." << std::endl;
  } catch (const std::exception &e) {
    std::cerr << "Error starting server: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
