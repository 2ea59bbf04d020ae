#include "helpdesk_core/async/ingest_source_task.hpp"

#include <iostream>

#include "helpdesk_core/async/service_provider.hpp"
#include "helpdesk_core/errors.hpp"
#include "helpdesk_core/services/retrieval_pipeline.hpp"
#include "helpdesk_core/sources/document_source.hpp"

namespace helpdesk_core {

IngestSourceTask::IngestSourceTask(long long id,
                                   TaskStatus status,
                                   std::chrono::system_clock::time_point created_at,
                                   std::chrono::system_clock::time_point updated_at,
                                   std::optional<std::string> error_message,
                                   SourceKind source_kind,
                                   nlohmann::json payload)
    : ITask(id, status, created_at, updated_at, std::move(error_message)),
      source_kind_(source_kind),
      payload_(std::move(payload)) {}

void IngestSourceTask::execute(ServiceProvider& services,
                               const ProgressUpdater& on_progress,
                               const std::atomic<bool>& cancel) {
  on_progress(0.0f, "Fetching documents...");

  // 1. Fetch
  std::unique_ptr<DocumentSource> source = services.create_source(source_kind_, payload_);
  std::vector<Document> documents = source->fetch();
  on_progress(0.2f, "Fetched " + std::to_string(documents.size()) + " documents from " +
                        source->describe() + ".");

  // 2. Ingest one document at a time, mapping its progress into the remaining 80%
  RetrievalPipeline& pipeline = services.get_pipeline();
  std::vector<std::string> failures;
  const size_t total = documents.size();
  for (size_t i = 0; i < total; ++i) {
    const std::string document_id = documents[i].metadata.id;
    const float base = 0.2f + 0.8f * static_cast<float>(i) / static_cast<float>(total);
    const float span = 0.8f / static_cast<float>(total);
    ProgressUpdater document_progress = [&](float fraction, const std::string& message) {
      on_progress(base + span * fraction, "[" + std::to_string(i + 1) + "/" +
                                              std::to_string(total) + "] " + message);
    };

    try {
      pipeline.ingest(std::move(documents[i]), &cancel, document_progress);
    } catch (const IngestCancelled&) {
      throw;
    } catch (const HelpdeskError& e) {
      std::cerr << "[IngestTask " << id_ << "] " << document_id << " failed: " << e.what()
                << std::endl;
      failures.push_back(document_id + ": " + e.what());
    }
  }

  if (!failures.empty()) {
    std::string message = std::to_string(failures.size()) + " of " + std::to_string(total) +
                          " documents failed";
    for (const auto& failure : failures) {
      message += "; " + failure;
    }
    throw HelpdeskError(message);
  }
  on_progress(1.0f, "Ingested " + std::to_string(total) + " documents.");
}

}  // namespace helpdesk_core
