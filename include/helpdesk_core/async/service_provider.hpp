#pragma once

#include <functional>
#include <memory>

#include <nlohmann/json.hpp>

#include "helpdesk_core/sources/document_source.hpp"
#include "helpdesk_core/types/document.hpp"

namespace helpdesk_core {
class RetrievalPipeline;
class TaskQueueRepo;
}

namespace helpdesk_core {

using SourceFactory =
    std::function<std::unique_ptr<DocumentSource>(SourceKind, const nlohmann::json&)>;

class ServiceProvider {
 public:
  ServiceProvider(std::shared_ptr<RetrievalPipeline> pipeline,
                  std::shared_ptr<TaskQueueRepo> repo,
                  SourceFactory source_factory)
      : pipeline_(std::move(pipeline)),
        task_repo_(std::move(repo)),
        source_factory_(std::move(source_factory)) {}

  RetrievalPipeline& get_pipeline() {
    return *pipeline_;
  }
  TaskQueueRepo& get_task_queue_repo() {
    return *task_repo_;
  }
  std::unique_ptr<DocumentSource> create_source(SourceKind kind, const nlohmann::json& payload) {
    return source_factory_(kind, payload);
  }

 private:
  std::shared_ptr<RetrievalPipeline> pipeline_;
  std::shared_ptr<TaskQueueRepo> task_repo_;
  SourceFactory source_factory_;
};

}  // namespace helpdesk_core
