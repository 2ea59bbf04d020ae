#pragma once

#include <nlohmann/json.hpp>

#include "helpdesk_core/async/ITask.hpp"
#include "helpdesk_core/types/document.hpp"

namespace helpdesk_core {

// Fetches every document of one source and ingests them through the pipeline.
class IngestSourceTask : public ITask {
 public:
  static constexpr const char* kType = "INGEST_SOURCE";

  IngestSourceTask(long long id,
                   TaskStatus status,
                   std::chrono::system_clock::time_point created_at,
                   std::chrono::system_clock::time_point updated_at,
                   std::optional<std::string> error_message,
                   SourceKind source_kind,
                   nlohmann::json payload);

  // Documents that fail are skipped; the task fails afterwards if any did.
  void execute(ServiceProvider& services,
               const ProgressUpdater& on_progress,
               const std::atomic<bool>& cancel) override;
  const char* get_type() const override {
    return kType;
  }

  SourceKind get_source_kind() const {
    return source_kind_;
  }
  const nlohmann::json& get_payload() const {
    return payload_;
  }

 private:
  SourceKind source_kind_;
  nlohmann::json payload_;
};

}  // namespace helpdesk_core
