#include "helpdesk_core/async/task_factory.hpp"

#include <stdexcept>

#include "helpdesk_core/async/ingest_source_task.hpp"

namespace helpdesk_core {
ITaskPtr TaskFactory::create_task(const IngestTaskRecord& record) {
  SourceKind kind;
  try {
    kind = source_kind_from_string(record.source_kind);
  } catch (const std::invalid_argument& e) {
    throw std::runtime_error("Ingest task " + std::to_string(record.id) + ": " + e.what());
  }

  nlohmann::json payload;
  try {
    payload = nlohmann::json::parse(record.payload);
  } catch (const nlohmann::json::parse_error& e) {
    throw std::runtime_error("Ingest task " + std::to_string(record.id) +
                             " has an unreadable payload: " + e.what());
  }

  return std::make_unique<IngestSourceTask>(record.id, record.status, record.created_at,
                                            record.updated_at, record.error_message, kind,
                                            std::move(payload));
}
}  // namespace helpdesk_core
