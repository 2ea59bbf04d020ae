#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "helpdesk_core/db/task.hpp"
#include "helpdesk_core/services/retrieval_pipeline.hpp"

namespace helpdesk_api {

// A request body the API refuses with 400.
class BadRequest : public std::exception {
 public:
  explicit BadRequest(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

constexpr int kMaxTopK = 20;

struct ChatRequest {
  std::string question;
  std::optional<int> top_k;
};

struct SearchRequest {
  std::string query;
  std::optional<int> top_k;
  std::optional<float> min_score;
};

struct IngestRequest {
  helpdesk_core::SourceKind kind = helpdesk_core::SourceKind::Web;
  // Validated source configuration, stored as the task payload
  nlohmann::json payload;
};

ChatRequest parse_chat_request(const std::string &body);
SearchRequest parse_search_request(const std::string &body);
IngestRequest parse_ingest_request(const std::string &body);

nlohmann::json reference_to_json(const helpdesk_core::RetrievalResult &result);
nlohmann::json answer_to_json(const helpdesk_core::Answer &answer);
nlohmann::json task_to_json(const helpdesk_core::IngestTaskRecord &task,
                            const std::optional<helpdesk_core::TaskProgress> &progress);
nlohmann::json stats_to_json(const helpdesk_core::PipelineStats &stats);

}  // namespace helpdesk_api
