#include "helpdesk_api/payloads.hpp"

#include "helpdesk_core/errors.hpp"
#include "helpdesk_core/sources/source_factory.hpp"

namespace helpdesk_api {

namespace {

nlohmann::json parse_object(const std::string &body) {
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(body);
  } catch (const nlohmann::json::parse_error &e) {
    throw BadRequest(std::string("Request body is not valid JSON: ") + e.what());
  }
  if (!j.is_object()) {
    throw BadRequest("Request body must be a JSON object");
  }
  return j;
}

std::string required_text(const nlohmann::json &j, const char *key) {
  if (!j.contains(key) || !j[key].is_string()) {
    throw BadRequest(std::string("'") + key + "' must be a string");
  }
  std::string value = j[key].get<std::string>();
  if (value.find_first_not_of(" \t\r\n") == std::string::npos) {
    throw BadRequest(std::string("'") + key + "' must not be empty");
  }
  return value;
}

std::optional<int> optional_top_k(const nlohmann::json &j) {
  if (!j.contains("top_k") || j["top_k"].is_null()) {
    return std::nullopt;
  }
  if (!j["top_k"].is_number_integer()) {
    throw BadRequest("'top_k' must be an integer");
  }
  const int top_k = j["top_k"].get<int>();
  if (top_k < 1 || top_k > kMaxTopK) {
    throw BadRequest("'top_k' must be between 1 and " + std::to_string(kMaxTopK));
  }
  return top_k;
}

}  // namespace

ChatRequest parse_chat_request(const std::string &body) {
  nlohmann::json j = parse_object(body);
  return ChatRequest{required_text(j, "question"), optional_top_k(j)};
}

SearchRequest parse_search_request(const std::string &body) {
  nlohmann::json j = parse_object(body);
  SearchRequest request;
  request.query = required_text(j, j.contains("query") ? "query" : "question");
  request.top_k = optional_top_k(j);
  if (j.contains("min_score") && !j["min_score"].is_null()) {
    if (!j["min_score"].is_number()) {
      throw BadRequest("'min_score' must be a number");
    }
    request.min_score = j["min_score"].get<float>();
  }
  return request;
}

IngestRequest parse_ingest_request(const std::string &body) {
  nlohmann::json j = parse_object(body);
  if (!j.contains("kind") || !j["kind"].is_string()) {
    throw BadRequest("'kind' must be \"web\" or \"notion\"");
  }

  IngestRequest request;
  try {
    request.kind = helpdesk_core::source_kind_from_string(j["kind"].get<std::string>());
  } catch (const std::invalid_argument &) {
    throw BadRequest("'kind' must be \"web\" or \"notion\"");
  }
  j.erase("kind");

  try {
    if (request.kind == helpdesk_core::SourceKind::Web) {
      request.payload = helpdesk_core::to_json(helpdesk_core::web_source_from_json(j));
    } else {
      request.payload = helpdesk_core::to_json(helpdesk_core::notion_source_from_json(j));
    }
  } catch (const helpdesk_core::ConfigError &e) {
    throw BadRequest(e.what());
  }
  return request;
}

nlohmann::json reference_to_json(const helpdesk_core::RetrievalResult &result) {
  const helpdesk_core::Citation citation = helpdesk_core::make_citation(result);
  return nlohmann::json{{"chunk_id", result.chunk.chunk_id},
                        {"document_id", result.chunk.document_id},
                        {"citation", citation.label()},
                        {"score", result.score},
                        {"content", result.chunk.text},
                        {"source", helpdesk_core::to_string(result.document.source_kind)},
                        {"origin", result.document.origin},
                        {"start", result.chunk.start_offset},
                        {"end", result.chunk.end_offset}};
}

nlohmann::json answer_to_json(const helpdesk_core::Answer &answer) {
  nlohmann::json references = nlohmann::json::array();
  for (const auto &result : answer.results) {
    references.push_back(reference_to_json(result));
  }
  return nlohmann::json{
      {"answer", answer.answer}, {"no_context", answer.no_context}, {"references", references}};
}

nlohmann::json task_to_json(const helpdesk_core::IngestTaskRecord &task,
                            const std::optional<helpdesk_core::TaskProgress> &progress) {
  nlohmann::json j;
  j["id"] = task.id;
  j["kind"] = task.source_kind;
  j["status"] = helpdesk_core::to_string(task.status);
  j["priority"] = task.priority;
  j["payload"] = nlohmann::json::parse(task.payload, nullptr, false);
  j["error_message"] =
      task.error_message ? nlohmann::json(*task.error_message) : nlohmann::json(nullptr);
  j["created_at"] = helpdesk_core::format_timestamp(task.created_at);
  j["updated_at"] = helpdesk_core::format_timestamp(task.updated_at);
  if (progress) {
    j["progress"] = {{"percent", progress->progress_percent},
                     {"message", progress->status_message},
                     {"updated_at", progress->updated_at}};
  }
  return j;
}

nlohmann::json stats_to_json(const helpdesk_core::PipelineStats &stats) {
  return nlohmann::json{
      {"records", stats.store.record_count},
      {"documents", stats.store.document_count},
      {"dimension",
       stats.store.dimension ? nlohmann::json(*stats.store.dimension) : nlohmann::json(nullptr)},
      {"embedding_model", stats.store.embedding_model},
      {"indexed_records", stats.indexed_records}};
}

}  // namespace helpdesk_api
