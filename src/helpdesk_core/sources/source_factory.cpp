#include "helpdesk_core/sources/source_factory.hpp"

#include <set>

#include "helpdesk_core/errors.hpp"

namespace helpdesk_core {

namespace {

void reject_unknown_keys(const nlohmann::json &object,
                         const std::set<std::string> &known,
                         const std::string &where) {
  for (const auto &item : object.items()) {
    if (known.count(item.key()) == 0) {
      throw ConfigError("Unknown key '" + item.key() + "' in " + where);
    }
  }
}

}  // namespace

WebSourceConfig web_source_from_json(const nlohmann::json &entry) {
  if (!entry.is_object()) {
    throw ConfigError("Each web source must be an object");
  }
  reject_unknown_keys(entry, {"url", "max_pages", "delay", "allowed_paths"}, "web source");
  if (!entry.contains("url")) {
    throw ConfigError("web source requires a url");
  }

  WebSourceConfig source;
  try {
    source.url = entry.at("url").get<std::string>();
    source.max_pages = entry.value("max_pages", source.max_pages);
    source.delay_seconds = entry.value("delay", source.delay_seconds);
    source.allowed_paths = entry.value("allowed_paths", source.allowed_paths);
  } catch (const nlohmann::json::exception &e) {
    throw ConfigError(std::string("Invalid web source: ") + e.what());
  }
  source.validate();
  return source;
}

nlohmann::json to_json(const WebSourceConfig &source) {
  return nlohmann::json{{"url", source.url},
                        {"max_pages", source.max_pages},
                        {"delay", source.delay_seconds},
                        {"allowed_paths", source.allowed_paths}};
}

NotionSourceConfig notion_source_from_json(const nlohmann::json &entry) {
  if (!entry.is_object()) {
    throw ConfigError("Each notion source must be an object");
  }
  reject_unknown_keys(entry, {"path", "id"}, "notion source");
  if (!entry.contains("path")) {
    throw ConfigError("notion source requires a path");
  }

  NotionSourceConfig source;
  try {
    source.path = entry.at("path").get<std::string>();
    source.id = entry.value("id", source.id);
  } catch (const nlohmann::json::exception &e) {
    throw ConfigError(std::string("Invalid notion source: ") + e.what());
  }
  source.validate();
  return source;
}

nlohmann::json to_json(const NotionSourceConfig &source) {
  nlohmann::json j{{"path", source.path.string()}};
  if (!source.id.empty()) {
    j["id"] = source.id;
  }
  return j;
}

std::unique_ptr<DocumentSource> make_document_source(SourceKind kind, const nlohmann::json &payload) {
  switch (kind) {
    case SourceKind::Web:
      return std::make_unique<WebCrawler>(web_source_from_json(payload));
    case SourceKind::Notion:
      return std::make_unique<NotionExportReader>(notion_source_from_json(payload));
  }
  throw ConfigError("Unsupported source kind");
}

}  // namespace helpdesk_core
