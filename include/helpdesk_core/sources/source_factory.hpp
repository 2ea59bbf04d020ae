#pragma once

#include <memory>

#include <nlohmann/json.hpp>

#include "helpdesk_core/sources/document_source.hpp"
#include "helpdesk_core/sources/notion_export_reader.hpp"
#include "helpdesk_core/sources/web_crawler.hpp"

namespace helpdesk_core {

// {"url", "max_pages"?, "delay"?, "allowed_paths"?}; unknown keys throw ConfigError.
WebSourceConfig web_source_from_json(const nlohmann::json &entry);
nlohmann::json to_json(const WebSourceConfig &source);

// {"path", "id"?}; unknown keys throw ConfigError.
NotionSourceConfig notion_source_from_json(const nlohmann::json &entry);
nlohmann::json to_json(const NotionSourceConfig &source);

// Builds the source described by a queued ingest payload.
std::unique_ptr<DocumentSource> make_document_source(SourceKind kind, const nlohmann::json &payload);

}  // namespace helpdesk_core
