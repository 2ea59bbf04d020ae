#include "helpdesk_core/sources/notion_export_reader.hpp"

#include <fstream>
#include <sstream>

#include "helpdesk_core/errors.hpp"

namespace helpdesk_core {

namespace {

std::string first_heading(const std::string &text) {
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    if (line.rfind("# ", 0) == 0) {
      const auto start = line.find_first_not_of(' ', 2);
      if (start != std::string::npos)
        return line.substr(start);
    }
  }
  return "";
}

}  // namespace

void NotionSourceConfig::validate() const {
  if (path.empty()) {
    throw ConfigError("notion source requires a path");
  }
}

NotionExportReader::NotionExportReader(NotionSourceConfig config) : config_(std::move(config)) {
  config_.validate();
}

std::string NotionExportReader::describe() const {
  return "notion " + config_.path.string();
}

std::vector<Document> NotionExportReader::fetch() {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(config_.path, ec)) {
    throw SourceError("Notion export not found: " + config_.path.string());
  }

  std::ifstream file(config_.path, std::ios::binary);
  if (!file) {
    throw SourceError("Cannot open Notion export: " + config_.path.string());
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    throw SourceError("Failed reading Notion export: " + config_.path.string());
  }

  Document document;
  document.text = buffer.str();
  document.metadata.id = config_.id.empty() ? config_.path.stem().string() : config_.id;
  document.metadata.source_kind = SourceKind::Notion;
  document.metadata.origin = config_.path.string();
  const std::string heading = first_heading(document.text);
  document.metadata.title = heading.empty() ? config_.path.stem().string() : heading;
  document.metadata.fetched_at = std::chrono::system_clock::now();
  return {document};
}

}  // namespace helpdesk_core
