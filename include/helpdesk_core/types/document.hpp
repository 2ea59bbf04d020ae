#pragma once

#include <chrono>
#include <string>

namespace helpdesk_core {

enum class SourceKind { Web, Notion };

std::string to_string(SourceKind kind);
// Throws std::invalid_argument for anything other than "web" or "notion"
SourceKind source_kind_from_string(const std::string& str);

// Metadata that travels with every persisted chunk so results can be cited.
struct DocumentMetadata {
  std::string id;
  SourceKind source_kind = SourceKind::Web;
  std::string origin;
  std::string title;
  std::chrono::system_clock::time_point fetched_at;
  std::string content_hash;

  bool operator==(const DocumentMetadata& other) const = default;
};

struct Document {
  DocumentMetadata metadata;
  std::string text;
};

// ISO-8601 UTC, second precision ("2024-05-01T12:00:00Z")
std::string format_timestamp(const std::chrono::system_clock::time_point& tp);
std::chrono::system_clock::time_point parse_timestamp(const std::string& str);

}  // namespace helpdesk_core
