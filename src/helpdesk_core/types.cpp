#include "helpdesk_core/types.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace helpdesk_core {

std::string to_string(SourceKind kind) {
  switch (kind) {
    case SourceKind::Web:
      return "web";
    case SourceKind::Notion:
      return "notion";
    default:
      return "unknown";
  }
}

SourceKind source_kind_from_string(const std::string& str) {
  if (str == "web")
    return SourceKind::Web;
  if (str == "notion")
    return SourceKind::Notion;
  throw std::invalid_argument("Unknown source kind: " + str);
}

std::string format_timestamp(const std::chrono::system_clock::time_point& tp) {
  auto time_t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm_struct = {};
  gmtime_r(&time_t, &tm_struct);
  std::stringstream ss;
  ss << std::put_time(&tm_struct, "%Y-%m-%dT%H:%M:%SZ");
  return ss.str();
}

std::chrono::system_clock::time_point parse_timestamp(const std::string& str) {
  std::tm tm_struct = {};
  std::stringstream ss(str);
  ss >> std::get_time(&tm_struct, "%Y-%m-%dT%H:%M:%SZ");
  if (ss.fail()) {
    throw std::invalid_argument("Failed to parse timestamp: " + str +
                                ". Expected format YYYY-MM-DDTHH:MM:SSZ.");
  }
  // Stored as UTC.
  return std::chrono::system_clock::from_time_t(timegm(&tm_struct));
}

std::string Citation::label() const {
  if (!title.empty())
    return title;
  if (!origin.empty())
    return origin;
  return chunk_id;
}

Citation make_citation(const RetrievalResult& result) {
  Citation citation;
  citation.chunk_id = result.chunk.chunk_id;
  citation.document_id = result.chunk.document_id;
  citation.origin = result.document.origin;
  citation.title = result.document.title;
  citation.source_kind = result.document.source_kind;
  citation.start_offset = result.chunk.start_offset;
  citation.end_offset = result.chunk.end_offset;
  citation.score = result.score;
  return citation;
}

}  // namespace helpdesk_core
