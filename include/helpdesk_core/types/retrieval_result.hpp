#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "helpdesk_core/types/chunk.hpp"
#include "helpdesk_core/types/document.hpp"

namespace helpdesk_core {

struct RetrievalResult {
  Chunk chunk;
  float score = 0.0f;
  DocumentMetadata document;
  uint64_t sequence = 0;
};

struct Citation {
  std::string chunk_id;
  std::string document_id;
  std::string origin;
  std::string title;
  SourceKind source_kind = SourceKind::Web;
  size_t start_offset = 0;
  size_t end_offset = 0;
  float score = 0.0f;

  // Title when known, else origin, else the chunk id.
  std::string label() const;
};

Citation make_citation(const RetrievalResult& result);

}  // namespace helpdesk_core
