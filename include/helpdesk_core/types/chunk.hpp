#pragma once

#include <cstddef>
#include <string>

namespace helpdesk_core {

struct Chunk {
  std::string chunk_id;
  std::string document_id;
  int chunk_index = 0;
  std::string text;
  // Offsets count characters (code points) of the normalized document text.
  size_t start_offset = 0;
  size_t end_offset = 0;
  size_t overlap_with_previous = 0;

  bool operator==(const Chunk& other) const = default;
};

}  // namespace helpdesk_core
