#pragma once

#include <cstdint>
#include <vector>

#include "helpdesk_core/types/chunk.hpp"
#include "helpdesk_core/types/document.hpp"

namespace helpdesk_core {

using EmbeddingVector = std::vector<float>;

struct StoreRecord {
  uint64_t sequence = 0;
  Chunk chunk;
  EmbeddingVector vector;
  DocumentMetadata document;

  bool operator==(const StoreRecord& other) const = default;
};

}  // namespace helpdesk_core
