#pragma once

#include <string>
#include <vector>

#include "helpdesk_core/types/chunk.hpp"

namespace helpdesk_core {

struct ChunkingOptions {
  int chunk_size = 500;
  int chunk_overlap = 100;

  // Throws ConfigError unless chunk_size > 0 and 0 <= chunk_overlap < chunk_size.
  void validate() const;
};

/**
 * @class Chunker
 * @brief Splits normalized text into overlapping fixed-size windows.
 *
 * Windows are measured in characters (UTF-8 code points), so a window never cuts a
 * multi-byte sequence. The window advances by chunk_size - chunk_overlap; the last
 * window may be shorter but is never empty, and chunking stops as soon as a window
 * reaches the end of the text. Offsets recorded on each chunk map it exactly back to
 * the source text.
 */
class Chunker {
 public:
  explicit Chunker(ChunkingOptions options);

  std::vector<Chunk> chunk(const std::string& text, const std::string& document_id) const;

  static std::vector<Chunk> chunk(const std::string& text,
                                  int chunk_size,
                                  int chunk_overlap,
                                  const std::string& document_id);

  // "<document_id>-0001"; indices are 1-based and padded to max(4, digits(total)).
  static std::string make_chunk_id(const std::string& document_id, int index, size_t total);

  const ChunkingOptions& options() const {
    return options_;
  }

 private:
  ChunkingOptions options_;
};

}  // namespace helpdesk_core
