#include "helpdesk_core/chunking/chunker.hpp"

#include <utf8.h>

#include <algorithm>
#include <iomanip>
#include <sstream>

#include "helpdesk_core/errors.hpp"

namespace helpdesk_core {

namespace {

// Byte offset of every code point plus a trailing entry for text.size().
std::vector<size_t> code_point_boundaries(const std::string& text) {
  std::vector<size_t> boundaries;
  boundaries.reserve(text.size() + 1);
  try {
    for (auto it = text.begin(); it != text.end(); utf8::next(it, text.end())) {
      boundaries.push_back(static_cast<size_t>(it - text.begin()));
    }
  } catch (const utf8::exception& e) {
    throw ChunkingError("Text is not valid UTF-8: " + std::string(e.what()));
  }
  boundaries.push_back(text.size());
  return boundaries;
}

size_t count_digits(size_t value) {
  size_t digits = 1;
  while (value >= 10) {
    value /= 10;
    ++digits;
  }
  return digits;
}

}  // namespace

void ChunkingOptions::validate() const {
  if (chunk_size <= 0) {
    throw ConfigError("chunk_size must be greater than 0, got " + std::to_string(chunk_size));
  }
  if (chunk_overlap < 0) {
    throw ConfigError("chunk_overlap cannot be negative, got " + std::to_string(chunk_overlap));
  }
  if (chunk_overlap >= chunk_size) {
    throw ConfigError("chunk_overlap (" + std::to_string(chunk_overlap) +
                      ") must be smaller than chunk_size (" + std::to_string(chunk_size) + ")");
  }
}

Chunker::Chunker(ChunkingOptions options) : options_(options) {
  options_.validate();
}

std::vector<Chunk> Chunker::chunk(const std::string& text, const std::string& document_id) const {
  return chunk(text, options_.chunk_size, options_.chunk_overlap, document_id);
}

std::vector<Chunk> Chunker::chunk(const std::string& text,
                                  int chunk_size,
                                  int chunk_overlap,
                                  const std::string& document_id) {
  ChunkingOptions{chunk_size, chunk_overlap}.validate();

  std::vector<Chunk> chunks;
  if (text.empty())
    return chunks;

  const std::vector<size_t> boundaries = code_point_boundaries(text);
  const size_t length = boundaries.size() - 1;
  const size_t window = static_cast<size_t>(chunk_size);
  const size_t stride = static_cast<size_t>(chunk_size - chunk_overlap);

  size_t start = 0;
  size_t previous_end = 0;
  while (true) {
    const size_t end = std::min(length, start + window);

    Chunk chunk;
    chunk.document_id = document_id;
    chunk.chunk_index = static_cast<int>(chunks.size());
    chunk.start_offset = start;
    chunk.end_offset = end;
    chunk.overlap_with_previous = chunks.empty() ? 0 : previous_end - start;
    chunk.text = text.substr(boundaries[start], boundaries[end] - boundaries[start]);
    chunks.push_back(std::move(chunk));

    if (end == length)
      break;
    previous_end = end;
    start += stride;
  }

  for (auto& chunk : chunks) {
    chunk.chunk_id = make_chunk_id(document_id, chunk.chunk_index + 1, chunks.size());
  }
  return chunks;
}

std::string Chunker::make_chunk_id(const std::string& document_id, int index, size_t total) {
  const size_t width = std::max<size_t>(4, count_digits(total));
  std::ostringstream ss;
  ss << document_id << "-" << std::setw(static_cast<int>(width)) << std::setfill('0') << index;
  return ss.str();
}

}  // namespace helpdesk_core
