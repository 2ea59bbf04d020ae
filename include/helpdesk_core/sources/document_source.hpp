#pragma once

#include <string>
#include <vector>

#include "helpdesk_core/types/document.hpp"

namespace helpdesk_core {

// Yields raw documents; the pipeline normalizes, hashes and chunks them.
class DocumentSource {
 public:
  virtual ~DocumentSource() = default;

  // Throws SourceError when the source as a whole cannot be read.
  virtual std::vector<Document> fetch() = 0;

  // Short human label for logs, e.g. "web https://example.com".
  virtual std::string describe() const = 0;
};

}  // namespace helpdesk_core
