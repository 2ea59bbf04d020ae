#pragma once

#include <string>
#include <vector>

#include "helpdesk_core/types/store_record.hpp"

namespace helpdesk_core {

class EmbeddingProvider {
 public:
  virtual ~EmbeddingProvider() = default;

  // One vector per input text, in input order, all of one dimension.
  // Throws ProviderError on any failure.
  virtual std::vector<EmbeddingVector> embed(const std::vector<std::string> &texts) = 0;

  virtual std::string model_name() const = 0;
};

}  // namespace helpdesk_core
