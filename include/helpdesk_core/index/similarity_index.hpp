#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "helpdesk_core/types/retrieval_result.hpp"
#include "helpdesk_core/types/store_record.hpp"

namespace helpdesk_core {

/**
 * @class SimilarityIndex
 * @brief Exact cosine top-k over every stored vector.
 *
 * Vectors are copied into one contiguous row-major matrix with their L2 norms
 * precomputed, and every query scores all rows. An index is immutable once built;
 * callers swap in a new one after the store changes.
 */
class SimilarityIndex {
 public:
  SimilarityIndex() = default;

  // Throws DimensionMismatch when the records do not share one dimension.
  static SimilarityIndex build(const std::vector<StoreRecord> &records);

  // A copy without the document's rows, plus the given records. Only the new rows
  // have their norms computed. Throws DimensionMismatch like build().
  SimilarityIndex with_document(const std::string &document_id,
                                const std::vector<StoreRecord> &records) const;

  // Results scoring below min_score are dropped. Ordered by score descending, then by
  // ascending store sequence. A zero vector on either side scores 0.
  std::vector<RetrievalResult> search(const EmbeddingVector &query,
                                      int k,
                                      float min_score = 0.0f) const;

  size_t size() const {
    return rows_.size();
  }
  bool empty() const {
    return rows_.empty();
  }
  size_t dimension() const {
    return dimension_;
  }

 private:
  struct Row {
    Chunk chunk;
    DocumentMetadata document;
    uint64_t sequence = 0;
  };

  size_t dimension_ = 0;
  std::vector<float> matrix_;
  std::vector<float> norms_;
  std::vector<Row> rows_;
};

}  // namespace helpdesk_core
