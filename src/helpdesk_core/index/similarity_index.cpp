#include "helpdesk_core/index/similarity_index.hpp"

#include <faiss/utils/distances.h>

#include <algorithm>

#include "helpdesk_core/errors.hpp"

namespace helpdesk_core {

SimilarityIndex SimilarityIndex::build(const std::vector<StoreRecord> &records) {
  SimilarityIndex index;
  if (records.empty()) {
    return index;
  }

  index.dimension_ = records.front().vector.size();
  index.matrix_.reserve(records.size() * index.dimension_);
  index.rows_.reserve(records.size());
  for (const auto &record : records) {
    if (record.vector.size() != index.dimension_) {
      throw DimensionMismatch("index build at " + record.chunk.chunk_id, index.dimension_,
                              record.vector.size());
    }
    index.matrix_.insert(index.matrix_.end(), record.vector.begin(), record.vector.end());
    index.rows_.push_back(Row{record.chunk, record.document, record.sequence});
  }

  index.norms_.resize(index.rows_.size());
  faiss::fvec_norms_L2(index.norms_.data(), index.matrix_.data(), index.dimension_,
                       index.rows_.size());
  return index;
}

SimilarityIndex SimilarityIndex::with_document(const std::string &document_id,
                                               const std::vector<StoreRecord> &records) const {
  SimilarityIndex next;
  next.rows_.reserve(rows_.size() + records.size());
  next.matrix_.reserve(matrix_.size() + records.size() * dimension_);
  next.norms_.reserve(rows_.size() + records.size());
  for (size_t i = 0; i < rows_.size(); ++i) {
    if (rows_[i].chunk.document_id == document_id) {
      continue;
    }
    const auto row_begin = matrix_.begin() + static_cast<std::ptrdiff_t>(i * dimension_);
    next.matrix_.insert(next.matrix_.end(), row_begin,
                        row_begin + static_cast<std::ptrdiff_t>(dimension_));
    next.norms_.push_back(norms_[i]);
    next.rows_.push_back(rows_[i]);
  }

  next.dimension_ = next.rows_.empty() ? 0 : dimension_;
  if (next.dimension_ == 0 && !records.empty()) {
    next.dimension_ = records.front().vector.size();
  }

  const size_t first_new = next.rows_.size();
  for (const auto &record : records) {
    if (record.vector.size() != next.dimension_) {
      throw DimensionMismatch("index update at " + record.chunk.chunk_id, next.dimension_,
                              record.vector.size());
    }
    next.matrix_.insert(next.matrix_.end(), record.vector.begin(), record.vector.end());
    next.rows_.push_back(Row{record.chunk, record.document, record.sequence});
  }

  next.norms_.resize(next.rows_.size());
  if (next.rows_.size() > first_new) {
    faiss::fvec_norms_L2(next.norms_.data() + first_new,
                         next.matrix_.data() + first_new * next.dimension_, next.dimension_,
                         next.rows_.size() - first_new);
  }
  return next;
}

std::vector<RetrievalResult> SimilarityIndex::search(const EmbeddingVector &query,
                                                     int k,
                                                     float min_score) const {
  std::vector<RetrievalResult> results;
  if (k <= 0 || rows_.empty()) {
    return results;
  }
  if (query.size() != dimension_) {
    throw DimensionMismatch("search query", dimension_, query.size());
  }

  float query_norm = 0.0f;
  faiss::fvec_norms_L2(&query_norm, query.data(), dimension_, 1);

  std::vector<float> inner_products(rows_.size());
  faiss::fvec_inner_products_ny(inner_products.data(), query.data(), matrix_.data(), dimension_,
                                rows_.size());

  struct Scored {
    float score;
    size_t row;
  };
  std::vector<Scored> candidates;
  candidates.reserve(rows_.size());
  for (size_t i = 0; i < rows_.size(); ++i) {
    float score = 0.0f;
    if (query_norm > 0.0f && norms_[i] > 0.0f) {
      score = std::clamp(inner_products[i] / (query_norm * norms_[i]), -1.0f, 1.0f);
    }
    if (score >= min_score) {
      candidates.push_back({score, i});
    }
  }

  auto better = [this](const Scored &a, const Scored &b) {
    if (a.score != b.score)
      return a.score > b.score;
    return rows_[a.row].sequence < rows_[b.row].sequence;
  };
  const size_t limit = std::min(candidates.size(), static_cast<size_t>(k));
  std::partial_sort(candidates.begin(), candidates.begin() + limit, candidates.end(), better);

  results.reserve(limit);
  for (size_t i = 0; i < limit; ++i) {
    const Row &row = rows_[candidates[i].row];
    results.push_back(RetrievalResult{row.chunk, candidates[i].score, row.document, row.sequence});
  }
  return results;
}

}  // namespace helpdesk_core
