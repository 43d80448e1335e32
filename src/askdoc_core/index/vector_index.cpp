#include "askdoc_core/index/vector_index.hpp"

#include <faiss/impl/AuxIndexStructures.h>
#include <faiss/impl/IDSelector.h>
#include <faiss/utils/distances.h>

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_set>

#include "askdoc_core/errors.hpp"

namespace askdoc_core {

VectorIndex::VectorIndex(int dimension) : dimension_(0) {
  if (dimension < 0) {
    throw ConfigurationError("Vector index dimension must not be negative");
  }
  if (dimension > 0) {
    create_faiss_index(dimension);
  }
}

VectorIndex::~VectorIndex() = default;

void VectorIndex::create_faiss_index(int dimension) {
  // Flat inner product over normalized vectors gives exact cosine similarity.
  auto base_index = new faiss::IndexFlatIP(dimension);
  faiss_index_ = std::make_unique<faiss::IndexIDMap>(base_index);
  faiss_index_->own_fields = true;
  dimension_ = dimension;
}

void VectorIndex::check_dimension(size_t actual, const std::string &what) const {
  if (actual != static_cast<size_t>(dimension_)) {
    throw DimensionMismatchError(what + " dimension mismatch. Expected " +
                                 std::to_string(dimension_) + ", got " + std::to_string(actual));
  }
}

void VectorIndex::insert(int document_id, const std::vector<VectorEntry> &entries) {
  if (entries.empty()) {
    throw std::invalid_argument("Cannot insert an empty batch for document " +
                                std::to_string(document_id));
  }

  // Validate the batch on its own before touching the index
  const size_t batch_dimension = entries.front().vector.size();
  if (batch_dimension == 0) {
    throw DimensionMismatchError("Vector for document " + std::to_string(document_id) +
                                 " is empty");
  }
  std::unordered_set<int> seen_chunks;
  for (const auto &entry : entries) {
    if (entry.vector.size() != batch_dimension) {
      throw DimensionMismatchError("Vectors for document " + std::to_string(document_id) +
                                   " have mixed dimensions (" + std::to_string(batch_dimension) +
                                   " and " + std::to_string(entry.vector.size()) + ")");
    }
    if (!seen_chunks.insert(entry.chunk_index).second) {
      throw std::invalid_argument("Chunk index " + std::to_string(entry.chunk_index) +
                                  " appears twice for document " + std::to_string(document_id));
    }
  }

  std::vector<float> flat_vectors;
  flat_vectors.reserve(entries.size() * batch_dimension);
  for (const auto &entry : entries) {
    flat_vectors.insert(flat_vectors.end(), entry.vector.begin(), entry.vector.end());
  }
  faiss::fvec_renorm_L2(batch_dimension, entries.size(), flat_vectors.data());

  auto document_guard = document_locks_.lock(document_id);
  std::unique_lock<std::shared_mutex> lock(index_mutex_);

  if (document_labels_.count(document_id) > 0) {
    throw DuplicateDocumentError("Document " + std::to_string(document_id) +
                                 " already has entries in the vector index");
  }
  if (!faiss_index_) {
    create_faiss_index(static_cast<int>(batch_dimension));
  }
  check_dimension(batch_dimension, "Vector");

  std::vector<faiss::idx_t> labels;
  labels.reserve(entries.size());
  for (size_t i = 0; i < entries.size(); ++i) {
    labels.push_back(next_label_ + static_cast<faiss::idx_t>(i));
  }

  faiss_index_->add_with_ids(static_cast<faiss::idx_t>(entries.size()), flat_vectors.data(),
                             labels.data());

  // Only reached once Faiss accepted the batch
  next_label_ += static_cast<faiss::idx_t>(entries.size());
  for (size_t i = 0; i < entries.size(); ++i) {
    label_refs_[labels[i]] = {document_id, entries[i].chunk_index};
  }
  document_labels_[document_id] = std::move(labels);
}

size_t VectorIndex::remove(int document_id) {
  auto document_guard = document_locks_.lock(document_id);
  std::unique_lock<std::shared_mutex> lock(index_mutex_);

  auto it = document_labels_.find(document_id);
  if (it == document_labels_.end()) {
    return 0;
  }

  const std::vector<faiss::idx_t> &labels = it->second;
  faiss::IDSelectorBatch selector(labels.size(), labels.data());
  size_t removed = faiss_index_->remove_ids(selector);
  if (removed != labels.size()) {
    std::cerr << "Warning: Faiss removed " << removed << " vectors for document " << document_id
              << ", expected " << labels.size() << std::endl;
  }

  for (faiss::idx_t label : labels) {
    label_refs_.erase(label);
  }
  size_t count = labels.size();
  document_labels_.erase(it);
  return count;
}

std::vector<IndexHit> VectorIndex::search(const std::vector<float> &query_vector,
                                          int k,
                                          std::optional<int> document_id_filter) const {
  if (k < 0) {
    throw ConfigurationError("k must not be negative, got " + std::to_string(k));
  }

  std::shared_lock<std::shared_mutex> lock(index_mutex_);

  if (label_refs_.empty()) {
    throw EmptyIndexError("Vector index is empty. Cannot perform search.");
  }
  check_dimension(query_vector.size(), "Query vector");
  if (k == 0) {
    return {};
  }

  size_t eligible = label_refs_.size();
  std::unique_ptr<faiss::IDSelectorBatch> selector;
  faiss::SearchParameters params;
  if (document_id_filter.has_value()) {
    auto it = document_labels_.find(*document_id_filter);
    if (it == document_labels_.end()) {
      return {};
    }
    selector = std::make_unique<faiss::IDSelectorBatch>(it->second.size(), it->second.data());
    params.sel = selector.get();
    eligible = it->second.size();
  }
  const faiss::SearchParameters *search_params = selector ? &params : nullptr;

  std::vector<float> query(query_vector);
  faiss::fvec_renorm_L2(static_cast<size_t>(dimension_), 1, query.data());

  const faiss::idx_t fetch = std::min<faiss::idx_t>(k, static_cast<faiss::idx_t>(eligible));
  std::vector<float> scores(fetch);
  std::vector<faiss::idx_t> labels(fetch);
  faiss_index_->search(1, query.data(), fetch, scores.data(), labels.data(), search_params);

  std::unordered_map<faiss::idx_t, float> candidates;
  for (faiss::idx_t i = 0; i < fetch; ++i) {
    if (labels[i] != -1) {
      candidates.emplace(labels[i], scores[i]);
    }
  }

  // Faiss cuts ties at the k-th score arbitrarily. Pull in every entry that
  // scores at least as high as the weakest hit so the tie-break below decides.
  if (static_cast<size_t>(fetch) < eligible && labels[fetch - 1] != -1) {
    const float cutoff = scores[fetch - 1];
    faiss::RangeSearchResult ties(1);
    faiss_index_->range_search(1, query.data(),
                               std::nextafter(cutoff, -std::numeric_limits<float>::infinity()),
                               &ties, search_params);
    for (size_t j = ties.lims[0]; j < ties.lims[1]; ++j) {
      candidates.emplace(ties.labels[j], ties.distances[j]);
    }
  }

  std::vector<IndexHit> hits;
  hits.reserve(candidates.size());
  for (const auto &[label, score] : candidates) {
    auto ref = label_refs_.find(label);
    if (ref == label_refs_.end()) {
      std::cerr << "Warning: Faiss returned label " << label
                << " but no corresponding entry is registered." << std::endl;
      continue;
    }
    hits.push_back({ref->second.document_id, ref->second.chunk_index, score});
  }

  std::sort(hits.begin(), hits.end(), [](const IndexHit &a, const IndexHit &b) {
    if (a.score != b.score) {
      return a.score > b.score;
    }
    if (a.chunk_index != b.chunk_index) {
      return a.chunk_index < b.chunk_index;
    }
    return a.document_id < b.document_id;
  });
  if (hits.size() > static_cast<size_t>(k)) {
    hits.resize(k);
  }
  return hits;
}

bool VectorIndex::contains(int document_id) const {
  std::shared_lock<std::shared_mutex> lock(index_mutex_);
  return document_labels_.count(document_id) > 0;
}

size_t VectorIndex::size() const {
  std::shared_lock<std::shared_mutex> lock(index_mutex_);
  return label_refs_.size();
}

size_t VectorIndex::document_count() const {
  std::shared_lock<std::shared_mutex> lock(index_mutex_);
  return document_labels_.size();
}

int VectorIndex::dimension() const {
  std::shared_lock<std::shared_mutex> lock(index_mutex_);
  return dimension_;
}

IndexStats VectorIndex::stats() const {
  std::shared_lock<std::shared_mutex> lock(index_mutex_);
  IndexStats stats;
  stats.document_count = document_labels_.size();
  stats.entry_count = label_refs_.size();
  stats.dimension = dimension_;
  stats.memory_bytes = label_refs_.size() * static_cast<size_t>(dimension_) * sizeof(float);
  return stats;
}

}  // namespace askdoc_core
