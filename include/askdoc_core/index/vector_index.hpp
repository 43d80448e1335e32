#pragma once

#include <faiss/IndexFlat.h>
#include <faiss/IndexIDMap.h>

#include <memory>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include "askdoc_core/index/document_lock_table.hpp"
#include "askdoc_core/types/chunk.hpp"

namespace askdoc_core {

// One vector per chunk. The owning document id is given to insert().
struct VectorEntry {
  int chunk_index = 0;
  std::vector<float> vector;
};

struct IndexHit {
  int document_id = 0;
  int chunk_index = 0;
  float score = 0.0f;  // cosine similarity in [-1, 1]

  ChunkKey key() const {
    return {document_id, chunk_index};
  }
};

struct IndexStats {
  size_t document_count = 0;
  size_t entry_count = 0;
  int dimension = 0;
  size_t memory_bytes = 0;
};

/**
 * @brief In-memory cosine similarity index over chunk embeddings.
 *
 * Vectors are L2-normalized on the way in and stored in a flat inner-product
 * Faiss index, so the inner product of two stored vectors is their cosine
 * similarity. Every stored vector carries a weak (document id, chunk index)
 * back-reference and nothing else.
 *
 * Thread safety: insert() and remove() for the same document id are
 * serialized. The Faiss index itself is guarded by a reader/writer lock so
 * searches run concurrently with each other and only wait for the short
 * critical section of a mutation.
 */
class VectorIndex {
 public:
  static constexpr const char *SIMILARITY_METRIC = "cosine";

  // dimension == 0 lets the first insert establish the dimensionality.
  explicit VectorIndex(int dimension = 0);
  virtual ~VectorIndex();

  VectorIndex(const VectorIndex &) = delete;
  VectorIndex &operator=(const VectorIndex &) = delete;
  VectorIndex(VectorIndex &&) = delete;
  VectorIndex &operator=(VectorIndex &&) = delete;

  /**
   * @brief Adds all entries of a document in one step.
   * @throw DuplicateDocumentError if the document already has entries.
   * @throw DimensionMismatchError if any vector has the wrong length.
   * @throw std::invalid_argument on an empty batch or a repeated chunk index.
   */
  void insert(int document_id, const std::vector<VectorEntry> &entries);

  // Removes every entry of the document. Returns how many were removed;
  // 0 for an unknown document.
  virtual size_t remove(int document_id);

  /**
   * @brief Top-k entries by cosine similarity.
   *
   * Ordered by descending score; equal scores by ascending chunk index, then
   * ascending document id.
   *
   * @throw EmptyIndexError when the index holds no entries at all.
   * @throw DimensionMismatchError when the query has the wrong length.
   * @throw ConfigurationError when k is negative.
   */
  std::vector<IndexHit> search(const std::vector<float> &query_vector,
                               int k,
                               std::optional<int> document_id_filter = std::nullopt) const;

  bool contains(int document_id) const;
  size_t size() const;
  size_t document_count() const;
  int dimension() const;
  IndexStats stats() const;

 private:
  struct EntryRef {
    int document_id;
    int chunk_index;
  };

  void create_faiss_index(int dimension);
  void check_dimension(size_t actual, const std::string &what) const;

  mutable std::shared_mutex index_mutex_;
  DocumentLockTable document_locks_;

  std::unique_ptr<faiss::IndexIDMap> faiss_index_;
  int dimension_;
  faiss::idx_t next_label_ = 0;
  std::unordered_map<int, std::vector<faiss::idx_t>> document_labels_;
  std::unordered_map<faiss::idx_t, EntryRef> label_refs_;
};

}  // namespace askdoc_core
