#pragma once

#include <map>
#include <mutex>

#include "askdoc_core/storage/document_repository.hpp"

namespace askdoc_core {

class InMemoryDocumentRepository : public DocumentRepository {
 public:
  void save(const Document &document, const std::vector<Chunk> &chunks) override;
  bool remove(int document_id) override;

  bool contains(int document_id) const override;
  std::optional<Document> get_document(int document_id) const override;
  std::vector<Document> list_documents() const override;
  std::vector<Chunk> get_chunks(const std::vector<ChunkKey> &keys) const override;

  size_t document_count() const override;
  size_t chunk_count() const override;

  std::vector<StoredDocument> load_all() const override;

 private:
  mutable std::mutex mutex_;
  std::map<int, StoredDocument> documents_;
  size_t chunk_count_ = 0;
};

}  // namespace askdoc_core
