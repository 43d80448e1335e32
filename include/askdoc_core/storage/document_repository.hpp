#pragma once

#include <optional>
#include <vector>

#include "askdoc_core/types/chunk.hpp"
#include "askdoc_core/types/document.hpp"

namespace askdoc_core {

// A document with all its chunks, embeddings included.
struct StoredDocument {
  Document document;
  std::vector<Chunk> chunks;
  // False when some stored chunk could not be read back; chunks is empty then.
  bool complete = true;
};

/**
 * @brief Durable record of ingested documents and their chunks.
 *
 * The vector index only holds back-references; chunk text, page metadata and
 * document records live here. Every chunk is saved together with its
 * embedding so the index can be rebuilt from the repository alone.
 */
class DocumentRepository {
 public:
  virtual ~DocumentRepository() = default;

  // Stores a document and its chunks as one unit.
  // @throw DuplicateDocumentError if the id is already stored.
  // @throw DocumentStoreError on storage failure; nothing is stored then.
  virtual void save(const Document &document, const std::vector<Chunk> &chunks) = 0;

  // Deletes the document and its chunks. Returns false for an unknown id.
  virtual bool remove(int document_id) = 0;

  virtual bool contains(int document_id) const = 0;
  virtual std::optional<Document> get_document(int document_id) const = 0;
  // Ordered by document id.
  virtual std::vector<Document> list_documents() const = 0;

  // Chunks for the given keys in the order of the keys, without embeddings.
  // Keys that are not stored are skipped.
  virtual std::vector<Chunk> get_chunks(const std::vector<ChunkKey> &keys) const = 0;

  virtual size_t document_count() const = 0;
  virtual size_t chunk_count() const = 0;

  // Everything, embeddings included. Used to rebuild the vector index.
  // Documents with unreadable chunks come back with complete == false.
  virtual std::vector<StoredDocument> load_all() const = 0;
};

}  // namespace askdoc_core
