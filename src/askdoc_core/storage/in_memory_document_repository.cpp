#include "askdoc_core/storage/in_memory_document_repository.hpp"

#include <string>

#include "askdoc_core/errors.hpp"

namespace askdoc_core {

void InMemoryDocumentRepository::save(const Document &document, const std::vector<Chunk> &chunks) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (documents_.count(document.id) > 0) {
    throw DuplicateDocumentError("Document " + std::to_string(document.id) +
                                 " is already stored");
  }
  documents_.emplace(document.id, StoredDocument{document, chunks});
  chunk_count_ += chunks.size();
}

bool InMemoryDocumentRepository::remove(int document_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = documents_.find(document_id);
  if (it == documents_.end()) {
    return false;
  }
  chunk_count_ -= it->second.chunks.size();
  documents_.erase(it);
  return true;
}

bool InMemoryDocumentRepository::contains(int document_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return documents_.count(document_id) > 0;
}

std::optional<Document> InMemoryDocumentRepository::get_document(int document_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = documents_.find(document_id);
  if (it == documents_.end()) {
    return std::nullopt;
  }
  return it->second.document;
}

std::vector<Document> InMemoryDocumentRepository::list_documents() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Document> documents;
  documents.reserve(documents_.size());
  for (const auto &[id, stored] : documents_) {
    documents.push_back(stored.document);
  }
  return documents;
}

std::vector<Chunk> InMemoryDocumentRepository::get_chunks(const std::vector<ChunkKey> &keys) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Chunk> chunks;
  chunks.reserve(keys.size());
  for (const auto &key : keys) {
    auto it = documents_.find(key.document_id);
    if (it == documents_.end()) {
      continue;
    }
    for (const auto &chunk : it->second.chunks) {
      if (chunk.chunk_index == key.chunk_index) {
        Chunk copy = chunk;
        copy.vector_embedding.clear();
        chunks.push_back(std::move(copy));
        break;
      }
    }
  }
  return chunks;
}

size_t InMemoryDocumentRepository::document_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return documents_.size();
}

size_t InMemoryDocumentRepository::chunk_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return chunk_count_;
}

std::vector<StoredDocument> InMemoryDocumentRepository::load_all() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<StoredDocument> all;
  all.reserve(documents_.size());
  for (const auto &[id, stored] : documents_) {
    all.push_back(stored);
  }
  return all;
}

}  // namespace askdoc_core
