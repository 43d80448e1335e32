#pragma once

#include <chrono>
#include <string>

#include "askdoc_core/db/database_manager.hpp"
#include "askdoc_core/storage/document_repository.hpp"

namespace askdoc_core {

/**
 * @brief Document repository on an encrypted SQLite database.
 *
 * Chunk text is stored zstd-compressed and embeddings as raw float blobs.
 * Deleting a document cascades to its chunks.
 */
class SqliteDocumentRepository : public DocumentRepository {
 public:
  explicit SqliteDocumentRepository(DatabaseManager &db_manager);

  SqliteDocumentRepository(const SqliteDocumentRepository &) = delete;
  SqliteDocumentRepository &operator=(const SqliteDocumentRepository &) = delete;

  void save(const Document &document, const std::vector<Chunk> &chunks) override;
  bool remove(int document_id) override;

  bool contains(int document_id) const override;
  std::optional<Document> get_document(int document_id) const override;
  std::vector<Document> list_documents() const override;
  std::vector<Chunk> get_chunks(const std::vector<ChunkKey> &keys) const override;

  size_t document_count() const override;
  size_t chunk_count() const override;

  std::vector<StoredDocument> load_all() const override;

  static std::string time_point_to_string(const std::chrono::system_clock::time_point &tp);
  static std::chrono::system_clock::time_point string_to_time_point(const std::string &time_str);

  static std::string pages_to_string(const std::vector<int> &pages);
  static std::vector<int> pages_from_string(const std::string &pages);

 private:
  DatabaseManager &db_manager_;
};

}  // namespace askdoc_core
