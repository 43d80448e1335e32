#include "askdoc_core/storage/sqlite_document_repository.hpp"

#include <cstdint>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>

#include "askdoc_core/db/pooled_connection.hpp"
#include "askdoc_core/db/sqlite_error_utils.hpp"
#include "askdoc_core/db/transaction.hpp"
#include "askdoc_core/errors.hpp"
#include "askdoc_core/services/compression_service.hpp"

namespace askdoc_core {

namespace {

const char *const DOCUMENT_COLUMNS =
    "SELECT id, title, chunk_count, token_count, page_count, content_hash, created_at "
    "FROM documents";

Document make_document(int id,
                       std::string title,
                       int64_t chunk_count,
                       int64_t token_count,
                       int page_count,
                       std::string content_hash,
                       const std::string &created_at) {
  Document document;
  document.id = id;
  document.title = std::move(title);
  document.chunk_count = static_cast<size_t>(chunk_count);
  document.token_count = static_cast<size_t>(token_count);
  document.page_count = page_count;
  document.content_hash = std::move(content_hash);
  document.created_at = SqliteDocumentRepository::string_to_time_point(created_at);
  return document;
}

std::vector<char> vector_to_blob(const std::vector<float> &vector) {
  std::vector<char> blob(vector.size() * sizeof(float));
  if (!blob.empty()) {
    std::memcpy(blob.data(), vector.data(), blob.size());
  }
  return blob;
}

std::vector<float> blob_to_vector(const std::vector<char> &blob) {
  if (blob.size() % sizeof(float) != 0) {
    throw DocumentStoreError("Stored vector blob has " + std::to_string(blob.size()) +
                             " bytes, not a whole number of floats");
  }
  std::vector<float> vector(blob.size() / sizeof(float));
  if (!blob.empty()) {
    std::memcpy(vector.data(), blob.data(), blob.size());
  }
  return vector;
}

std::string int_vector_to_comma_string(const std::vector<int> &values) {
  std::string out;
  for (size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out += ",";
    }
    out += std::to_string(values[i]);
  }
  return out;
}

}  // namespace

std::string SqliteDocumentRepository::time_point_to_string(
    const std::chrono::system_clock::time_point &tp) {
  auto time_t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm_struct = {};
  gmtime_r(&time_t, &tm_struct);
  std::stringstream ss;
  ss << std::put_time(&tm_struct, "%Y-%m-%d %H:%M:%S");
  return ss.str();
}

std::chrono::system_clock::time_point SqliteDocumentRepository::string_to_time_point(
    const std::string &time_str) {
  std::tm tm_struct = {};
  std::stringstream ss(time_str);
  ss >> std::get_time(&tm_struct, "%Y-%m-%d %H:%M:%S");
  if (ss.fail()) {
    throw DocumentStoreError("Failed to parse time string: " + time_str +
                             ". Expected format YYYY-MM-DD HH:MM:SS.");
  }
  // Stored as UTC
  return std::chrono::system_clock::from_time_t(timegm(&tm_struct));
}

std::string SqliteDocumentRepository::pages_to_string(const std::vector<int> &pages) {
  return int_vector_to_comma_string(pages);
}

std::vector<int> SqliteDocumentRepository::pages_from_string(const std::string &pages) {
  std::vector<int> out;
  std::stringstream ss(pages);
  std::string item;
  while (std::getline(ss, item, ',')) {
    if (item.empty()) {
      continue;
    }
    try {
      out.push_back(std::stoi(item));
    } catch (const std::logic_error &) {
      throw DocumentStoreError("Invalid page list in database: '" + pages + "'");
    }
  }
  return out;
}

SqliteDocumentRepository::SqliteDocumentRepository(DatabaseManager &db_manager)
    : db_manager_(db_manager) {}

void SqliteDocumentRepository::save(const Document &document, const std::vector<Chunk> &chunks) {
  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, TransactionMode::Immediate);

    bool exists = false;
    *conn << "SELECT 1 FROM documents WHERE id = ? LIMIT 1" << document.id >>
        [&](int /*dummy*/) { exists = true; };
    if (exists) {
      throw DuplicateDocumentError("Document " + std::to_string(document.id) +
                                   " is already stored");
    }

    *conn << "INSERT INTO documents (id, title, chunk_count, token_count, page_count, "
             "content_hash, created_at) VALUES (?, ?, ?, ?, ?, ?, ?)"
          << document.id << document.title << static_cast<int64_t>(document.chunk_count)
          << static_cast<int64_t>(document.token_count) << document.page_count
          << document.content_hash << time_point_to_string(document.created_at);

    for (const auto &chunk : chunks) {
      *conn << "INSERT INTO chunks (document_id, chunk_index, content, token_count, "
               "page_numbers, vector_blob) VALUES (?, ?, ?, ?, ?, ?)"
            << document.id << chunk.chunk_index << CompressionService::compress(chunk.content)
            << static_cast<int64_t>(chunk.token_count) << pages_to_string(chunk.page_numbers)
            << vector_to_blob(chunk.vector_embedding);
    }
    tx.commit();
  } catch (const sqlite::sqlite_exception &e) {
    throw DocumentStoreError(format_db_error("save_document", e));
  }
}

bool SqliteDocumentRepository::remove(int document_id) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "DELETE FROM documents WHERE id = ?" << document_id;
    return conn->rows_modified() > 0;
  } catch (const sqlite::sqlite_exception &e) {
    throw DocumentStoreError(format_db_error("remove_document", e));
  }
}

bool SqliteDocumentRepository::contains(int document_id) const {
  try {
    bool exists = false;
    PooledConnection conn(db_manager_);
    *conn << "SELECT 1 FROM documents WHERE id = ? LIMIT 1" << document_id >>
        [&](int /*dummy*/) { exists = true; };
    return exists;
  } catch (const sqlite::sqlite_exception &e) {
    throw DocumentStoreError(format_db_error("contains_document", e));
  }
}

std::optional<Document> SqliteDocumentRepository::get_document(int document_id) const {
  try {
    std::optional<Document> result;
    PooledConnection conn(db_manager_);
    *conn << std::string(DOCUMENT_COLUMNS) + " WHERE id = ?" << document_id >>
        [&](int id, std::string title, int64_t chunk_count, int64_t token_count, int page_count,
            std::string content_hash, std::string created_at) {
          result = make_document(id, std::move(title), chunk_count, token_count, page_count,
                                 std::move(content_hash), created_at);
        };
    return result;
  } catch (const sqlite::sqlite_exception &e) {
    throw DocumentStoreError(format_db_error("get_document", e));
  }
}

std::vector<Document> SqliteDocumentRepository::list_documents() const {
  try {
    std::vector<Document> documents;
    PooledConnection conn(db_manager_);
    *conn << std::string(DOCUMENT_COLUMNS) + " ORDER BY id" >>
        [&](int id, std::string title, int64_t chunk_count, int64_t token_count, int page_count,
            std::string content_hash, std::string created_at) {
          documents.push_back(make_document(id, std::move(title), chunk_count, token_count,
                                            page_count, std::move(content_hash), created_at));
        };
    return documents;
  } catch (const sqlite::sqlite_exception &e) {
    throw DocumentStoreError(format_db_error("list_documents", e));
  }
}

std::vector<Chunk> SqliteDocumentRepository::get_chunks(const std::vector<ChunkKey> &keys) const {
  if (keys.empty()) {
    return {};
  }

  try {
    PooledConnection conn(db_manager_);
    std::map<std::pair<int, int>, Chunk> found;

    // One flat IN list per document keeps the statement shallow for any k
    std::map<int, std::vector<int>> indices_by_document;
    for (const auto &key : keys) {
      indices_by_document[key.document_id].push_back(key.chunk_index);
    }

    for (const auto &[document_id, chunk_indices] : indices_by_document) {
      *conn << "SELECT chunk_index, content, token_count, page_numbers FROM chunks "
               "WHERE document_id = ? AND chunk_index IN (" +
                   int_vector_to_comma_string(chunk_indices) + ")"
            << document_id >>
          [&, document_id = document_id](int chunk_index, std::vector<char> content,
                                         int64_t token_count, std::string page_numbers) {
            Chunk chunk;
            chunk.document_id = document_id;
            chunk.chunk_index = chunk_index;
            chunk.content = CompressionService::decompress(content);
            chunk.token_count = static_cast<size_t>(token_count);
            chunk.page_numbers = pages_from_string(page_numbers);
            found[{document_id, chunk_index}] = std::move(chunk);
          };
    }

    std::vector<Chunk> chunks;
    chunks.reserve(found.size());
    for (const auto &key : keys) {
      auto it = found.find({key.document_id, key.chunk_index});
      if (it != found.end()) {
        chunks.push_back(it->second);
      }
    }
    return chunks;
  } catch (const sqlite::sqlite_exception &e) {
    throw DocumentStoreError(format_db_error("get_chunks", e));
  }
}

size_t SqliteDocumentRepository::document_count() const {
  try {
    int64_t count = 0;
    PooledConnection conn(db_manager_);
    *conn << "SELECT count(*) FROM documents" >> count;
    return static_cast<size_t>(count);
  } catch (const sqlite::sqlite_exception &e) {
    throw DocumentStoreError(format_db_error("document_count", e));
  }
}

size_t SqliteDocumentRepository::chunk_count() const {
  try {
    int64_t count = 0;
    PooledConnection conn(db_manager_);
    *conn << "SELECT count(*) FROM chunks" >> count;
    return static_cast<size_t>(count);
  } catch (const sqlite::sqlite_exception &e) {
    throw DocumentStoreError(format_db_error("chunk_count", e));
  }
}

std::vector<StoredDocument> SqliteDocumentRepository::load_all() const {
  try {
    PooledConnection conn(db_manager_);
    std::map<int, StoredDocument> by_id;

    *conn << std::string(DOCUMENT_COLUMNS) + " ORDER BY id" >>
        [&](int id, std::string title, int64_t chunk_count, int64_t token_count, int page_count,
            std::string content_hash, std::string created_at) {
          by_id[id].document = make_document(id, std::move(title), chunk_count, token_count,
                                             page_count, std::move(content_hash), created_at);
        };

    *conn << "SELECT document_id, chunk_index, content, token_count, page_numbers, vector_blob "
             "FROM chunks ORDER BY document_id, chunk_index" >>
        [&](int document_id, int chunk_index, std::vector<char> content, int64_t token_count,
            std::string page_numbers, std::vector<char> vector_blob) {
          auto it = by_id.find(document_id);
          if (it == by_id.end()) {
            std::cerr << "Warning: chunk " << chunk_index << " references missing document "
                      << document_id << std::endl;
            return;
          }
          if (!it->second.complete) {
            return;
          }
          Chunk chunk;
          chunk.document_id = document_id;
          chunk.chunk_index = chunk_index;
          chunk.token_count = static_cast<size_t>(token_count);
          try {
            chunk.content = CompressionService::decompress(content);
            chunk.page_numbers = pages_from_string(page_numbers);
            chunk.vector_embedding = blob_to_vector(vector_blob);
          } catch (const DocumentStoreError &e) {
            std::cerr << "Warning: chunk " << chunk_index << " of document " << document_id
                      << " is unreadable: " << e.what() << std::endl;
            it->second.complete = false;
            it->second.chunks.clear();
            return;
          }
          it->second.chunks.push_back(std::move(chunk));
        };

    std::vector<StoredDocument> all;
    all.reserve(by_id.size());
    for (auto &[id, stored] : by_id) {
      all.push_back(std::move(stored));
    }
    return all;
  } catch (const sqlite::sqlite_exception &e) {
    throw DocumentStoreError(format_db_error("load_all", e));
  }
}

}  // namespace askdoc_core
