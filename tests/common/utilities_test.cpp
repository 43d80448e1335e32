#include "common/utilities_test.hpp"

#include <unistd.h>

#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdint>

namespace askdoc_tests {

std::filesystem::path TestUtilities::create_temp_test_db() {
  static std::atomic<int> counter{0};
  auto temp_dir = std::filesystem::temp_directory_path() / "askdoc_tests";
  std::filesystem::create_directories(temp_dir);

  auto now = std::chrono::system_clock::now();
  auto timestamp =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();

  return temp_dir / ("test_" + std::to_string(getpid()) + "_" + std::to_string(timestamp) + "_" +
                     std::to_string(counter++) + ".db");
}

void TestUtilities::cleanup_temp_db(const std::filesystem::path &db_path) {
  std::error_code ec;
  for (const char *suffix : {"", "-wal", "-shm"}) {
    std::filesystem::remove(db_path.string() + suffix, ec);
  }

  auto parent_dir = db_path.parent_path();
  if (std::filesystem::exists(parent_dir, ec) && std::filesystem::is_empty(parent_dir, ec)) {
    std::filesystem::remove(parent_dir, ec);
  }
}

std::vector<float> TestUtilities::create_test_vector(const std::string &seed_text, int dimension) {
  // FNV-1a seed, then a xorshift stream
  uint64_t state = 1469598103934665603ULL;
  for (unsigned char c : seed_text) {
    state ^= c;
    state *= 1099511628211ULL;
  }
  if (state == 0) {
    state = 1;
  }

  std::vector<float> vector(static_cast<size_t>(dimension));
  double norm = 0.0;
  for (auto &value : vector) {
    state ^= state << 13;
    state ^= state >> 7;
    state ^= state << 17;
    value = static_cast<float>(static_cast<double>(state % 2001) / 1000.0 - 1.0);
    norm += static_cast<double>(value) * value;
  }
  if (norm == 0.0) {
    vector[0] = 1.0f;
    return vector;
  }
  for (auto &value : vector) {
    value = static_cast<float>(value / std::sqrt(norm));
  }
  return vector;
}

std::vector<float> TestUtilities::axis_vector(int axis, int dimension) {
  std::vector<float> vector(static_cast<size_t>(dimension), 0.0f);
  vector[static_cast<size_t>(axis)] = 1.0f;
  return vector;
}

std::string TestUtilities::make_words(size_t count, const std::string &prefix) {
  std::string text;
  for (size_t i = 0; i < count; ++i) {
    if (i > 0) {
      text += " ";
    }
    text += prefix + std::to_string(i);
  }
  return text;
}

askdoc_core::Document TestUtilities::create_test_document(int id, size_t chunk_count) {
  askdoc_core::Document document;
  document.id = id;
  document.title = "Document " + std::to_string(id);
  document.chunk_count = chunk_count;
  document.token_count = chunk_count * 10;
  document.page_count = 1;
  document.content_hash = "hash_" + std::to_string(id);
  // Whole seconds so the value survives the text round trip
  document.created_at = std::chrono::time_point_cast<std::chrono::seconds>(
      std::chrono::system_clock::now());
  return document;
}

std::vector<askdoc_core::Chunk> TestUtilities::create_test_chunks(int document_id,
                                                                  int count,
                                                                  const std::string &base_content) {
  std::vector<askdoc_core::Chunk> chunks;
  chunks.reserve(static_cast<size_t>(count));
  for (int i = 0; i < count; ++i) {
    askdoc_core::Chunk chunk;
    chunk.document_id = document_id;
    chunk.chunk_index = i;
    chunk.content = base_content + " " + std::to_string(document_id) + "/" + std::to_string(i);
    chunk.token_count = 4;
    chunk.page_numbers = {1};
    chunk.vector_embedding = create_test_vector(chunk.content);
    chunks.push_back(std::move(chunk));
  }
  return chunks;
}

}  // namespace askdoc_tests
