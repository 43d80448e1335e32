#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace askdoc_core {

// Zstandard compression of chunk text at rest.
class CompressionService {
 public:
  static constexpr int DEFAULT_LEVEL = 3;

  /**
   * @brief Compresses a block of text.
   * @return The zstd frame. Empty input gives an empty frame.
   * @throw DocumentStoreError if zstd reports an error.
   */
  static std::vector<char> compress(std::string_view data, int compression_level = DEFAULT_LEVEL);

  /**
   * @brief Restores text written by compress().
   * @throw DocumentStoreError if the data is not a complete zstd frame.
   */
  static std::string decompress(const std::vector<char> &compressed_data);
};

}  // namespace askdoc_core
