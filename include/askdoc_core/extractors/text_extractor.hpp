#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace askdoc_core {

struct ExtractedText {
  std::string text;
  int page_count = 0;
  // Byte offset at which each page starts. Empty when the format has no
  // page structure.
  std::vector<size_t> page_offsets;
};

class TextExtractor {
 public:
  virtual ~TextExtractor() = default;

  // Checks if this extractor can handle the given file extension
  virtual bool can_handle(const fs::path &file_path) const = 0;

  // Reads the file and returns its text. Throws ExtractionError when the
  // file cannot be read or is not valid UTF-8.
  virtual ExtractedText extract(const fs::path &file_path) const = 0;

 protected:
  std::string read_file(const fs::path &file_path) const;
  static std::string normalize_line_endings(const std::string &content);
};

using TextExtractorPtr = std::unique_ptr<TextExtractor>;

}  // namespace askdoc_core
