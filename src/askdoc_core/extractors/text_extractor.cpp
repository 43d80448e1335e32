#include "askdoc_core/extractors/text_extractor.hpp"

#include <utf8.h>

#include <fstream>
#include <sstream>

#include "askdoc_core/errors.hpp"

namespace askdoc_core {

std::string TextExtractor::read_file(const fs::path &file_path) const {
  std::ifstream file_stream(file_path, std::ios::binary);
  if (!file_stream.is_open()) {
    throw ExtractionError("Could not open file: " + file_path.string());
  }

  std::stringstream buffer;
  buffer << file_stream.rdbuf();
  std::string content = buffer.str();

  if (!utf8::is_valid(content.begin(), content.end())) {
    throw ExtractionError("File is not valid UTF-8: " + file_path.string());
  }
  // A byte order mark carries no text
  if (utf8::starts_with_bom(content.begin(), content.end())) {
    content.erase(0, 3);
  }
  return content;
}

std::string TextExtractor::normalize_line_endings(const std::string &content) {
  std::string out;
  out.reserve(content.size());
  for (size_t i = 0; i < content.size(); ++i) {
    if (content[i] == '\r') {
      out.push_back('\n');
      if (i + 1 < content.size() && content[i + 1] == '\n') {
        ++i;
      }
    } else {
      out.push_back(content[i]);
    }
  }
  return out;
}

}  // namespace askdoc_core
