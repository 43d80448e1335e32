#include "askdoc_core/extractors/plaintext_extractor.hpp"

namespace askdoc_core {

bool PlainTextExtractor::can_handle(const fs::path &file_path) const {
  const std::string extension = file_path.extension().string();
  return extension == ".txt";
}

ExtractedText PlainTextExtractor::extract(const fs::path &file_path) const {
  return from_content(normalize_line_endings(read_file(file_path)));
}

/**
 * @brief Records where each page of the content starts.
 *
 * The form feed stays in the text as the last character of its page, so the
 * offsets index straight into the returned text. A trailing form feed does
 * not open an empty page.
 */
ExtractedText PlainTextExtractor::from_content(std::string content) {
  ExtractedText result;
  if (content.empty()) {
    return result;
  }

  result.page_offsets.push_back(0);
  for (size_t pos = content.find(PAGE_BREAK); pos != std::string::npos;
       pos = content.find(PAGE_BREAK, pos + 1)) {
    if (pos + 1 < content.size()) {
      result.page_offsets.push_back(pos + 1);
    }
  }
  result.page_count = static_cast<int>(result.page_offsets.size());
  result.text = std::move(content);
  return result;
}

}  // namespace askdoc_core
