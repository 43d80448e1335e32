#include "askdoc_core/extractors/markdown_extractor.hpp"

#include <regex>

namespace askdoc_core {

bool MarkdownExtractor::can_handle(const fs::path &file_path) const {
  return file_path.extension() == ".md";
}

ExtractedText MarkdownExtractor::extract(const fs::path &file_path) const {
  return from_content(normalize_line_endings(read_file(file_path)));
}

ExtractedText MarkdownExtractor::from_content(std::string content) {
  // ---\n...\n---\n at the very start of the file
  static const std::regex front_matter_regex(R"(^---\n[\s\S]*?\n---\n)");

  std::smatch match;
  if (std::regex_search(content, match, front_matter_regex,
                        std::regex_constants::match_continuous)) {
    content.erase(0, static_cast<size_t>(match.length(0)));
  }

  ExtractedText result;
  if (content.empty()) {
    return result;
  }
  result.page_count = 1;
  result.text = std::move(content);
  return result;
}

}  // namespace askdoc_core
