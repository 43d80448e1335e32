#pragma once

#include "askdoc_core/extractors/text_extractor.hpp"

namespace askdoc_core {

class MarkdownExtractor : public TextExtractor {
 public:
  bool can_handle(const fs::path &file_path) const override;

  ExtractedText extract(const fs::path &file_path) const override;

  // Markdown has no pages; the whole file is page 1. A leading YAML front
  // matter block is dropped.
  static ExtractedText from_content(std::string content);
};

}  // namespace askdoc_core
