#pragma once

#include "askdoc_core/extractors/text_extractor.hpp"

namespace askdoc_core {

// Plain text. Form feed characters separate pages.
class PlainTextExtractor : public TextExtractor {
 public:
  static constexpr char PAGE_BREAK = '\f';

  bool can_handle(const fs::path &file_path) const override;

  ExtractedText extract(const fs::path &file_path) const override;

  // Splits already-loaded content into pages.
  static ExtractedText from_content(std::string content);
};

}  // namespace askdoc_core
