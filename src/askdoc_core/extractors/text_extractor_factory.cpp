#include "askdoc_core/extractors/text_extractor_factory.hpp"

#include "askdoc_core/errors.hpp"
#include "askdoc_core/extractors/markdown_extractor.hpp"
#include "askdoc_core/extractors/plaintext_extractor.hpp"

namespace askdoc_core {

TextExtractorFactory::TextExtractorFactory() {
  extractors.push_back(std::make_unique<MarkdownExtractor>());
  extractors.push_back(std::make_unique<PlainTextExtractor>());
}

const TextExtractor &TextExtractorFactory::get_extractor_for(
    const std::filesystem::path &file_path) const {
  for (const auto &extractor : extractors) {
    if (extractor->can_handle(file_path)) {
      return *extractor;
    }
  }
  throw ExtractionError("No suitable text extractor found for " + file_path.string());
}

}  // namespace askdoc_core
