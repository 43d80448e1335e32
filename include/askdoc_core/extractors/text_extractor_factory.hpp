#pragma once

#include <filesystem>
#include <memory>
#include <vector>

#include "askdoc_core/extractors/text_extractor.hpp"

namespace askdoc_core {

/**
 * @class TextExtractorFactory
 * @brief Holds every available extractor and picks one per file.
 *
 * The factory is non-copyable and non-movable.
 */
class TextExtractorFactory {
 public:
  TextExtractorFactory();

  /**
   * @brief Returns the first registered extractor that can handle the file.
   * @throw ExtractionError if no extractor handles the file type.
   */
  const TextExtractor &get_extractor_for(const std::filesystem::path &file_path) const;

  TextExtractorFactory(const TextExtractorFactory &) = delete;
  TextExtractorFactory &operator=(const TextExtractorFactory &) = delete;
  TextExtractorFactory(TextExtractorFactory &&) = delete;
  TextExtractorFactory &operator=(TextExtractorFactory &&) = delete;

 private:
  std::vector<std::unique_ptr<TextExtractor>> extractors;
};

}  // namespace askdoc_core
