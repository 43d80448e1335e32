#pragma once

#include <string>
#include <vector>

namespace askdoc_core {

struct Citation {
  int document_id = 0;
  int chunk_index = 0;
  float score = 0.0f;
  std::string text;
  std::vector<int> page_numbers;
};

struct QueryResult {
  std::string answer;
  float confidence = 0.0f;
  // True when the confidence was derived from retrieval scores rather than
  // reported by the language model.
  bool confidence_derived = false;
  std::string reasoning;
  std::vector<Citation> citations;
  // Number of chunks placed in the model context.
  size_t chunks_used = 0;
};

}  // namespace askdoc_core
