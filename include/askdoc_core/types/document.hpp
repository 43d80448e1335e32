#pragma once

#include <chrono>
#include <string>

namespace askdoc_core {

struct Document {
  int id = 0;
  std::string title;
  size_t chunk_count = 0;
  size_t token_count = 0;
  int page_count = 0;
  std::string content_hash;
  std::chrono::system_clock::time_point created_at;
};

}  // namespace askdoc_core
