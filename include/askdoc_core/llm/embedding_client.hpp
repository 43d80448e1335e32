#pragma once

#include <string>
#include <vector>

namespace askdoc_core {

// Maps text to a fixed-length vector. Implementations report any failure of
// the underlying service (including timeouts) as EmbeddingUnavailableError.
class EmbeddingClient {
 public:
  virtual ~EmbeddingClient() = default;

  virtual std::vector<float> embed(const std::string &text) = 0;

  // One vector per input, in input order.
  virtual std::vector<std::vector<float>> embed_batch(const std::vector<std::string> &texts) = 0;
};

}  // namespace askdoc_core
