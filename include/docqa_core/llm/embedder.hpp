#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace docqa_core {

// Text to fixed-length vectors. Identical input must give index-compatible
// output across calls.
class Embedder {
 public:
  virtual ~Embedder() = default;

  virtual std::vector<std::vector<float>> embed_many(const std::vector<std::string> &texts) = 0;
  virtual std::vector<float> embed_one(const std::string &text) = 0;

  virtual std::size_t dimension() const = 0;
};

}  // namespace docqa_core
