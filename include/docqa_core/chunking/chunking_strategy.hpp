#pragma once

#include <cstddef>
#include <exception>
#include <memory>
#include <string>
#include <vector>

#include "docqa_core/types/chunk.hpp"

namespace docqa_core {

class ChunkingError : public std::exception {
 public:
  explicit ChunkingError(const std::string &message) : message_(message) {}
  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/**
 * @class ChunkingStrategy
 * @brief Turns one document's raw text into an ordered list of chunks.
 *
 * Sizes are measured in characters (Unicode code points). Implementations are
 * stateless after construction, so one instance can be shared between threads.
 */
class ChunkingStrategy {
 public:
  ChunkingStrategy(std::size_t chunk_size, std::size_t chunk_overlap);
  virtual ~ChunkingStrategy() = default;

  // Chunks in document order. Empty or whitespace-only text gives no chunks.
  virtual std::vector<Chunk> split(const std::string &text) const = 0;

  virtual std::string name() const = 0;

  std::size_t chunk_size() const {
    return chunk_size_;
  }
  std::size_t chunk_overlap() const {
    return chunk_overlap_;
  }

 protected:
  // Greedy sentence packing shared by both strategies: sentences are joined by
  // a single space and a new chunk starts when the next sentence would push the
  // current one past chunk_size. A sentence longer than chunk_size is emitted on
  // its own.
  std::vector<Chunk> pack_sentences(const std::vector<std::string> &sentences) const;

  std::size_t chunk_size_;
  std::size_t chunk_overlap_;
};

using ChunkingStrategyPtr = std::unique_ptr<ChunkingStrategy>;

inline constexpr const char *kParagraphStrategy = "paragraph";
inline constexpr const char *kSentenceStrategy = "sentence";

// Builds the strategy registered under `name`. Throws ChunkingError for an
// unknown name or invalid sizes.
ChunkingStrategyPtr make_chunking_strategy(const std::string &name,
                                           std::size_t chunk_size,
                                           std::size_t chunk_overlap);

bool is_known_chunking_strategy(const std::string &name);

}  // namespace docqa_core
