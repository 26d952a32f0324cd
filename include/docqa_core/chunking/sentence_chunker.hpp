#pragma once

#include "docqa_core/chunking/chunking_strategy.hpp"

namespace docqa_core {

// Sentence-only chunking. Sentences are packed up to chunk_size and every new
// chunk starts with the trailing words of the previous one. The number of
// carried words is derived from chunk_overlap, see overlap_word_count().
class SentenceChunker : public ChunkingStrategy {
 public:
  SentenceChunker(std::size_t chunk_size, std::size_t chunk_overlap);

  std::vector<Chunk> split(const std::string &text) const override;

  std::string name() const override {
    return kSentenceStrategy;
  }

  // Half of chunk_overlap at roughly five characters per word, at least one
  // word unless overlap is disabled.
  std::size_t overlap_word_count() const;

 private:
  static constexpr std::size_t CHARS_PER_WORD_ESTIMATE = 5;

  std::string overlap_seed(const std::string &chunk_text) const;
};

}  // namespace docqa_core
