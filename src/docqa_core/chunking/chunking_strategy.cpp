#include "docqa_core/chunking/chunking_strategy.hpp"

#include "docqa_core/chunking/paragraph_chunker.hpp"
#include "docqa_core/chunking/sentence_chunker.hpp"
#include "docqa_core/text/text_utils.hpp"

namespace docqa_core {

ChunkingStrategy::ChunkingStrategy(std::size_t chunk_size, std::size_t chunk_overlap)
    : chunk_size_(chunk_size), chunk_overlap_(chunk_overlap) {
  if (chunk_size_ == 0) {
    throw ChunkingError("chunk_size must be greater than 0");
  }
}

std::vector<Chunk> ChunkingStrategy::pack_sentences(
    const std::vector<std::string> &sentences) const {
  std::vector<Chunk> chunks;
  std::string current;
  std::size_t current_length = 0;

  for (const auto &sentence : sentences) {
    const std::size_t sentence_length = char_count(sentence);
    if (!current.empty() && current_length + 1 + sentence_length > chunk_size_) {
      chunks.emplace_back(std::move(current));
      current.clear();
      current_length = 0;
    }
    if (!current.empty()) {
      current += ' ';
      current_length += 1;
    }
    current += sentence;
    current_length += sentence_length;
  }

  if (!current.empty()) {
    chunks.emplace_back(std::move(current));
  }
  return chunks;
}

bool is_known_chunking_strategy(const std::string &name) {
  return name == kParagraphStrategy || name == kSentenceStrategy;
}

ChunkingStrategyPtr make_chunking_strategy(const std::string &name,
                                           std::size_t chunk_size,
                                           std::size_t chunk_overlap) {
  if (name == kParagraphStrategy) {
    return std::make_unique<ParagraphChunker>(chunk_size, chunk_overlap);
  }
  if (name == kSentenceStrategy) {
    return std::make_unique<SentenceChunker>(chunk_size, chunk_overlap);
  }
  throw ChunkingError("Unknown chunking strategy: " + name);
}

}  // namespace docqa_core
