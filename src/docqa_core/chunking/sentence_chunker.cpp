#include "docqa_core/chunking/sentence_chunker.hpp"

#include <algorithm>

#include "docqa_core/text/text_utils.hpp"

namespace docqa_core {

SentenceChunker::SentenceChunker(std::size_t chunk_size, std::size_t chunk_overlap)
    : ChunkingStrategy(chunk_size, chunk_overlap) {}

std::size_t SentenceChunker::overlap_word_count() const {
  if (chunk_overlap_ == 0) {
    return 0;
  }
  return std::max<std::size_t>(1, (chunk_overlap_ / 2) / CHARS_PER_WORD_ESTIMATE);
}

std::string SentenceChunker::overlap_seed(const std::string &chunk_text) const {
  const std::size_t wanted = overlap_word_count();
  if (wanted == 0) {
    return "";
  }
  const std::vector<std::string> words = split_words(chunk_text);
  const std::size_t start = words.size() > wanted ? words.size() - wanted : 0;

  std::string seed;
  for (std::size_t i = start; i < words.size(); ++i) {
    if (!seed.empty()) {
      seed += ' ';
    }
    seed += words[i];
  }
  return seed;
}

std::vector<Chunk> SentenceChunker::split(const std::string &text) const {
  const std::vector<std::string> sentences = split_sentences(text);
  if (sentences.empty()) {
    return {};
  }

  std::vector<Chunk> chunks;
  std::string current;
  std::size_t current_length = 0;

  for (const auto &sentence : sentences) {
    const std::size_t sentence_length = char_count(sentence);

    if (!current.empty() && current_length + 1 + sentence_length > chunk_size_) {
      std::string seed = overlap_seed(current);
      chunks.emplace_back(std::move(current));
      current.clear();
      current_length = 0;

      // Drop the overlap when it would push the next chunk over the limit.
      const std::size_t seed_length = char_count(seed);
      if (!seed.empty() && seed_length + 1 + sentence_length <= chunk_size_) {
        current = std::move(seed);
        current_length = seed_length;
      }
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

}  // namespace docqa_core
