#pragma once

#include "docqa_core/chunking/chunking_strategy.hpp"

namespace docqa_core {

/**
 * @class ParagraphChunker
 * @brief Paragraph and heading aware chunking. This is the default strategy.
 *
 * Paragraphs (separated by blank lines) are packed into chunks of at most
 * chunk_size characters, joined by a blank line. Each new chunk repeats the
 * last one or two paragraphs of the previous chunk. A heading always opens a
 * chunk instead of trailing one. Chunks still over the limit afterwards (one
 * huge paragraph, say) are re-split at sentence boundaries.
 *
 * chunk_overlap only switches overlap on or off here: 0 disables it, any other
 * value keeps the paragraph overlap.
 */
class ParagraphChunker : public ChunkingStrategy {
 public:
  ParagraphChunker(std::size_t chunk_size, std::size_t chunk_overlap);

  std::vector<Chunk> split(const std::string &text) const override;

  std::string name() const override {
    return kParagraphStrategy;
  }

  // Ends with ':' or is a short, fully upper-case line.
  static bool is_heading(const std::string &paragraph);

 private:
  static constexpr std::size_t MAX_HEADING_CHARS = 100;
  static constexpr std::size_t MAX_OVERLAP_PARAGRAPHS = 2;
  // Length charged for the blank line joining two paragraphs.
  static constexpr std::size_t SEPARATOR_CHARS = 2;

  std::vector<std::string> pack_paragraphs(const std::vector<std::string> &paragraphs) const;
};

}  // namespace docqa_core
