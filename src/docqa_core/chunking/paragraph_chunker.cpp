#include "docqa_core/chunking/paragraph_chunker.hpp"

#include <algorithm>
#include <cctype>

#include "docqa_core/text/text_utils.hpp"

namespace docqa_core {

namespace {

std::string join_paragraphs(const std::vector<std::string> &paragraphs) {
  std::string joined;
  for (size_t i = 0; i < paragraphs.size(); ++i) {
    if (i > 0) {
      joined += "\n\n";
    }
    joined += paragraphs[i];
  }
  return joined;
}

// At least one cased letter and no lower-case letter. Only ASCII letters are
// considered cased.
bool is_upper_case(const std::string &text) {
  bool has_cased = false;
  for (unsigned char c : text) {
    if (std::islower(c)) {
      return false;
    }
    if (std::isupper(c)) {
      has_cased = true;
    }
  }
  return has_cased;
}

}  // namespace

ParagraphChunker::ParagraphChunker(std::size_t chunk_size, std::size_t chunk_overlap)
    : ChunkingStrategy(chunk_size, chunk_overlap) {}

bool ParagraphChunker::is_heading(const std::string &paragraph) {
  if (!paragraph.empty() && paragraph.back() == ':') {
    return true;
  }
  return char_count(paragraph) < MAX_HEADING_CHARS && is_upper_case(paragraph);
}

std::vector<std::string> ParagraphChunker::pack_paragraphs(
    const std::vector<std::string> &paragraphs) const {
  std::vector<std::string> drafts;
  std::vector<std::string> buffer;
  std::size_t buffer_length = 0;

  for (const auto &paragraph : paragraphs) {
    const std::size_t paragraph_length = char_count(paragraph);
    const bool heading = is_heading(paragraph);

    if (!buffer.empty() && buffer_length + paragraph_length > chunk_size_) {
      drafts.push_back(join_paragraphs(buffer));

      const std::size_t keep =
          chunk_overlap_ == 0 ? 0 : std::min(MAX_OVERLAP_PARAGRAPHS, buffer.size());
      buffer.erase(buffer.begin(), buffer.end() - static_cast<long>(keep));
      buffer_length = 0;
      for (const auto &kept : buffer) {
        buffer_length += char_count(kept) + SEPARATOR_CHARS;
      }
    }

    buffer.push_back(paragraph);
    buffer_length += paragraph_length + SEPARATOR_CHARS;

    // A heading opens the next chunk rather than closing this one.
    if (heading && buffer.size() > 1) {
      buffer.pop_back();
      drafts.push_back(join_paragraphs(buffer));
      buffer = {paragraph};
      buffer_length = paragraph_length;
    }
  }

  if (!buffer.empty()) {
    drafts.push_back(join_paragraphs(buffer));
  }
  return drafts;
}

std::vector<Chunk> ParagraphChunker::split(const std::string &text) const {
  const std::vector<std::string> paragraphs = split_paragraphs(text);
  if (paragraphs.empty()) {
    return {};
  }

  std::vector<Chunk> chunks;
  for (auto &draft : pack_paragraphs(paragraphs)) {
    if (char_count(draft) <= chunk_size_) {
      chunks.emplace_back(std::move(draft));
      continue;
    }
    // Still too large, fall back to sentence boundaries.
    for (auto &piece : pack_sentences(split_sentences(draft))) {
      chunks.push_back(std::move(piece));
    }
  }
  return chunks;
}

}  // namespace docqa_core
