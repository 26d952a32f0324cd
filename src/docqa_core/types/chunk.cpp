#include "docqa_core/types/chunk.hpp"

#include "docqa_core/text/content_hash.hpp"
#include "docqa_core/text/text_utils.hpp"

namespace docqa_core {

DocumentRef DocumentRef::from_path(const std::filesystem::path &path) {
  return {path.stem().string(), path.string(), path.filename().string()};
}

Chunk::Chunk(std::string text)
    : text_(std::move(text)),
      chunk_id_(compute_content_hash(text_)),
      length_(char_count(text_)) {}

void Chunk::assign_document(const std::filesystem::path &path) {
  document_ = DocumentRef::from_path(path);
}

RecordMetadata Chunk::metadata() const {
  return {chunk_id_, length_, document_};
}

}  // namespace docqa_core
