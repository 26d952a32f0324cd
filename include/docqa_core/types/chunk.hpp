#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

namespace docqa_core {

// Provenance of a chunk: which file it was cut from.
struct DocumentRef {
  std::string document_id;    // file stem
  std::string document_path;  // full path as given
  std::string document_name;  // file name with extension

  static DocumentRef from_path(const std::filesystem::path &path);

  bool operator==(const DocumentRef &other) const = default;
};

// Everything a stored record keeps about a chunk apart from its text.
struct RecordMetadata {
  std::string chunk_id;
  std::size_t length = 0;
  DocumentRef document;

  bool operator==(const RecordMetadata &other) const = default;
};

// A bounded span of document text. `length` and `chunk_id` are derived from
// the text at construction and cannot drift from it.
class Chunk {
 public:
  explicit Chunk(std::string text);

  const std::string &text() const {
    return text_;
  }
  const std::string &chunk_id() const {
    return chunk_id_;
  }
  std::size_t length() const {
    return length_;
  }
  const DocumentRef &document() const {
    return document_;
  }

  // Stamps the source document. Chunks come out of the chunker without one.
  void assign_document(const std::filesystem::path &path);

  RecordMetadata metadata() const;

 private:
  std::string text_;
  std::string chunk_id_;
  std::size_t length_;
  DocumentRef document_;
};

}  // namespace docqa_core
