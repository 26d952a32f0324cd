#pragma once

#include <exception>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "docqa_core/chunking/chunking_strategy.hpp"
#include "docqa_core/types/chunk.hpp"

namespace fs = std::filesystem;

namespace docqa_core {

class DocumentError : public std::exception {
 public:
  explicit DocumentError(const std::string &message) : message_(message) {}
  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

inline const std::vector<std::string> &default_file_extensions() {
  static const std::vector<std::string> extensions = {".txt", ".md", ".pdf"};
  return extensions;
}

/**
 * @class DocumentProcessor
 * @brief Reads documents from disk and turns them into stamped chunks.
 *
 * A failure on one file (unreadable, not UTF-8) is logged and that file
 * contributes no chunks; it never stops the rest of a directory.
 */
class DocumentProcessor {
 public:
  explicit DocumentProcessor(ChunkingStrategyPtr strategy);

  DocumentProcessor(const DocumentProcessor &) = delete;
  DocumentProcessor &operator=(const DocumentProcessor &) = delete;

  // Whole file as UTF-8 text. Throws DocumentError.
  std::string load_document(const fs::path &file_path) const;

  std::vector<Chunk> split_into_chunks(const std::string &text) const;

  // Never throws; see class comment.
  std::vector<Chunk> process_document(const fs::path &file_path) const;

  /**
   * @brief Processes every regular file directly inside `directory` whose
   *        extension is one of `file_extensions`.
   *
   * Extensions are visited in the given order and files within one extension
   * in sorted path order. Matching is case-sensitive and not recursive.
   */
  std::vector<Chunk> process_directory(
      const fs::path &directory,
      const std::vector<std::string> &file_extensions = default_file_extensions()) const;

  // Files process_directory would visit, in visiting order.
  std::vector<fs::path> list_documents(const fs::path &directory,
                                       const std::vector<std::string> &file_extensions) const;

  const ChunkingStrategy &strategy() const {
    return *strategy_;
  }

 private:
  ChunkingStrategyPtr strategy_;
};

}  // namespace docqa_core
