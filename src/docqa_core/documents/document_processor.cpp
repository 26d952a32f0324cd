#include "docqa_core/documents/document_processor.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>

#include "docqa_core/text/text_utils.hpp"

namespace docqa_core {

DocumentProcessor::DocumentProcessor(ChunkingStrategyPtr strategy)
    : strategy_(std::move(strategy)) {
  if (!strategy_) {
    throw DocumentError("DocumentProcessor requires a chunking strategy");
  }
}

std::string DocumentProcessor::load_document(const fs::path &file_path) const {
  std::ifstream file_stream(file_path, std::ios::binary);
  if (!file_stream.is_open()) {
    throw DocumentError("Could not open file: " + file_path.string());
  }

  std::stringstream buffer;
  buffer << file_stream.rdbuf();
  if (file_stream.bad()) {
    throw DocumentError("Failed to read file: " + file_path.string());
  }
  std::string content = buffer.str();

  if (!is_valid_utf8(content)) {
    throw DocumentError("File is not valid UTF-8 text: " + file_path.string());
  }
  return content;
}

std::vector<Chunk> DocumentProcessor::split_into_chunks(const std::string &text) const {
  return strategy_->split(text);
}

std::vector<Chunk> DocumentProcessor::process_document(const fs::path &file_path) const {
  try {
    std::vector<Chunk> chunks = split_into_chunks(load_document(file_path));
    for (auto &chunk : chunks) {
      chunk.assign_document(file_path);
    }
    return chunks;
  } catch (const std::exception &e) {
    std::cerr << "Error processing " << file_path.string() << ": " << e.what() << std::endl;
    return {};
  }
}

std::vector<fs::path> DocumentProcessor::list_documents(
    const fs::path &directory, const std::vector<std::string> &file_extensions) const {
  std::error_code ec;
  if (!fs::is_directory(directory, ec)) {
    std::cerr << "Warning: documents directory does not exist: " << directory.string()
              << std::endl;
    return {};
  }

  std::vector<fs::path> files;
  for (const auto &extension : file_extensions) {
    std::vector<fs::path> matching;
    fs::directory_iterator it(directory, ec);
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
      // Dangling links fail to stat and are skipped.
      std::error_code entry_ec;
      if (it->is_regular_file(entry_ec) && it->path().extension().string() == extension) {
        matching.push_back(it->path());
      }
    }
    if (ec) {
      std::cerr << "Warning: failed to list " << directory.string() << ": " << ec.message()
                << std::endl;
      ec.clear();
    }
    std::sort(matching.begin(), matching.end());
    files.insert(files.end(), matching.begin(), matching.end());
  }
  return files;
}

std::vector<Chunk> DocumentProcessor::process_directory(
    const fs::path &directory, const std::vector<std::string> &file_extensions) const {
  std::vector<Chunk> all_chunks;
  const std::vector<fs::path> files = list_documents(directory, file_extensions);

  std::cout << "Processing " << files.size() << " documents from " << directory.string()
            << std::endl;
  for (const auto &file_path : files) {
    std::vector<Chunk> chunks = process_document(file_path);
    all_chunks.insert(all_chunks.end(), std::make_move_iterator(chunks.begin()),
                      std::make_move_iterator(chunks.end()));
  }
  return all_chunks;
}

}  // namespace docqa_core
