#pragma once
#include <faiss/Index.h>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "docqa_core/types/chunk.hpp"
#include "docqa_core/types/vector_record.hpp"

namespace docqa_core {

class VectorIndexError : public std::exception {
 public:
  explicit VectorIndexError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class DimensionMismatchError : public VectorIndexError {
 public:
  DimensionMismatchError(std::size_t expected, std::size_t actual)
      : VectorIndexError("Vector dimension mismatch. Expected " + std::to_string(expected) +
                         ", got " + std::to_string(actual)),
        expected_(expected),
        actual_(actual) {}

  std::size_t expected() const {
    return expected_;
  }
  std::size_t actual() const {
    return actual_;
  }

 private:
  std::size_t expected_;
  std::size_t actual_;
};

class PersistenceError : public VectorIndexError {
 public:
  explicit PersistenceError(const std::string &message) : VectorIndexError(message) {}
};

/**
 * @class VectorIndex
 * @brief Exact nearest-neighbour store: a Faiss IndexFlatL2 plus one metadata
 *        record per vector.
 *
 * Record i always describes vector i. Every mutation appends to (or resets)
 * both containers under one exclusive lock, so callers can never observe them
 * out of step. Searches take a shared lock and may run concurrently.
 *
 * Persistence uses two sibling files: `<index_path>` (faiss::write_index) and
 * `<index_path>.json` (the metadata records).
 */
class VectorIndex {
 public:
  VectorIndex(std::size_t vector_dim, const std::filesystem::path &index_path);
  ~VectorIndex();

  VectorIndex(const VectorIndex &) = delete;
  VectorIndex &operator=(const VectorIndex &) = delete;
  VectorIndex(VectorIndex &&) = delete;
  VectorIndex &operator=(VectorIndex &&) = delete;

  /**
   * @brief Appends one record per (text, embedding, metadata) triple, in order.
   *
   * All-or-nothing: the batch is validated before anything is inserted.
   *
   * @throw std::invalid_argument if the three sequences differ in length.
   * @throw DimensionMismatchError if any embedding is not vector_dim long.
   * @return Positions of the inserted records.
   */
  RecordRange add_embeddings(const std::vector<std::string> &texts,
                             const std::vector<std::vector<float>> &embeddings,
                             const std::vector<RecordMetadata> &metadatas);

  RecordRange add_chunks(const std::vector<Chunk> &chunks,
                         const std::vector<std::vector<float>> &embeddings);

  // Up to k records by ascending squared L2 distance. Empty when the index is.
  std::vector<QueryResult> similarity_search(const std::vector<float> &query_vector,
                                             int k) const;

  // Writes both artifacts. Throws PersistenceError.
  void save() const;

  // Restores both artifacts, or resets to empty (and logs why) when either is
  // missing, unreadable or inconsistent. Never throws.
  void load();

  // Drops every vector and record. Not durable until save().
  void clear();

  std::optional<VectorRecord> get_document(std::size_t id) const;
  std::vector<std::optional<VectorRecord>> get_documents(const std::vector<std::size_t> &ids) const;
  std::vector<VectorRecord> get_all_documents() const;

  std::size_t size() const;
  std::size_t dimension() const {
    return vector_dim_;
  }
  const std::filesystem::path &index_path() const {
    return index_path_;
  }
  std::filesystem::path metadata_path() const;

 private:
  std::size_t vector_dim_;
  std::filesystem::path index_path_;

  mutable std::shared_mutex mutex_;
  std::unique_ptr<faiss::Index> index_;
  std::vector<VectorRecord> records_;

  std::unique_ptr<faiss::Index> create_base_index() const;
  void reset_locked();
  void validate_vector_dimension(const std::vector<float> &vector) const;
  // Throws PersistenceError describing why the files cannot be restored.
  void load_locked();
};

}  // namespace docqa_core
