#include "docqa_core/store/vector_index.hpp"

#include <faiss/IndexFlat.h>
#include <faiss/impl/FaissException.h>
#include <faiss/index_io.h>

#include <algorithm>
#include <fstream>
#include <iostream>
#include <mutex>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace docqa_core {

namespace {

std::filesystem::path temporary_path(const std::filesystem::path &path) {
  std::filesystem::path tmp = path;
  tmp += ".tmp";
  return tmp;
}

}  // namespace

VectorIndex::VectorIndex(std::size_t vector_dim, const std::filesystem::path &index_path)
    : vector_dim_(vector_dim), index_path_(index_path) {
  if (vector_dim_ == 0) {
    throw VectorIndexError("vector_dim must be greater than 0");
  }
  index_ = create_base_index();
  if (std::filesystem::exists(index_path_)) {
    load();
  }
}

VectorIndex::~VectorIndex() = default;

std::filesystem::path VectorIndex::metadata_path() const {
  std::filesystem::path path = index_path_;
  path += ".json";
  return path;
}

std::unique_ptr<faiss::Index> VectorIndex::create_base_index() const {
  return std::make_unique<faiss::IndexFlatL2>(static_cast<faiss::idx_t>(vector_dim_));
}

void VectorIndex::reset_locked() {
  index_ = create_base_index();
  records_.clear();
}

void VectorIndex::validate_vector_dimension(const std::vector<float> &vector) const {
  if (vector.size() != vector_dim_) {
    throw DimensionMismatchError(vector_dim_, vector.size());
  }
}

RecordRange VectorIndex::add_embeddings(const std::vector<std::string> &texts,
                                        const std::vector<std::vector<float>> &embeddings,
                                        const std::vector<RecordMetadata> &metadatas) {
  if (texts.size() != embeddings.size() || texts.size() != metadatas.size()) {
    throw std::invalid_argument("add_embeddings: texts, embeddings and metadatas differ in length (" +
                                std::to_string(texts.size()) + ", " +
                                std::to_string(embeddings.size()) + ", " +
                                std::to_string(metadatas.size()) + ")");
  }

  std::unique_lock lock(mutex_);
  const std::size_t first = records_.size();
  if (texts.empty()) {
    return {first, 0};
  }

  // Validate the whole batch before touching either container
  std::vector<float> all_vectors_flat;
  all_vectors_flat.reserve(embeddings.size() * vector_dim_);
  for (const auto &embedding : embeddings) {
    validate_vector_dimension(embedding);
    all_vectors_flat.insert(all_vectors_flat.end(), embedding.begin(), embedding.end());
  }

  std::vector<VectorRecord> new_records;
  new_records.reserve(texts.size());
  for (std::size_t i = 0; i < texts.size(); ++i) {
    new_records.push_back({texts[i], metadatas[i], first + i});
  }
  records_.reserve(records_.size() + new_records.size());

  try {
    index_->add(static_cast<faiss::idx_t>(embeddings.size()), all_vectors_flat.data());
  } catch (const faiss::FaissException &e) {
    throw VectorIndexError("Failed to add vectors to Faiss index: " + std::string(e.what()));
  }
  records_.insert(records_.end(), std::make_move_iterator(new_records.begin()),
                  std::make_move_iterator(new_records.end()));

  return {first, texts.size()};
}

RecordRange VectorIndex::add_chunks(const std::vector<Chunk> &chunks,
                                    const std::vector<std::vector<float>> &embeddings) {
  std::vector<std::string> texts;
  std::vector<RecordMetadata> metadatas;
  texts.reserve(chunks.size());
  metadatas.reserve(chunks.size());
  for (const auto &chunk : chunks) {
    texts.push_back(chunk.text());
    metadatas.push_back(chunk.metadata());
  }
  return add_embeddings(texts, embeddings, metadatas);
}

std::vector<QueryResult> VectorIndex::similarity_search(const std::vector<float> &query_vector,
                                                        int k) const {
  validate_vector_dimension(query_vector);

  std::shared_lock lock(mutex_);
  const int actual_k = std::min(k, static_cast<int>(index_->ntotal));
  if (actual_k <= 0) {
    return {};
  }

  std::vector<float> distances(actual_k);
  std::vector<faiss::idx_t> labels(actual_k);
  try {
    index_->search(1, query_vector.data(), actual_k, distances.data(), labels.data());
  } catch (const faiss::FaissException &e) {
    throw VectorIndexError("Faiss search failed: " + std::string(e.what()));
  }

  std::vector<QueryResult> results;
  results.reserve(actual_k);
  for (int i = 0; i < actual_k; ++i) {
    const faiss::idx_t label = labels[i];
    if (label < 0 || static_cast<std::size_t>(label) >= records_.size()) {
      continue;
    }
    QueryResult result;
    static_cast<VectorRecord &>(result) = records_[static_cast<std::size_t>(label)];
    result.score = distances[i];
    results.push_back(std::move(result));
  }
  return results;
}

void VectorIndex::save() const {
  std::shared_lock lock(mutex_);

  std::error_code ec;
  if (index_path_.has_parent_path()) {
    std::filesystem::create_directories(index_path_.parent_path(), ec);
    if (ec) {
      throw PersistenceError("Failed to create directory " + index_path_.parent_path().string() +
                             ": " + ec.message());
    }
  }

  const std::filesystem::path index_tmp = temporary_path(index_path_);
  const std::filesystem::path metadata_file = metadata_path();
  const std::filesystem::path metadata_tmp = temporary_path(metadata_file);

  try {
    faiss::write_index(index_.get(), index_tmp.c_str());
  } catch (const faiss::FaissException &e) {
    throw PersistenceError("Failed to write index " + index_path_.string() + ": " + e.what());
  }

  {
    std::ofstream out(metadata_tmp, std::ios::trunc);
    if (!out.is_open()) {
      throw PersistenceError("Failed to open metadata file for writing: " + metadata_tmp.string());
    }
    out << nlohmann::json(records_).dump();
    if (!out) {
      throw PersistenceError("Failed to write metadata file: " + metadata_tmp.string());
    }
  }

  std::filesystem::rename(index_tmp, index_path_, ec);
  if (!ec) {
    std::filesystem::rename(metadata_tmp, metadata_file, ec);
  }
  if (ec) {
    throw PersistenceError("Failed to move index files into place: " + ec.message());
  }
}

void VectorIndex::load_locked() {
  if (!std::filesystem::exists(index_path_)) {
    throw PersistenceError("index file " + index_path_.string() + " does not exist");
  }
  const std::filesystem::path metadata_file = metadata_path();
  if (!std::filesystem::exists(metadata_file)) {
    throw PersistenceError("metadata file " + metadata_file.string() + " does not exist");
  }

  std::unique_ptr<faiss::Index> loaded;
  try {
    loaded.reset(faiss::read_index(index_path_.c_str()));
  } catch (const faiss::FaissException &e) {
    throw PersistenceError("unreadable index file: " + std::string(e.what()));
  }
  if (loaded->metric_type != faiss::METRIC_L2 ||
      dynamic_cast<faiss::IndexFlatL2 *>(loaded.get()) == nullptr) {
    throw PersistenceError("index file does not hold a flat L2 index");
  }
  if (static_cast<std::size_t>(loaded->d) != vector_dim_) {
    throw PersistenceError("index dimension " + std::to_string(loaded->d) +
                           " does not match expected " + std::to_string(vector_dim_));
  }

  std::vector<VectorRecord> loaded_records;
  try {
    std::ifstream in(metadata_file);
    if (!in.is_open()) {
      throw PersistenceError("cannot open " + metadata_file.string());
    }
    nlohmann::json json_records;
    in >> json_records;
    loaded_records = json_records.get<std::vector<VectorRecord>>();
  } catch (const nlohmann::json::exception &e) {
    throw PersistenceError("corrupt metadata file: " + std::string(e.what()));
  }

  if (loaded_records.size() != static_cast<std::size_t>(loaded->ntotal)) {
    throw PersistenceError("index holds " + std::to_string(loaded->ntotal) +
                           " vectors but metadata holds " + std::to_string(loaded_records.size()) +
                           " records");
  }
  for (std::size_t i = 0; i < loaded_records.size(); ++i) {
    if (loaded_records[i].index != i) {
      throw PersistenceError("metadata record " + std::to_string(i) + " claims position " +
                             std::to_string(loaded_records[i].index));
    }
  }

  index_ = std::move(loaded);
  records_ = std::move(loaded_records);
}

void VectorIndex::load() {
  std::unique_lock lock(mutex_);
  try {
    load_locked();
    std::cout << "Loaded index with " << records_.size() << " vectors from "
              << index_path_.string() << std::endl;
  } catch (const std::exception &e) {
    std::cerr << "Error loading index: " << e.what() << ". Starting with an empty index."
              << std::endl;
    reset_locked();
  }
}

void VectorIndex::clear() {
  std::unique_lock lock(mutex_);
  reset_locked();
}

std::optional<VectorRecord> VectorIndex::get_document(std::size_t id) const {
  std::shared_lock lock(mutex_);
  if (id >= records_.size()) {
    return std::nullopt;
  }
  return records_[id];
}

std::vector<std::optional<VectorRecord>> VectorIndex::get_documents(
    const std::vector<std::size_t> &ids) const {
  std::vector<std::optional<VectorRecord>> documents;
  documents.reserve(ids.size());
  for (std::size_t id : ids) {
    documents.push_back(get_document(id));
  }
  return documents;
}

std::vector<VectorRecord> VectorIndex::get_all_documents() const {
  std::shared_lock lock(mutex_);
  return records_;
}

std::size_t VectorIndex::size() const {
  std::shared_lock lock(mutex_);
  return records_.size();
}

}  // namespace docqa_core
