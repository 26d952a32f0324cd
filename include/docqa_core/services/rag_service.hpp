#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "docqa_core/llm/generator.hpp"
#include "docqa_core/services/service_provider.hpp"
#include "docqa_core/types/vector_record.hpp"

namespace docqa_core {

enum class ServiceErrorKind { None, Validation, EmptyCorpus, DimensionMismatch, Persistence, Internal };

std::string to_string(ServiceErrorKind kind);

struct IngestResult {
  bool success;
  std::string status;
  std::string message;
  ServiceErrorKind error_kind;
  std::size_t chunks_processed;
  std::size_t total_vectors;

  static IngestResult success_response(std::size_t chunks_processed, std::size_t total_vectors) {
    return {true, "success", "Documents ingested", ServiceErrorKind::None, chunks_processed,
            total_vectors};
  }

  static IngestResult failure_response(ServiceErrorKind kind,
                                       const std::string &message,
                                       std::size_t total_vectors = 0) {
    return {false, "error", message, kind, 0, total_vectors};
  }
};

struct SourceReference {
  std::string document;
  float score;
  std::string text;  // preview, at most PREVIEW_CHARS characters plus "..."
};

// Shared by free-text and structured answers; only the answer type differs.
template <typename Answer>
struct BasicQueryResponse {
  bool success = false;
  ServiceErrorKind error_kind = ServiceErrorKind::None;
  std::string error_message;
  std::string question;
  Answer answer{};
  std::vector<SourceReference> sources;
  std::string timestamp;

  static BasicQueryResponse success_response(const std::string &question,
                                             Answer answer,
                                             std::vector<SourceReference> sources,
                                             const std::string &timestamp) {
    BasicQueryResponse response;
    response.success = true;
    response.question = question;
    response.answer = std::move(answer);
    response.sources = std::move(sources);
    response.timestamp = timestamp;
    return response;
  }

  static BasicQueryResponse failure_response(ServiceErrorKind kind,
                                             const std::string &message,
                                             const std::string &question) {
    BasicQueryResponse response;
    response.error_kind = kind;
    response.error_message = message;
    response.question = question;
    return response;
  }
};

using QueryResponse = BasicQueryResponse<std::string>;
using StructuredQueryResponse = BasicQueryResponse<nlohmann::json>;

struct OperationResult {
  bool success;
  std::string status;
  std::string message;
  ServiceErrorKind error_kind;
};

struct RagSettings {
  int top_k = 3;
  std::filesystem::path documents_dir = "./data/documents";
  std::vector<std::string> file_extensions = {".txt", ".md", ".pdf"};
};

/**
 * @class RagService
 * @brief Ingest and question-answering workflows over the components held by a
 *        ServiceProvider.
 *
 * Expected failures (bad input, empty corpus, dimension mismatch, failed save)
 * come back as tagged results. Model transport errors (OllamaError) propagate.
 * Ingest and clear are serialized against each other; queries only take the
 * index's shared lock.
 */
class RagService {
 public:
  static constexpr std::size_t PREVIEW_CHARS = 200;
  static constexpr const char *kInsufficientContextAnswer =
      "I don't have enough information to answer this question.";

  RagService(std::shared_ptr<ServiceProvider> services, RagSettings settings);

  // Chunk, embed (one batch), index and persist. Uses the configured
  // documents directory when none is given.
  IngestResult ingest();
  IngestResult ingest(const std::filesystem::path &directory);

  QueryResponse query(const std::string &question, std::optional<int> top_k = std::nullopt);

  // Like query(), streaming answer fragments to `on_fragment` as they arrive.
  QueryResponse query_stream(const std::string &question,
                             const FragmentCallback &on_fragment,
                             std::optional<int> top_k = std::nullopt);

  // `response_format` is passed to the generator unmodified and must be a JSON object.
  StructuredQueryResponse query_structured(const std::string &question,
                                           const nlohmann::json &response_format,
                                           std::optional<int> top_k = std::nullopt);

  // Same, with the schema still serialized. Unparsable JSON is a validation failure.
  StructuredQueryResponse query_structured_text(const std::string &question,
                                                const std::string &response_format,
                                                std::optional<int> top_k = std::nullopt);

  OperationResult clear_index();

  std::size_t index_size() const;

  const RagSettings &settings() const {
    return settings_;
  }

  static std::string build_context(const std::vector<QueryResult> &results);
  static std::string build_prompt(const std::string &question, const std::string &context);
  static std::string build_structured_prompt(const std::string &question, const std::string &context);
  static std::vector<SourceReference> build_sources(const std::vector<QueryResult> &results);

 private:
  std::shared_ptr<ServiceProvider> services_;
  RagSettings settings_;
  std::mutex write_mutex_;

  // Error message when the request is invalid.
  std::optional<std::string> validate_request(const std::string &question, int top_k) const;
  std::vector<QueryResult> retrieve(const std::string &question, int top_k);

  template <typename Response, typename Generate>
  Response run_query(const std::string &question,
                     std::optional<int> top_k,
                     const Generate &generate_answer);
};

}  // namespace docqa_core
