#include "docqa_core/services/rag_service.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "docqa_core/documents/document_processor.hpp"
#include "docqa_core/llm/embedder.hpp"
#include "docqa_core/store/vector_index.hpp"
#include "docqa_core/text/text_utils.hpp"

namespace docqa_core {

namespace {

// UTC, ISO-8601 with microseconds.
std::string current_timestamp() {
  const auto now = std::chrono::system_clock::now();
  const std::time_t time_t = std::chrono::system_clock::to_time_t(now);
  const auto micros =
      std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count() %
      1000000;
  std::tm tm_struct = {};
  gmtime_r(&time_t, &tm_struct);

  std::stringstream ss;
  ss << std::put_time(&tm_struct, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(6)
     << std::setfill('0') << micros;
  return ss.str();
}

}  // namespace

std::string to_string(ServiceErrorKind kind) {
  switch (kind) {
    case ServiceErrorKind::None:
      return "none";
    case ServiceErrorKind::Validation:
      return "validation";
    case ServiceErrorKind::EmptyCorpus:
      return "empty_corpus";
    case ServiceErrorKind::DimensionMismatch:
      return "dimension_mismatch";
    case ServiceErrorKind::Persistence:
      return "persistence";
    case ServiceErrorKind::Internal:
      return "internal";
    default:
      return "unknown";
  }
}

RagService::RagService(std::shared_ptr<ServiceProvider> services, RagSettings settings)
    : services_(std::move(services)), settings_(std::move(settings)) {
  if (!services_) {
    throw std::invalid_argument("RagService requires a ServiceProvider");
  }
}

IngestResult RagService::ingest() {
  return ingest(settings_.documents_dir);
}

IngestResult RagService::ingest(const std::filesystem::path &directory) {
  std::lock_guard<std::mutex> lock(write_mutex_);
  VectorIndex &index = services_->get_vector_index();

  std::cout << "Ingesting documents from: " << directory.string() << std::endl;
  std::vector<Chunk> chunks =
      services_->get_document_processor().process_directory(directory, settings_.file_extensions);
  if (chunks.empty()) {
    return IngestResult::failure_response(ServiceErrorKind::EmptyCorpus,
                                          "No documents found to process", index.size());
  }
  std::cout << "Processed " << chunks.size() << " chunks from documents" << std::endl;

  std::vector<std::string> texts;
  texts.reserve(chunks.size());
  for (const auto &chunk : chunks) {
    texts.push_back(chunk.text());
  }

  std::cout << "Generating embeddings..." << std::endl;
  std::vector<std::vector<float>> embeddings = services_->get_embedder().embed_many(texts);
  if (embeddings.size() != texts.size()) {
    return IngestResult::failure_response(
        ServiceErrorKind::Internal,
        "Embedder returned " + std::to_string(embeddings.size()) + " vectors for " +
            std::to_string(texts.size()) + " chunks",
        index.size());
  }

  std::cout << "Adding to vector store..." << std::endl;
  try {
    index.add_chunks(chunks, embeddings);
  } catch (const DimensionMismatchError &e) {
    std::cerr << "Ingest aborted: " << e.what() << std::endl;
    return IngestResult::failure_response(ServiceErrorKind::DimensionMismatch, e.what(),
                                          index.size());
  }

  try {
    index.save();
  } catch (const PersistenceError &e) {
    std::cerr << "Failed to persist index: " << e.what() << std::endl;
    return IngestResult::failure_response(ServiceErrorKind::Persistence, e.what(), index.size());
  }

  return IngestResult::success_response(chunks.size(), index.size());
}

std::optional<std::string> RagService::validate_request(const std::string &question,
                                                        int top_k) const {
  if (trim(question).empty()) {
    return "Question cannot be empty";
  }
  if (top_k <= 0) {
    return "top_k must be greater than 0";
  }
  return std::nullopt;
}

std::vector<QueryResult> RagService::retrieve(const std::string &question, int top_k) {
  std::vector<float> query_embedding = services_->get_embedder().embed_one(question);
  return services_->get_vector_index().similarity_search(query_embedding, top_k);
}

template <typename Response, typename Generate>
Response RagService::run_query(const std::string &question,
                               std::optional<int> top_k,
                               const Generate &generate_answer) {
  const int k = top_k.value_or(settings_.top_k);
  if (auto error = validate_request(question, k)) {
    return Response::failure_response(ServiceErrorKind::Validation, *error, question);
  }

  std::vector<QueryResult> results;
  try {
    results = retrieve(question, k);
  } catch (const DimensionMismatchError &e) {
    std::cerr << "Query aborted: " << e.what() << std::endl;
    return Response::failure_response(ServiceErrorKind::DimensionMismatch, e.what(), question);
  }

  auto answer = generate_answer(build_context(results));
  return Response::success_response(question, std::move(answer), build_sources(results),
                                    current_timestamp());
}

QueryResponse RagService::query(const std::string &question, std::optional<int> top_k) {
  return run_query<QueryResponse>(question, top_k, [&](const std::string &context) {
    return trim(services_->get_generator().generate(build_prompt(question, context)));
  });
}

QueryResponse RagService::query_stream(const std::string &question,
                                       const FragmentCallback &on_fragment,
                                       std::optional<int> top_k) {
  return run_query<QueryResponse>(question, top_k, [&](const std::string &context) {
    return trim(
        services_->get_generator().generate_stream(build_prompt(question, context), on_fragment));
  });
}

StructuredQueryResponse RagService::query_structured(const std::string &question,
                                                     const nlohmann::json &response_format,
                                                     std::optional<int> top_k) {
  if (!response_format.is_object()) {
    return StructuredQueryResponse::failure_response(
        ServiceErrorKind::Validation, "response_format must be a JSON object", question);
  }
  return run_query<StructuredQueryResponse>(question, top_k, [&](const std::string &context) {
    return services_->get_generator()
        .generate_structured(build_structured_prompt(question, context), response_format)
        .to_json();
  });
}

StructuredQueryResponse RagService::query_structured_text(const std::string &question,
                                                          const std::string &response_format,
                                                          std::optional<int> top_k) {
  nlohmann::json schema;
  try {
    schema = nlohmann::json::parse(response_format);
  } catch (const nlohmann::json::parse_error &) {
    return StructuredQueryResponse::failure_response(
        ServiceErrorKind::Validation, "Invalid JSON format for response_format", question);
  }
  return query_structured(question, schema, top_k);
}

OperationResult RagService::clear_index() {
  std::lock_guard<std::mutex> lock(write_mutex_);
  VectorIndex &index = services_->get_vector_index();
  index.clear();
  try {
    index.save();
  } catch (const PersistenceError &e) {
    std::cerr << "Failed to persist cleared index: " << e.what() << std::endl;
    return {false, "error", e.what(), ServiceErrorKind::Persistence};
  }
  return {true, "success", "Vector store index cleared", ServiceErrorKind::None};
}

std::size_t RagService::index_size() const {
  return services_->get_vector_index().size();
}

std::string RagService::build_context(const std::vector<QueryResult> &results) {
  std::stringstream ss;
  for (size_t i = 0; i < results.size(); ++i) {
    if (i > 0) {
      ss << "\n\n";
    }
    ss << "[Document " << (i + 1) << ", Score: " << std::fixed << std::setprecision(2)
       << results[i].score << "]\n"
       << results[i].text;
  }
  return ss.str();
}

std::string RagService::build_prompt(const std::string &question, const std::string &context) {
  return "You are a helpful assistant that answers questions based on the provided context.\n\n"
         "Context:\n" +
         context + "\n\nQuestion: " + question +
         "\n\nAnswer the question based on the context above. If the context doesn't contain the "
         "answer, say \"" +
         kInsufficientContextAnswer + "\"\n\nProvide a concise and accurate answer:";
}

std::string RagService::build_structured_prompt(const std::string &question,
                                                const std::string &context) {
  return "You are a helpful assistant that answers questions based on the provided context.\n\n"
         "Context:\n" +
         context + "\n\nQuestion: " + question +
         "\n\nAnswer the question based on the context above. If the context doesn't contain the "
         "answer, indicate this in your response.";
}

std::vector<SourceReference> RagService::build_sources(const std::vector<QueryResult> &results) {
  std::vector<SourceReference> sources;
  sources.reserve(results.size());
  for (const auto &result : results) {
    SourceReference source;
    const std::string &name = result.metadata.document.document_name;
    source.document = name.empty() ? "Unknown" : name;
    source.score = result.score;
    source.text = truncate_chars(result.text, PREVIEW_CHARS);
    if (source.text.size() < result.text.size()) {
      source.text += "...";
    }
    sources.push_back(std::move(source));
  }
  return sources;
}

}  // namespace docqa_core
