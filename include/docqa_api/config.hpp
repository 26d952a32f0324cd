#pragma once

#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "docqa_core/chunking/chunking_strategy.hpp"

class Config {
 public:
  std::string api_base_url;
  int server_threads;  // 0 means one per hardware thread
  std::string documents_dir;
  std::string vector_store_path;

  // Model configuration
  std::string ollama_url;
  std::string embedding_model;
  int embedding_dimension;
  std::string llm_model;
  int request_timeout_seconds;

  // Retrieval configuration
  int chunk_size;
  int chunk_overlap;
  std::string chunking_strategy;
  int top_k;
  std::vector<std::string> file_extensions;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception& e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename + "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json& json_config) {
    Config config;

    // Apply defaults when keys are missing
    config.api_base_url = json_config.value("api_base_url", std::string("0.0.0.0:8000"));
    config.documents_dir = json_config.value("documents_dir", std::string("./data/documents"));
    config.vector_store_path =
        json_config.value("vector_store_path", std::string("./data/vector_store.faiss"));
    config.ollama_url = json_config.value("ollama_url", std::string("http://localhost:11434"));
    config.embedding_model = json_config.value("embedding_model", std::string("nomic-embed-text"));
    config.llm_model = json_config.value("llm_model", std::string("llama3"));
    config.chunking_strategy =
        json_config.value("chunking_strategy", std::string(docqa_core::kParagraphStrategy));

    // Integers fall back to their default when missing or of the wrong type
    config.embedding_dimension = int_or_default(json_config, "embedding_dimension", 768);
    config.request_timeout_seconds = int_or_default(json_config, "request_timeout_seconds", 120);
    config.server_threads = int_or_default(json_config, "server_threads", 0);
    config.chunk_size = int_or_default(json_config, "chunk_size", 1000);
    config.chunk_overlap = int_or_default(json_config, "chunk_overlap", 200);
    config.top_k = int_or_default(json_config, "top_k", 3);

    try {
      if (json_config.contains("file_extensions")) {
        config.file_extensions = json_config.at("file_extensions").get<std::vector<std::string>>();
      } else {
        config.file_extensions = {".txt", ".md", ".pdf"};
      }
    } catch (const std::exception& e) {
      throw std::runtime_error(std::string("file_extensions must be an array of strings: ") + e.what());
    }

    config.validate();
    return config;
  }

 private:
  static int int_or_default(const nlohmann::json& json_config, const std::string& key, int fallback) {
    try {
      if (json_config.contains(key)) {
        return json_config.at(key).get<int>();
      }
    } catch (const std::exception&) {
      // Fallback to default if wrong type provided
    }
    return fallback;
  }

  void validate() const {
    if (api_base_url.empty() || api_base_url.find(':') == std::string::npos) {
      throw std::runtime_error("api_base_url must have the form host:port");
    }
    if (server_threads < 0) {
      throw std::runtime_error("server_threads cannot be negative");
    }
    if (documents_dir.empty()) {
      throw std::runtime_error("documents_dir cannot be empty");
    }
    if (vector_store_path.empty()) {
      throw std::runtime_error("vector_store_path cannot be empty");
    }
    if (ollama_url.empty()) {
      throw std::runtime_error("ollama_url cannot be empty");
    }
    if (embedding_model.empty()) {
      throw std::runtime_error("embedding_model cannot be empty");
    }
    if (llm_model.empty()) {
      throw std::runtime_error("llm_model cannot be empty");
    }
    if (embedding_dimension <= 0) {
      throw std::runtime_error("embedding_dimension must be greater than 0");
    }
    if (request_timeout_seconds <= 0) {
      throw std::runtime_error("request_timeout_seconds must be greater than 0");
    }
    if (chunk_size <= 0) {
      throw std::runtime_error("chunk_size must be greater than 0");
    }
    if (chunk_overlap < 0 || chunk_overlap >= chunk_size) {
      throw std::runtime_error("chunk_overlap must be at least 0 and smaller than chunk_size");
    }
    if (!docqa_core::is_known_chunking_strategy(chunking_strategy)) {
      throw std::runtime_error("Unknown chunking_strategy: " + chunking_strategy);
    }
    if (top_k <= 0) {
      throw std::runtime_error("top_k must be greater than 0");
    }
    if (file_extensions.empty()) {
      throw std::runtime_error("file_extensions cannot be empty");
    }
    for (const auto& extension : file_extensions) {
      if (extension.size() < 2 || extension.front() != '.') {
        throw std::runtime_error("file extension must start with '.': " + extension);
      }
    }
  }
};
