#pragma once

#include <cstddef>
#include <exception>
#include <string>
#include <vector>

#include "docqa_core/llm/embedder.hpp"
#include "docqa_core/llm/generator.hpp"

namespace docqa_core {

class OllamaError : public std::exception {
 public:
  explicit OllamaError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Points ollama-hpp at `ollama_url` with the given read/write timeout and
// checks the server answers. Throws OllamaError when it does not.
void setup_server_connection(const std::string &ollama_url, int timeout_seconds);

bool is_server_available();

class OllamaEmbedder : public Embedder {
 public:
  OllamaEmbedder(const std::string &ollama_url,
                 const std::string &embedding_model,
                 std::size_t dimension,
                 int timeout_seconds = 120);

  OllamaEmbedder(const OllamaEmbedder &) = delete;
  OllamaEmbedder &operator=(const OllamaEmbedder &) = delete;

  std::vector<std::vector<float>> embed_many(const std::vector<std::string> &texts) override;
  std::vector<float> embed_one(const std::string &text) override;

  std::size_t dimension() const override {
    return dimension_;
  }

 private:
  std::string ollama_url_;
  std::string embedding_model_;
  std::size_t dimension_;
};

class OllamaGenerator : public Generator {
 public:
  OllamaGenerator(const std::string &ollama_url, const std::string &model_name, int timeout_seconds = 120);

  OllamaGenerator(const OllamaGenerator &) = delete;
  OllamaGenerator &operator=(const OllamaGenerator &) = delete;

  std::string generate(const std::string &prompt) override;
  std::string generate_stream(const std::string &prompt, const FragmentCallback &on_fragment) override;

  const std::string &model_name() const {
    return model_name_;
  }

 protected:
  std::string generate_json(const std::string &system_prompt, const std::string &prompt) override;

 private:
  std::string ollama_url_;
  std::string model_name_;
};

}  // namespace docqa_core
