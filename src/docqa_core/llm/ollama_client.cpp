#include "docqa_core/llm/ollama_client.hpp"
#include "ollama.hpp"

namespace docqa_core {

void setup_server_connection(const std::string &ollama_url, int timeout_seconds) {
  ollama::setServerURL(ollama_url);
  // Generation on a local model can take a while; bound it at the boundary
  ollama::setReadTimeout(timeout_seconds);
  ollama::setWriteTimeout(timeout_seconds);
  if (!ollama::is_running()) {
    throw OllamaError("Ollama server is not running at " + ollama_url);
  }
}

bool is_server_available() {
  return ollama::is_running();
}

OllamaEmbedder::OllamaEmbedder(const std::string &ollama_url,
                               const std::string &embedding_model,
                               std::size_t dimension,
                               int timeout_seconds)
    : ollama_url_(ollama_url), embedding_model_(embedding_model), dimension_(dimension) {
  setup_server_connection(ollama_url_, timeout_seconds);
}

// The Ollama api supports batch requests for the embeddings, this will have to be a separate endpoint
std::vector<std::vector<float>> OllamaEmbedder::embed_many(const std::vector<std::string> &texts) {
  std::vector<std::vector<float>> embeddings;
  embeddings.reserve(texts.size());
  for (const auto &text : texts) {
    embeddings.push_back(embed_one(text));
  }
  return embeddings;
}

std::vector<float> OllamaEmbedder::embed_one(const std::string &text) {
  try {
    ollama::response response = ollama::generate_embeddings(embedding_model_, text);

    auto json_response = response.as_json();
    if (!json_response.contains("embeddings")) {
      throw OllamaError("Response does not contain embedding field");
    }

    // Handle different embedding response formats
    auto embeddings = json_response["embeddings"];
    if (!embeddings.is_array()) {
      throw OllamaError("Embeddings field is not an array");
    }
    if (embeddings.size() > 0 && embeddings[0].is_array()) {
      // Array of arrays - take the first embedding vector
      return embeddings[0].get<std::vector<float>>();
    }
    return embeddings.get<std::vector<float>>();
  } catch (const ollama::exception &e) {
    throw OllamaError("Embedding generation failed: " + std::string(e.what()));
  }
}

OllamaGenerator::OllamaGenerator(const std::string &ollama_url,
                                 const std::string &model_name,
                                 int timeout_seconds)
    : ollama_url_(ollama_url), model_name_(model_name) {
  setup_server_connection(ollama_url_, timeout_seconds);
}

std::string OllamaGenerator::generate(const std::string &prompt) {
  try {
    ollama::response response = ollama::generate(model_name_, prompt);
    return response.as_simple_string();
  } catch (const ollama::exception &e) {
    throw OllamaError("Text generation failed: " + std::string(e.what()));
  }
}

std::string OllamaGenerator::generate_stream(const std::string &prompt,
                                             const FragmentCallback &on_fragment) {
  std::string full_text;
  bool keep_going = true;
  try {
    ollama::generate(model_name_, prompt, [&](const ollama::response &partial) {
      if (!keep_going) {
        return false;
      }
      const std::string fragment = partial.as_simple_string();
      full_text += fragment;
      keep_going = on_fragment(fragment);
      return keep_going;
    });
  } catch (const ollama::exception &e) {
    throw OllamaError("Streaming generation failed: " + std::string(e.what()));
  }
  return full_text;
}

std::string OllamaGenerator::generate_json(const std::string &system_prompt,
                                           const std::string &prompt) {
  try {
    ollama::request request(model_name_, prompt, nullptr, false);
    request["system"] = system_prompt;
    request["format"] = "json";
    ollama::response response = ollama::generate(request);
    return response.as_simple_string();
  } catch (const ollama::exception &e) {
    throw OllamaError("Structured generation failed: " + std::string(e.what()));
  }
}

}  // namespace docqa_core
