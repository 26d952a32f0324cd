#pragma once

#include <functional>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace docqa_core {

/**
 * @brief Outcome of a schema-constrained generation.
 *
 * Either the model's reply parsed as JSON, or the raw text of the fallback
 * free-text generation together with the reason parsing failed.
 */
class StructuredGeneration {
 public:
  static StructuredGeneration success(nlohmann::json value) {
    StructuredGeneration result;
    result.value_ = std::move(value);
    return result;
  }

  static StructuredGeneration failure(std::string raw_text, std::string error) {
    StructuredGeneration result;
    result.raw_text_ = std::move(raw_text);
    result.error_ = std::move(error);
    return result;
  }

  bool parsed() const {
    return !error_.has_value();
  }
  const nlohmann::json &value() const {
    return value_;
  }
  const std::string &raw_text() const {
    return raw_text_;
  }
  std::string error() const {
    return error_.value_or("");
  }

  // The parsed value, or {"error": ..., "raw_response": ...}.
  nlohmann::json to_json() const;

 private:
  StructuredGeneration() = default;

  nlohmann::json value_;
  std::string raw_text_;
  std::optional<std::string> error_;
};

// Receives one streamed fragment; return false to stop the stream.
using FragmentCallback = std::function<bool(const std::string &fragment)>;

class Generator {
 public:
  virtual ~Generator() = default;

  virtual std::string generate(const std::string &prompt) = 0;

  // Streams the reply fragment by fragment and returns the concatenation of
  // the fragments delivered.
  virtual std::string generate_stream(const std::string &prompt, const FragmentCallback &on_fragment) = 0;

  /**
   * @brief Generates a reply constrained to `schema` and parses it as JSON.
   *
   * The schema is serialized into a system instruction and the model is asked
   * for JSON only. A surrounding markdown code fence is stripped before
   * parsing. If the reply does not parse, falls back to generate(prompt) and
   * returns a failure carrying that text; parse errors never escape.
   */
  StructuredGeneration generate_structured(const std::string &prompt, const nlohmann::json &schema);

  static std::string build_schema_instruction(const nlohmann::json &schema);
  static std::string strip_code_fences(const std::string &text);

  static constexpr const char *kStructuredFailureMessage = "Failed to generate structured response";

 protected:
  // One JSON-mode completion: the raw reply text.
  virtual std::string generate_json(const std::string &system_prompt, const std::string &prompt) = 0;
};

}  // namespace docqa_core
