#include "docqa_core/llm/generator.hpp"

#include <iostream>

#include "docqa_core/text/text_utils.hpp"

namespace docqa_core {

nlohmann::json StructuredGeneration::to_json() const {
  if (parsed()) {
    return value_;
  }
  return {{"error", error()}, {"raw_response", raw_text_}};
}

std::string Generator::build_schema_instruction(const nlohmann::json &schema) {
  return "You are a helpful assistant that always responds with valid JSON.\n"
         "The response must match the following JSON schema exactly:\n\n" +
         schema.dump(2) +
         "\n\nReturn only the JSON object, without any additional text or markdown formatting.";
}

std::string Generator::strip_code_fences(const std::string &text) {
  std::string stripped = trim(text);
  if (stripped.rfind("```", 0) != 0) {
    return stripped;
  }

  // Drop the opening fence together with its language tag
  const auto first_newline = stripped.find('\n');
  if (first_newline == std::string::npos) {
    stripped = stripped.substr(3);
    if (stripped.rfind("json", 0) == 0) {
      stripped = stripped.substr(4);
    }
  } else {
    stripped = stripped.substr(first_newline + 1);
  }

  stripped = trim(stripped);
  if (stripped.size() >= 3 && stripped.compare(stripped.size() - 3, 3, "```") == 0) {
    stripped = stripped.substr(0, stripped.size() - 3);
  }
  return trim(stripped);
}

StructuredGeneration Generator::generate_structured(const std::string &prompt,
                                                    const nlohmann::json &schema) {
  const std::string raw = generate_json(build_schema_instruction(schema), prompt);

  try {
    return StructuredGeneration::success(nlohmann::json::parse(strip_code_fences(raw)));
  } catch (const nlohmann::json::parse_error &e) {
    std::cerr << "Failed to parse JSON response: " << e.what() << std::endl;
  }

  std::string fallback = generate(prompt);
  return StructuredGeneration::failure(std::move(fallback), kStructuredFailureMessage);
}

}  // namespace docqa_core
