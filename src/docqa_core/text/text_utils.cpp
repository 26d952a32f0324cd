#include "docqa_core/text/text_utils.hpp"

#include <utf8.h>

#include <regex>
#include <sstream>

namespace docqa_core {

namespace {

constexpr const char *kWhitespace = " \t\n\r\f\v";

void push_trimmed(std::vector<std::string> &out, const std::string &piece) {
  std::string trimmed = trim(piece);
  if (!trimmed.empty()) {
    out.push_back(std::move(trimmed));
  }
}

// Splits `text` at every match of `separator`. `keep_prefix` characters of each
// match stay with the piece before it.
std::vector<std::string> split_on(const std::string &text, const std::regex &separator,
                                  long keep_prefix) {
  std::vector<std::string> pieces;
  long start = 0;

  auto matches_begin = std::sregex_iterator(text.begin(), text.end(), separator);
  auto matches_end = std::sregex_iterator();
  for (std::sregex_iterator i = matches_begin; i != matches_end; ++i) {
    long cut = i->position() + keep_prefix;
    push_trimmed(pieces, text.substr(start, cut - start));
    start = i->position() + i->length();
  }
  push_trimmed(pieces, text.substr(start));
  return pieces;
}

}  // namespace

bool is_valid_utf8(const std::string &text) {
  return utf8::is_valid(text.begin(), text.end());
}

std::size_t char_count(const std::string &text) {
  if (!is_valid_utf8(text)) {
    return text.size();
  }
  return static_cast<std::size_t>(utf8::distance(text.begin(), text.end()));
}

std::string trim(const std::string &text) {
  const auto first = text.find_first_not_of(kWhitespace);
  if (first == std::string::npos) {
    return "";
  }
  const auto last = text.find_last_not_of(kWhitespace);
  return text.substr(first, last - first + 1);
}

std::string truncate_chars(const std::string &text, std::size_t max_chars) {
  if (!is_valid_utf8(text)) {
    return text.substr(0, max_chars);
  }
  auto it = text.begin();
  for (std::size_t i = 0; i < max_chars && it != text.end(); ++i) {
    utf8::next(it, text.end());
  }
  return std::string(text.begin(), it);
}

std::vector<std::string> split_paragraphs(const std::string &text) {
  static const std::regex paragraph_regex(R"(\n\s*\n)");
  return split_on(text, paragraph_regex, 0);
}

std::vector<std::string> split_sentences(const std::string &text) {
  static const std::regex sentence_regex(R"([.!?]\s+)");
  // Keep the punctuation with the sentence it ends.
  return split_on(text, sentence_regex, 1);
}

std::vector<std::string> split_words(const std::string &text) {
  std::vector<std::string> words;
  std::istringstream stream(text);
  std::string word;
  while (stream >> word) {
    words.push_back(word);
  }
  return words;
}

}  // namespace docqa_core
