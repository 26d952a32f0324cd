#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace docqa_core {

// Number of Unicode code points in `text`. Falls back to the byte count when
// the text is not valid UTF-8.
std::size_t char_count(const std::string &text);

bool is_valid_utf8(const std::string &text);

// Strips leading and trailing ASCII whitespace.
std::string trim(const std::string &text);

// First `max_chars` code points of `text`, never cutting a multi-byte sequence.
std::string truncate_chars(const std::string &text, std::size_t max_chars);

// Splits on blank lines (a newline, optional whitespace, a newline). Pieces are
// trimmed and empty pieces are dropped.
std::vector<std::string> split_paragraphs(const std::string &text);

// Splits after '.', '!' or '?' when followed by whitespace. Pieces are trimmed
// and empty pieces are dropped.
std::vector<std::string> split_sentences(const std::string &text);

std::vector<std::string> split_words(const std::string &text);

}  // namespace docqa_core
