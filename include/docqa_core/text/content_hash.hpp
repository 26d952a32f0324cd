#pragma once

#include <exception>
#include <string>

namespace docqa_core {

class ContentHashError : public std::exception {
 public:
  explicit ContentHashError(const std::string &message) : message_(message) {}
  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Lower-case hex SHA-256 digest of `content`.
std::string compute_content_hash(const std::string &content);

}  // namespace docqa_core
