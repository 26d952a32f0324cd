#pragma once

#include <string>
#include <curl/curl.h>
#include <nlohmann/json.hpp>

namespace docqa_cli
{

  enum class Command
  {
    Ingest,
    Query,
    Structured,
    Clear,
    Documents,
    Upload,
    Help
  };

  struct CliOptions
  {
    Command command = Command::Help;
    std::string question;
    std::string response_format;  // raw JSON schema text for structured queries
    std::string file_path;
    int top_k = 0;                // 0 leaves the server's configured default in place
  };

  class CliError : public std::exception
  {
  public:
    explicit CliError(const std::string &message) : message_(message) {}

    const char *what() const noexcept override
    {
      return message_.c_str();
    }

  private:
    std::string message_;
  };

  class CliHandler
  {
  public:
    explicit CliHandler(const std::string &api_base_url);
    ~CliHandler();

    // Disable copy constructor and assignment
    CliHandler(const CliHandler &) = delete;
    CliHandler &operator=(const CliHandler &) = delete;

    // Parse command line arguments
    CliOptions parse_arguments(int argc, char *argv[]) const;

    // Execute command. Returns false when the request failed.
    bool execute_command(const CliOptions &options);

    std::string get_api_base_url() const;

    std::string build_url(const std::string &endpoint) const;

  private:
    std::string api_base_url_;
    CURL *curl_handle_;

    // Command handlers
    void handle_ingest_command(const CliOptions &options);
    void handle_query_command(const CliOptions &options);
    void handle_structured_command(const CliOptions &options);
    void handle_clear_command(const CliOptions &options);
    void handle_documents_command(const CliOptions &options);
    void handle_upload_command(const CliOptions &options);

    // HTTP methods
    nlohmann::json make_get_request(const std::string &endpoint);
    nlohmann::json make_post_request(const std::string &endpoint, const nlohmann::json &data);
    nlohmann::json perform_request(const std::string &url);

    // Helper methods
    void setup_curl_handle();
    std::string url_encode(const std::string &value);
    static size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp);
    void print_json_response(const nlohmann::json &response);
    void print_answer_response(const nlohmann::json &response);
    void print_error(const std::string &error);
    void print_help();
  };

}
