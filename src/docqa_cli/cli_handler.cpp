#include "docqa_cli/cli_handler.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip> // Required for std::fixed and std::setprecision
#include <iostream>
#include <sstream>

namespace docqa_cli {

CliHandler::CliHandler(const std::string& api_base_url)
    : api_base_url_(api_base_url), curl_handle_(nullptr) {
    // Tolerate a trailing slash in API_BASE_URL
    while (!api_base_url_.empty() && api_base_url_.back() == '/') {
        api_base_url_.pop_back();
    }
    setup_curl_handle();
}

CliHandler::~CliHandler() {
    if (curl_handle_) {
        curl_easy_cleanup(curl_handle_);
    }
}

void CliHandler::setup_curl_handle() {
    curl_handle_ = curl_easy_init();
    if (!curl_handle_) {
        throw CliError("Failed to initialize CURL");
    }
}

size_t CliHandler::write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    userp->append((char*)contents, size * nmemb);
    return size * nmemb;
}

CliOptions CliHandler::parse_arguments(int argc, char* argv[]) const {
    CliOptions options;

    if (argc < 2) {
        options.command = Command::Help;
        return options;
    }

    std::string command = argv[1];

    // Flags all take a value
    auto flag_value = [&](int i) -> std::string {
        if (i + 1 >= argc) {
            throw CliError(std::string("Missing value for ") + argv[i]);
        }
        return argv[i + 1];
    };
    auto parse_top_k = [](const std::string& value) {
        int top_k = 0;
        try {
            top_k = std::stoi(value);
        } catch (const std::exception&) {
            throw CliError("--top-k expects an integer, got: " + value);
        }
        if (top_k <= 0) {
            throw CliError("--top-k must be greater than 0");
        }
        return top_k;
    };

    if (command == "ingest" || command == "i") {
        options.command = Command::Ingest;
    } else if (command == "query" || command == "q") {
        options.command = Command::Query;
        for (int i = 2; i < argc; i += 2) {
            std::string flag = argv[i];
            if (flag == "--question" || flag == "-q") {
                options.question = flag_value(i);
            } else if (flag == "--top-k" || flag == "-k") {
                options.top_k = parse_top_k(flag_value(i));
            } else {
                throw CliError("Unknown option for query: " + flag);
            }
        }
        if (options.question.empty()) {
            throw CliError("Query command requires a question. Usage: query --question <text>");
        }
    } else if (command == "structured" || command == "sq") {
        options.command = Command::Structured;
        for (int i = 2; i < argc; i += 2) {
            std::string flag = argv[i];
            if (flag == "--question" || flag == "-q") {
                options.question = flag_value(i);
            } else if (flag == "--format" || flag == "-f") {
                options.response_format = flag_value(i);
            } else if (flag == "--top-k" || flag == "-k") {
                options.top_k = parse_top_k(flag_value(i));
            } else {
                throw CliError("Unknown option for structured: " + flag);
            }
        }
        if (options.question.empty() || options.response_format.empty()) {
            throw CliError(
                "Structured command requires a question and a format. "
                "Usage: structured --question <text> --format <json schema>");
        }
    } else if (command == "clear" || command == "c") {
        options.command = Command::Clear;
    } else if (command == "documents" || command == "d") {
        options.command = Command::Documents;
    } else if (command == "upload" || command == "u") {
        options.command = Command::Upload;
        for (int i = 2; i < argc; i += 2) {
            std::string flag = argv[i];
            if (flag == "--file" || flag == "-f") {
                options.file_path = flag_value(i);
            } else {
                throw CliError("Unknown option for upload: " + flag);
            }
        }
        if (options.file_path.empty()) {
            throw CliError("Upload command requires a file path. Usage: upload --file <path>");
        }
    } else if (command == "help" || command == "h" || command == "--help" || command == "-h") {
        options.command = Command::Help;
    } else {
        throw CliError("Unknown command: " + command);
    }

    return options;
}

bool CliHandler::execute_command(const CliOptions& options) {
    try {
        switch (options.command) {
            case Command::Ingest:
                handle_ingest_command(options);
                break;
            case Command::Query:
                handle_query_command(options);
                break;
            case Command::Structured:
                handle_structured_command(options);
                break;
            case Command::Clear:
                handle_clear_command(options);
                break;
            case Command::Documents:
                handle_documents_command(options);
                break;
            case Command::Upload:
                handle_upload_command(options);
                break;
            case Command::Help:
                print_help();
                break;
        }
    } catch (const std::exception& e) {
        print_error(e.what());
        return false;
    }
    return true;
}

void CliHandler::handle_ingest_command(const CliOptions& options) {
    std::cout << "Ingesting documents..." << std::endl;
    nlohmann::json response = make_post_request("/ingest", nlohmann::json::object());
    std::cout << "Chunks processed: " << response.value("chunks_processed", 0) << std::endl;
    std::cout << "Total vectors: " << response.value("total_vectors", 0) << std::endl;
}

void CliHandler::handle_query_command(const CliOptions& options) {
    std::cout << "Question: " << options.question << std::endl;

    std::string endpoint = "/query?question=" + url_encode(options.question);
    if (options.top_k > 0) {
        endpoint += "&top_k=" + std::to_string(options.top_k);
    }
    print_answer_response(make_get_request(endpoint));
}

void CliHandler::handle_structured_command(const CliOptions& options) {
    std::cout << "Question: " << options.question << std::endl;

    nlohmann::json request_data = {
        {"question", options.question},
        {"response_format", options.response_format}
    };
    if (options.top_k > 0) {
        request_data["top_k"] = options.top_k;
    }
    print_answer_response(make_post_request("/query_structured", request_data));
}

void CliHandler::handle_clear_command(const CliOptions& options) {
    nlohmann::json response = make_post_request("/clear", nlohmann::json::object());
    std::cout << response.value("message", std::string("Vector store index cleared")) << std::endl;
}

void CliHandler::handle_documents_command(const CliOptions& options) {
    nlohmann::json response = make_get_request("/documents");
    const auto& documents = response["documents"];
    if (!documents.is_array() || documents.empty()) {
        std::cout << "No documents found." << std::endl;
        return;
    }
    std::cout << "\n=== Documents (" << documents.size() << ") ===" << std::endl;
    for (const auto& document : documents) {
        std::cout << "  - " << document["name"].get<std::string>()
                  << " (" << document["size"].get<std::uintmax_t>() << " bytes)" << std::endl;
    }
}

void CliHandler::handle_upload_command(const CliOptions& options) {
    std::ifstream file(options.file_path, std::ios::binary);
    if (!file.is_open()) {
        throw CliError("Cannot open file: " + options.file_path);
    }
    std::ostringstream content;
    content << file.rdbuf();

    std::string filename = std::filesystem::path(options.file_path).filename().string();
    std::cout << "Uploading " << filename << "..." << std::endl;

    nlohmann::json request_data = {
        {"filename", filename},
        {"content", content.str()}
    };
    nlohmann::json response = make_post_request("/upload", request_data);
    std::cout << response.value("message", std::string("Uploaded")) << std::endl;
}

nlohmann::json CliHandler::make_get_request(const std::string& endpoint) {
    if (!curl_handle_) {
        throw CliError("CURL handle not initialized");
    }
    curl_easy_reset(curl_handle_);
    return perform_request(build_url(endpoint));
}

nlohmann::json CliHandler::make_post_request(const std::string& endpoint, const nlohmann::json& data) {
    if (!curl_handle_) {
        throw CliError("CURL handle not initialized");
    }

    std::string request_json = data.dump();
    struct curl_slist* headers = curl_slist_append(nullptr, "Content-Type: application/json");

    curl_easy_reset(curl_handle_);
    curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDS, request_json.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDSIZE, static_cast<long>(request_json.size()));
    curl_easy_setopt(curl_handle_, CURLOPT_HTTPHEADER, headers);

    try {
        nlohmann::json response = perform_request(build_url(endpoint));
        curl_slist_free_all(headers);
        return response;
    } catch (...) {
        curl_slist_free_all(headers);
        throw;
    }
}

nlohmann::json CliHandler::perform_request(const std::string& url) {
    std::string response_buffer;

    curl_easy_setopt(curl_handle_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEDATA, &response_buffer);

    CURLcode res = curl_easy_perform(curl_handle_);
    if (res != CURLE_OK) {
        throw CliError("CURL request failed: " + std::string(curl_easy_strerror(res)));
    }

    long http_code = 0;
    curl_easy_getinfo(curl_handle_, CURLINFO_RESPONSE_CODE, &http_code);

    nlohmann::json body = nlohmann::json::parse(response_buffer, nullptr, /*allow_exceptions*/ false);
    if (http_code != 200) {
        std::string message = "HTTP request failed with status code: " + std::to_string(http_code);
        if (body.is_object()) {
            if (body.contains("error") && body["error"].is_string()) {
                message += " (" + body["error"].get<std::string>() + ")";
            } else if (body.contains("message") && body["message"].is_string()) {
                message += " (" + body["message"].get<std::string>() + ")";
            }
        }
        throw CliError(message);
    }
    if (body.is_discarded()) {
        throw CliError("Server returned invalid JSON");
    }
    return body;
}

std::string CliHandler::url_encode(const std::string& value) {
    char* escaped = curl_easy_escape(curl_handle_, value.c_str(), static_cast<int>(value.size()));
    if (!escaped) {
        throw CliError("Failed to URL-encode query");
    }
    std::string result(escaped);
    curl_free(escaped);
    return result;
}

std::string CliHandler::get_api_base_url() const {
    return api_base_url_;
}

std::string CliHandler::build_url(const std::string& endpoint) const {
    return api_base_url_ + endpoint;
}

void CliHandler::print_json_response(const nlohmann::json& response) {
    std::cout << response.dump(2) << std::endl;
}

void CliHandler::print_answer_response(const nlohmann::json& response) {
    std::cout << "\n=== Answer ===" << std::endl;
    const auto& answer = response["answer"];
    if (answer.is_string()) {
        std::cout << answer.get<std::string>() << std::endl;
    } else {
        print_json_response(answer);
    }

    if (response.contains("sources") && response["sources"].is_array() && !response["sources"].empty()) {
        std::cout << "\n=== Sources ===" << std::endl;
        for (const auto& source : response["sources"]) {
            std::cout << "  - " << source["document"].get<std::string>()
                      << " (score: " << std::fixed << std::setprecision(2) << source["score"].get<float>()
                      << ")" << std::endl;
        }
    }
}

void CliHandler::print_error(const std::string& error) {
    std::cerr << "Error: " << error << std::endl;
}

void CliHandler::print_help() {
    std::cout << R"(
docqa CLI - Question answering over your documents

Usage: docqa_cli <command> [options]

Commands:
  ingest, i       Chunk, embed and index every document in the server's documents directory

  query, q        Ask a question
    --question, -q <text>   Question to answer
    --top-k, -k <num>       Number of chunks to retrieve (default: server setting)

  structured, sq  Ask a question and get JSON shaped by a schema
    --question, -q <text>   Question to answer
    --format, -f <json>     JSON schema for the answer
    --top-k, -k <num>       Number of chunks to retrieve (default: server setting)

  clear, c        Remove every vector from the index

  documents, d    List the files in the documents directory

  upload, u       Copy a local file into the documents directory
    --file, -f <path>       File to upload

  help, h         Show this help message

Environment Variables:
  API_BASE_URL  Base URL for the docqa API (default: http://127.0.0.1:8000)

Examples:
  docqa_cli upload --file ./notes/python.txt
  docqa_cli ingest
  docqa_cli query --question "Who created Python?" --top-k 5
  docqa_cli structured --question "Who created Python?" --format '{"type":"object","properties":{"name":{"type":"string"}}}'
)" << std::endl;
}

}  // namespace docqa_cli
