#include "docqa_api/routes.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

#include "docqa_core/services/rag_service.hpp"

namespace docqa_api {
Routes::Routes(std::shared_ptr<docqa_core::RagService> rag_service, const std::string &llm_model)
    : rag_service_(rag_service), llm_model_(llm_model) {}

void Routes::register_routes(Server &server) {
  auto &app = server.get_app();

  // Health check endpoint
  CROW_ROUTE(app, "/")
  ([this](const crow::request &req) { return handle_health_check(req); });

  CROW_ROUTE(app, "/ingest").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_ingest(req);
  });

  CROW_ROUTE(app, "/upload").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_upload(req);
  });

  CROW_ROUTE(app, "/query")
  ([this](const crow::request &req) { return handle_query(req); });

  CROW_ROUTE(app, "/query_structured")
      .methods(crow::HTTPMethod::POST)(
          [this](const crow::request &req) { return handle_query_structured(req); });

  CROW_ROUTE(app, "/clear").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_clear(req);
  });

  CROW_ROUTE(app, "/documents")
  ([this](const crow::request &req) { return handle_list_documents(req); });

  std::cout << "All routes registered successfully" << std::endl;
}

crow::response Routes::handle_health_check(const crow::request &req) {
  nlohmann::json response = create_success_response("docqa API is running");
  response["name"] = "docqa";
  response["version"] = "1.0.0";
  response["status"] = "running";
  response["model"] = llm_model_;
  response["documents_dir"] = rag_service_->settings().documents_dir.string();
  response["total_vectors"] = rag_service_->index_size();
  return create_json_response(response);
}

crow::response Routes::handle_ingest(const crow::request &req) {
  try {
    docqa_core::IngestResult result = rag_service_->ingest();

    nlohmann::json response;
    response["status"] = result.status;
    if (result.success) {
      response["chunks_processed"] = result.chunks_processed;
      response["total_vectors"] = result.total_vectors;
      return create_json_response(response);
    }
    response["message"] = result.message;
    response["error_kind"] = docqa_core::to_string(result.error_kind);
    return create_json_response(response, status_for(result.error_kind));
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_ingest: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_upload(const crow::request &req) {
  try {
    auto json_body = parse_json_body(req.body);
    std::string filename = json_body.value("filename", "");
    std::string content = json_body.value("content", "");

    if (!is_acceptable_upload_name(filename)) {
      return create_json_response(create_error_response("Invalid or unsupported filename: " + filename),
                                  400);
    }

    const std::filesystem::path documents_dir = rag_service_->settings().documents_dir;
    std::filesystem::create_directories(documents_dir);
    const std::filesystem::path file_path = documents_dir / filename;

    std::ofstream out(file_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      return create_json_response(create_error_response("Could not write " + file_path.string()), 500);
    }
    out << content;
    out.close();
    if (!out) {
      return create_json_response(create_error_response("Could not write " + file_path.string()), 500);
    }

    std::cout << "Uploaded document: " << file_path.string() << std::endl;
    nlohmann::json response;
    response["status"] = "success";
    response["message"] = "File " + filename + " uploaded successfully";
    return create_json_response(response);
  } catch (const nlohmann::json::exception &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_upload: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_query(const crow::request &req) {
  try {
    const char *question_param = req.url_params.get("question");
    std::string question = question_param ? question_param : "";

    std::optional<int> top_k;
    if (const char *top_k_param = req.url_params.get("top_k")) {
      try {
        top_k = std::stoi(top_k_param);
      } catch (const std::exception &) {
        return create_json_response(create_error_response("top_k must be an integer"), 400);
      }
    }

    std::cout << "Query: " << question << std::endl;
    docqa_core::QueryResponse result = rag_service_->query(question, top_k);
    if (!result.success) {
      return create_json_response(create_error_response(result.error_message),
                                  status_for(result.error_kind));
    }

    nlohmann::json response;
    response["question"] = result.question;
    response["answer"] = result.answer;
    response["sources"] = sources_to_json(result.sources);
    response["timestamp"] = result.timestamp;
    return create_json_response(response);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_query: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_query_structured(const crow::request &req) {
  nlohmann::json json_body;
  try {
    json_body = parse_json_body(req.body);
  } catch (const nlohmann::json::exception &) {
    return create_json_response(create_error_response("Request body must be JSON"), 400);
  }

  try {
    std::string question = json_body.value("question", "");
    std::optional<int> top_k = extract_top_k(json_body);
    nlohmann::json response_format = json_body.value("response_format", nlohmann::json());

    std::cout << "Structured query: " << question << std::endl;
    docqa_core::StructuredQueryResponse result =
        response_format.is_string()
            ? rag_service_->query_structured_text(question, response_format.get<std::string>(), top_k)
            : rag_service_->query_structured(question, response_format, top_k);
    if (!result.success) {
      return create_json_response(create_error_response(result.error_message),
                                  status_for(result.error_kind));
    }

    nlohmann::json response;
    response["question"] = result.question;
    response["answer"] = result.answer;
    response["sources"] = sources_to_json(result.sources);
    response["timestamp"] = result.timestamp;
    return create_json_response(response);
  } catch (const nlohmann::json::type_error &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_query_structured: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_clear(const crow::request &req) {
  try {
    docqa_core::OperationResult result = rag_service_->clear_index();
    nlohmann::json response;
    response["status"] = result.status;
    response["message"] = result.message;
    return create_json_response(response, result.success ? 200 : status_for(result.error_kind));
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_clear: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_list_documents(const crow::request &req) {
  try {
    const std::filesystem::path documents_dir = rag_service_->settings().documents_dir;
    nlohmann::json documents = nlohmann::json::array();

    if (std::filesystem::is_directory(documents_dir)) {
      for (const auto &entry : std::filesystem::directory_iterator(documents_dir)) {
        if (!entry.is_regular_file()) {
          continue;
        }
        auto modified = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
            entry.last_write_time() - std::filesystem::file_time_type::clock::now() +
            std::chrono::system_clock::now());

        nlohmann::json document;
        document["name"] = entry.path().filename().string();
        document["size"] = entry.file_size();
        document["modified"] = std::chrono::system_clock::to_time_t(modified);
        documents.push_back(document);
      }
    }

    nlohmann::json response;
    response["status"] = "success";
    response["count"] = documents.size();
    response["documents"] = documents;
    return create_json_response(response);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_list_documents: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::create_json_response(const nlohmann::json &json_data, int status_code) {
  crow::response resp(status_code, json_data.dump(2));
  resp.add_header("Content-Type", "application/json");
  return resp;
}

nlohmann::json Routes::create_success_response(const std::string &message,
                                               const nlohmann::json &data) {
  nlohmann::json response;
  response["success"] = true;
  response["message"] = message;
  if (!data.is_null()) {
    response["data"] = data;
  }
  return response;
}

nlohmann::json Routes::create_error_response(const std::string &error) {
  nlohmann::json response;
  response["success"] = false;
  response["error"] = error;
  return response;
}

nlohmann::json Routes::parse_json_body(const std::string &body) {
  return nlohmann::json::parse(body);
}

std::optional<int> Routes::extract_top_k(const nlohmann::json &json_body) {
  if (!json_body.contains("top_k") || json_body["top_k"].is_null()) {
    return std::nullopt;
  }
  return json_body["top_k"].get<int>();
}

bool Routes::is_acceptable_upload_name(const std::string &filename) const {
  if (filename.empty() || filename == "." || filename == "..") {
    return false;
  }
  // Plain file names only; nothing that walks out of the documents directory
  const std::filesystem::path path(filename);
  if (path.filename().string() != filename || path.has_parent_path()) {
    return false;
  }
  const auto &extensions = rag_service_->settings().file_extensions;
  return std::find(extensions.begin(), extensions.end(), path.extension().string()) !=
         extensions.end();
}

nlohmann::json Routes::sources_to_json(const std::vector<docqa_core::SourceReference> &sources) {
  nlohmann::json result = nlohmann::json::array();
  for (const auto &source : sources) {
    nlohmann::json source_json;
    source_json["document"] = source.document;
    source_json["score"] = source.score;
    source_json["text"] = source.text;
    result.push_back(source_json);
  }
  return result;
}

int Routes::status_for(docqa_core::ServiceErrorKind kind) {
  switch (kind) {
    case docqa_core::ServiceErrorKind::Validation:
    case docqa_core::ServiceErrorKind::EmptyCorpus:
      return 400;
    default:
      return 500;
  }
}
}  // namespace docqa_api
