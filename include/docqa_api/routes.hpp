#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "server.hpp"

// Forward declarations
namespace docqa_core {
class RagService;
struct SourceReference;
enum class ServiceErrorKind;
}  // namespace docqa_core

namespace docqa_api {

class Routes {
 public:
  Routes(std::shared_ptr<docqa_core::RagService> rag_service, const std::string &llm_model);
  ~Routes() = default;

  // Disable copy constructor and assignment
  Routes(const Routes &) = delete;
  Routes &operator=(const Routes &) = delete;

  // Register all routes with the server
  void register_routes(Server &server);

  // Route handlers, public so they can be driven without a running server
  crow::response handle_health_check(const crow::request &req);
  crow::response handle_ingest(const crow::request &req);
  crow::response handle_upload(const crow::request &req);
  crow::response handle_query(const crow::request &req);
  crow::response handle_query_structured(const crow::request &req);
  crow::response handle_clear(const crow::request &req);
  crow::response handle_list_documents(const crow::request &req);

 private:
  std::shared_ptr<docqa_core::RagService> rag_service_;
  std::string llm_model_;

  // Helper methods
  nlohmann::json parse_json_body(const std::string &body);
  std::optional<int> extract_top_k(const nlohmann::json &json_body);
  bool is_acceptable_upload_name(const std::string &filename) const;
  static nlohmann::json sources_to_json(const std::vector<docqa_core::SourceReference> &sources);
  static int status_for(docqa_core::ServiceErrorKind kind);
  nlohmann::json create_success_response(const std::string &message,
                                         const nlohmann::json &data = nlohmann::json{});
  nlohmann::json create_error_response(const std::string &error);
  crow::response create_json_response(const nlohmann::json &json_data, int status_code = 200);
};

}  // namespace docqa_api
