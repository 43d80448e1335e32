#pragma once
#include <memory>
#include <nlohmann/json.hpp>

#include "askdoc_api/server.hpp"
#include "askdoc_core/chunking/chunker.hpp"
#include "askdoc_core/types/document.hpp"
#include "askdoc_core/types/query_result.hpp"

namespace askdoc_core {
class RagOrchestrator;
class AskdocError;
struct IngestRequest;
}  // namespace askdoc_core

namespace askdoc_api {

class Routes {
 public:
  Routes(std::shared_ptr<askdoc_core::RagOrchestrator> orchestrator,
         askdoc_core::ChunkingConfig default_chunking);
  ~Routes() = default;

  Routes(const Routes &) = delete;
  Routes &operator=(const Routes &) = delete;

  // Register all routes with the server
  void register_routes(Server &server);

  // Route handlers. Public so they can be driven without a listening socket.
  crow::response handle_health_check(const crow::request &req);
  crow::response handle_ingest(const crow::request &req);
  crow::response handle_list_documents(const crow::request &req);
  crow::response handle_get_document(const crow::request &req, int document_id);
  crow::response handle_delete_document(const crow::request &req, int document_id);
  crow::response handle_query(const crow::request &req);
  crow::response handle_stats(const crow::request &req);

  // HTTP status for a domain error: 400 caller fault, 409 duplicate,
  // 503 external service, 500 rollback or storage failure.
  static int status_for(const askdoc_core::AskdocError &error);

  static askdoc_core::IngestRequest parse_ingest_request(
      const nlohmann::json &body, const askdoc_core::ChunkingConfig &default_chunking);

  static nlohmann::json document_to_json(const askdoc_core::Document &document);
  static nlohmann::json query_result_to_json(const askdoc_core::QueryResult &result);

 private:
  std::shared_ptr<askdoc_core::RagOrchestrator> orchestrator_;
  askdoc_core::ChunkingConfig default_chunking_;

  // Helper methods
  nlohmann::json parse_json_body(const std::string &body);
  nlohmann::json create_success_response(const std::string &message,
                                         const nlohmann::json &data = nlohmann::json{});
  nlohmann::json create_error_response(const std::string &error, const std::string &kind);
  crow::response create_json_response(const nlohmann::json &json_data, int status_code = 200);
  crow::response error_response_for(const std::exception &e, const char *handler);
};

}  // namespace askdoc_api
