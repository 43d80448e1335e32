#include "askdoc_api/routes.hpp"

#include <iostream>
#include <nlohmann/json.hpp>
#include <stdexcept>

#include "askdoc_core/errors.hpp"
#include "askdoc_core/services/rag_orchestrator.hpp"
#include "askdoc_core/storage/sqlite_document_repository.hpp"

namespace askdoc_api {

Routes::Routes(std::shared_ptr<askdoc_core::RagOrchestrator> orchestrator,
               askdoc_core::ChunkingConfig default_chunking)
    : orchestrator_(orchestrator), default_chunking_(default_chunking) {}

void Routes::register_routes(Server &server) {
  auto &app = server.get_app();

  // Health check endpoint
  CROW_ROUTE(app, "/")
  ([this](const crow::request &req) { return handle_health_check(req); });

  CROW_ROUTE(app, "/documents").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_ingest(req);
  });

  CROW_ROUTE(app, "/documents")
  ([this](const crow::request &req) { return handle_list_documents(req); });

  CROW_ROUTE(app, "/documents/<int>")
  ([this](const crow::request &req, int document_id) {
    return handle_get_document(req, document_id);
  });

  CROW_ROUTE(app, "/documents/<int>")
      .methods(crow::HTTPMethod::DELETE)([this](const crow::request &req, int document_id) {
        return handle_delete_document(req, document_id);
      });

  CROW_ROUTE(app, "/query").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_query(req);
  });

  CROW_ROUTE(app, "/stats")
  ([this](const crow::request &req) { return handle_stats(req); });

  std::cout << "All routes registered successfully" << std::endl;
}

crow::response Routes::handle_health_check(const crow::request &req) {
  nlohmann::json response = create_success_response("askdoc API is running");
  response["version"] = "0.1.0";
  response["status"] = "healthy";
  return create_json_response(response);
}

crow::response Routes::handle_ingest(const crow::request &req) {
  try {
    askdoc_core::IngestRequest request =
        parse_ingest_request(parse_json_body(req.body), default_chunking_);
    std::cout << "Ingesting document " << request.document_id << " (" << request.text.size()
              << " bytes)" << std::endl;

    askdoc_core::Document document = orchestrator_->ingest(request);
    nlohmann::json response =
        create_success_response("Document ingested successfully", document_to_json(document));
    return create_json_response(response, 201);
  } catch (const std::exception &e) {
    return error_response_for(e, "handle_ingest");
  }
}

crow::response Routes::handle_list_documents(const crow::request &req) {
  try {
    nlohmann::json documents = nlohmann::json::array();
    for (const auto &document : orchestrator_->list_documents()) {
      documents.push_back(document_to_json(document));
    }
    nlohmann::json response = create_success_response("Documents retrieved successfully");
    response["data"]["documents"] = documents;
    response["data"]["count"] = documents.size();
    return create_json_response(response);
  } catch (const std::exception &e) {
    return error_response_for(e, "handle_list_documents");
  }
}

crow::response Routes::handle_get_document(const crow::request &req, int document_id) {
  try {
    auto document = orchestrator_->get_document(document_id);
    if (!document.has_value()) {
      return create_json_response(
          create_error_response("Document " + std::to_string(document_id) + " not found",
                                "not_found"),
          404);
    }
    return create_json_response(
        create_success_response("Document retrieved successfully", document_to_json(*document)));
  } catch (const std::exception &e) {
    return error_response_for(e, "handle_get_document");
  }
}

crow::response Routes::handle_delete_document(const crow::request &req, int document_id) {
  try {
    std::cout << "Deleting document " << document_id << std::endl;
    bool removed = orchestrator_->remove_document(document_id);
    nlohmann::json response = create_success_response(
        removed ? "Document deleted successfully" : "Document was not present");
    response["data"]["removed"] = removed;
    return create_json_response(response);
  } catch (const std::exception &e) {
    return error_response_for(e, "handle_delete_document");
  }
}

crow::response Routes::handle_query(const crow::request &req) {
  try {
    nlohmann::json body = parse_json_body(req.body);
    std::string question = body.value("question", "");
    if (question.empty()) {
      throw std::invalid_argument("Field 'question' is required");
    }
    std::optional<int> document_id;
    if (body.contains("document_id") && !body["document_id"].is_null()) {
      document_id = body["document_id"].get<int>();
    }
    std::optional<int> top_k;
    if (body.contains("top_k") && !body["top_k"].is_null()) {
      top_k = body["top_k"].get<int>();
    }

    std::cout << "Query: " << question << std::endl;
    askdoc_core::QueryResult result = orchestrator_->query(question, document_id, top_k);
    return create_json_response(
        create_success_response("Query answered", query_result_to_json(result)));
  } catch (const std::exception &e) {
    return error_response_for(e, "handle_query");
  }
}

crow::response Routes::handle_stats(const crow::request &req) {
  try {
    askdoc_core::OrchestratorStats stats = orchestrator_->stats();
    nlohmann::json data;
    data["document_count"] = stats.document_count;
    data["chunk_count"] = stats.chunk_count;
    data["index_entry_count"] = stats.index_entry_count;
    data["index_document_count"] = stats.index_document_count;
    data["dimension"] = stats.dimension;
    data["index_memory_bytes"] = stats.index_memory_bytes;
    data["similarity_metric"] = stats.similarity_metric;
    return create_json_response(create_success_response("Statistics retrieved", data));
  } catch (const std::exception &e) {
    return error_response_for(e, "handle_stats");
  }
}

int Routes::status_for(const askdoc_core::AskdocError &error) {
  if (dynamic_cast<const askdoc_core::DuplicateDocumentError *>(&error)) {
    return 409;
  }
  if (dynamic_cast<const askdoc_core::EmbeddingUnavailableError *>(&error) ||
      dynamic_cast<const askdoc_core::SynthesisError *>(&error)) {
    return 503;
  }
  if (dynamic_cast<const askdoc_core::RollbackError *>(&error) ||
      dynamic_cast<const askdoc_core::DocumentStoreError *>(&error)) {
    return 500;
  }
  // Configuration, dimension, empty index/document, cancellation, extraction
  return 400;
}

askdoc_core::IngestRequest Routes::parse_ingest_request(
    const nlohmann::json &body, const askdoc_core::ChunkingConfig &default_chunking) {
  if (!body.is_object()) {
    throw std::invalid_argument("Request body must be a JSON object");
  }
  if (!body.contains("document_id") || !body["document_id"].is_number_integer()) {
    throw std::invalid_argument("Field 'document_id' is required and must be an integer");
  }
  if (!body.contains("text") || !body["text"].is_string()) {
    throw std::invalid_argument("Field 'text' is required and must be a string");
  }

  askdoc_core::IngestRequest request;
  request.document_id = body["document_id"].get<int>();
  request.text = body["text"].get<std::string>();
  request.title = body.value("title", "");
  request.page_count = body.value("page_count", 0);
  if (body.contains("page_offsets")) {
    request.page_offsets = body["page_offsets"].get<std::vector<size_t>>();
  }

  askdoc_core::ChunkingConfig chunking = default_chunking;
  chunking.chunk_size_tokens = body.value("chunk_size_tokens", chunking.chunk_size_tokens);
  chunking.overlap_tokens = body.value("overlap_tokens", chunking.overlap_tokens);
  request.chunking = chunking;
  return request;
}

nlohmann::json Routes::document_to_json(const askdoc_core::Document &document) {
  nlohmann::json json;
  json["id"] = document.id;
  json["title"] = document.title;
  json["chunk_count"] = document.chunk_count;
  json["token_count"] = document.token_count;
  json["page_count"] = document.page_count;
  json["content_hash"] = document.content_hash;
  json["created_at"] =
      askdoc_core::SqliteDocumentRepository::time_point_to_string(document.created_at);
  return json;
}

nlohmann::json Routes::query_result_to_json(const askdoc_core::QueryResult &result) {
  nlohmann::json json;
  json["answer"] = result.answer;
  json["confidence"] = result.confidence;
  json["confidence_derived"] = result.confidence_derived;
  json["reasoning"] = result.reasoning;
  json["chunks_used"] = result.chunks_used;

  nlohmann::json citations = nlohmann::json::array();
  for (const auto &citation : result.citations) {
    nlohmann::json citation_json;
    citation_json["document_id"] = citation.document_id;
    citation_json["chunk_index"] = citation.chunk_index;
    citation_json["score"] = citation.score;
    citation_json["text"] = citation.text;
    citation_json["page_numbers"] = citation.page_numbers;
    citations.push_back(citation_json);
  }
  json["citations"] = citations;
  return json;
}

crow::response Routes::error_response_for(const std::exception &e, const char *handler) {
  if (auto domain_error = dynamic_cast<const askdoc_core::AskdocError *>(&e)) {
    int status = status_for(*domain_error);
    if (status >= 500) {
      std::cerr << "Exception in " << handler << ": " << e.what() << std::endl;
    }
    return create_json_response(create_error_response(e.what(), domain_error->kind()), status);
  }
  if (dynamic_cast<const nlohmann::json::exception *>(&e) ||
      dynamic_cast<const std::invalid_argument *>(&e)) {
    return create_json_response(create_error_response(e.what(), "invalid_request"), 400);
  }
  std::cerr << "Exception in " << handler << ": " << e.what() << std::endl;
  return create_json_response(create_error_response(e.what(), "internal_error"), 500);
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

nlohmann::json Routes::create_error_response(const std::string &error, const std::string &kind) {
  nlohmann::json response;
  response["success"] = false;
  response["error"] = error;
  response["kind"] = kind;
  return response;
}

nlohmann::json Routes::parse_json_body(const std::string &body) {
  return nlohmann::json::parse(body);
}

}  // namespace askdoc_api
