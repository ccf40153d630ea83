#include "lore_api/routes.hpp"

#include <iostream>
#include <nlohmann/json.hpp>
#include <stdexcept>

#include "lore_api/error_status.hpp"
#include "lore_api/request_fields.hpp"
#include "lore_core/db/snapshot_repository.hpp"
#include "lore_core/service_provider.hpp"
#include "lore_core/services/document_pipeline.hpp"
#include "lore_core/services/rag_service.hpp"
#include "lore_core/store/document_store.hpp"

namespace lore_api {

namespace {

nlohmann::json report_to_json(const lore_core::IngestReport &report) {
  nlohmann::json json_report;
  json_report["source"] = report.source;
  json_report["total_chunks"] = report.total_chunks;
  json_report["stored_chunks"] = report.stored_count();
  json_report["chunk_ids"] = report.stored_chunk_ids;
  if (!report.content_hash.empty()) {
    json_report["content_hash"] = report.content_hash;
  }
  if (report.failed_chunk_index) {
    json_report["failed_chunk_index"] = *report.failed_chunk_index;
  }
  return json_report;
}

nlohmann::json results_to_json(const lore_core::RetrievalResult &results) {
  nlohmann::json json_results = nlohmann::json::array();
  for (const lore_core::ScoredChunk &result : results) {
    nlohmann::json result_json;
    result_json["id"] = result.chunk.id;
    result_json["source"] = result.chunk.metadata.source;
    result_json["chunk_index"] = result.chunk.metadata.chunk_index;
    result_json["content"] = result.chunk.content;
    result_json["score"] = result.score;
    json_results.push_back(result_json);
  }
  return json_results;
}

}  // namespace

Routes::Routes(std::shared_ptr<lore_core::DocumentPipeline> pipeline,
               std::shared_ptr<lore_core::RagService> rag_service,
               std::shared_ptr<lore_core::ServiceProvider> services,
               std::shared_ptr<lore_core::SnapshotRepository> snapshot_repository)
    : pipeline_(std::move(pipeline)),
      rag_service_(std::move(rag_service)),
      services_(std::move(services)),
      snapshot_repository_(std::move(snapshot_repository)) {}

void Routes::register_routes(Server &server) {
  auto &app = server.get_app();

  // Health check endpoint
  CROW_ROUTE(app, "/")
  ([this](const crow::request &req) { return handle_health_check(req); });

  CROW_ROUTE(app, "/documents")
      .methods(crow::HTTPMethod::POST)(
          [this](const crow::request &req) { return handle_ingest(req); });

  CROW_ROUTE(app, "/documents")
      .methods(crow::HTTPMethod::GET)(
          [this](const crow::request &req) { return handle_list_documents(req); });

  CROW_ROUTE(app, "/search").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_search(req);
  });

  CROW_ROUTE(app, "/query").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_query(req);
  });

  CROW_ROUTE(app, "/stats")
  ([this](const crow::request &req) { return handle_stats(req); });

  CROW_ROUTE(app, "/snapshot").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_snapshot(req);
  });

  std::cout << "[Server] All routes registered successfully" << std::endl;
}

crow::response Routes::handle_health_check(const crow::request &req) {
  nlohmann::json response = create_success_response("Lore API is running");
  response["version"] = "0.1.0";
  response["status"] = "healthy";
  return create_json_response(response);
}

crow::response Routes::handle_ingest(const crow::request &req) {
  try {
    nlohmann::json body = parse_json_body(req.body);
    lore_core::IngestReport report;

    if (body.contains("path")) {
      const std::string path = body.at("path").get<std::string>();
      std::cout << "[Server] Ingesting file: " << path << std::endl;
      report = pipeline_->ingest_file(path);
    } else if (body.contains("source") && body.contains("text")) {
      const std::string source = body.at("source").get<std::string>();
      std::cout << "[Server] Ingesting text for source: " << source << std::endl;
      report = pipeline_->ingest(source, body.at("text").get<std::string>());
    } else {
      throw std::invalid_argument("Request body needs either 'path' or 'source' and 'text'");
    }

    return create_json_response(create_success_response("Document ingested", report_to_json(report)));
  } catch (const lore_core::IngestionError &e) {
    std::cerr << "[Server] Partial ingestion: " << e.what() << std::endl;
    nlohmann::json error_response = create_error_response(e.what());
    error_response["data"] = report_to_json(e.report());
    return create_json_response(error_response, http_status_for(e));
  } catch (const std::exception &e) {
    return create_exception_response("handle_ingest", e);
  }
}

crow::response Routes::handle_search(const crow::request &req) {
  try {
    nlohmann::json body = parse_json_body(req.body);
    std::string query = extract_query_from_request(body);
    std::optional<int> top_k = top_k_from_body(body);

    std::cout << "[Server] Search for: " << query << std::endl;
    lore_core::RetrievalResult results = rag_service_->search(query, top_k);

    nlohmann::json response = create_success_response("Search completed");
    response["data"]["results"] = results_to_json(results);
    return create_json_response(response);
  } catch (const std::exception &e) {
    return create_exception_response("handle_search", e);
  }
}

crow::response Routes::handle_query(const crow::request &req) {
  try {
    nlohmann::json body = parse_json_body(req.body);
    std::string query = extract_query_from_request(body);
    std::optional<int> top_k = top_k_from_body(body);

    std::cout << "[Server] Question: " << query << std::endl;
    lore_core::Answer answer = rag_service_->ask(query, top_k);

    nlohmann::json response = create_success_response("Answer generated");
    response["data"]["answer"] = answer.text;
    response["data"]["sources"] = results_to_json(answer.sources);
    return create_json_response(response);
  } catch (const std::exception &e) {
    return create_exception_response("handle_query", e);
  }
}

crow::response Routes::handle_list_documents(const crow::request &req) {
  try {
    nlohmann::json documents = nlohmann::json::array();
    for (const lore_core::SourceSummary &summary : services_->get_document_store().sources()) {
      documents.push_back({{"source", summary.source}, {"chunk_count", summary.chunk_count}});
    }
    nlohmann::json response = create_success_response("Documents retrieved successfully");
    response["data"]["documents"] = documents;
    response["data"]["count"] = documents.size();
    return create_json_response(response);
  } catch (const std::exception &e) {
    return create_exception_response("handle_list_documents", e);
  }
}

crow::response Routes::handle_stats(const crow::request &req) {
  const lore_core::DocumentStore &store = services_->get_document_store();
  nlohmann::json stats;
  stats["chunks"] = store.size();
  stats["dimension"] = store.dimension();
  stats["documents"] = store.sources().size();
  stats["snapshot_enabled"] = snapshot_repository_ != nullptr;
  return create_json_response(create_success_response("Store statistics", stats));
}

crow::response Routes::handle_snapshot(const crow::request &req) {
  if (!snapshot_repository_) {
    return create_json_response(create_error_response("Snapshot persistence is disabled"), 409);
  }
  try {
    size_t saved = snapshot_repository_->save(services_->get_document_store());
    nlohmann::json data;
    data["saved_chunks"] = saved;
    data["path"] = snapshot_repository_->path().string();
    return create_json_response(create_success_response("Snapshot saved", data));
  } catch (const lore_core::StoreError &e) {
    std::cerr << "[Server] Snapshot failed: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::create_json_response(const nlohmann::json &json_data, int status_code) {
  crow::response resp(status_code, json_data.dump(2));
  resp.add_header("Content-Type", "application/json");
  return resp;
}

crow::response Routes::create_exception_response(const std::string &handler,
                                                 const std::exception &e) {
  const int status = http_status_for(e);
  if (status >= 500) {
    std::cerr << "[Server] Exception in " << handler << ": " << e.what() << std::endl;
  }
  return create_json_response(create_error_response(e.what()), status);
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
  try {
    return nlohmann::json::parse(body);
  } catch (const nlohmann::json::parse_error &e) {
    throw std::invalid_argument(std::string("Request body is not valid JSON: ") + e.what());
  }
}

std::string Routes::extract_query_from_request(const nlohmann::json &body) {
  std::string query = body.value("query", "");
  if (query.empty()) {
    throw std::invalid_argument("query cannot be empty");
  }
  return query;
}

}  // namespace lore_api
