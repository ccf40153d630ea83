#pragma once
#include <memory>
#include <nlohmann/json.hpp>

#include "server.hpp"

// Forward declarations
namespace lore_core {
class DocumentPipeline;
class RagService;
class ServiceProvider;
class SnapshotRepository;
}  // namespace lore_core

namespace lore_api {

class Routes {
 public:
  // snapshot_repository may be null when persistence is disabled
  Routes(std::shared_ptr<lore_core::DocumentPipeline> pipeline,
         std::shared_ptr<lore_core::RagService> rag_service,
         std::shared_ptr<lore_core::ServiceProvider> services,
         std::shared_ptr<lore_core::SnapshotRepository> snapshot_repository);
  ~Routes() = default;

  // Disable copy constructor and assignment
  Routes(const Routes &) = delete;
  Routes &operator=(const Routes &) = delete;

  // Register all routes with the server
  void register_routes(Server &server);

 private:
  std::shared_ptr<lore_core::DocumentPipeline> pipeline_;
  std::shared_ptr<lore_core::RagService> rag_service_;
  std::shared_ptr<lore_core::ServiceProvider> services_;
  std::shared_ptr<lore_core::SnapshotRepository> snapshot_repository_;

  // Route handlers
  crow::response handle_health_check(const crow::request &req);
  crow::response handle_ingest(const crow::request &req);
  crow::response handle_search(const crow::request &req);
  crow::response handle_query(const crow::request &req);
  crow::response handle_list_documents(const crow::request &req);
  crow::response handle_stats(const crow::request &req);
  crow::response handle_snapshot(const crow::request &req);

  // Helper methods
  nlohmann::json parse_json_body(const std::string &body);
  std::string extract_query_from_request(const nlohmann::json &body);
  nlohmann::json create_success_response(const std::string &message,
                                         const nlohmann::json &data = nlohmann::json{});
  nlohmann::json create_error_response(const std::string &error);
  crow::response create_json_response(const nlohmann::json &json_data, int status_code = 200);
  crow::response create_exception_response(const std::string &handler, const std::exception &e);
};

}  // namespace lore_api
