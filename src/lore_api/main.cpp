#include <curl/curl.h>

#include <atomic>
#include <condition_variable>
#include <csignal>
#include <iostream>
#include <memory>
#include <mutex>

#include "lore_api/config.hpp"
#include "lore_api/routes.hpp"
#include "lore_api/server.hpp"
#include "lore_core/db/snapshot_repository.hpp"
#include "lore_core/extractors/content_extractor_factory.hpp"
#include "lore_core/llm/provider_factory.hpp"
#include "lore_core/service_provider.hpp"
#include "lore_core/services/document_pipeline.hpp"
#include "lore_core/services/rag_service.hpp"
#include "lore_core/store/document_store.hpp"

std::atomic<bool> shutdown_requested = false;
std::mutex shutdown_mutex;
std::condition_variable shutdown_cv;

void signal_handler(int signal) {
  shutdown_requested = true;
  shutdown_cv.notify_one();  // Wake up the main thread
}

int main() {
  curl_global_init(CURL_GLOBAL_DEFAULT);
  int exit_code = 0;
  try {
    const std::string config_path = Config::default_path();
    Config config = Config::from_file(config_path);

    std::cout << "Starting Lore API Server..." << std::endl;
    std::cout << "Config: " << config_path << std::endl;
    std::cout << "Server URL: " << config.api_base_url << std::endl;
    std::cout << "Embedding: " << config.embedding.provider << " / " << config.embedding.model
              << std::endl;
    std::cout << "Generation: " << config.generation.provider << " / " << config.generation.model
              << std::endl;
    std::cout << "Retrieval index: " << config.retrieval_index << std::endl;
    std::cout << "Snapshot: " << (config.snapshot_path.empty() ? "disabled" : config.snapshot_path)
              << std::endl;

    // Initialize core components
    const lore_core::RetryPolicy retry_policy = config.retry_policy();
    auto store = std::make_shared<lore_core::DocumentStore>();
    auto embedder = lore_core::create_embedding_provider(config.embedding, retry_policy);
    auto generator = lore_core::create_generation_provider(config.generation, retry_policy);
    auto content_extractor_factory = std::make_shared<lore_core::ContentExtractorFactory>();
    auto services = std::make_shared<lore_core::ServiceProvider>(store, embedder, generator,
                                                                 content_extractor_factory);

    std::shared_ptr<lore_core::SnapshotRepository> snapshot_repository;
    if (!config.snapshot_path.empty()) {
      snapshot_repository = std::make_shared<lore_core::SnapshotRepository>(config.snapshot_path);
      snapshot_repository->load_into(*store);
    }

    auto pipeline =
        std::make_shared<lore_core::DocumentPipeline>(services, config.pipeline_options());
    auto rag_service = std::make_shared<lore_core::RagService>(
        services, config.retriever_options(), config.top_k);

    const std::string &server_url = config.api_base_url;
    std::string host = server_url.substr(0, server_url.find(':'));
    int port = std::stoi(server_url.substr(server_url.find(':') + 1));
    lore_api::Server server(host, port);
    lore_api::Routes routes(pipeline, rag_service, services, snapshot_repository);
    routes.register_routes(server);

    // Shutdown is driven by our own handler, not Crow's
    server.get_app().signal_clear();
    server.start();
    std::cout << "Server started successfully. Press Ctrl+C to exit." << std::endl;

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    {
      std::unique_lock<std::mutex> lock(shutdown_mutex);
      shutdown_cv.wait(lock, [] { return shutdown_requested.load(); });
    }

    std::cout << "\nShutdown signal received. Initiating graceful shutdown..." << std::endl;
    std::cout << "[1/2] Stopping API server to refuse new requests..." << std::endl;
    server.stop();

    std::cout << "[2/2] Saving snapshot..." << std::endl;
    if (snapshot_repository) {
      snapshot_repository->save(*store);
    }

    std::cout << "Shutdown complete." << std::endl;
  } catch (const std::exception &e) {
    std::cerr << "Error running server: " << e.what() << std::endl;
    exit_code = 1;
  }

  curl_global_cleanup();
  return exit_code;
}
