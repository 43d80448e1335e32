#include <atomic>
#include <condition_variable>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>

#include "askdoc_api/config.hpp"
#include "askdoc_api/routes.hpp"
#include "askdoc_api/server.hpp"
#include "askdoc_core/db/database_manager.hpp"
#include "askdoc_core/index/vector_index.hpp"
#include "askdoc_core/llm/ollama_client.hpp"
#include "askdoc_core/services/rag_orchestrator.hpp"
#include "askdoc_core/storage/sqlite_document_repository.hpp"

std::atomic<bool> shutdown_requested = false;
std::mutex shutdown_mutex;
std::condition_variable shutdown_cv;

void signal_handler(int signal) {
  std::cout << "\nShutdown signal (" << signal << ") received. Initiating graceful shutdown..."
            << std::endl;
  shutdown_requested = true;
  shutdown_cv.notify_one();
}

int main(int argc, char *argv[]) {
  try {
    const std::string config_path = argc > 1 ? argv[1] : "askdocrc.json";
    askdoc_api::Config config = askdoc_api::Config::from_file(config_path);

    const char *db_key = std::getenv(config.database_key_env.c_str());
    if (!db_key || std::string(db_key).empty()) {
      throw askdoc_core::ConfigurationError("Environment variable " + config.database_key_env +
                                            " must hold the database key");
    }

    std::cout << "Starting askdoc API Server..." << std::endl;
    std::cout << "Server URL: " << config.api_base_url << std::endl;
    std::cout << "Database Path: " << config.database_path << std::endl;
    std::cout << "Ollama URL: " << config.ollama_url << std::endl;
    std::cout << "Embedding Model: " << config.embedding_model << std::endl;
    std::cout << "Generation Model: " << config.generation_model << std::endl;
    std::cout << "Chunking: " << config.chunk_size_tokens << " tokens, " << config.overlap_tokens
              << " overlap" << std::endl;

    // Initialize core components
    auto embedding_client = std::make_shared<askdoc_core::OllamaEmbeddingClient>(
        config.ollama_url, config.embedding_model);
    auto language_model = std::make_shared<askdoc_core::OllamaLanguageModelClient>(
        config.ollama_url, config.generation_model);
    auto db_manager = std::make_shared<askdoc_core::DatabaseManager>(
        config.database_path, db_key, config.connection_pool_size);
    auto repository = std::make_shared<askdoc_core::SqliteDocumentRepository>(*db_manager);
    auto vector_index = std::make_shared<askdoc_core::VectorIndex>(config.embedding_dimension);

    auto orchestrator = std::make_shared<askdoc_core::RagOrchestrator>(
        embedding_client, language_model, vector_index, repository, config.orchestrator_config(),
        config.synthesis_config());
    orchestrator->restore();

    askdoc_api::Server server(config.api_base_url);
    askdoc_api::Routes routes(orchestrator, config.chunking_config());
    routes.register_routes(server);

    // Shutdown is driven by our own handler below
    server.get_app().signal_clear();
    server.start();
    std::cout << "Server started successfully. Press Ctrl+C to exit." << std::endl;

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    {
      std::unique_lock<std::mutex> lock(shutdown_mutex);
      shutdown_cv.wait(lock, [] { return shutdown_requested.load(); });
    }

    std::cout << "[1/2] Stopping API server to refuse new requests..." << std::endl;
    server.stop();

    std::cout << "[2/2] Shutting down database connections..." << std::endl;
    db_manager->shutdown();

    std::cout << "Shutdown complete." << std::endl;
  } catch (const askdoc_core::AskdocError &e) {
    std::cerr << "Error starting server (" << e.kind() << "): " << e.what() << std::endl;
    return 1;
  } catch (const std::exception &e) {
    std::cerr << "Error starting server: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
