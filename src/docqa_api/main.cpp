#include <atomic>
#include <condition_variable>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>

#include "docqa_api/config.hpp"
#include "docqa_api/routes.hpp"
#include "docqa_api/server.hpp"
#include "docqa_core/chunking/chunking_strategy.hpp"
#include "docqa_core/documents/document_processor.hpp"
#include "docqa_core/llm/ollama_client.hpp"
#include "docqa_core/services/rag_service.hpp"
#include "docqa_core/services/service_provider.hpp"
#include "docqa_core/store/vector_index.hpp"

std::atomic<bool> shutdown_requested = false;
std::mutex shutdown_mutex;
std::condition_variable shutdown_cv;

// The signal handler function
void signal_handler(int signal) {
  std::cout << "\nShutdown signal (" << signal << ") received. Initiating graceful shutdown..."
            << std::endl;
  shutdown_requested = true;
  shutdown_cv.notify_one();  // Wake up the main thread
}

static Config load_config() {
  const char *config_env = std::getenv("DOCQA_CONFIG");
  std::string config_path = config_env ? config_env : "docqarc.json";
  if (!std::filesystem::exists(config_path)) {
    std::cout << "No config file at " << config_path << ", using defaults" << std::endl;
    return Config::from_json(nlohmann::json::object());
  }
  return Config::from_file(config_path);
}

int main() {
  try {
    Config config = load_config();

    std::cout << "Starting docqa API Server..." << std::endl;
    std::cout << "Server URL: " << config.api_base_url << std::endl;
    std::cout << "Documents Directory: " << config.documents_dir << std::endl;
    std::cout << "Vector Store Path: " << config.vector_store_path << std::endl;
    std::cout << "Ollama URL: " << config.ollama_url << std::endl;
    std::cout << "Embedding Model: " << config.embedding_model << " (" << config.embedding_dimension
              << " dims)" << std::endl;
    std::cout << "LLM Model: " << config.llm_model << std::endl;
    std::cout << "Chunking: " << config.chunking_strategy << ", size " << config.chunk_size
              << ", overlap " << config.chunk_overlap << std::endl;

    std::error_code ec;
    std::filesystem::create_directories(config.documents_dir, ec);
    if (ec) {
      std::cerr << "Warning: Failed to create documents directory: " << ec.message() << std::endl;
    }

    // Initialize core components
    auto embedder = std::make_shared<docqa_core::OllamaEmbedder>(
        config.ollama_url, config.embedding_model, config.embedding_dimension,
        config.request_timeout_seconds);
    auto generator = std::make_shared<docqa_core::OllamaGenerator>(
        config.ollama_url, config.llm_model, config.request_timeout_seconds);
    auto vector_index = std::make_shared<docqa_core::VectorIndex>(config.embedding_dimension,
                                                                  config.vector_store_path);
    auto document_processor =
        std::make_shared<docqa_core::DocumentProcessor>(docqa_core::make_chunking_strategy(
            config.chunking_strategy, config.chunk_size, config.chunk_overlap));

    auto services = std::make_shared<docqa_core::ServiceProvider>(vector_index, embedder, generator,
                                                                  document_processor);
    docqa_core::RagSettings settings;
    settings.top_k = config.top_k;
    settings.documents_dir = config.documents_dir;
    settings.file_extensions = config.file_extensions;
    auto rag_service = std::make_shared<docqa_core::RagService>(services, settings);
    std::cout << "Vector index loaded with " << rag_service->index_size() << " vectors" << std::endl;

    std::string host = config.api_base_url.substr(0, config.api_base_url.find(':'));
    int port = std::stoi(config.api_base_url.substr(config.api_base_url.find(':') + 1));
    docqa_api::Server server(host, port, static_cast<unsigned int>(config.server_threads));
    docqa_api::Routes routes(rag_service, config.llm_model);
    routes.register_routes(server);

    std::cout << "Disabling Crow's internal signal handling..." << std::endl;
    server.get_app().signal_clear();

    server.start();
    std::cout << "Server started successfully. Press Ctrl+C to exit." << std::endl;

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    {
      std::unique_lock<std::mutex> lock(shutdown_mutex);
      shutdown_cv.wait(lock, [] { return shutdown_requested.load(); });
    }

    std::cout << "Stopping API server..." << std::endl;
    server.stop();

    std::cout << "Shutdown complete." << std::endl;
  } catch (const std::exception &e) {
    std::cerr << "Error starting server: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
