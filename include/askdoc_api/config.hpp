#pragma once

#include <chrono>
#include <fstream>
#include <nlohmann/json.hpp>
#include <string>

#include "askdoc_core/errors.hpp"
#include "askdoc_core/index/vector_index.hpp"
#include "askdoc_core/services/answer_synthesizer.hpp"
#include "askdoc_core/services/rag_orchestrator.hpp"

namespace askdoc_api {

class Config {
 public:
  std::string api_base_url;
  std::string database_path;
  // Name of the environment variable holding the database key
  std::string database_key_env;
  int connection_pool_size;

  std::string ollama_url;
  std::string embedding_model;
  std::string generation_model;
  int embedding_dimension;  // 0 = adopt from the first insert

  int chunk_size_tokens;
  int overlap_tokens;
  int max_chunks_for_context;
  int max_context_tokens;
  int default_top_k;
  int embedding_batch_size;
  int external_call_max_attempts;
  int external_call_backoff_ms;
  std::string similarity_metric;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string &filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw askdoc_core::ConfigurationError("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const nlohmann::json::parse_error &e) {
      throw askdoc_core::ConfigurationError(std::string("Failed to parse JSON in config file '") +
                                            filename + "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json &json_config) {
    if (!json_config.is_object()) {
      throw askdoc_core::ConfigurationError("Configuration must be a JSON object");
    }
    Config config;

    // Apply defaults when keys are missing
    config.api_base_url = read(json_config, "api_base_url", std::string("127.0.0.1:3030"));
    config.database_path = read(json_config, "database_path", std::string("./data/askdoc.db"));
    config.database_key_env = read(json_config, "database_key_env", std::string("ASKDOC_DB_KEY"));
    config.connection_pool_size = read(json_config, "connection_pool_size", 4);

    config.ollama_url = read(json_config, "ollama_url", std::string("http://localhost:11434"));
    config.embedding_model =
        read(json_config, "embedding_model", std::string("mxbai-embed-large"));
    config.generation_model = read(json_config, "generation_model", std::string("llama3.1"));
    config.embedding_dimension = read(json_config, "embedding_dimension", 0);

    config.chunk_size_tokens = read(json_config, "chunk_size_tokens", 500);
    config.overlap_tokens = read(json_config, "overlap_tokens", 50);
    config.max_chunks_for_context = read(json_config, "max_chunks_for_context", 5);
    config.max_context_tokens = read(json_config, "max_context_tokens", 3000);
    config.default_top_k = read(json_config, "default_top_k", 5);
    config.embedding_batch_size = read(json_config, "embedding_batch_size", 32);
    config.external_call_max_attempts = read(json_config, "external_call_max_attempts", 3);
    config.external_call_backoff_ms = read(json_config, "external_call_backoff_ms", 200);
    config.similarity_metric =
        read(json_config, "similarity_metric", std::string(askdoc_core::VectorIndex::SIMILARITY_METRIC));

    config.validate();
    return config;
  }

  askdoc_core::ChunkingConfig chunking_config() const {
    askdoc_core::ChunkingConfig chunking;
    chunking.chunk_size_tokens = chunk_size_tokens;
    chunking.overlap_tokens = overlap_tokens;
    return chunking;
  }

  askdoc_core::OrchestratorConfig orchestrator_config() const {
    askdoc_core::OrchestratorConfig orchestrator;
    orchestrator.chunking = chunking_config();
    orchestrator.default_top_k = default_top_k;
    orchestrator.embedding_batch_size = static_cast<size_t>(embedding_batch_size);
    orchestrator.retry.max_attempts = external_call_max_attempts;
    orchestrator.retry.initial_backoff = std::chrono::milliseconds(external_call_backoff_ms);
    return orchestrator;
  }

  askdoc_core::SynthesisConfig synthesis_config() const {
    askdoc_core::SynthesisConfig synthesis;
    synthesis.max_chunks_for_context = max_chunks_for_context;
    synthesis.max_context_tokens = static_cast<size_t>(max_context_tokens);
    return synthesis;
  }

 private:
  template <typename T>
  static T read(const nlohmann::json &json_config, const char *key, const T &fallback) {
    if (!json_config.contains(key)) {
      return fallback;
    }
    try {
      return json_config.at(key).get<T>();
    } catch (const nlohmann::json::type_error &) {
      throw askdoc_core::ConfigurationError(std::string("Config key '") + key +
                                            "' has the wrong type");
    }
  }

  void validate() const {
    if (api_base_url.empty() || api_base_url.find(':') == std::string::npos) {
      throw askdoc_core::ConfigurationError("api_base_url must have the form host:port");
    }
    if (database_path.empty()) {
      throw askdoc_core::ConfigurationError("database_path cannot be empty");
    }
    if (database_key_env.empty()) {
      throw askdoc_core::ConfigurationError("database_key_env cannot be empty");
    }
    if (connection_pool_size <= 0) {
      throw askdoc_core::ConfigurationError("connection_pool_size must be greater than 0");
    }
    if (ollama_url.empty()) {
      throw askdoc_core::ConfigurationError("ollama_url cannot be empty");
    }
    if (embedding_model.empty()) {
      throw askdoc_core::ConfigurationError("embedding_model cannot be empty");
    }
    if (generation_model.empty()) {
      throw askdoc_core::ConfigurationError("generation_model cannot be empty");
    }
    if (embedding_dimension < 0) {
      throw askdoc_core::ConfigurationError("embedding_dimension must not be negative");
    }
    if (max_context_tokens <= 0) {
      throw askdoc_core::ConfigurationError("max_context_tokens must be greater than 0");
    }
    if (embedding_batch_size <= 0) {
      throw askdoc_core::ConfigurationError("embedding_batch_size must be greater than 0");
    }
    if (external_call_backoff_ms < 0) {
      throw askdoc_core::ConfigurationError("external_call_backoff_ms must not be negative");
    }
    if (similarity_metric != askdoc_core::VectorIndex::SIMILARITY_METRIC) {
      throw askdoc_core::ConfigurationError("similarity_metric must be \"cosine\", got \"" +
                                            similarity_metric + "\"");
    }
    chunking_config().validate();
    synthesis_config().validate();
    orchestrator_config().validate();
  }
};

}  // namespace askdoc_api
