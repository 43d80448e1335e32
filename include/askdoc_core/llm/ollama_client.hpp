#pragma once

#include <string>
#include <vector>

#include "askdoc_core/llm/embedding_client.hpp"
#include "askdoc_core/llm/language_model_client.hpp"

namespace askdoc_core {

class OllamaEmbeddingClient : public EmbeddingClient {
 public:
  OllamaEmbeddingClient(const std::string &ollama_url, const std::string &embedding_model);
  ~OllamaEmbeddingClient() override = default;

  // Disable copy constructor and assignment
  OllamaEmbeddingClient(const OllamaEmbeddingClient &) = delete;
  OllamaEmbeddingClient &operator=(const OllamaEmbeddingClient &) = delete;

  std::vector<float> embed(const std::string &text) override;
  std::vector<std::vector<float>> embed_batch(const std::vector<std::string> &texts) override;

 private:
  std::string ollama_url_;
  std::string embedding_model_;

  void setup_server_connection();
};

class OllamaLanguageModelClient : public LanguageModelClient {
 public:
  OllamaLanguageModelClient(const std::string &ollama_url,
                            const std::string &generation_model,
                            float temperature = 0.2f,
                            int max_tokens = 1000);
  ~OllamaLanguageModelClient() override = default;

  OllamaLanguageModelClient(const OllamaLanguageModelClient &) = delete;
  OllamaLanguageModelClient &operator=(const OllamaLanguageModelClient &) = delete;

  GenerationResult generate(const std::string &question,
                            const std::vector<ContextChunk> &context) override;

  // Prompt and response handling are exposed for tests; they never touch the network.
  static std::string build_user_prompt(const std::string &question,
                                       const std::vector<ContextChunk> &context);
  static GenerationResult parse_response(const std::string &raw_response,
                                         const std::vector<ContextChunk> &context);

  static const char *const SYSTEM_PROMPT;

 private:
  std::string ollama_url_;
  std::string generation_model_;
  float temperature_;
  int max_tokens_;
};

}  // namespace askdoc_core
