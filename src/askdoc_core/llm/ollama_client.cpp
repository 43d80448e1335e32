#include "askdoc_core/llm/ollama_client.hpp"

#include <cmath>
#include <nlohmann/json.hpp>
#include <sstream>

#include "askdoc_core/errors.hpp"
#include "ollama.hpp"

namespace askdoc_core {

OllamaEmbeddingClient::OllamaEmbeddingClient(const std::string &ollama_url,
                                             const std::string &embedding_model)
    : ollama_url_(ollama_url), embedding_model_(embedding_model) {
  setup_server_connection();
}

void OllamaEmbeddingClient::setup_server_connection() {
  ollama::setServerURL(ollama_url_);
  if (!ollama::is_running()) {
    throw EmbeddingUnavailableError("Ollama server is not running at " + ollama_url_);
  }
}

std::vector<float> OllamaEmbeddingClient::embed(const std::string &text) {
  try {
    ollama::response response = ollama::generate_embeddings(embedding_model_, text);
    nlohmann::json json_response = response.as_json();

    // /api/embed answers with "embeddings" (array of arrays), the legacy
    // /api/embeddings endpoint with a single "embedding" array.
    if (json_response.contains("embeddings")) {
      const auto &embeddings = json_response["embeddings"];
      if (!embeddings.is_array() || embeddings.empty()) {
        throw EmbeddingUnavailableError("Embeddings field is not a non-empty array");
      }
      if (embeddings[0].is_array()) {
        return embeddings[0].get<std::vector<float>>();
      }
      return embeddings.get<std::vector<float>>();
    }
    if (json_response.contains("embedding") && json_response["embedding"].is_array()) {
      return json_response["embedding"].get<std::vector<float>>();
    }
    throw EmbeddingUnavailableError("Response does not contain an embedding field");

  } catch (const ollama::exception &e) {
    throw EmbeddingUnavailableError("Embedding generation failed: " + std::string(e.what()));
  } catch (const nlohmann::json::exception &e) {
    throw EmbeddingUnavailableError("Embedding response could not be read: " +
                                    std::string(e.what()));
  }
}

// The Ollama API accepts batched input on /api/embed, but ollama-hpp only
// exposes single inputs, so the batch is sent one text at a time.
std::vector<std::vector<float>> OllamaEmbeddingClient::embed_batch(
    const std::vector<std::string> &texts) {
  std::vector<std::vector<float>> vectors;
  vectors.reserve(texts.size());
  for (const auto &text : texts) {
    vectors.push_back(embed(text));
  }
  return vectors;
}

const char *const OllamaLanguageModelClient::SYSTEM_PROMPT =
    R"(You are a helpful assistant that answers questions based on provided document context.

Your task is to:
1. Answer the user's question using ONLY the information provided in the context
2. Be accurate and concise
3. If the context doesn't contain enough information, say so clearly
4. Provide a confidence score between 0.0 and 1.0 based on how well the context supports your answer
5. List the numbers of the context blocks you used
6. Always respond in JSON format with the following structure:
{
    "answer": "Your detailed answer here",
    "confidence": 0.85,
    "reasoning": "Brief explanation of why you have this confidence level",
    "used_context": [1, 3]
}

Guidelines:
- If the context clearly answers the question: confidence 0.8-1.0
- If the context partially answers the question: confidence 0.4-0.7
- If the context barely relates to the question: confidence 0.1-0.3
- If the context doesn't help at all: confidence 0.0
)";

OllamaLanguageModelClient::OllamaLanguageModelClient(const std::string &ollama_url,
                                                     const std::string &generation_model,
                                                     float temperature,
                                                     int max_tokens)
    : ollama_url_(ollama_url),
      generation_model_(generation_model),
      temperature_(temperature),
      max_tokens_(max_tokens) {
  ollama::setServerURL(ollama_url_);
}

std::string OllamaLanguageModelClient::build_user_prompt(
    const std::string &question, const std::vector<ContextChunk> &context) {
  std::ostringstream prompt;
  prompt << "Context:\n";
  for (const auto &chunk : context) {
    prompt << "[Context " << chunk.label << "] (document " << chunk.document_id << ", chunk "
           << chunk.chunk_index;
    if (!chunk.page_numbers.empty()) {
      prompt << ", page";
      if (chunk.page_numbers.size() > 1) {
        prompt << "s";
      }
      for (size_t i = 0; i < chunk.page_numbers.size(); ++i) {
        prompt << (i == 0 ? " " : ", ") << chunk.page_numbers[i];
      }
    }
    prompt << "):\n" << chunk.text << "\n\n";
  }
  prompt << "Question: " << question << "\n\n"
         << "Please answer the question based on the provided context. Remember to respond in "
            "JSON format with answer, confidence, reasoning and used_context fields.";
  return prompt.str();
}

GenerationResult OllamaLanguageModelClient::parse_response(
    const std::string &raw_response, const std::vector<ContextChunk> &context) {
  nlohmann::json parsed;
  try {
    parsed = nlohmann::json::parse(raw_response);
  } catch (const nlohmann::json::parse_error &e) {
    throw SynthesisError("Language model returned malformed JSON: " + std::string(e.what()));
  }
  if (!parsed.is_object()) {
    throw SynthesisError("Language model response is not a JSON object");
  }
  if (!parsed.contains("answer") || !parsed["answer"].is_string() ||
      parsed["answer"].get<std::string>().empty()) {
    throw SynthesisError("Language model response has no answer");
  }

  GenerationResult result;
  result.answer = parsed["answer"].get<std::string>();

  if (parsed.contains("confidence") && parsed["confidence"].is_number()) {
    float confidence = parsed["confidence"].get<float>();
    // Values outside [0, 1] are not usable; the caller derives its own
    if (std::isfinite(confidence) && confidence >= 0.0f && confidence <= 1.0f) {
      result.confidence = confidence;
    }
  }

  if (parsed.contains("reasoning") && parsed["reasoning"].is_string()) {
    result.reasoning = parsed["reasoning"].get<std::string>();
  }

  if (parsed.contains("used_context") && parsed["used_context"].is_array()) {
    for (const auto &label_json : parsed["used_context"]) {
      if (!label_json.is_number_integer()) {
        continue;
      }
      int label = label_json.get<int>();
      for (const auto &chunk : context) {
        if (chunk.label == label) {
          result.used_chunks.push_back(chunk.key());
          break;
        }
      }
    }
  }
  return result;
}

GenerationResult OllamaLanguageModelClient::generate(const std::string &question,
                                                     const std::vector<ContextChunk> &context) {
  std::string content;
  try {
    ollama::messages messages = {ollama::message("system", SYSTEM_PROMPT),
                                 ollama::message("user", build_user_prompt(question, context))};
    ollama::options options;
    options["temperature"] = temperature_;
    options["num_predict"] = max_tokens_;

    ollama::response response = ollama::chat(generation_model_, messages, options, "json");
    content = response.as_simple_string();
  } catch (const ollama::exception &e) {
    throw SynthesisError("Answer generation failed: " + std::string(e.what()));
  } catch (const nlohmann::json::exception &e) {
    throw SynthesisError("Answer generation response could not be read: " +
                         std::string(e.what()));
  }
  return parse_response(content, context);
}

}  // namespace askdoc_core
