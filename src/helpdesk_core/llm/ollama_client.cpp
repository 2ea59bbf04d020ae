#include "helpdesk_core/llm/ollama_client.hpp"

#include <algorithm>
#include <cctype>

#include "helpdesk_core/errors.hpp"
#include "ollama.hpp"

namespace helpdesk_core {

namespace {

bool contains(const std::string &haystack, const char *needle) {
  return haystack.find(needle) != std::string::npos;
}

ProviderErrorKind classify_failure(const std::string &message) {
  std::string lower = message;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (contains(lower, "timeout") || contains(lower, "timed out"))
    return ProviderErrorKind::Timeout;
  if (contains(lower, "401") || contains(lower, "403") || contains(lower, "unauthorized"))
    return ProviderErrorKind::Auth;
  if (contains(lower, "429") || contains(lower, "quota") || contains(lower, "rate limit"))
    return ProviderErrorKind::Quota;
  if (contains(lower, "connect") || contains(lower, "connection") || contains(lower, "network"))
    return ProviderErrorKind::Network;
  return ProviderErrorKind::Unknown;
}

}  // namespace

OllamaClient::OllamaClient(OllamaOptions options) : options_(std::move(options)) {
  setup_server_connection();
}

void OllamaClient::setup_server_connection() {
  ollama::setServerURL(options_.url);
  ollama::setReadTimeout(options_.timeout_seconds);
  ollama::setWriteTimeout(options_.timeout_seconds);
}

std::string OllamaClient::model_name() const {
  return options_.embedding_model;
}

std::vector<EmbeddingVector> OllamaClient::embed(const std::vector<std::string> &texts) {
  std::vector<EmbeddingVector> vectors;
  vectors.reserve(texts.size());
  for (const auto &text : texts) {
    EmbeddingVector vector = embed_one(text);
    if (!vectors.empty() && vector.size() != vectors.front().size()) {
      throw ProviderError(ProviderErrorKind::InvalidResponse,
                          "Embedding model " + options_.embedding_model + " returned vectors of " +
                              std::to_string(vectors.front().size()) + " and " +
                              std::to_string(vector.size()) + " dimensions in one batch");
    }
    vectors.push_back(std::move(vector));
  }
  return vectors;
}

// /api/embed takes one input per request here; batching is the pipeline's concern
EmbeddingVector OllamaClient::embed_one(const std::string &text) {
  nlohmann::json json_response;
  try {
    std::lock_guard<std::mutex> lock(request_mutex_);
    ollama::response response = ollama::generate_embeddings(options_.embedding_model, text);
    json_response = response.as_json();
  } catch (const ollama::exception &e) {
    const std::string message = e.what();
    throw ProviderError(classify_failure(message), "Embedding generation failed: " + message);
  }

  // Older servers answer with a single "embedding" field
  const char *field = json_response.contains("embeddings") ? "embeddings" : "embedding";
  if (!json_response.contains(field) || !json_response[field].is_array()) {
    throw ProviderError(ProviderErrorKind::InvalidResponse,
                        "Response does not contain an embedding array");
  }

  try {
    auto embeddings = json_response[field];
    EmbeddingVector vector = (!embeddings.empty() && embeddings[0].is_array())
                                 ? embeddings[0].get<EmbeddingVector>()
                                 : embeddings.get<EmbeddingVector>();
    if (vector.empty()) {
      throw ProviderError(ProviderErrorKind::InvalidResponse, "Embedding vector is empty");
    }
    return vector;
  } catch (const nlohmann::json::exception &e) {
    throw ProviderError(ProviderErrorKind::InvalidResponse,
                        "Embedding array is malformed: " + std::string(e.what()));
  }
}

std::string OllamaClient::answer(const std::string &question,
                                 const std::vector<ContextSnippet> &context) {
  ollama::messages messages = {ollama::message("system", kDefaultSystemPrompt),
                               ollama::message("user", build_user_prompt(question, context))};
  try {
    std::lock_guard<std::mutex> lock(request_mutex_);
    ollama::response response = ollama::chat(options_.chat_model, messages);
    return response.as_simple_string();
  } catch (const ollama::exception &e) {
    const std::string message = e.what();
    throw ProviderError(classify_failure(message), "Chat completion failed: " + message);
  }
}

bool OllamaClient::is_server_available() {
  std::lock_guard<std::mutex> lock(request_mutex_);
  return ollama::is_running();
}

}  // namespace helpdesk_core
