#pragma once

#include <mutex>
#include <string>
#include <vector>

#include "helpdesk_core/llm/chat_provider.hpp"
#include "helpdesk_core/llm/embedding_provider.hpp"

namespace helpdesk_core {

struct OllamaOptions {
  std::string url = "http://localhost:11434";
  std::string embedding_model = "mxbai-embed-large";
  std::string chat_model = "llama3.1";
  int timeout_seconds = 120;
};

// Embedding and chat provider backed by an Ollama server.
class OllamaClient : public EmbeddingProvider, public ChatProvider {
 public:
  explicit OllamaClient(OllamaOptions options);

  OllamaClient(const OllamaClient &) = delete;
  OllamaClient &operator=(const OllamaClient &) = delete;

  std::vector<EmbeddingVector> embed(const std::vector<std::string> &texts) override;
  std::string model_name() const override;

  std::string answer(const std::string &question,
                     const std::vector<ContextSnippet> &context) override;

  bool is_server_available();

 private:
  EmbeddingVector embed_one(const std::string &text);
  void setup_server_connection();

  OllamaOptions options_;
  // ollama-hpp talks through one process-wide client
  std::mutex request_mutex_;
};

}  // namespace helpdesk_core
