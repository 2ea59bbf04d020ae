#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "helpdesk_core/config.hpp"
#include "helpdesk_core/services/retrieval_pipeline.hpp"

namespace helpdesk_cli {

enum class Command { Ingest, Ask, Chat, Search, Stats, Forget, Clear, Repair, Help };

struct CliOptions {
  Command command = Command::Help;
  std::string config_path;
  std::optional<std::string> store_dir;
  std::optional<int> top_k;
  std::optional<std::string> web_url;
  std::optional<int> max_pages;
  std::optional<std::string> notion_file;
  // Question, search query or document id, depending on the command
  std::string argument;
};

class CliError : public std::exception {
 public:
  explicit CliError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/**
 * @class CliHandler
 * @brief Runs helpdesk commands in-process against the local record store.
 *
 * The CLI never talks to the API server. It opens the store named by the
 * configuration, builds a RetrievalPipeline on top of it and executes one command.
 */
class CliHandler {
 public:
  explicit CliHandler(std::ostream &out);
  ~CliHandler() = default;

  CliHandler(const CliHandler &) = delete;
  CliHandler &operator=(const CliHandler &) = delete;

  static CliOptions parse_arguments(int argc, char *argv[]);

  // Configuration file (or defaults) with the command line overrides applied.
  static helpdesk_core::Config resolve_config(const CliOptions &options);

  // Returns the process exit code.
  int execute_command(const CliOptions &options);

  // Checked between documents and embedding batches during ingest.
  void set_cancel_flag(const std::atomic<bool> *cancel) {
    cancel_ = cancel;
  }

  // Test seam: use these providers instead of an OllamaClient.
  void set_providers(std::shared_ptr<helpdesk_core::EmbeddingProvider> embedder,
                     std::shared_ptr<helpdesk_core::ChatProvider> chat);

 private:
  std::ostream &out_;
  const std::atomic<bool> *cancel_ = nullptr;
  std::shared_ptr<helpdesk_core::EmbeddingProvider> embedder_;
  std::shared_ptr<helpdesk_core::ChatProvider> chat_;

  int handle_ingest_command(const helpdesk_core::Config &config, const CliOptions &options);
  int handle_ask_command(helpdesk_core::RetrievalPipeline &pipeline, const std::string &question);
  int handle_chat_command(helpdesk_core::RetrievalPipeline &pipeline);
  int handle_search_command(helpdesk_core::RetrievalPipeline &pipeline, const CliOptions &options);
  int handle_stats_command(helpdesk_core::RetrievalPipeline &pipeline);
  int handle_forget_command(helpdesk_core::RetrievalPipeline &pipeline,
                            const std::string &document_id);
  int handle_clear_command(helpdesk_core::RetrievalPipeline &pipeline);
  int handle_repair_command(const helpdesk_core::Config &config);
  void print_help();

  std::unique_ptr<helpdesk_core::RetrievalPipeline> open_pipeline(
      const helpdesk_core::Config &config);
  void print_answer(const helpdesk_core::Answer &answer);
};

// "- <citation> (score=0.xxx)"
std::string format_reference(const helpdesk_core::Citation &citation);

// At most max_code_points code points of text, with "..." appended when cut.
std::string truncate_snippet(const std::string &text, size_t max_code_points);

}  // namespace helpdesk_cli
