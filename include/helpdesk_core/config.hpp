#pragma once

#include <fstream>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "helpdesk_core/errors.hpp"
#include "helpdesk_core/llm/ollama_client.hpp"
#include "helpdesk_core/services/retrieval_pipeline.hpp"
#include "helpdesk_core/sources/source_factory.hpp"
#include "helpdesk_core/storage/vector_record_store.hpp"

namespace helpdesk_core {

class Config {
 public:
  std::string store_dir = "./data/store";
  std::string tasks_db_path = "./data/tasks.db";
  std::string api_base_url = "127.0.0.1:8000";
  std::string ollama_url = "http://localhost:11434";
  std::string embedding_model = "mxbai-embed-large";
  std::string chat_model = "llama3.1";
  int provider_timeout_seconds = 120;

  int chunk_size = 500;
  int chunk_overlap = 100;
  int embed_batch_size = 16;
  int top_k = 5;
  float min_score = 0.0f;
  int num_workers = 1;

  std::vector<WebSourceConfig> web;
  std::vector<NotionSourceConfig> notion;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string &filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw ConfigError("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception &e) {
      throw ConfigError(std::string("Failed to parse JSON in config file '") + filename +
                        "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json &json_config) {
    if (!json_config.is_object()) {
      throw ConfigError("Configuration must be a JSON object");
    }
    reject_unknown_keys(json_config,
                        {"store_dir", "tasks_db_path", "api_base_url", "ollama_url",
                         "embedding_model", "chat_model", "provider_timeout_seconds",
                         "chunk_size", "chunk_overlap", "embed_batch_size", "top_k",
                         "min_score", "num_workers", "web", "notion"},
                        "configuration");

    Config config;
    try {
      // Apply defaults when keys are missing
      config.store_dir = json_config.value("store_dir", config.store_dir);
      config.tasks_db_path = json_config.value("tasks_db_path", config.tasks_db_path);
      config.api_base_url = json_config.value("api_base_url", config.api_base_url);
      config.ollama_url = json_config.value("ollama_url", config.ollama_url);
      config.embedding_model = json_config.value("embedding_model", config.embedding_model);
      config.chat_model = json_config.value("chat_model", config.chat_model);
      config.provider_timeout_seconds =
          json_config.value("provider_timeout_seconds", config.provider_timeout_seconds);
      config.chunk_size = json_config.value("chunk_size", config.chunk_size);
      config.chunk_overlap = json_config.value("chunk_overlap", config.chunk_overlap);
      config.embed_batch_size = json_config.value("embed_batch_size", config.embed_batch_size);
      config.top_k = json_config.value("top_k", config.top_k);
      config.min_score = json_config.value("min_score", config.min_score);
      config.num_workers = json_config.value("num_workers", config.num_workers);

      if (json_config.contains("web")) {
        if (!json_config.at("web").is_array()) {
          throw ConfigError("web must be a list of sources");
        }
        for (const auto &entry : json_config.at("web")) {
          config.web.push_back(web_source_from_json(entry));
        }
      }
      if (json_config.contains("notion")) {
        if (!json_config.at("notion").is_array()) {
          throw ConfigError("notion must be a list of sources");
        }
        for (const auto &entry : json_config.at("notion")) {
          config.notion.push_back(notion_source_from_json(entry));
        }
      }
    } catch (const nlohmann::json::exception &e) {
      throw ConfigError(std::string("Invalid configuration value: ") + e.what());
    }

    config.validate();
    return config;
  }

  void validate() const {
    if (store_dir.empty()) {
      throw ConfigError("store_dir cannot be empty");
    }
    if (tasks_db_path.empty()) {
      throw ConfigError("tasks_db_path cannot be empty");
    }
    if (api_base_url.empty()) {
      throw ConfigError("api_base_url cannot be empty");
    }
    if (ollama_url.empty()) {
      throw ConfigError("ollama_url cannot be empty");
    }
    if (embedding_model.empty()) {
      throw ConfigError("embedding_model cannot be empty");
    }
    if (chat_model.empty()) {
      throw ConfigError("chat_model cannot be empty");
    }
    if (provider_timeout_seconds <= 0) {
      throw ConfigError("provider_timeout_seconds must be greater than 0");
    }
    if (num_workers <= 0) {
      throw ConfigError("num_workers must be greater than 0");
    }
    pipeline_options().validate();
    for (const auto &source : web) {
      source.validate();
    }
    for (const auto &source : notion) {
      source.validate();
    }
  }

  PipelineOptions pipeline_options() const {
    return PipelineOptions{.chunk_size = chunk_size,
                           .chunk_overlap = chunk_overlap,
                           .embed_batch_size = embed_batch_size,
                           .top_k = top_k,
                           .min_score = min_score,
                           .max_parallel_documents = num_workers};
  }

  StoreContext store_context() const {
    return StoreContext{.root = store_dir, .embedding_model = embedding_model};
  }

  OllamaOptions ollama_options() const {
    return OllamaOptions{.url = ollama_url,
                         .embedding_model = embedding_model,
                         .chat_model = chat_model,
                         .timeout_seconds = provider_timeout_seconds};
  }

 private:
  static void reject_unknown_keys(const nlohmann::json &object,
                                  const std::set<std::string> &known,
                                  const std::string &where) {
    for (const auto &item : object.items()) {
      if (known.count(item.key()) == 0) {
        throw ConfigError("Unknown key '" + item.key() + "' in " + where);
      }
    }
  }
};

}  // namespace helpdesk_core
