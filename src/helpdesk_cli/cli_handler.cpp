#include "helpdesk_cli/cli_handler.hpp"

#include <utf8.h>

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "helpdesk_core/chunking/text_normalizer.hpp"
#include "helpdesk_core/errors.hpp"
#include "helpdesk_core/llm/ollama_client.hpp"
#include "helpdesk_core/sources/notion_export_reader.hpp"
#include "helpdesk_core/sources/web_crawler.hpp"
#include "helpdesk_core/storage/vector_record_store.hpp"

namespace helpdesk_cli {

namespace {

constexpr const char *kDefaultConfigFile = "helpdeskrc.json";

int parse_int_flag(const std::string &flag, const std::string &value) {
  try {
    size_t consumed = 0;
    int parsed = std::stoi(value, &consumed);
    if (consumed != value.size()) {
      throw std::invalid_argument(value);
    }
    return parsed;
  } catch (const std::exception &) {
    throw CliError(flag + " expects an integer, got '" + value + "'");
  }
}

Command parse_command(const std::string &command) {
  if (command == "ingest" || command == "i") return Command::Ingest;
  if (command == "ask" || command == "a") return Command::Ask;
  if (command == "chat" || command == "c") return Command::Chat;
  if (command == "search" || command == "s") return Command::Search;
  if (command == "stats") return Command::Stats;
  if (command == "forget") return Command::Forget;
  if (command == "clear") return Command::Clear;
  if (command == "repair") return Command::Repair;
  if (command == "help" || command == "h" || command == "--help" || command == "-h")
    return Command::Help;
  throw CliError("Unknown command: " + command);
}

}  // namespace

std::string format_reference(const helpdesk_core::Citation &citation) {
  std::ostringstream line;
  line << "- " << citation.label() << " (score=" << std::fixed << std::setprecision(3)
       << citation.score << ")";
  return line.str();
}

std::string truncate_snippet(const std::string &text, size_t max_code_points) {
  const std::string valid = helpdesk_core::repair_utf8(text);
  auto it = valid.begin();
  for (size_t count = 0; count < max_code_points && it != valid.end(); ++count) {
    utf8::next(it, valid.end());
  }
  if (it == valid.end()) {
    return valid;
  }
  return std::string(valid.begin(), it) + "...";
}

CliHandler::CliHandler(std::ostream &out) : out_(out) {}

void CliHandler::set_providers(std::shared_ptr<helpdesk_core::EmbeddingProvider> embedder,
                               std::shared_ptr<helpdesk_core::ChatProvider> chat) {
  embedder_ = std::move(embedder);
  chat_ = std::move(chat);
}

CliOptions CliHandler::parse_arguments(int argc, char *argv[]) {
  CliOptions options;
  if (argc < 2) {
    options.command = Command::Help;
    return options;
  }

  options.command = parse_command(argv[1]);

  std::vector<std::string> positional;
  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg.rfind("--", 0) != 0) {
      positional.push_back(arg);
      continue;
    }
    if (i + 1 >= argc) {
      throw CliError(arg + " requires a value");
    }
    std::string value = argv[++i];

    if (arg == "--config") {
      options.config_path = value;
    } else if (arg == "--store-dir") {
      options.store_dir = value;
    } else if (arg == "--top-k") {
      options.top_k = parse_int_flag(arg, value);
    } else if (arg == "--web-url") {
      options.web_url = value;
    } else if (arg == "--max-pages") {
      options.max_pages = parse_int_flag(arg, value);
    } else if (arg == "--notion-file") {
      options.notion_file = value;
    } else {
      throw CliError("Unknown flag: " + arg);
    }
  }

  std::ostringstream joined;
  for (size_t i = 0; i < positional.size(); ++i) {
    joined << (i ? " " : "") << positional[i];
  }
  options.argument = joined.str();

  switch (options.command) {
    case Command::Ask:
    case Command::Search:
      if (options.argument.empty()) {
        throw CliError("This command requires a question. Usage: " + std::string(argv[1]) +
                       " <question>");
      }
      break;
    case Command::Forget:
      if (options.argument.empty()) {
        throw CliError("Forget command requires a document id. Usage: forget <document-id>");
      }
      break;
    default:
      break;
  }
  if (options.top_k && *options.top_k <= 0) {
    throw CliError("--top-k must be greater than 0");
  }
  return options;
}

helpdesk_core::Config CliHandler::resolve_config(const CliOptions &options) {
  helpdesk_core::Config config;
  if (!options.config_path.empty()) {
    config = helpdesk_core::Config::from_file(options.config_path);
  } else if (std::filesystem::exists(kDefaultConfigFile)) {
    config = helpdesk_core::Config::from_file(kDefaultConfigFile);
  }

  if (options.store_dir) {
    config.store_dir = *options.store_dir;
  }
  if (options.top_k) {
    config.top_k = *options.top_k;
  }
  if (options.web_url || options.notion_file) {
    // Sources named on the command line replace the configured ones
    config.web.clear();
    config.notion.clear();
    if (options.web_url) {
      helpdesk_core::WebSourceConfig web;
      web.url = *options.web_url;
      config.web.push_back(web);
    }
    if (options.notion_file) {
      helpdesk_core::NotionSourceConfig notion;
      notion.path = *options.notion_file;
      config.notion.push_back(notion);
    }
  }
  if (options.max_pages) {
    for (auto &web : config.web) {
      web.max_pages = *options.max_pages;
    }
  }
  config.validate();
  return config;
}

int CliHandler::execute_command(const CliOptions &options) {
  if (options.command == Command::Help) {
    print_help();
    return 0;
  }

  helpdesk_core::Config config = resolve_config(options);

  switch (options.command) {
    case Command::Ingest:
      return handle_ingest_command(config, options);
    case Command::Repair:
      return handle_repair_command(config);
    default:
      break;
  }

  auto pipeline = open_pipeline(config);
  switch (options.command) {
    case Command::Ask:
      return handle_ask_command(*pipeline, options.argument);
    case Command::Chat:
      return handle_chat_command(*pipeline);
    case Command::Search:
      return handle_search_command(*pipeline, options);
    case Command::Stats:
      return handle_stats_command(*pipeline);
    case Command::Forget:
      return handle_forget_command(*pipeline, options.argument);
    case Command::Clear:
      return handle_clear_command(*pipeline);
    default:
      print_help();
      return 1;
  }
}

std::unique_ptr<helpdesk_core::RetrievalPipeline> CliHandler::open_pipeline(
    const helpdesk_core::Config &config) {
  auto store = std::make_shared<helpdesk_core::VectorRecordStore>(config.store_context());
  if (store->is_corrupt()) {
    throw CliError("Record store is corrupt (" + store->corruption_message() +
                   "). Run 'helpdesk_cli repair' to keep the readable records.");
  }

  if (!embedder_ || !chat_) {
    auto client = std::make_shared<helpdesk_core::OllamaClient>(config.ollama_options());
    if (!embedder_) embedder_ = client;
    if (!chat_) chat_ = client;
  }
  return std::make_unique<helpdesk_core::RetrievalPipeline>(store, embedder_, chat_,
                                                            config.pipeline_options());
}

int CliHandler::handle_ingest_command(const helpdesk_core::Config &config,
                                      const CliOptions &options) {
  if (config.web.empty() && config.notion.empty()) {
    throw CliError(
        "No sources to ingest. Pass --web-url or --notion-file, or list sources in the "
        "configuration file.");
  }

  std::vector<std::unique_ptr<helpdesk_core::DocumentSource>> sources;
  for (const auto &web : config.web) {
    sources.push_back(std::make_unique<helpdesk_core::WebCrawler>(web));
  }
  for (const auto &notion : config.notion) {
    sources.push_back(std::make_unique<helpdesk_core::NotionExportReader>(notion));
  }

  int failures = 0;
  std::vector<helpdesk_core::Document> documents;
  for (const auto &source : sources) {
    out_ << "Fetching " << source->describe() << "..." << std::endl;
    try {
      auto fetched = source->fetch();
      out_ << "  " << fetched.size() << " document(s)" << std::endl;
      for (auto &document : fetched) {
        documents.push_back(std::move(document));
      }
    } catch (const helpdesk_core::SourceError &e) {
      std::cerr << "Error: " << e.what() << std::endl;
      ++failures;
    }
    if (cancel_ && cancel_->load()) {
      throw CliError("Ingest cancelled");
    }
  }

  auto pipeline = open_pipeline(config);
  auto reports = pipeline->ingest_all(std::move(documents), cancel_);

  size_t total_chunks = 0;
  for (const auto &report : reports) {
    out_ << report.document_id << ": " << helpdesk_core::to_string(report.outcome);
    if (report.outcome == helpdesk_core::IngestOutcome::Failed) {
      out_ << " (" << report.error << ")";
      ++failures;
    } else {
      out_ << " (" << report.chunk_count << " chunks)";
      total_chunks += report.chunk_count;
    }
    out_ << std::endl;
  }

  auto stats = pipeline->stats();
  out_ << "Ingested " << reports.size() << " document(s), " << total_chunks
       << " chunk(s). Store holds " << stats.store.record_count << " record(s) from "
       << stats.store.document_count << " document(s)." << std::endl;
  return failures == 0 ? 0 : 1;
}

void CliHandler::print_answer(const helpdesk_core::Answer &answer) {
  out_ << answer.answer << std::endl;
  if (answer.no_context) {
    out_ << "\n(No relevant documents were found in the knowledge base.)" << std::endl;
    return;
  }
  out_ << "\nReferences:" << std::endl;
  for (const auto &citation : answer.citations) {
    out_ << format_reference(citation) << std::endl;
  }
}

int CliHandler::handle_ask_command(helpdesk_core::RetrievalPipeline &pipeline,
                                   const std::string &question) {
  try {
    print_answer(pipeline.ask(question));
    return 0;
  } catch (const helpdesk_core::ProviderError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}

int CliHandler::handle_chat_command(helpdesk_core::RetrievalPipeline &pipeline) {
  out_ << "AI Helpdesk chat. Type 'exit' to quit." << std::endl;
  std::string line;
  while (true) {
    out_ << "\n> " << std::flush;
    if (!std::getline(std::cin, line)) {
      break;
    }
    if (line == "exit" || line == "quit") {
      break;
    }
    if (line.find_first_not_of(" \t") == std::string::npos) {
      continue;
    }
    try {
      print_answer(pipeline.ask(line));
    } catch (const helpdesk_core::ProviderError &e) {
      std::cerr << "Error: " << e.what() << std::endl;
    }
  }
  return 0;
}

int CliHandler::handle_search_command(helpdesk_core::RetrievalPipeline &pipeline,
                                      const CliOptions &options) {
  auto results = pipeline.retrieve(options.argument);
  if (results.empty()) {
    out_ << "No results." << std::endl;
    return 0;
  }
  for (const auto &result : results) {
    out_ << format_reference(helpdesk_core::make_citation(result)) << std::endl;
    out_ << "   " << truncate_snippet(result.chunk.text, 200) << std::endl;
  }
  return 0;
}

int CliHandler::handle_stats_command(helpdesk_core::RetrievalPipeline &pipeline) {
  auto stats = pipeline.stats();
  out_ << "Records:         " << stats.store.record_count << std::endl;
  out_ << "Documents:       " << stats.store.document_count << std::endl;
  out_ << "Dimension:       "
       << (stats.store.dimension ? std::to_string(*stats.store.dimension) : "unset") << std::endl;
  out_ << "Embedding model: " << stats.store.embedding_model << std::endl;
  return 0;
}

int CliHandler::handle_forget_command(helpdesk_core::RetrievalPipeline &pipeline,
                                      const std::string &document_id) {
  size_t removed = pipeline.forget(document_id);
  if (removed == 0) {
    std::cerr << "Error: no records for document '" << document_id << "'" << std::endl;
    return 1;
  }
  out_ << "Removed " << removed << " record(s) of " << document_id << std::endl;
  return 0;
}

int CliHandler::handle_clear_command(helpdesk_core::RetrievalPipeline &pipeline) {
  pipeline.clear();
  out_ << "Store cleared." << std::endl;
  return 0;
}

int CliHandler::handle_repair_command(const helpdesk_core::Config &config) {
  helpdesk_core::VectorRecordStore store(config.store_context());
  if (!store.is_corrupt()) {
    out_ << "Store is healthy (" << store.record_count() << " records). Nothing to repair."
         << std::endl;
    return 0;
  }

  out_ << "Store is corrupt: " << store.corruption_message() << std::endl;
  std::vector<helpdesk_core::StoreRecord> readable;
  try {
    readable = store.load_all();
  } catch (const helpdesk_core::CorruptStoreError &e) {
    readable = e.partial_records();
  }
  store.rebuild(std::move(readable));
  out_ << "Rebuilt store with " << store.record_count() << " readable record(s)." << std::endl;
  return 0;
}

void CliHandler::print_help() {
  out_ << "AI Helpdesk CLI\n"
       << "\n"
       << "Usage: helpdesk_cli <command> [arguments] [flags]\n"
       << "\n"
       << "Commands:\n"
       << "  ingest              Fetch the configured (or flagged) sources and index them\n"
       << "  ask <question>      Answer one question from the indexed documents\n"
       << "  chat                Interactive question loop\n"
       << "  search <query>      Show the best matching chunks without asking the model\n"
       << "  stats               Show record and document counts\n"
       << "  forget <doc-id>     Remove every record of one document\n"
       << "  clear               Remove all records\n"
       << "  repair              Rewrite a corrupt store keeping the readable records\n"
       << "  help                Show this message\n"
       << "\n"
       << "Flags:\n"
       << "  --config <file>       Configuration file (default: helpdeskrc.json if present)\n"
       << "  --store-dir <dir>     Storage root\n"
       << "  --top-k <n>           Number of chunks to retrieve\n"
       << "  --web-url <url>       Crawl this site instead of the configured sources\n"
       << "  --max-pages <n>       Page cap for web sources\n"
       << "  --notion-file <file>  Ingest this Notion export instead of the configured sources\n";
}

}  // namespace helpdesk_cli
