#include <atomic>
#include <csignal>
#include <iostream>

#include "helpdesk_cli/cli_handler.hpp"

namespace {
std::atomic<bool> cancel_requested = false;

void signal_handler(int) {
  cancel_requested = true;
}
}  // namespace

int main(int argc, char *argv[]) {
  try {
    helpdesk_cli::CliOptions options = helpdesk_cli::CliHandler::parse_arguments(argc, argv);

    helpdesk_cli::CliHandler handler(std::cout);
    if (options.command == helpdesk_cli::Command::Ingest) {
      std::signal(SIGINT, signal_handler);
      handler.set_cancel_flag(&cancel_requested);
    }
    return handler.execute_command(options);
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
