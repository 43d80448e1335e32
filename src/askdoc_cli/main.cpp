#include <cstdlib>
#include <iostream>

#include "askdoc_cli/cli_handler.hpp"

int main(int argc, char *argv[]) {
  const char *env_url = std::getenv("ASKDOC_API_URL");
  const std::string base_url = env_url ? env_url : "http://127.0.0.1:3030";

  askdoc_cli::CliOptions options;
  try {
    options = askdoc_cli::CliHandler::parse_arguments(argc, argv);
  } catch (const askdoc_cli::CliError &e) {
    std::cerr << "Error: " << e.what() << "\nRun 'askdoc_cli help' for usage." << std::endl;
    return 2;
  }

  try {
    askdoc_cli::CliHandler handler(base_url);
    handler.execute_command(options);
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}
