#include "cli/cli.hpp"
#include "logger/logger.hpp"
#include "store/blob_store.hpp"
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
  const std::vector<std::string> args(argv, argv + argc);

  const auto options = bulk::cli::parse_command_line(args, std::cerr);
  if (!options.valid) {
    return bulk::cli::EXIT_USAGE;
  }

  bulk::logging::init_logging(bulk::logging::level_from_verbosity(options.verbosity));

  try {
    bulk::store::BlobStore store(options.blob_store);
    bulk::cli::CLI cli(store, std::cout, std::cerr);
    return cli.execute(options.command, options.arguments);
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << '\n';
    return bulk::cli::EXIT_FAILURE_RESULT;
  }
}
