#include "cli/cli.hpp"
#include <cstdlib>
#include <boost/log/trivial.hpp>

namespace bulk {
namespace cli {

//==============================================
// CONFIGURATION
//==============================================

ProgramOptions parse_command_line(const std::vector<std::string>& args, std::ostream& err) {
  ProgramOptions options;
  if (!args.empty()) {
    options.program_name = args[0];
  }

  const std::string blob_store_prefix = "--blob-store=";
  size_t i = 1;
  for (; i < args.size(); ++i) {
    const std::string& arg = args[i];

    if (arg == "--blob-store") {
      if (i + 1 >= args.size()) {
        err << "error: --blob-store requires a directory\n";
        print_usage(err, options.program_name);
        return options;
      }
      options.blob_store = args[++i];
    } else if (arg.compare(0, blob_store_prefix.size(), blob_store_prefix) == 0) {
      options.blob_store = arg.substr(blob_store_prefix.size());
    } else if (arg == "--verbose") {
      ++options.verbosity;
    } else if (arg.size() > 1 && arg[0] == '-' && arg.find_first_not_of('v', 1) == std::string::npos) {
      // -v, -vv, -vvv... each v raises verbosity by one
      options.verbosity += static_cast<int>(arg.size() - 1);
    } else if (arg == "-h" || arg == "--help") {
      options.command = "help";
      ++i;
      break;
    } else if (!arg.empty() && arg[0] == '-') {
      err << "error: unknown option: " << arg << "\n";
      print_usage(err, options.program_name);
      return options;
    } else {
      options.command = arg;
      ++i;
      break;
    }
  }

  if (options.command.empty()) {
    err << "error: no command specified\n";
    print_usage(err, options.program_name);
    return options;
  }

  options.arguments.assign(args.begin() + i, args.end());

  if (options.blob_store.empty()) {
    if (const char* env = std::getenv(BLOB_STORE_ENV)) {
      options.blob_store = env;
    }
  }

  if (options.blob_store.empty() && requires_blob_store(options.command)) {
    err << "error: missing --blob-store (or " << BLOB_STORE_ENV << ")\n";
    return options;
  }

  options.valid = true;
  return options;
}

bool requires_blob_store(const std::string& command) {
  return command != "help" && command != "hash";
}

void print_usage(std::ostream& os, const std::string& program_name) {
  os << "Usage: " << program_name << " [--blob-store DIR] [-v|-vv] <command> [args...]\n"
     << "Commands:\n"
     << "  init                Create the blobs/ and partial/ directories\n"
     << "  store <file>...     Store files, printing their digests\n"
     << "  exists <digest>...  Report whether each blob is stored\n"
     << "  verify <digest>...  Re-hash stored blobs and report corruption\n"
     << "  path <digest>       Print the path of a blob\n"
     << "  hash <file>...      Print digests without storing\n"
     << "  help                Display this help message\n"
     << "The store root defaults to $" << BLOB_STORE_ENV << ".\n";
}


//==============================================
// CONSTRUCTOR
//==============================================

CLI::CLI(store::BlobStore& store, std::ostream& out, std::ostream& err)
  : store_(store)
  , out_(out)
  , err_(err) {
}


//==============================================
// COMMAND PROCESSING
//==============================================

int CLI::execute(const std::string& command, const std::vector<std::string>& arguments) {
  BOOST_LOG_TRIVIAL(debug) << "CLI: Processing command: " << command << " with " << arguments.size() << " argument(s)";

  if (command == "help") {
    print_usage(out_, "bulk-store");
    return EXIT_OK;
  }
  if (command == "init" && arguments.empty()) {
    return handle_init_command();
  }
  if (command == "path" && arguments.size() == 1) {
    return handle_path_command(arguments[0]);
  }

  const bool has_arguments = !arguments.empty();
  if (command == "store" && has_arguments) {
    return handle_store_command(arguments);
  }
  if (command == "exists" && has_arguments) {
    return handle_exists_command(arguments);
  }
  if (command == "verify" && has_arguments) {
    return handle_verify_command(arguments);
  }
  if (command == "hash" && has_arguments) {
    return handle_hash_command(arguments);
  }

  err_ << "error: unknown command or invalid arguments: " << command << "\n";
  return EXIT_USAGE;
}

int CLI::handle_init_command() {
  try {
    store_.init();
  } catch (const store::StoreError& e) {
    log_and_display_error("Error initializing store", e.what());
    return EXIT_FAILURE_RESULT;
  }
  return EXIT_OK;
}

int CLI::handle_store_command(const std::vector<std::string>& files) {
  int result = EXIT_OK;
  for (const auto& file : files) {
    try {
      const store::Digest digest = store_.store(file);
      out_ << digest << "  " << file << "\n";
    } catch (const store::StoreError& e) {
      log_and_display_error("Error storing " + file, e.what());
      result = EXIT_FAILURE_RESULT;
    }
  }
  return result;
}

int CLI::handle_exists_command(const std::vector<std::string>& digests) {
  int result = EXIT_OK;
  for (const auto& digest : digests) {
    try {
      const bool found = store_.exists(digest);
      out_ << digest << (found ? " yes" : " no") << "\n";
      if (!found) {
        result = EXIT_FAILURE_RESULT;
      }
    } catch (const store::StoreError& e) {
      log_and_display_error("Error checking " + digest, e.what());
      result = EXIT_FAILURE_RESULT;
    }
  }
  return result;
}

int CLI::handle_verify_command(const std::vector<std::string>& digests) {
  int result = EXIT_OK;
  for (const auto& digest : digests) {
    try {
      const bool intact = store_.verify(digest);
      out_ << digest << (intact ? " OK" : " FAILED") << "\n";
      if (!intact) {
        result = EXIT_FAILURE_RESULT;
      }
    } catch (const store::StoreError& e) {
      log_and_display_error("Error verifying " + digest, e.what());
      result = EXIT_FAILURE_RESULT;
    }
  }
  return result;
}

int CLI::handle_path_command(const std::string& digest) {
  try {
    out_ << store_.blob_path(digest).string() << "\n";
  } catch (const store::StoreError& e) {
    log_and_display_error("Error resolving " + digest, e.what());
    return EXIT_FAILURE_RESULT;
  }
  return EXIT_OK;
}

int CLI::handle_hash_command(const std::vector<std::string>& files) {
  int result = EXIT_OK;
  for (const auto& file : files) {
    try {
      out_ << store::hash_file(file) << "  " << file << "\n";
    } catch (const store::StoreError& e) {
      log_and_display_error("Error hashing " + file, e.what());
      result = EXIT_FAILURE_RESULT;
    }
  }
  return result;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << "CLI: " << message << ": " << error;
  err_ << "error: " << error << "\n";
}

} // namespace cli
} // namespace bulk
