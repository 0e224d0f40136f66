#pragma once

#include <ostream>
#include <string>
#include <vector>
#include "store/blob_store.hpp"

namespace bulk {
namespace cli {

// Environment variable consulted when --blob-store is not given
constexpr const char* BLOB_STORE_ENV = "BULK_BLOB_STORE";

enum ExitCode {
  EXIT_OK = 0,
  EXIT_FAILURE_RESULT = 1,   // A check answered "no" or an operation failed
  EXIT_USAGE = 2
};

struct ProgramOptions {
  std::string program_name{"bulk-store"};
  std::string blob_store;
  int verbosity{0};
  std::string command;
  std::vector<std::string> arguments;
  bool valid{false};
};

// ---- CONFIGURATION ----
// Parses "[--blob-store DIR] [-v...] <command> [args...]" and falls back to
// BULK_BLOB_STORE for the store root. Problems are reported on err.
ProgramOptions parse_command_line(const std::vector<std::string>& args, std::ostream& err);
// Everything except help and hash operates on a store root
bool requires_blob_store(const std::string& command);
void print_usage(std::ostream& os, const std::string& program_name);


class CLI {
public:
  // ---- CONSTRUCTOR ----
  CLI(store::BlobStore& store, std::ostream& out, std::ostream& err);


  // ---- COMMAND PROCESSING ----
  // Runs one command and returns the process exit code
  int execute(const std::string& command, const std::vector<std::string>& arguments);

private:
  // ---- PARAMETERS ----
  store::BlobStore& store_;
  std::ostream& out_;
  std::ostream& err_;


  // ---- COMMAND HANDLERS ----
  int handle_init_command();
  int handle_store_command(const std::vector<std::string>& files);
  int handle_exists_command(const std::vector<std::string>& digests);
  int handle_verify_command(const std::vector<std::string>& digests);
  int handle_path_command(const std::string& digest);
  int handle_hash_command(const std::vector<std::string>& files);
  void log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace bulk
