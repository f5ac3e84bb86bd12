#pragma once

#include <iostream>
#include <string>
#include <vector>
#include "config/server_config.hpp"

namespace lanshare {
namespace cli {

enum class Command {
  Info,       // Print folder and URL, then exit
  RunServer   // Serve until stopped
};

struct ProgramOptions {
  Command command = Command::Info;
  config::ServerConfig config;
  bool show_help = false;
  bool valid = false;
};

// ---- ARGUMENT PARSING ----
// Parses argv, printing the error and usage to err when an argument is rejected
ProgramOptions parse_command_line(int argc, char* argv[], std::ostream& err = std::cerr);
ProgramOptions parse_arguments(const std::string& program_name, const std::vector<std::string>& args,
                               std::ostream& err = std::cerr);


// ---- OUTPUT ----
void print_usage(const std::string& program_name, std::ostream& out = std::cerr);
// Folder and URL block shown at start-up
void print_banner(const std::string& folder, const std::string& url, std::ostream& out = std::cout);
// Shown instead of serving when no command is given
void print_run_instructions(const std::string& program_name, std::ostream& out = std::cout);

} // namespace cli
} // namespace lanshare
