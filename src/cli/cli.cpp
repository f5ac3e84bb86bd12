#include "cli/cli.hpp"
#include <boost/log/trivial.hpp>
#include <limits>
#include <stdexcept>

namespace lanshare {
namespace cli {

namespace {

// Flags that consume the following argument
bool takes_value(const std::string& flag) {
  return flag == "-p" || flag == "--port"
      || flag == "-b" || flag == "--bind"
      || flag == "-d" || flag == "--dir"
      || flag == "-t" || flag == "--threads"
      || flag == "-l" || flag == "--log-file"
      || flag == "--log-level";
}

// Whole-string unsigned parse, throws std::invalid_argument or std::out_of_range
unsigned long parse_number(const std::string& value) {
  std::size_t consumed = 0;
  if (value.empty() || value[0] == '-' || value[0] == '+') {
    throw std::invalid_argument(value);
  }
  const unsigned long number = std::stoul(value, &consumed);
  if (consumed != value.size()) {
    throw std::invalid_argument(value);
  }
  return number;
}

ProgramOptions reject(ProgramOptions options, const std::string& program_name,
                      const std::string& message, std::ostream& err) {
  BOOST_LOG_TRIVIAL(debug) << "CLI: Rejected arguments: " << message;
  err << "Error: " << message << '\n';
  print_usage(program_name, err);
  options.valid = false;
  return options;
}

} // namespace


//==============================================
// ARGUMENT PARSING
//==============================================

ProgramOptions parse_command_line(int argc, char* argv[], std::ostream& err) {
  const std::string program_name = argc > 0 ? argv[0] : "lanshare";
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }
  return parse_arguments(program_name, args, err);
}

ProgramOptions parse_arguments(const std::string& program_name, const std::vector<std::string>& args,
                               std::ostream& err) {
  ProgramOptions options;
  bool command_seen = false;

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];

    if (arg == "-h" || arg == "--help") {
      options.show_help = true;
      options.valid = true;
      return options;
    }
    if (arg == "--open") {
      options.config.open_browser = true;
      continue;
    }
    if (arg == "-v" || arg == "--verbose") {
      options.config.log_level = "debug";
      continue;
    }
    if (arg == "runserver") {
      if (command_seen) {
        return reject(options, program_name, "Command given twice: " + arg, err);
      }
      options.command = Command::RunServer;
      command_seen = true;
      continue;
    }
    if (!takes_value(arg)) {
      return reject(options, program_name, "Unknown argument: " + arg, err);
    }
    if (i + 1 >= args.size()) {
      return reject(options, program_name, "Missing value for " + arg, err);
    }

    const std::string& value = args[++i];
    if (arg == "-p" || arg == "--port") {
      try {
        const unsigned long port = parse_number(value);
        if (port == 0 || port > std::numeric_limits<uint16_t>::max()) {
          return reject(options, program_name, "Port must be between 1 and 65535", err);
        }
        options.config.port = static_cast<uint16_t>(port);
      } catch (const std::exception&) {
        return reject(options, program_name, "Invalid port number: " + value, err);
      }
    } else if (arg == "-t" || arg == "--threads") {
      try {
        const unsigned long threads = parse_number(value);
        if (threads == 0) {
          return reject(options, program_name, "Thread count must be at least 1", err);
        }
        options.config.worker_threads = threads;
      } catch (const std::exception&) {
        return reject(options, program_name, "Invalid thread count: " + value, err);
      }
    } else if (arg == "-b" || arg == "--bind") {
      options.config.bind_address = value;
    } else if (arg == "-d" || arg == "--dir") {
      if (value.empty()) {
        return reject(options, program_name, "Storage directory must not be empty", err);
      }
      options.config.storage_root = value;
    } else if (arg == "-l" || arg == "--log-file") {
      options.config.log_file = value;
    } else {
      options.config.log_level = value;
    }
  }

  options.valid = true;
  return options;
}


//==============================================
// OUTPUT
//==============================================

void print_usage(const std::string& program_name, std::ostream& out) {
  out << "Usage: " << program_name << " [runserver] [options]\n"
      << "Commands:\n"
      << "  (none)                 Print the shared folder and URL, then exit\n"
      << "  runserver              Serve the folder until interrupted\n"
      << "Options:\n"
      << "      --open             Open the page in a browser once the server is up\n"
      << "  -p, --port <n>         Listening port (default " << config::DEFAULT_PORT << ")\n"
      << "  -b, --bind <addr>      Bind address (default " << config::DEFAULT_BIND_ADDRESS << ")\n"
      << "  -d, --dir <path>       Shared folder (default ./" << config::DEFAULT_STORAGE_DIR << ")\n"
      << "  -t, --threads <n>      Worker threads (default: one per core, at least 2)\n"
      << "  -l, --log-file <path>  Also write the log to this file\n"
      << "      --log-level <lvl>  trace, debug, info, warning, error or fatal\n"
      << "  -v, --verbose          Same as --log-level debug\n"
      << "  -h, --help             Show this message\n"
      << "Example: " << program_name << " runserver --port 8000 --dir ~/Public\n";
}

void print_banner(const std::string& folder, const std::string& url, std::ostream& out) {
  const std::string rule(40, '=');
  out << '\n' << rule << '\n'
      << " LANSHARE\n"
      << rule << '\n'
      << " Folder: " << folder << '\n'
      << " URL:    " << url << '\n'
      << std::string(40, '-') << '\n';
}

void print_run_instructions(const std::string& program_name, std::ostream& out) {
  out << "To start the server, run:\n"
      << "    " << program_name << " runserver\n";
}

} // namespace cli
} // namespace lanshare
