#include "app/bootstrap.hpp"
#include "cli/cli.hpp"
#include "logger/logger.hpp"
#include "network/local_address.hpp"
#include "store/store.hpp"
#include <boost/log/trivial.hpp>
#include <iostream>

namespace {

using namespace lanshare;

bool init_logging(const config::ServerConfig& config) {
  logger::LogOptions log_options;
  log_options.log_file = config.log_file;
  if (!logger::parse_severity(config.log_level, log_options.min_level)) {
    std::cerr << "Error: Unknown log level: " << config.log_level << '\n';
    return false;
  }
  try {
    logger::init_logging(log_options);
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to initialize logging: " << e.what() << '\n';
    return false;
  }
  return true;
}

// Prints where the server would be reachable without starting it
int show_info(const std::string& program_name, const config::ServerConfig& config) {
  store::Store store(config.storage_root);
  const std::string url = network::make_server_url(network::resolve_local_ipv4(), config.port);
  cli::print_banner(store.root().string(), url);
  cli::print_run_instructions(program_name);
  return 0;
}

int run_server(const config::ServerConfig& config) {
  app::Bootstrap bootstrap(config);
  if (!bootstrap.start(config.open_browser)) {
    std::cerr << "Error: Failed to start server on " << config.bind_address << ":" << config.port << '\n';
    return 1;
  }

  cli::print_banner(bootstrap.get_store().root().string(), bootstrap.url());
  std::cout << "Server running... (Press Ctrl+C to stop)" << std::endl;

  const int status = bootstrap.run();
  std::cout << "Server stopped." << std::endl;
  return status;
}

} // namespace

int main(int argc, char* argv[]) {
  const auto options = cli::parse_command_line(argc, argv);
  if (!options.valid) {
    return 1;
  }
  const std::string program_name = argc > 0 ? argv[0] : "lanshare";
  if (options.show_help) {
    cli::print_usage(program_name, std::cout);
    return 0;
  }

  if (!init_logging(options.config)) {
    return 1;
  }

  try {
    config::validate(options.config);
    if (options.command == cli::Command::Info) {
      return show_info(program_name, options.config);
    }
    return run_server(options.config);
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(fatal) << "Main: " << e.what();
    std::cerr << "Error: " << e.what() << '\n';
    return 1;
  }
}
