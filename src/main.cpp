#include "cli/cli.hpp"
#include "logger/logger.hpp"
#include "store/file_system.hpp"
#include <iostream>
#include <string>

bool init_logging(const fatsplit::cli::ProgramOptions& options) {
  try {
    fatsplit::logging::init_logging(options.log_file, options.log_level, options.verbose);
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to set up logging: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  const auto options = fatsplit::cli::parse_command_line(argc, argv);
  if (!options.valid) {
    std::cerr << "Error: " << options.error << '\n';
    fatsplit::cli::print_usage(argv[0], std::cerr);
    return 1;
  }
  if (options.help) {
    fatsplit::cli::print_usage(argv[0], std::cout);
    return 0;
  }
  if (!init_logging(options)) {
    return 1;
  }

  fatsplit::store::FileSystem file_system;
  fatsplit::cli::CLI cli(file_system);
  return cli.run(options);
}
