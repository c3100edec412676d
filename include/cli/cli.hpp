#pragma once

#include <chrono>
#include <iostream>
#include <string>
#include "logger/logger.hpp"
#include "store/file_system.hpp"
#include "split/progress.hpp"
#include "split/split_status.hpp"

namespace fatsplit {
namespace cli {

enum class Mode {
  SPLIT_COPY,
  SPLIT_QUICK,
  JOIN
};

struct ProgramOptions {
  std::string path;
  std::string output_dir;
  Mode mode{Mode::SPLIT_COPY};
  std::string log_file{"fatsplit.log"};
  logging::severity_level log_level{logging::severity_level::info};
  bool verbose{false};
  bool help{false};
  bool valid{false};
  std::string error;
};

void print_usage(const std::string& program_name, std::ostream& out);

// Hand-rolled flag parsing; on failure valid is false and error says why
ProgramOptions parse_command_line(int argc, char* argv[]);

class CLI {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit CLI(store::FileSystem& file_system, std::ostream& out = std::cout);


  // ---- STARTUP ----
  // Runs the selected operation and returns the process exit code
  int run(const ProgramOptions& options);

private:
  // ---- PARAMETERS ----
  store::FileSystem& file_system_;
  std::ostream& out_;
  bool announced_{false};


  // ---- COMMAND PROCESSING ----
  split::SplitStatus handle_split_copy(const ProgramOptions& options);
  split::SplitStatus handle_split_quick(const ProgramOptions& options);
  split::SplitStatus handle_join(const ProgramOptions& options);
  void on_part_event(const split::PartEvent& event, const std::string& action);
  void report_status(split::SplitStatus status, const std::string& path);
  void log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace fatsplit
