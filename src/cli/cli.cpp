#include "cli/cli.hpp"
#include "split/naming.hpp"
#include "split/splitter.hpp"
#include "split/joiner.hpp"
#include <iomanip>
#include <boost/log/trivial.hpp>

namespace fatsplit {
namespace cli {

//==============================================
// ARGUMENT PARSING
//==============================================

void print_usage(const std::string& program_name, std::ostream& out) {
  out << "Usage: " << program_name << " [options] <path>\n"
      << "Splits a file into FAT32 compatible parts, or joins a split directory back.\n"
      << "Options:\n"
      << "  -q, --quick             Split in place without a copy, needs 4GiB free space\n"
      << "  -j, --join              Join the parts in <path> into one file\n"
      << "  -o, --output-dir <dir>  Alternative split directory (or joined file with --join)\n"
      << "      --log-file <file>   Log file (default fatsplit.log)\n"
      << "      --log-level <lvl>   trace, debug, info, warning, error or fatal\n"
      << "  -v, --verbose           Debug logging, mirrored to the console\n"
      << "  -h, --help              Show this message\n"
      << "Example: " << program_name << " -o /mnt/sd/game game.nsp\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  ProgramOptions options;
  bool quick = false;
  bool join = false;

  auto fail = [&options](const std::string& message) {
    options.valid = false;
    options.error = message;
    return options;
  };

  for (int i = 1; i < argc; ++i) {
    const std::string arg(argv[i]);

    if (arg == "-h" || arg == "--help") {
      options.help = true;
    } else if (arg == "-q" || arg == "--quick") {
      quick = true;
    } else if (arg == "-j" || arg == "--join") {
      join = true;
    } else if (arg == "-v" || arg == "--verbose") {
      options.verbose = true;
      options.log_level = logging::severity_level::debug;
    } else if (arg == "-o" || arg == "--output-dir" || arg == "--log-file" || arg == "--log-level") {
      if (i + 1 >= argc) {
        return fail("Missing value for " + arg);
      }
      const std::string value(argv[++i]);
      if (arg == "--log-file") {
        options.log_file = value;
      } else if (arg == "--log-level") {
        auto level = logging::parse_severity(value);
        if (!level) {
          return fail("Unknown log level: " + value);
        }
        options.log_level = *level;
      } else {
        options.output_dir = value;
      }
    } else if (!arg.empty() && arg[0] == '-') {
      return fail("Unknown argument: " + arg);
    } else if (options.path.empty()) {
      options.path = arg;
    } else {
      return fail("Unexpected argument: " + arg);
    }
  }

  if (options.help) {
    options.valid = true;
    return options;
  }
  if (quick && join) {
    return fail("--quick and --join are mutually exclusive");
  }
  if (quick && !options.output_dir.empty()) {
    return fail("--quick and --output-dir are mutually exclusive");
  }
  if (options.path.empty()) {
    return fail("A file or directory path is required");
  }

  options.mode = quick ? Mode::SPLIT_QUICK : (join ? Mode::JOIN : Mode::SPLIT_COPY);
  options.valid = true;
  return options;
}


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(store::FileSystem& file_system, std::ostream& out)
  : file_system_(file_system)
  , out_(out) {
  BOOST_LOG_TRIVIAL(debug) << "CLI initialized";
}


//==============================================
// STARTUP
//==============================================

int CLI::run(const ProgramOptions& options) {
  const auto start_time = std::chrono::steady_clock::now();
  announced_ = false;

  out_ << "\n========== FAT32 Splitter ==========\n" << std::endl;

  split::SplitStatus status = split::SplitStatus::SUCCESS;
  try {
    switch (options.mode) {
      case Mode::SPLIT_COPY:
        status = handle_split_copy(options);
        break;
      case Mode::SPLIT_QUICK:
        status = handle_split_quick(options);
        break;
      case Mode::JOIN:
        status = handle_join(options);
        break;
    }
  } catch (const std::exception& e) {
    log_and_display_error("Operation aborted", e.what());
    return 1;
  }

  const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start_time;
  LOG_INFO << "Finished with status '" << split::split_status_to_string(status)
           << "' after " << elapsed.count() << "s";
  out_ << "Elapsed time: " << std::fixed << std::setprecision(2) << elapsed.count() << "s\n" << std::endl;

  return split::is_failure(status) ? 1 : 0;
}


//==============================================
// COMMAND PROCESSING
//==============================================

split::SplitStatus CLI::handle_split_copy(const ProgramOptions& options) {
  split::Splitter splitter(file_system_);
  splitter.set_progress_callback([this](const split::PartEvent& event) {
    on_part_event(event, "Splitting file into");
  });

  out_ << "Calculating number of splits...\n" << std::endl;
  split::SplitResult result = splitter.split_copy(options.path, options.output_dir);

  switch (result.status) {
    case split::SplitStatus::INSUFFICIENT_SPACE:
      out_ << "Not enough free space to run. Will require twice the space as the file\n" << std::endl;
      break;
    case split::SplitStatus::SUCCESS:
      out_ << "\nFile successfully split into " << result.directory.string() << "!\n" << std::endl;
      break;
    default:
      report_status(result.status, options.path);
      break;
  }
  return result.status;
}

split::SplitStatus CLI::handle_split_quick(const ProgramOptions& options) {
  split::Splitter splitter(file_system_);
  splitter.set_progress_callback([this](const split::PartEvent& event) {
    on_part_event(event, "Splitting file into");
  });

  out_ << "Calculating number of splits...\n" << std::endl;
  split::SplitResult result = splitter.split_quick(options.path);

  switch (result.status) {
    case split::SplitStatus::INSUFFICIENT_SPACE:
      out_ << "Not enough temporary space. Needs 4GiB of free space\n" << std::endl;
      break;
    case split::SplitStatus::SUCCESS:
      out_ << "\nFile successfully split into " << result.directory.string() << "!\n" << std::endl;
      break;
    default:
      report_status(result.status, options.path);
      break;
  }
  return result.status;
}

split::SplitStatus CLI::handle_join(const ProgramOptions& options) {
  split::Joiner joiner(file_system_);
  joiner.set_progress_callback([this](const split::PartEvent& event) {
    on_part_event(event, "Joining");
  });

  split::JoinResult result = joiner.join(options.path, options.output_dir);

  switch (result.status) {
    case split::SplitStatus::NOTHING_TO_DO:
      out_ << result.output.string() << " already matches the parts, nothing to join.\n" << std::endl;
      break;
    case split::SplitStatus::INSUFFICIENT_SPACE:
      out_ << "Not enough free space to join. Will require " << result.total_size << " bytes\n" << std::endl;
      break;
    case split::SplitStatus::SUCCESS:
      out_ << "\nParts successfully joined into " << result.output.string() << "!\n" << std::endl;
      break;
    default:
      report_status(result.status, options.path);
      break;
  }
  return result.status;
}

void CLI::on_part_event(const split::PartEvent& event, const std::string& action) {
  if (!announced_) {
    out_ << action << " " << event.part_count << " parts...\n" << std::endl;
    announced_ = true;
  }

  if (event.phase == split::PartPhase::STARTED) {
    out_ << "Starting part " << split::part_name(event.index) << std::endl;
  } else {
    out_ << "Part " << split::part_name(event.index) << " complete" << std::endl;
  }
}

void CLI::report_status(split::SplitStatus status, const std::string& path) {
  switch (status) {
    case split::SplitStatus::NOTHING_TO_DO:
      out_ << "This file is under 4GiB and does not need to be split.\n" << std::endl;
      break;
    case split::SplitStatus::INPUT_MISSING:
      out_ << path << " cannot be found\n" << std::endl;
      break;
    case split::SplitStatus::TOO_MANY_PARTS:
      out_ << "This file needs more than " << split::MAX_PARTS << " parts and cannot be split.\n" << std::endl;
      break;
    case split::SplitStatus::MISSING_PART:
      out_ << path << " is missing a part and cannot be joined.\n" << std::endl;
      break;
    case split::SplitStatus::OUTPUT_CONFLICT:
      out_ << "The output directory would replace " << path << ". Choose another location.\n" << std::endl;
      break;
    default:
      out_ << split::split_status_to_string(status) << "\n" << std::endl;
      break;
  }
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << message << ": " << error;
  out_ << message << ": " << error << std::endl;
}

} // namespace cli
} // namespace fatsplit
