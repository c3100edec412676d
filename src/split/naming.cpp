#include "split/naming.hpp"
#include <iomanip>
#include <sstream>

namespace fatsplit::split {

namespace {

bool is_ascii_digit(char c) {
  return c >= '0' && c <= '9';
}

// Directory paths given as "dir/" carry an empty filename
std::filesystem::path without_trailing_separator(const std::filesystem::path& path) {
  if (path.has_filename()) {
    return path;
  }
  return path.parent_path();
}

} // namespace

std::string part_name(std::uint64_t index) {
  std::ostringstream ss;
  ss << std::setw(2) << std::setfill('0') << index;
  return ss.str();
}

bool is_part_name(const std::string& name) {
  return name.size() == 2 && is_ascii_digit(name[0]) && is_ascii_digit(name[1]);
}

std::optional<std::uint64_t> part_index(const std::string& name) {
  if (!is_part_name(name)) {
    return std::nullopt;
  }
  return static_cast<std::uint64_t>((name[0] - '0') * 10 + (name[1] - '0'));
}

std::filesystem::path split_directory_for(const std::filesystem::path& source) {
  std::filesystem::path file = without_trailing_separator(source);
  std::string name = file.stem().string() + SPLIT_SUFFIX + file.extension().string();
  return file.parent_path() / name;
}

std::filesystem::path resolve_output_directory(const std::filesystem::path& source,
                                               const std::filesystem::path& requested) {
  if (requested.empty()) {
    return split_directory_for(source);
  }

  std::filesystem::path dir = without_trailing_separator(requested);
  const std::string extension = source.extension().string();
  if (!extension.empty() && dir.extension() != extension) {
    dir += extension;
  }
  return dir;
}

std::filesystem::path joined_file_for(const std::filesystem::path& split_dir) {
  std::filesystem::path dir = without_trailing_separator(split_dir);
  std::string stem = dir.stem().string();
  const std::string suffix = SPLIT_SUFFIX;

  if (stem.size() > suffix.size() &&
      stem.compare(stem.size() - suffix.size(), suffix.size(), suffix) == 0) {
    stem.erase(stem.size() - suffix.size());
  } else {
    stem += JOINED_SUFFIX;
  }
  return dir.parent_path() / (stem + dir.extension().string());
}

} // namespace fatsplit::split
