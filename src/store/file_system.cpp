#include "store/file_system.hpp"
#include <boost/log/trivial.hpp>

namespace fatsplit {
namespace store {

//==============================================
// QUERY OPERATIONS
//==============================================

bool FileSystem::exists(const std::filesystem::path& path) const {
  std::error_code ec;
  bool found = std::filesystem::exists(path, ec);
  BOOST_LOG_TRIVIAL(debug) << "FileSystem: " << path.string() << (found ? " exists" : " not found");
  return found;
}

bool FileSystem::is_file(const std::filesystem::path& path) const {
  std::error_code ec;
  return std::filesystem::is_regular_file(path, ec);
}

bool FileSystem::is_directory(const std::filesystem::path& path) const {
  std::error_code ec;
  return std::filesystem::is_directory(path, ec);
}

std::uintmax_t FileSystem::get_file_size(const std::filesystem::path& path) const {
  verify_file_exists(path);

  try {
    std::uintmax_t size = std::filesystem::file_size(path);
    BOOST_LOG_TRIVIAL(debug) << "FileSystem: File size for " << path.string() << ": " << size << " bytes";
    return size;
  } catch (const std::filesystem::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "FileSystem: Failed to query size: " << e.what();
    throw StoreError("FileSystem: Failed to query size of " + path.string() + ": " + e.what());
  }
}

std::uintmax_t FileSystem::free_space(const std::filesystem::path& path) const {
  // Walk up until something exists, a directory about to be created lives on its parent's volume
  std::filesystem::path probe;
  try {
    probe = std::filesystem::absolute(path.empty() ? std::filesystem::path(".") : path);
  } catch (const std::filesystem::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "FileSystem: Failed to resolve path: " << e.what();
    throw StoreError("FileSystem: Failed to resolve " + path.string() + ": " + e.what());
  }
  while (!std::filesystem::exists(probe) && probe.has_parent_path() && probe != probe.parent_path()) {
    probe = probe.parent_path();
  }

  try {
    std::filesystem::space_info info = std::filesystem::space(probe);
    BOOST_LOG_TRIVIAL(debug) << "FileSystem: Free space at " << probe.string() << ": "
                             << info.available << " bytes";
    return info.available;
  } catch (const std::filesystem::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "FileSystem: Failed to query free space: " << e.what();
    throw StoreError("FileSystem: Failed to query free space at " + probe.string() + ": " + e.what());
  }
}

bool FileSystem::is_within(const std::filesystem::path& path, const std::filesystem::path& dir) const {
  std::filesystem::path inner;
  std::filesystem::path outer;
  try {
    inner = std::filesystem::weakly_canonical(std::filesystem::absolute(path));
    outer = std::filesystem::weakly_canonical(std::filesystem::absolute(dir));
  } catch (const std::filesystem::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "FileSystem: Failed to resolve path: " << e.what();
    throw StoreError("FileSystem: Failed to resolve " + dir.string() + ": " + e.what());
  }

  // Component-wise prefix, so /a/bc is not inside /a/b
  auto inner_it = inner.begin();
  for (const auto& component : outer) {
    if (component.empty()) {
      continue;
    }
    if (inner_it == inner.end() || *inner_it != component) {
      return false;
    }
    ++inner_it;
  }
  BOOST_LOG_TRIVIAL(debug) << "FileSystem: " << inner.string() << " lies within " << outer.string();
  return true;
}

std::vector<std::filesystem::path> FileSystem::list_files(const std::filesystem::path& dir) const {
  BOOST_LOG_TRIVIAL(debug) << "FileSystem: Listing " << dir.string();

  std::vector<std::filesystem::path> files;
  try {
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
      if (entry.is_regular_file()) {
        files.push_back(entry.path());
      }
    }
  } catch (const std::filesystem::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "FileSystem: Failed to list directory: " << e.what();
    throw StoreError("FileSystem: Failed to list " + dir.string() + ": " + e.what());
  }
  return files;
}


//==============================================
// MUTATING OPERATIONS
//==============================================

void FileSystem::recreate_directory(const std::filesystem::path& dir) {
  BOOST_LOG_TRIVIAL(info) << "FileSystem: Recreating directory: " << dir.string();

  try {
    if (std::filesystem::exists(dir)) {
      BOOST_LOG_TRIVIAL(warning) << "FileSystem: Removing existing " << dir.string();
      std::filesystem::remove_all(dir);
    }
    std::filesystem::create_directories(dir);
  } catch (const std::filesystem::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "FileSystem: Failed to recreate directory: " << e.what();
    throw StoreError("FileSystem: Failed to recreate " + dir.string() + ": " + e.what());
  }
}

void FileSystem::move_file(const std::filesystem::path& from, const std::filesystem::path& to) {
  BOOST_LOG_TRIVIAL(info) << "FileSystem: Moving " << from.string() << " to " << to.string();
  verify_file_exists(from);

  try {
    std::filesystem::rename(from, to);
  } catch (const std::filesystem::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "FileSystem: Failed to move file: " << e.what();
    throw StoreError("FileSystem: Failed to move " + from.string() + ": " + e.what());
  }
}

void FileSystem::truncate(const std::filesystem::path& path, std::uintmax_t new_size) {
  BOOST_LOG_TRIVIAL(debug) << "FileSystem: Truncating " << path.string() << " to " << new_size << " bytes";
  verify_file_exists(path);

  try {
    std::filesystem::resize_file(path, new_size);
  } catch (const std::filesystem::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "FileSystem: Failed to truncate file: " << e.what();
    throw StoreError("FileSystem: Failed to truncate " + path.string() + ": " + e.what());
  }
}


//==============================================
// STREAMS
//==============================================

std::ifstream FileSystem::open_read(const std::filesystem::path& path) const {
  verify_file_exists(path);

  std::ifstream file(path, std::ios::binary);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "FileSystem: Failed to open file: " << path.string();
    throw StoreError("FileSystem: Failed to open file: " + path.string());
  }
  return file;
}

std::ofstream FileSystem::open_write(const std::filesystem::path& path) const {
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "FileSystem: Failed to create file: " << path.string();
    throw StoreError("FileSystem: Failed to create file: " + path.string());
  }
  return file;
}


//==============================================
// UTILITY METHODS
//==============================================

void FileSystem::verify_file_exists(const std::filesystem::path& file_path) const {
  if (!std::filesystem::is_regular_file(file_path)) {
    BOOST_LOG_TRIVIAL(error) << "FileSystem: File not found: " << file_path.string();
    throw StoreError("FileSystem: File not found: " + file_path.string());
  }
}

} // namespace store
} // namespace fatsplit
