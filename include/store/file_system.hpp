#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fatsplit {
namespace store {

// Filesystem collaborator for the split and join pipelines.
// Every failure surfaces as StoreError; nothing is retried.
class FileSystem {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  FileSystem() = default;
  virtual ~FileSystem() = default;


  // ---- QUERY OPERATIONS ----
  bool exists(const std::filesystem::path& path) const;
  bool is_file(const std::filesystem::path& path) const;
  bool is_directory(const std::filesystem::path& path) const;
  // Returns the size of a regular file in bytes, throws StoreError if missing
  std::uintmax_t get_file_size(const std::filesystem::path& path) const;
  // Bytes available on the volume holding path. Resolves to the nearest
  // existing ancestor so it can be asked about a directory not yet created.
  virtual std::uintmax_t free_space(const std::filesystem::path& path) const;
  // True if path is dir itself or lies anywhere beneath it, after resolving
  // relative components and symlinks of the existing prefix
  bool is_within(const std::filesystem::path& path, const std::filesystem::path& dir) const;
  // Regular files directly inside dir, in directory order
  std::vector<std::filesystem::path> list_files(const std::filesystem::path& dir) const;


  // ---- MUTATING OPERATIONS ----
  // Removes dir with its contents if present, then creates it empty
  void recreate_directory(const std::filesystem::path& dir);
  // Renames a file, no copy fallback
  virtual void move_file(const std::filesystem::path& from, const std::filesystem::path& to);
  // Drops every byte of path beyond new_size
  virtual void truncate(const std::filesystem::path& path, std::uintmax_t new_size);


  // ---- STREAMS ----
  std::ifstream open_read(const std::filesystem::path& path) const;
  // Creates or truncates path
  std::ofstream open_write(const std::filesystem::path& path) const;

private:
  // Verifies if a file exists at the given path, throws StoreError if not found
  void verify_file_exists(const std::filesystem::path& file_path) const;
};

class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace store
} // namespace fatsplit
