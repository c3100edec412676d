#ifndef FATSPLIT_JOINER_HPP
#define FATSPLIT_JOINER_HPP

#include <cstdint>
#include <filesystem>
#include <utility>
#include <vector>
#include "store/file_system.hpp"
#include "transfer/chunk_copier.hpp"
#include "split/progress.hpp"
#include "split/split_error.hpp"
#include "split/split_status.hpp"

namespace fatsplit::split {

struct JoinResult {
  SplitStatus status = SplitStatus::SUCCESS;
  std::filesystem::path output;
  std::uint64_t total_size = 0;
  std::uint64_t part_count = 0;
};

class Joiner {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit Joiner(store::FileSystem& file_system,
                  std::size_t chunk_size = transfer::ChunkCopier::CHUNK_SIZE);


  // ---- JOIN OPERATIONS ----
  // Concatenates the parts of split_dir in index order into output (derived from
  // the directory name when empty). Parts are left in place. An existing output
  // whose size already equals the parts' total is left untouched.
  JoinResult join(const std::filesystem::path& split_dir,
                  const std::filesystem::path& output = {});

  // Part files of split_dir sorted by name, unrelated entries skipped
  std::vector<std::filesystem::path> list_parts(const std::filesystem::path& split_dir) const;


  // ---- GETTERS/SETTERS ----
  void set_progress_callback(ProgressCallback callback) { progress_ = std::move(callback); }

private:
  // ---- PARAMETERS ----
  store::FileSystem& file_system_;
  transfer::ChunkCopier copier_;
  ProgressCallback progress_;

  // Parts must run 00, 01, ... without a gap
  bool verify_contiguous(const std::vector<std::filesystem::path>& parts) const;
  void report(std::uint64_t index, std::uint64_t size, std::uint64_t part_count, PartPhase phase) const;
};

} // namespace fatsplit::split

#endif // FATSPLIT_JOINER_HPP
