#ifndef FATSPLIT_SPLITTER_HPP
#define FATSPLIT_SPLITTER_HPP

#include <cstdint>
#include <filesystem>
#include <utility>
#include "store/file_system.hpp"
#include "transfer/chunk_copier.hpp"
#include "split/part_layout.hpp"
#include "split/progress.hpp"
#include "split/split_error.hpp"
#include "split/split_status.hpp"

namespace fatsplit::split {

struct SplitResult {
  SplitStatus status = SplitStatus::SUCCESS;
  std::filesystem::path directory;  // empty unless parts were written
  PartLayout layout;
};

class Splitter {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit Splitter(store::FileSystem& file_system, SplitGeometry geometry = {});


  // ---- SPLIT OPERATIONS ----
  // Reads source once front to back and writes every part into a fresh directory.
  // Source is never modified. Needs twice the source size free at the destination.
  SplitResult split_copy(const std::filesystem::path& source,
                         const std::filesystem::path& output_dir = {});

  // Moves source into the split directory as part 00, then peels parts off its
  // tail from the highest index down, truncating after each copy. Needs one
  // split size of free space. Source is consumed.
  SplitResult split_quick(const std::filesystem::path& source);


  // ---- GETTERS/SETTERS ----
  void set_progress_callback(ProgressCallback callback) { progress_ = std::move(callback); }
  const SplitGeometry& geometry() const { return geometry_; }

private:
  // ---- PARAMETERS ----
  store::FileSystem& file_system_;
  SplitGeometry geometry_;
  transfer::ChunkCopier copier_;
  ProgressCallback progress_;


  // ---- PREFLIGHT ----
  // Checks that can run before anything is touched. Returns SUCCESS when the split may proceed.
  // Copy mode reserves twice the source size, quick mode one split size.
  SplitStatus preflight(const std::filesystem::path& source,
                        const std::filesystem::path& space_probe,
                        bool quick,
                        PartLayout& layout) const;


  // ---- QUICK MODE STEPS ----
  // Phase one: copy the last budget bytes of source into part_path
  void extract_tail(const std::filesystem::path& source, std::uint64_t source_size,
                    std::uint64_t budget, const std::filesystem::path& part_path);
  // Phase two: drop the copied tail. Runs only after phase one succeeded.
  void drop_tail(const std::filesystem::path& source, std::uint64_t source_size, std::uint64_t budget);


  // ---- PROGRESS ----
  void report(std::uint64_t index, const PartLayout& layout, PartPhase phase) const;
};

} // namespace fatsplit::split

#endif // FATSPLIT_SPLITTER_HPP
