#include "split/splitter.hpp"
#include "split/naming.hpp"
#include <fstream>
#include <string>
#include <boost/log/trivial.hpp>

namespace fatsplit::split {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Splitter::Splitter(store::FileSystem& file_system, SplitGeometry geometry)
  : file_system_(file_system)
  , geometry_(geometry)
  , copier_(geometry.chunk_size) {
  if (geometry_.split_size == 0) {
    BOOST_LOG_TRIVIAL(error) << "Splitter: Split size must be positive";
    throw std::invalid_argument("Splitter: Invalid split size");
  }
  BOOST_LOG_TRIVIAL(debug) << "Splitter: Initialized with split size " << geometry_.split_size
                           << " and chunk size " << geometry_.chunk_size;
}


//==============================================
// SPLIT OPERATIONS
//==============================================

SplitResult Splitter::split_copy(const std::filesystem::path& source,
                                 const std::filesystem::path& output_dir) {
  BOOST_LOG_TRIVIAL(info) << "Splitter: Copy split of " << source.string();

  SplitResult result;
  const std::filesystem::path dir = resolve_output_directory(source, output_dir);

  result.status = preflight(source, dir, false, result.layout);
  if (result.status != SplitStatus::SUCCESS) {
    return result;
  }
  const PartLayout& layout = result.layout;

  // Recreating the directory would delete the source along with it
  if (file_system_.is_within(source, dir)) {
    BOOST_LOG_TRIVIAL(error) << "Splitter: Output directory " << dir.string() << " contains the source "
                             << source.string();
    result.status = SplitStatus::OUTPUT_CONFLICT;
    return result;
  }

  BOOST_LOG_TRIVIAL(info) << "Splitter: Writing " << layout.part_count() << " parts to " << dir.string();
  file_system_.recreate_directory(dir);
  result.directory = dir;

  // Source is read once, sequentially, no seeking
  std::ifstream input = file_system_.open_read(source);
  for (std::uint64_t index = 0; index < layout.part_count(); ++index) {
    report(index, layout, PartPhase::STARTED);

    const std::filesystem::path part_path = dir / part_name(index);
    {
      std::ofstream output = file_system_.open_write(part_path);
      copier_.transfer(input, output, layout.part_size(index));
      output.close();
      if (output.fail()) {
        BOOST_LOG_TRIVIAL(error) << "Splitter: Failed to close part " << part_path.string();
        throw TransferError("failed to flush " + part_path.string());
      }
    }

    BOOST_LOG_TRIVIAL(debug) << "Splitter: Part " << part_name(index) << " written ("
                             << layout.part_size(index) << " bytes)";
    report(index, layout, PartPhase::COMPLETED);
  }

  BOOST_LOG_TRIVIAL(info) << "Splitter: Copy split of " << source.string() << " complete";
  return result;
}

SplitResult Splitter::split_quick(const std::filesystem::path& source) {
  BOOST_LOG_TRIVIAL(info) << "Splitter: Quick split of " << source.string();

  SplitResult result;
  const std::filesystem::path dir = split_directory_for(source);

  // A bare file name has no parent, probe the split directory like copy mode
  result.status = preflight(source, dir, true, result.layout);
  if (result.status != SplitStatus::SUCCESS) {
    return result;
  }
  const PartLayout& layout = result.layout;

  BOOST_LOG_TRIVIAL(info) << "Splitter: Carving " << layout.part_count() << " parts in " << dir.string();
  file_system_.recreate_directory(dir);
  result.directory = dir;

  // The original becomes part 00 and shrinks until only part 00 is left
  const std::filesystem::path first_part = dir / part_name(0);
  file_system_.move_file(source, first_part);

  std::uint64_t remaining = layout.file_size;
  for (std::uint64_t index = layout.last_index(); index > 0; --index) {
    const std::uint64_t budget = layout.part_size(index);
    report(index, layout, PartPhase::STARTED);

    // A crash between these two leaves the tail duplicated, never lost
    extract_tail(first_part, remaining, budget, dir / part_name(index));
    drop_tail(first_part, remaining, budget);
    remaining -= budget;

    report(index, layout, PartPhase::COMPLETED);
  }

  // Part 00 is already in place
  report(0, layout, PartPhase::STARTED);
  report(0, layout, PartPhase::COMPLETED);

  BOOST_LOG_TRIVIAL(info) << "Splitter: Quick split complete, part 00 holds " << remaining << " bytes";
  return result;
}


//==============================================
// PREFLIGHT
//==============================================

SplitStatus Splitter::preflight(const std::filesystem::path& source,
                                const std::filesystem::path& space_probe,
                                bool quick,
                                PartLayout& layout) const {
  if (!file_system_.is_file(source)) {
    BOOST_LOG_TRIVIAL(error) << "Splitter: Source file not found: " << source.string();
    return SplitStatus::INPUT_MISSING;
  }

  const std::uint64_t file_size = file_system_.get_file_size(source);
  const std::uint64_t required = quick ? geometry_.split_size : file_size * 2;
  const std::uint64_t available = file_system_.free_space(space_probe);
  if (available < required) {
    BOOST_LOG_TRIVIAL(error) << "Splitter: Not enough free space, need " << required
                             << " bytes, have " << available;
    return SplitStatus::INSUFFICIENT_SPACE;
  }

  layout = PartLayout::compute(file_size, geometry_.split_size);
  if (!layout.needs_split()) {
    BOOST_LOG_TRIVIAL(info) << "Splitter: " << source.string() << " is " << file_size
                            << " bytes, under one part, no split needed";
    return SplitStatus::NOTHING_TO_DO;
  }

  if (layout.part_count() > MAX_PARTS) {
    BOOST_LOG_TRIVIAL(error) << "Splitter: " << layout.part_count() << " parts exceed the limit of "
                             << MAX_PARTS;
    return SplitStatus::TOO_MANY_PARTS;
  }

  return SplitStatus::SUCCESS;
}


//==============================================
// QUICK MODE STEPS
//==============================================

void Splitter::extract_tail(const std::filesystem::path& source, std::uint64_t source_size,
                            std::uint64_t budget, const std::filesystem::path& part_path) {
  BOOST_LOG_TRIVIAL(debug) << "Splitter: Extracting last " << budget << " of " << source_size
                           << " bytes into " << part_path.string();

  std::ifstream input = file_system_.open_read(source);
  input.seekg(static_cast<std::streamoff>(source_size - budget), std::ios::beg);
  if (!input) {
    BOOST_LOG_TRIVIAL(error) << "Splitter: Failed to seek in " << source.string();
    throw TransferError("failed to seek in " + source.string());
  }

  std::ofstream output = file_system_.open_write(part_path);
  copier_.transfer(input, output, budget);
  output.close();
  if (output.fail()) {
    BOOST_LOG_TRIVIAL(error) << "Splitter: Failed to close part " << part_path.string();
    throw TransferError("failed to flush " + part_path.string());
  }
}

void Splitter::drop_tail(const std::filesystem::path& source, std::uint64_t source_size,
                         std::uint64_t budget) {
  file_system_.truncate(source, source_size - budget);
}


//==============================================
// PROGRESS
//==============================================

void Splitter::report(std::uint64_t index, const PartLayout& layout, PartPhase phase) const {
  if (!progress_) {
    return;
  }
  PartEvent event;
  event.index = index;
  event.size = layout.part_size(index);
  event.part_count = layout.part_count();
  event.phase = phase;
  progress_(event);
}

} // namespace fatsplit::split
