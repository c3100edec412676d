#include "split/joiner.hpp"
#include "split/naming.hpp"
#include <algorithm>
#include <fstream>
#include <string>
#include <boost/log/trivial.hpp>

namespace fatsplit::split {

Joiner::Joiner(store::FileSystem& file_system, std::size_t chunk_size)
  : file_system_(file_system)
  , copier_(chunk_size) {
  BOOST_LOG_TRIVIAL(debug) << "Joiner: Initialized with chunk size " << chunk_size;
}

JoinResult Joiner::join(const std::filesystem::path& split_dir, const std::filesystem::path& output) {
  BOOST_LOG_TRIVIAL(info) << "Joiner: Joining parts in " << split_dir.string();

  JoinResult result;
  result.output = output.empty() ? joined_file_for(split_dir) : output;

  if (!file_system_.is_directory(split_dir)) {
    BOOST_LOG_TRIVIAL(error) << "Joiner: Split directory not found: " << split_dir.string();
    result.status = SplitStatus::INPUT_MISSING;
    return result;
  }

  const std::vector<std::filesystem::path> parts = list_parts(split_dir);
  if (parts.empty()) {
    BOOST_LOG_TRIVIAL(error) << "Joiner: No parts found in " << split_dir.string();
    result.status = SplitStatus::INPUT_MISSING;
    return result;
  }
  if (!verify_contiguous(parts)) {
    result.status = SplitStatus::MISSING_PART;
    return result;
  }

  std::vector<std::uint64_t> sizes;
  sizes.reserve(parts.size());
  for (const auto& part : parts) {
    sizes.push_back(file_system_.get_file_size(part));
    result.total_size += sizes.back();
  }
  result.part_count = parts.size();

  if (file_system_.is_file(result.output) &&
      file_system_.get_file_size(result.output) == result.total_size) {
    BOOST_LOG_TRIVIAL(info) << "Joiner: " << result.output.string() << " already holds "
                            << result.total_size << " bytes, nothing to do";
    result.status = SplitStatus::NOTHING_TO_DO;
    return result;
  }

  // An existing output is truncated first, its bytes count as free
  std::uint64_t reclaimable = 0;
  if (file_system_.is_file(result.output)) {
    reclaimable = file_system_.get_file_size(result.output);
  }
  const std::uint64_t available = file_system_.free_space(result.output);
  if (available + reclaimable < result.total_size) {
    BOOST_LOG_TRIVIAL(error) << "Joiner: Not enough free space, need " << result.total_size
                             << " bytes, have " << available << " plus " << reclaimable << " reclaimable";
    result.status = SplitStatus::INSUFFICIENT_SPACE;
    return result;
  }

  BOOST_LOG_TRIVIAL(info) << "Joiner: Writing " << result.total_size << " bytes from "
                          << parts.size() << " parts to " << result.output.string();

  std::ofstream destination = file_system_.open_write(result.output);
  for (std::size_t i = 0; i < parts.size(); ++i) {
    report(i, sizes[i], parts.size(), PartPhase::STARTED);

    std::ifstream part = file_system_.open_read(parts[i]);
    copier_.transfer(part, destination, sizes[i]);

    report(i, sizes[i], parts.size(), PartPhase::COMPLETED);
  }

  destination.close();
  if (destination.fail()) {
    BOOST_LOG_TRIVIAL(error) << "Joiner: Failed to close " << result.output.string();
    throw TransferError("failed to flush " + result.output.string());
  }

  BOOST_LOG_TRIVIAL(info) << "Joiner: Join into " << result.output.string() << " complete";
  return result;
}

std::vector<std::filesystem::path> Joiner::list_parts(const std::filesystem::path& split_dir) const {
  std::vector<std::filesystem::path> parts;
  for (const auto& file : file_system_.list_files(split_dir)) {
    if (is_part_name(file.filename().string())) {
      parts.push_back(file);
    } else {
      BOOST_LOG_TRIVIAL(debug) << "Joiner: Skipping non-part entry " << file.filename().string();
    }
  }

  // Fixed-width names sort in index order
  std::sort(parts.begin(), parts.end(),
    [](const std::filesystem::path& a, const std::filesystem::path& b) {
      return a.filename().string() < b.filename().string();
    });
  return parts;
}

bool Joiner::verify_contiguous(const std::vector<std::filesystem::path>& parts) const {
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (part_index(parts[i].filename().string()) != i) {
      BOOST_LOG_TRIVIAL(error) << "Joiner: Part " << part_name(i) << " is missing";
      return false;
    }
  }
  return true;
}

void Joiner::report(std::uint64_t index, std::uint64_t size, std::uint64_t part_count, PartPhase phase) const {
  if (!progress_) {
    return;
  }
  PartEvent event;
  event.index = index;
  event.size = size;
  event.part_count = part_count;
  event.phase = phase;
  progress_(event);
}

} // namespace fatsplit::split
