#ifndef FATSPLIT_PART_LAYOUT_HPP
#define FATSPLIT_PART_LAYOUT_HPP

#include <cstddef>
#include <cstdint>
#include "transfer/chunk_copier.hpp"

namespace fatsplit::split {

constexpr std::uint64_t SPLIT_SIZE = 0xFFFF0000;  // 4,294,901,760 bytes
constexpr std::size_t MAX_PARTS = 100;            // "00" through "99"

// Part and chunk sizes used by a split. The CLI always uses the defaults.
struct SplitGeometry {
  std::uint64_t split_size = SPLIT_SIZE;
  std::size_t chunk_size = transfer::ChunkCopier::CHUNK_SIZE;
};

// Part boundaries of a file of file_size bytes cut every split_size bytes
struct PartLayout {
  std::uint64_t file_size = 0;
  std::uint64_t split_size = 0;
  std::uint64_t split_num = 0;   // number of full parts
  std::uint64_t remainder = 0;   // size of the trailing short part, 0 if there is none

  static PartLayout compute(std::uint64_t file_size, std::uint64_t split_size);

  // Under one split_size, nothing to split
  bool needs_split() const { return split_num > 0; }
  bool has_remainder_part() const { return remainder > 0; }
  std::uint64_t part_count() const { return split_num + (has_remainder_part() ? 1 : 0); }
  std::uint64_t last_index() const { return part_count() - 1; }
  // Byte budget of the part at index
  std::uint64_t part_size(std::uint64_t index) const;
  // Byte offset of the part at index within the original file
  std::uint64_t part_offset(std::uint64_t index) const { return index * split_size; }
};

} // namespace fatsplit::split

#endif // FATSPLIT_PART_LAYOUT_HPP
