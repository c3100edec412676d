#include "split/part_layout.hpp"
#include <stdexcept>
#include <string>

namespace fatsplit::split {

PartLayout PartLayout::compute(std::uint64_t file_size, std::uint64_t split_size) {
  if (split_size == 0) {
    throw std::invalid_argument("PartLayout: split size must be positive");
  }

  PartLayout layout;
  layout.file_size = file_size;
  layout.split_size = split_size;
  layout.split_num = file_size / split_size;
  layout.remainder = file_size - split_size * layout.split_num;
  return layout;
}

std::uint64_t PartLayout::part_size(std::uint64_t index) const {
  if (index >= part_count()) {
    throw std::out_of_range("PartLayout: part index " + std::to_string(index) + " out of range");
  }
  if (has_remainder_part() && index == split_num) {
    return remainder;
  }
  return split_size;
}

} // namespace fatsplit::split
