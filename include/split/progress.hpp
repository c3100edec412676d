#ifndef FATSPLIT_PROGRESS_HPP
#define FATSPLIT_PROGRESS_HPP

#include <cstdint>
#include <functional>

namespace fatsplit::split {

enum class PartPhase {
  STARTED,
  COMPLETED
};

struct PartEvent {
  std::uint64_t index = 0;       // part number, as in its file name
  std::uint64_t size = 0;        // bytes in this part
  std::uint64_t part_count = 0;  // parts in the whole set
  PartPhase phase = PartPhase::STARTED;
};

// Invoked once when a part begins and once when it is fully written
using ProgressCallback = std::function<void(const PartEvent&)>;

} // namespace fatsplit::split

#endif // FATSPLIT_PROGRESS_HPP
