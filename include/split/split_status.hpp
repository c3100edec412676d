#ifndef FATSPLIT_SPLIT_STATUS_HPP
#define FATSPLIT_SPLIT_STATUS_HPP

namespace fatsplit {
namespace split {

enum class SplitStatus {
    SUCCESS = 0,
    NOTHING_TO_DO,
    INPUT_MISSING,
    INSUFFICIENT_SPACE,
    TOO_MANY_PARTS,
    MISSING_PART,
    OUTPUT_CONFLICT
};

inline const char* split_status_to_string(SplitStatus status) {
    switch (status) {
        case SplitStatus::SUCCESS: return "Success";
        case SplitStatus::NOTHING_TO_DO: return "Nothing to do";
        case SplitStatus::INPUT_MISSING: return "Input missing";
        case SplitStatus::INSUFFICIENT_SPACE: return "Insufficient free space";
        case SplitStatus::TOO_MANY_PARTS: return "Too many parts";
        case SplitStatus::MISSING_PART: return "Missing part";
        case SplitStatus::OUTPUT_CONFLICT: return "Output conflicts with input";
        default: return "Undefined status";
    }
}

// NOTHING_TO_DO is informational, not a failure
inline bool is_failure(SplitStatus status) {
    return status != SplitStatus::SUCCESS && status != SplitStatus::NOTHING_TO_DO;
}

} // namespace split
} // namespace fatsplit

#endif // FATSPLIT_SPLIT_STATUS_HPP
