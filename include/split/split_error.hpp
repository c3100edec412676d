#ifndef FATSPLIT_SPLIT_ERROR_HPP
#define FATSPLIT_SPLIT_ERROR_HPP

#include <stdexcept>
#include <string>

namespace fatsplit::split {

class SplitError : public std::runtime_error {
public:
    explicit SplitError(const std::string& message)
        : std::runtime_error(message) {}
};

// Raised by the chunked copy when the source runs dry or the destination rejects a write
class TransferError : public SplitError {
public:
    explicit TransferError(const std::string& message)
        : SplitError("Transfer error: " + message) {}
};

} // namespace fatsplit::split

#endif // FATSPLIT_SPLIT_ERROR_HPP
