#include "transfer/chunk_copier.hpp"
#include "split/split_error.hpp"
#include <algorithm>
#include <string>
#include <boost/log/trivial.hpp>

namespace fatsplit::transfer {

ChunkCopier::ChunkCopier(std::size_t chunk_size) {
  if (chunk_size == 0) {
    BOOST_LOG_TRIVIAL(error) << "ChunkCopier: Chunk size must be positive";
    throw std::invalid_argument("ChunkCopier: Invalid chunk size");
  }
  buffer_.resize(chunk_size);
}

void ChunkCopier::transfer(std::istream& source, std::ostream& destination, std::uint64_t byte_count) {
  BOOST_LOG_TRIVIAL(debug) << "ChunkCopier: Transferring " << byte_count << " bytes in chunks of "
                           << buffer_.size();

  std::uint64_t remaining = byte_count;
  while (remaining > 0) {
    // Never read past the budget, the final chunk may be short
    const auto wanted = static_cast<std::streamsize>(
      std::min<std::uint64_t>(remaining, buffer_.size()));

    source.read(buffer_.data(), wanted);
    const std::streamsize got = source.gcount();
    if (got != wanted) {
      BOOST_LOG_TRIVIAL(error) << "ChunkCopier: Source ended " << (remaining - got)
                               << " bytes short of the requested " << byte_count;
      throw split::TransferError("source ended after " +
        std::to_string(byte_count - remaining + got) + " of " + std::to_string(byte_count) + " bytes");
    }

    if (!destination.write(buffer_.data(), got)) {
      BOOST_LOG_TRIVIAL(error) << "ChunkCopier: Failed to write chunk to destination";
      throw split::TransferError("failed to write to destination");
    }

    remaining -= static_cast<std::uint64_t>(got);
  }

  BOOST_LOG_TRIVIAL(debug) << "ChunkCopier: Transferred " << byte_count << " bytes";
}

} // namespace fatsplit::transfer
