#ifndef FATSPLIT_CHUNK_COPIER_HPP
#define FATSPLIT_CHUNK_COPIER_HPP

#include <cstddef>
#include <cstdint>
#include <istream>
#include <ostream>
#include <vector>

namespace fatsplit::transfer {

class ChunkCopier {
public:
  static constexpr std::size_t CHUNK_SIZE = 0x8000;  // 32,768 bytes

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit ChunkCopier(std::size_t chunk_size = CHUNK_SIZE);


  // ---- TRANSFER ----
  // Copies exactly byte_count bytes from the current position of source to destination,
  // reading at most chunk_size bytes at a time. Both stream positions advance by byte_count.
  // Throws split::TransferError on a short read or a failed write.
  void transfer(std::istream& source, std::ostream& destination, std::uint64_t byte_count);


  // ---- GETTERS ----
  std::size_t chunk_size() const { return buffer_.size(); }

private:
  // ---- PARAMETERS ----
  std::vector<char> buffer_;
};

} // namespace fatsplit::transfer

#endif // FATSPLIT_CHUNK_COPIER_HPP
