#include <gtest/gtest.h>
#include <sstream>
#include "transfer/chunk_copier.hpp"
#include "split/split_error.hpp"
#include "test_utils.hpp"

using namespace fatsplit::transfer;
using fatsplit::split::TransferError;

class ChunkCopierTest : public ::testing::Test {
protected:
  void SetUp() override {
    init_test_logging();
  }

  static std::stringstream make_source(const std::string& data) {
    std::stringstream ss;
    ss.write(data.data(), static_cast<std::streamsize>(data.size()));
    ss.seekg(0);
    return ss;
  }
};

TEST_F(ChunkCopierTest, DefaultChunkSize) {
  ChunkCopier copier;
  EXPECT_EQ(copier.chunk_size(), 32768u);
}

TEST_F(ChunkCopierTest, BudgetNotMultipleOfChunkCopiesExactly) {
  const std::size_t chunk = ChunkCopier::CHUNK_SIZE;
  const std::uint64_t budget = chunk * 3 + 1000;
  const std::string data = make_payload(chunk * 5);

  auto source = make_source(data);
  std::stringstream destination;
  ChunkCopier copier;
  copier.transfer(source, destination, budget);

  EXPECT_EQ(destination.str().size(), budget);
  EXPECT_EQ(destination.str(), data.substr(0, budget));
  // Source left right after the budget, not at a chunk boundary
  EXPECT_EQ(static_cast<std::uint64_t>(source.tellg()), budget);
}

TEST_F(ChunkCopierTest, TransfersFromCurrentPosition) {
  const std::string data = make_payload(500);
  auto source = make_source(data);
  source.seekg(123);

  std::stringstream destination;
  ChunkCopier copier(64);
  copier.transfer(source, destination, 200);

  EXPECT_EQ(destination.str(), data.substr(123, 200));
  EXPECT_EQ(source.tellg(), std::streampos(323));
}

TEST_F(ChunkCopierTest, ConsecutiveTransfersAppend) {
  const std::string data = make_payload(1000);
  auto source = make_source(data);

  std::stringstream first;
  std::stringstream second;
  ChunkCopier copier(100);
  copier.transfer(source, first, 450);
  copier.transfer(source, second, 550);

  EXPECT_EQ(first.str() + second.str(), data);
}

TEST_F(ChunkCopierTest, ZeroBudgetCopiesNothing) {
  auto source = make_source("abc");
  std::stringstream destination;
  ChunkCopier copier;
  copier.transfer(source, destination, 0);

  EXPECT_TRUE(destination.str().empty());
  EXPECT_EQ(source.tellg(), std::streampos(0));
}

TEST_F(ChunkCopierTest, ShortSourceThrows) {
  auto source = make_source(make_payload(100));
  std::stringstream destination;
  ChunkCopier copier(32);

  EXPECT_THROW(copier.transfer(source, destination, 101), TransferError);
}

TEST_F(ChunkCopierTest, FailedWriteThrows) {
  auto source = make_source(make_payload(100));
  std::stringstream destination;
  destination.setstate(std::ios::badbit);
  ChunkCopier copier(32);

  EXPECT_THROW(copier.transfer(source, destination, 50), TransferError);
}

TEST_F(ChunkCopierTest, ZeroChunkSizeRejected) {
  EXPECT_THROW(ChunkCopier copier(0), std::invalid_argument);
}
