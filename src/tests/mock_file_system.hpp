#ifndef FATSPLIT_MOCK_FILE_SYSTEM_HPP
#define FATSPLIT_MOCK_FILE_SYSTEM_HPP

#include <gmock/gmock.h>
#include "store/file_system.hpp"

// Real filesystem with the free-space query and the mutating steps open to mocking.
// Unconfigured calls fall through to the real implementation.
class MockFileSystem : public fatsplit::store::FileSystem {
public:
  MockFileSystem() {
    using ::testing::_;
    using ::testing::Invoke;
    ON_CALL(*this, free_space(_)).WillByDefault(Invoke([this](const std::filesystem::path& path) {
      return FileSystem::free_space(path);
    }));
    ON_CALL(*this, move_file(_, _)).WillByDefault(Invoke(
      [this](const std::filesystem::path& from, const std::filesystem::path& to) {
        FileSystem::move_file(from, to);
      }));
    ON_CALL(*this, truncate(_, _)).WillByDefault(Invoke(
      [this](const std::filesystem::path& path, std::uintmax_t new_size) {
        FileSystem::truncate(path, new_size);
      }));
  }

  MOCK_METHOD(std::uintmax_t, free_space, (const std::filesystem::path& path), (const, override));
  MOCK_METHOD(void, move_file, (const std::filesystem::path& from, const std::filesystem::path& to), (override));
  MOCK_METHOD(void, truncate, (const std::filesystem::path& path, std::uintmax_t new_size), (override));
};

using NiceMockFileSystem = ::testing::NiceMock<MockFileSystem>;

#endif // FATSPLIT_MOCK_FILE_SYSTEM_HPP
