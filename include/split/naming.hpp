#ifndef FATSPLIT_NAMING_HPP
#define FATSPLIT_NAMING_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace fatsplit::split {

constexpr const char* SPLIT_SUFFIX = "_split";
constexpr const char* JOINED_SUFFIX = "_joined";

// "00", "01", ... two zero-padded digits
std::string part_name(std::uint64_t index);

// True only for names made of exactly two ASCII digits
bool is_part_name(const std::string& name);

// Index encoded in a part name, nullopt for anything else
std::optional<std::uint64_t> part_index(const std::string& name);

// game.nsp -> game_split.nsp, next to the source
std::filesystem::path split_directory_for(const std::filesystem::path& source);

// Split directory for source, honouring a user supplied location. A requested
// location lacking the source's extension gets it appended.
std::filesystem::path resolve_output_directory(const std::filesystem::path& source,
                                               const std::filesystem::path& requested);

// game_split.nsp -> game.nsp; a directory without the suffix yields <stem>_joined<ext>
std::filesystem::path joined_file_for(const std::filesystem::path& split_dir);

} // namespace fatsplit::split

#endif // FATSPLIT_NAMING_HPP
