#ifndef FATSPLIT_TEST_UTILS_HPP
#define FATSPLIT_TEST_UTILS_HPP

#include <boost/log/core.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <random>
#include <string>

// Console logging for tests, warnings and above to keep output readable
inline void init_test_logging() {
    // Remove any existing sinks to prevent duplicates
    boost::log::core::get()->remove_all_sinks();

    boost::log::register_simple_formatter_factory<boost::log::trivial::severity_level, char>("Severity");

    boost::log::add_console_log(
        std::cout,
        boost::log::keywords::format = "[%TimeStamp%] [%Severity%] %Message%",
        boost::log::keywords::auto_flush = true
    );

    boost::log::core::get()->set_filter(
        boost::log::trivial::severity >= boost::log::trivial::warning
    );

    boost::log::add_common_attributes();
}

// Fresh directory under the system temp dir, unique per call
inline std::filesystem::path make_test_dir(const std::string& prefix) {
    static int counter = 0;
    std::filesystem::path dir = std::filesystem::temp_directory_path() /
        (prefix + "_" + std::to_string(std::chrono::system_clock::now().time_since_epoch().count()) +
         "_" + std::to_string(counter++));
    std::filesystem::create_directories(dir);
    return dir;
}

// Switches the working directory for the lifetime of the guard
class CurrentPathGuard {
public:
    explicit CurrentPathGuard(const std::filesystem::path& dir)
        : previous_(std::filesystem::current_path()) {
        std::filesystem::current_path(dir);
    }
    ~CurrentPathGuard() {
        std::error_code ec;
        std::filesystem::current_path(previous_, ec);
    }
    CurrentPathGuard(const CurrentPathGuard&) = delete;
    CurrentPathGuard& operator=(const CurrentPathGuard&) = delete;

private:
    std::filesystem::path previous_;
};

// Pseudo-random bytes so misplaced ranges show up as content mismatches
inline std::string make_payload(std::size_t size, unsigned seed = 42) {
    std::mt19937 gen(seed);
    std::uniform_int_distribution<int> dis(0, 255);
    std::string data(size, '\0');
    for (auto& c : data) {
        c = static_cast<char>(dis(gen));
    }
    return data;
}

inline void write_file(const std::filesystem::path& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
}

inline std::string read_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

#endif // FATSPLIT_TEST_UTILS_HPP
