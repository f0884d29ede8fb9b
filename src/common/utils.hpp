#pragma once

#include <string>
#include <chrono>
#include <random>
#include <optional>

namespace cattlediag {
namespace common {

// StringUtils class
class StringUtils {
public:
    // Replace every occurrence of `from` with `to`
    static std::string replace(const std::string& str,
                             const std::string& from,
                             const std::string& to);

    // Convert string to lower case
    static std::string to_lower(const std::string& str);
    static std::string trim(const std::string& str);

    static bool starts_with(const std::string& str, const std::string& prefix);
    static bool ends_with(const std::string& str, const std::string& suffix);

    // True for a non-empty run of ASCII digits
    static bool is_digits(const std::string& str);

    // Lenient float parse: trims, returns nullopt on empty, garbage or a non-finite value
    static std::optional<double> parse_double(const std::string& str);
};

// TimeUtils class
class TimeUtils {
public:
    // Timer class
    class Timer {
    public:
        Timer() : start_(std::chrono::steady_clock::now()) {}

        void reset() {
            start_ = std::chrono::steady_clock::now();
        }

        double elapsed_ms() const {
            auto now = std::chrono::steady_clock::now();
            return std::chrono::duration<double, std::milli>(now - start_).count();
        }

        std::chrono::microseconds elapsed_us() const {
            return std::chrono::duration_cast<std::chrono::microseconds>(
                std::chrono::steady_clock::now() - start_);
        }

    private:
        std::chrono::steady_clock::time_point start_;
    };
};

// RandomUtils class
class RandomUtils {
public:
    // Get random number generator
    static std::mt19937_64& generator() {
        static thread_local std::mt19937_64 gen(std::random_device{}());
        return gen;
    }

    // Generate a lowercase hex string of the given length
    static std::string random_hex(size_t length = 32);
};

} // namespace common
} // namespace cattlediag
