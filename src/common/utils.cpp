#include "utils.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>

namespace cattlediag {
namespace common {

// StringUtils implementation
std::string StringUtils::replace(const std::string& str,
                               const std::string& from,
                               const std::string& to) {
    if (from.empty()) {
        return str;
    }
    std::string result = str;
    size_t pos = 0;
    while ((pos = result.find(from, pos)) != std::string::npos) {
        result.replace(pos, from.length(), to);
        pos += to.length();
    }
    return result;
}

std::string StringUtils::to_lower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string StringUtils::trim(const std::string& str) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    auto start = std::find_if_not(str.begin(), str.end(), is_space);
    auto end = std::find_if_not(str.rbegin(), str.rend(), is_space).base();
    return (start < end ? std::string(start, end) : std::string());
}

bool StringUtils::starts_with(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() &&
           str.compare(0, prefix.size(), prefix) == 0;
}

bool StringUtils::ends_with(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool StringUtils::is_digits(const std::string& str) {
    return !str.empty() &&
           std::all_of(str.begin(), str.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

std::optional<double> StringUtils::parse_double(const std::string& str) {
    std::string trimmed = trim(str);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    char* end = nullptr;
    double value = std::strtod(trimmed.c_str(), &end);
    if (end == trimmed.c_str() || *end != '\0' || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

// RandomUtils implementation
std::string RandomUtils::random_hex(size_t length) {
    static const char digits[] = "0123456789abcdef";
    std::uniform_int_distribution<int> dis(0, 15);

    std::string str;
    str.reserve(length);
    for (size_t i = 0; i < length; ++i) {
        str += digits[dis(generator())];
    }
    return str;
}

} // namespace common
} // namespace cattlediag
