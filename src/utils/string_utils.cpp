/**
 * @file string_utils.cpp
 * @brief Implementation of string helpers
 *
 * @date 2025
 */

#include "sandpool/utils/string_utils.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <random>
#include <sstream>

namespace sandpool {
namespace utils {

// Trim whitespace
std::string StringUtils::Trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : std::string();
}

// Convert to lowercase
std::string StringUtils::ToLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                  [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::vector<std::string> StringUtils::Split(const std::string& str, char delimiter) {
    std::vector<std::string> parts;
    std::istringstream stream(str);
    std::string part;

    while (std::getline(stream, part, delimiter)) {
        parts.push_back(part);
    }

    return parts;
}

std::string StringUtils::Join(const std::vector<std::string>& strings,
                              const std::string& delimiter) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < strings.size(); ++i) {
        if (i > 0) {
            oss << delimiter;
        }
        oss << strings[i];
    }
    return oss.str();
}

bool StringUtils::StartsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

bool StringUtils::Contains(const std::string& str, const std::string& substring) {
    return str.find(substring) != std::string::npos;
}

std::string StringUtils::Truncate(const std::string& str, std::size_t max_length,
                                  const std::string& ellipsis) {
    if (str.length() <= max_length) {
        return str;
    }
    if (max_length <= ellipsis.length()) {
        return str.substr(0, max_length);
    }
    return str.substr(0, max_length - ellipsis.length()) + ellipsis;
}

// ============================================================================
// SIZE PARSING
// ============================================================================
// docker stats prints "12.5MiB / 512MiB", "1.2kB / 0B" and so on

std::uint64_t StringUtils::ParseByteSize(const std::string& size_str) {
    std::string trimmed = Trim(size_str);
    if (trimmed.empty()) {
        return 0;
    }

    std::size_t pos = 0;
    double value = 0.0;
    try {
        value = std::stod(trimmed, &pos);
    } catch (const std::exception&) {
        return 0;
    }

    if (value < 0.0) {
        return 0;
    }

    std::string unit = ToLower(Trim(trimmed.substr(pos)));
    double multiplier = 1.0;

    if (unit.empty() || unit == "b") {
        multiplier = 1.0;
    } else if (unit == "kb") {
        multiplier = 1000.0;
    } else if (unit == "mb") {
        multiplier = 1000.0 * 1000.0;
    } else if (unit == "gb") {
        multiplier = 1000.0 * 1000.0 * 1000.0;
    } else if (unit == "tb") {
        multiplier = 1000.0 * 1000.0 * 1000.0 * 1000.0;
    } else if (unit == "kib") {
        multiplier = 1024.0;
    } else if (unit == "mib") {
        multiplier = 1024.0 * 1024.0;
    } else if (unit == "gib") {
        multiplier = 1024.0 * 1024.0 * 1024.0;
    } else if (unit == "tib") {
        multiplier = 1024.0 * 1024.0 * 1024.0 * 1024.0;
    } else {
        return 0;
    }

    return static_cast<std::uint64_t>(std::llround(value * multiplier));
}

std::string StringUtils::FormatSize(std::uint64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int unit_index = 0;
    double size = static_cast<double>(bytes);

    while (size >= 1024.0 && unit_index < 4) {
        size /= 1024.0;
        unit_index++;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << size << " " << units[unit_index];
    return oss.str();
}

std::string StringUtils::GenerateId(const std::string& prefix) {
    static std::atomic<std::uint64_t> counter{0};
    thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<int> dis(0, 0xffff);

    auto timestamp = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    std::ostringstream oss;
    oss << prefix << "-" << timestamp << "-" << counter.fetch_add(1) << "-"
        << std::hex << std::setw(4) << std::setfill('0') << dis(gen);
    return oss.str();
}

} // namespace utils
} // namespace sandpool
