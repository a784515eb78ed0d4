/**
 * @file string_utils.hpp
 * @brief String helpers shared by the control plane and the CLI
 *
 * @date 2025
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace sandpool {
namespace utils {

/**
 * @class StringUtils
 * @brief Static string manipulation helpers
 *
 * All methods are static - no instantiation required.
 */
class StringUtils {
public:
    /**
     * @brief Remove leading and trailing whitespace
     */
    static std::string Trim(const std::string& str);

    static std::string ToLower(const std::string& str);

    /**
     * @brief Split on a single delimiter, keeping empty fields
     */
    static std::vector<std::string> Split(const std::string& str, char delimiter);

    static std::string Join(const std::vector<std::string>& strings, const std::string& delimiter);

    static bool StartsWith(const std::string& str, const std::string& prefix);
    static bool Contains(const std::string& str, const std::string& substring);

    /**
     * @brief Truncate with a trailing ellipsis
     * @param str Input string
     * @param max_length Maximum length including the ellipsis
     */
    static std::string Truncate(const std::string& str, std::size_t max_length,
                                const std::string& ellipsis = "...");

    /**
     * @brief Parse a size as printed by the sandbox engine
     *
     * Accepts "512B", "1.5kB", "12.3MiB", "2GB", "4GiB" and bare numbers.
     * Decimal units (kB, MB, GB) use powers of 1000, binary units (KiB, MiB,
     * GiB) powers of 1024. Unparseable input yields 0.
     *
     * @param size_str Size string
     * @return Size in bytes
     */
    static std::uint64_t ParseByteSize(const std::string& size_str);

    /**
     * @brief Human-readable size (B, KB, MB, GB, TB)
     */
    static std::string FormatSize(std::uint64_t bytes);

    /**
     * @brief Generate a process-unique identifier
     *
     * Format: <prefix>-<epoch seconds>-<counter>-<4 hex digits>. The
     * counter makes ids unique within the process even when generated in
     * the same second.
     */
    static std::string GenerateId(const std::string& prefix);
};

} // namespace utils
} // namespace sandpool
