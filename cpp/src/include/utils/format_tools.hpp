// Formatting helpers shared by the logger and the key codec.
#pragma once
#include <chrono>
#include <string>
#include <string_view>
#include <fmt/format.h>

namespace relayhub::format_tools
{

/// Timestamp as "YYYY-MM-DD HH:MM:SS.uuuuuu".
RELAYHUB_UTILS_EXPORT std::string formatted_time(std::chrono::system_clock::time_point timestamp);

/**
 * @brief Decimal field of exactly @p width digits, left-padded with zeros.
 * @throws std::out_of_range if @p value is negative or has more than @p width digits.
 */
RELAYHUB_UTILS_EXPORT std::string zero_padded(int value, int width);

/// Value of a field made only of ASCII digits (at most 9), or -1 for anything else.
RELAYHUB_UTILS_EXPORT int parse_digits(std::string_view field) noexcept;

/// Formats straight into a memory_buffer, the form the logger queues.
template <typename... Args>
fmt::memory_buffer make_buffer(fmt::format_string<Args...> fmt_str, Args &&...args)
{
    fmt::memory_buffer buf;
    fmt::format_to(std::back_inserter(buf), fmt_str, std::forward<Args>(args)...);
    return buf;
}

/// Part of @p file_path after the last '/' or '\\'. Usable on __FILE__ at compile time.
constexpr std::string_view filename_only(std::string_view file_path) noexcept
{
    const auto sep = file_path.find_last_of("/\\");
    return sep == std::string_view::npos ? file_path : file_path.substr(sep + 1);
}

} // namespace relayhub::format_tools
