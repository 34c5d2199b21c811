// format_tools.cpp
#include "rlh_base.hpp"

#include <stdexcept>

namespace relayhub::format_tools
{

// Seconds go through fmt's chrono formatting; the microseconds are appended by hand so
// the width does not depend on the fmt version.
std::string formatted_time(std::chrono::system_clock::time_point timestamp)
{
    using namespace std::chrono;
    const auto whole = floor<seconds>(timestamp);
    const auto micros = duration_cast<microseconds>(timestamp - whole).count();
    return fmt::format("{:%Y-%m-%d %H:%M:%S}.{:06d}", whole, micros);
}

std::string zero_padded(int value, int width)
{
    std::string out = fmt::format("{:0{}d}", value, width);
    if (value < 0 || static_cast<int>(out.size()) != width)
    {
        throw std::out_of_range(
            fmt::format("zero_padded: value {} does not fit in {} digits", value, width));
    }
    return out;
}

int parse_digits(std::string_view field) noexcept
{
    if (field.empty() || field.size() > 9)
        return -1;
    int value = 0;
    for (char c : field)
    {
        if (c < '0' || c > '9')
            return -1;
        value = value * 10 + (c - '0');
    }
    return value;
}

} // namespace relayhub::format_tools
