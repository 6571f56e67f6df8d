#ifndef UUIDLIB_TIMESTAMP_HPP
#define UUIDLIB_TIMESTAMP_HPP
#include <chrono>
#include <string>

namespace timestamp{
    // UTC instant with millisecond resolution.
    using TimePoint = std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;

    // Longer inputs are rejected before any format is tried.
    constexpr static std::size_t max_length = 64;

    // Formats are tried in this order, first match wins:
    //   1. 10 digits: unix seconds.
    //   2. 13 digits: unix milliseconds.
    //   3. 2023-06-14T10:30:45Z, 2023-06-14T10:30:45-05:00 (converted to UTC).
    //   4. 2023-06-14T10:30:45 (UTC).
    //   5. 2023-06-14 (midnight UTC).
    //   6. 2023-06-14 10:30:45 (UTC).
    //   7. any other run of digits: milliseconds if greater than 10^12, otherwise seconds.
    // Formats 3, 4 and 6 accept a fractional second, truncated to milliseconds.
    // Throws std::invalid_argument if nothing matches.
    TimePoint parse(const std::string& str);

    // Human readable list of the formats accepted by parse().
    const std::string& supported_formats();
}
#endif
