#include "utils/time_utils.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace aggbook {

std::string nanos_to_iso8601(uint64_t nanos) {
    uint64_t seconds = nanos / 1000000000ULL;
    uint64_t nano_remainder = nanos % 1000000000ULL;

    std::time_t time = static_cast<std::time_t>(seconds);
    std::tm tm{};
    gmtime_r(&time, &tm);

    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(9) << nano_remainder << 'Z';

    return ss.str();
}

std::string format_duration(uint64_t nanos) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1);

    if (nanos < 1000ULL) {
        ss << nanos << "ns";
    } else if (nanos < 1000000ULL) {
        ss << static_cast<double>(nanos) / 1e3 << "us";
    } else if (nanos < 1000000000ULL) {
        ss << static_cast<double>(nanos) / 1e6 << "ms";
    } else {
        ss << static_cast<double>(nanos) / 1e9 << "s";
    }

    return ss.str();
}

} // namespace aggbook
