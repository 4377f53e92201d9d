#include "pathguard/clock.hpp"

#include <ctime>
#include <utility>
#include <vector>

namespace pathguard {

TimestampClock fixed_clock(std::string token) {
    return [token = std::move(token)]() { return token; };
}

TimestampClock utc_clock(std::string format) {
    return [format = std::move(format)]() {
        return format_utc(std::chrono::system_clock::now(), format);
    };
}

std::string format_utc(std::chrono::system_clock::time_point when, const std::string& format) {
    auto time_t_when = std::chrono::system_clock::to_time_t(when);

    std::tm tm_buf;
#ifdef _WIN32
    gmtime_s(&tm_buf, &time_t_when);
#else
    gmtime_r(&time_t_when, &tm_buf);
#endif

    // strftime reports 0 both for overflow and for an empty expansion, so
    // grow the buffer up to a bound before accepting an empty result
    if (format.empty()) {
        return {};
    }
    std::vector<char> buf(128);
    while (buf.size() <= 4096 + format.size() * 64) {
        size_t written = std::strftime(buf.data(), buf.size(), format.c_str(), &tm_buf);
        if (written > 0) {
            return std::string(buf.data(), written);
        }
        buf.resize(buf.size() * 2);
    }
    return {};
}

} // namespace pathguard
