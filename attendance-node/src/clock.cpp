#include "clock.hpp"

#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace attendance {

namespace {
std::tm to_local_tm(TimePoint tp) {
    const std::time_t t = WallClock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    return tm;
}
}  // namespace

LocalMoment split_local(TimePoint tp) {
    const std::tm tm = to_local_tm(tp);
    std::ostringstream date;
    date << std::put_time(&tm, "%Y-%m-%d");

    // to_time_t truncates, so recover the sub-second part separately.
    const auto whole = WallClock::from_time_t(WallClock::to_time_t(tp));
    auto frac = std::chrono::duration_cast<std::chrono::milliseconds>(tp - whole);
    if (frac.count() < 0) frac = std::chrono::milliseconds(0);

    LocalMoment m;
    m.date = date.str();
    m.time = std::chrono::hours(tm.tm_hour) + std::chrono::minutes(tm.tm_min) +
             std::chrono::seconds(tm.tm_sec) + frac;
    return m;
}

std::string format_timestamp(TimePoint tp) {
    const std::tm tm = to_local_tm(tp);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

std::optional<TimePoint> parse_timestamp(const std::string& text) {
    std::tm tm{};
    std::istringstream iss(text);
    iss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
    if (iss.fail()) return std::nullopt;
    tm.tm_isdst = -1;
    const std::time_t t = std::mktime(&tm);
    if (t == static_cast<std::time_t>(-1)) return std::nullopt;
    return WallClock::from_time_t(t);
}

std::string format_time_of_day(TimeOfDay tod) {
    const long long ms = tod.count();
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%02lld:%02lld:%02lld",
                  ms / 3600000, (ms / 60000) % 60, (ms / 1000) % 60);
    return buf;
}

}  // namespace attendance
