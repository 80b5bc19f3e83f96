#include "schedule_resolver.hpp"

#include <cctype>
#include <cstdlib>

#include <spdlog/spdlog.h>

namespace attendance {

namespace {

constexpr long long kMsPerDay = 24LL * 3600 * 1000;

bool read_field(const std::string& s, std::size_t& pos, int digits, int& out) {
    if (pos + digits > s.size()) return false;
    int v = 0;
    for (int i = 0; i < digits; ++i) {
        const char c = s[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        v = v * 10 + (c - '0');
    }
    pos += digits;
    out = v;
    return true;
}

std::optional<TimeOfDay> parse_clock_text(const std::string& s) {
    std::size_t pos = 0;
    int h = 0, m = 0, sec = 0, ms = 0;
    // single digit hours are legal in MySQL TIME text
    if (s.size() >= 2 && s[1] == ':') {
        if (!read_field(s, pos, 1, h)) return std::nullopt;
    } else if (!read_field(s, pos, 2, h)) {
        return std::nullopt;
    }
    if (pos >= s.size() || s[pos++] != ':') return std::nullopt;
    if (!read_field(s, pos, 2, m)) return std::nullopt;
    if (pos < s.size()) {
        if (s[pos++] != ':') return std::nullopt;
        if (!read_field(s, pos, 2, sec)) return std::nullopt;
        if (pos < s.size()) {
            if (s[pos++] != '.') return std::nullopt;
            const std::size_t digits = s.size() - pos;
            if (digits == 0 || digits > 6) return std::nullopt;
            int frac = 0;
            if (!read_field(s, pos, static_cast<int>(digits), frac)) return std::nullopt;
            for (std::size_t d = digits; d < 3; ++d) frac *= 10;
            for (std::size_t d = 3; d < digits; ++d) frac /= 10;
            ms = frac;
        }
    }
    if (h > 23 || m > 59 || sec > 59) return std::nullopt;
    return std::chrono::hours(h) + std::chrono::minutes(m) + std::chrono::seconds(sec) +
           std::chrono::milliseconds(ms);
}

}  // namespace

std::optional<TimeOfDay> normalize_time_of_day(const RawTime& raw) {
    if (const auto* secs = std::get_if<std::int64_t>(&raw)) {
        // 24:00:00 is a valid end-of-day duration, anything past it is not
        if (*secs < 0 || *secs > kMsPerDay / 1000) return std::nullopt;
        return TimeOfDay(*secs * 1000);
    }
    return parse_clock_text(std::get<std::string>(raw));
}

std::vector<ClassWindow> normalize_rows(const std::vector<ClassRow>& rows) {
    std::vector<ClassWindow> windows;
    windows.reserve(rows.size());
    for (const auto& row : rows) {
        const auto start = normalize_time_of_day(row.start);
        const auto end = normalize_time_of_day(row.end);
        if (!start || !end) {
            spdlog::warn("Skipping class {} ({}): malformed start/end time", row.id, row.name);
            continue;
        }
        windows.push_back(ClassWindow{row.id, row.name, row.date, *start, *end});
    }
    return windows;
}

std::optional<ClassWindow> select_active_window(const std::vector<ClassWindow>& windows, TimeOfDay time) {
    const ClassWindow* best = nullptr;
    for (const auto& w : windows) {
        if (w.start <= time && time <= w.end) {
            if (!best || w.start > best->start) best = &w;
        }
    }
    if (!best) return std::nullopt;
    return *best;
}

std::optional<ClassWindow> ScheduleResolver::resolve_active(TimePoint now) {
    const LocalMoment moment = split_local(now);
    return store_.getActiveClassWindow(moment.date, moment.time);
}

}  // namespace attendance
