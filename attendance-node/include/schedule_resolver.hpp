#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "attendance_store.hpp"
#include "clock.hpp"
#include "frame_types.hpp"

namespace attendance {

// A class time as the store hands it over: either clock text ("09:30",
// "09:30:00", "09:30:00.250") or a duration since midnight in seconds.
using RawTime = std::variant<std::string, std::int64_t>;

struct ClassRow {
    std::int64_t id{0};
    std::string name;
    std::string date;
    RawTime start;
    RawTime end;
};

std::optional<TimeOfDay> normalize_time_of_day(const RawTime& raw);

// Converts rows to windows, dropping (and logging) rows whose times do not
// normalize.
std::vector<ClassWindow> normalize_rows(const std::vector<ClassRow>& rows);

// Window containing `time` (both ends inclusive); overlaps resolve to the
// latest start.
std::optional<ClassWindow> select_active_window(const std::vector<ClassWindow>& windows, TimeOfDay time);

class ScheduleResolver {
public:
    explicit ScheduleResolver(AttendanceStore& store) : store_(store) {}

    std::optional<ClassWindow> resolve_active(TimePoint now);

private:
    AttendanceStore& store_;
};

}  // namespace attendance
