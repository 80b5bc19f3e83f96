#pragma once

#include <string>

#include "frame_types.hpp"

namespace attendance {

class Clock {
public:
    virtual ~Clock() = default;
    virtual TimePoint now() const = 0;
};

class SystemClock : public Clock {
public:
    TimePoint now() const override { return WallClock::now(); }
};

// Local calendar split of a wall-clock instant.
struct LocalMoment {
    std::string date;    // YYYY-MM-DD
    TimeOfDay time{0};
};

LocalMoment split_local(TimePoint tp);

// "YYYY-MM-DD HH:MM:SS" in local time, the format the store keeps.
std::string format_timestamp(TimePoint tp);

// Inverse of format_timestamp; nullopt on malformed input.
std::optional<TimePoint> parse_timestamp(const std::string& text);

std::string format_time_of_day(TimeOfDay tod);

}  // namespace attendance
