#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

namespace attendance {

using WallClock = std::chrono::system_clock;
using TimePoint = WallClock::time_point;

// Milliseconds since local midnight.
using TimeOfDay = std::chrono::milliseconds;

enum class AttendanceStatus { PRESENT, ABSENT };

inline const char* status_to_string(AttendanceStatus status) {
    switch (status) {
        case AttendanceStatus::PRESENT: return "present";
        case AttendanceStatus::ABSENT: return "absent";
    }
    return "absent";
}

inline std::optional<AttendanceStatus> status_from_string(const std::string& s) {
    if (s == "present") return AttendanceStatus::PRESENT;
    if (s == "absent") return AttendanceStatus::ABSENT;
    return std::nullopt;
}

struct Identity {
    std::string id;
    std::string name;
    std::vector<float> feature;
};

struct Gallery {
    std::size_t dimension{0};
    std::vector<Identity> identities;

    bool empty() const { return identities.empty(); }
    std::size_t size() const { return identities.size(); }
};

using GallerySnapshot = std::shared_ptr<const Gallery>;

struct ClassWindow {
    std::int64_t id{0};
    std::string name;
    std::string date;  // YYYY-MM-DD
    TimeOfDay start{0};
    TimeOfDay end{0};
};

struct Detection {
    std::optional<std::string> identity_id;  // empty when unmatched
    std::string name{"Unknown"};
    float confidence{0.0f};
    float distance{0.0f};
    cv::Rect bbox;

    bool matched() const { return identity_id.has_value(); }
};

struct AttendanceRecord {
    std::int64_t id{0};
    std::string student_id;
    std::int64_t class_id{0};
    AttendanceStatus status{AttendanceStatus::ABSENT};
    TimePoint marked_at{};
};

struct TransitionIntent {
    std::string student_id;
    std::int64_t class_id{0};
    AttendanceStatus status{AttendanceStatus::PRESENT};
    TimePoint timestamp{};
    std::string origin{"camera"};  // camera loop or terminal id
};

struct FrameResult {
    cv::Mat frame;                  // BGR image
    std::vector<Detection> dets;    // detections for this frame
    TimePoint timestamp{};
};

}  // namespace attendance
