#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "attendance_store.hpp"
#include "attendance_writer.hpp"
#include "frame_types.hpp"
#include "recognizer.hpp"

namespace attendance {

struct FaceReport {
    cv::Rect bbox;
    bool recognized{false};
    std::string name{"Unknown"};
    std::optional<std::string> student_id;
    float confidence{0.0f};
};

struct MarkedStudent {
    std::string student_id;
    std::string student_name;
};

struct FrameReport {
    std::vector<FaceReport> faces;
    std::vector<MarkedStudent> attendance_marked;
};

// Marks every recognized student present for `class_id` through the writer
// and describes all faces. A failed write leaves that student out of
// attendance_marked.
FrameReport build_report(const std::vector<Detection>& dets,
                         AttendanceWriter& writer,
                         std::int64_t class_id,
                         const std::string& terminal_id,
                         TimePoint now);

// Output of one single-shot request. `json` is either a report or an
// {"error": ...} payload; nothing escapes as an exception.
struct FrameOutcome {
    std::string json;
    bool ok{false};
};

// Loads the gallery, recognizes faces in `image` and marks the recognized
// students for `class_id`. Store and OpenCV failures become error payloads.
FrameOutcome handle_frame(const cv::Mat& image,
                          Recognizer& recognizer,
                          AttendanceStore& store,
                          std::size_t dimension,
                          std::int64_t class_id,
                          const std::string& terminal_id,
                          TimePoint now);

std::string to_json(const FrameReport& report);
std::string error_json(const std::string& message);
std::string json_escape(const std::string& s);

}  // namespace attendance
