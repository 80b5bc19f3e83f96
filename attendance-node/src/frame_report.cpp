#include "frame_report.hpp"

#include <algorithm>
#include <cstdio>
#include <iomanip>
#include <sstream>

#include <spdlog/spdlog.h>

#include "gallery_loader.hpp"

namespace attendance {

FrameReport build_report(const std::vector<Detection>& dets,
                         AttendanceWriter& writer,
                         std::int64_t class_id,
                         const std::string& terminal_id,
                         TimePoint now) {
    FrameReport report;
    for (const auto& d : dets) {
        FaceReport face;
        face.bbox = d.bbox;
        if (d.matched()) {
            face.recognized = true;
            face.name = d.name;
            face.student_id = d.identity_id;
            face.confidence = d.confidence;
        }
        report.faces.push_back(face);

        if (!d.matched()) continue;
        const std::string& id = *d.identity_id;
        const bool already = std::any_of(report.attendance_marked.begin(), report.attendance_marked.end(),
                                         [&](const MarkedStudent& m) { return m.student_id == id; });
        if (already) continue;

        try {
            writer.apply(TransitionIntent{id, class_id, AttendanceStatus::PRESENT, now, terminal_id});
            report.attendance_marked.push_back(MarkedStudent{id, d.name});
        } catch (const StoreError& e) {
            spdlog::error("Error marking attendance for {}: {}", id, e.what());
        }
    }
    return report;
}

FrameOutcome handle_frame(const cv::Mat& image,
                          Recognizer& recognizer,
                          AttendanceStore& store,
                          std::size_t dimension,
                          std::int64_t class_id,
                          const std::string& terminal_id,
                          TimePoint now) {
    try {
        const GalleryLoad load = load_gallery(store, dimension);
        if (!load.ok()) {
            spdlog::warn("No known face encodings available");
        }
        const auto dets = recognizer.detect(image, *load.gallery);
        AttendanceWriter writer(store);
        return FrameOutcome{to_json(build_report(dets, writer, class_id, terminal_id, now)), true};
    } catch (const StoreError& e) {
        spdlog::error("Error processing frame: {}", e.what());
        return FrameOutcome{error_json(e.what()), false};
    } catch (const std::exception& e) {
        spdlog::error("Face processing failed: {}", e.what());
        return FrameOutcome{error_json(e.what()), false};
    }
}

std::string json_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    for (char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    out += buf;
                } else {
                    out.push_back(c);
                }
        }
    }
    return out;
}

std::string to_json(const FrameReport& report) {
    std::ostringstream oss;
    oss << "{";
    oss << "\"faces\":[";
    bool first = true;
    for (const auto& f : report.faces) {
        if (!first) oss << ",";
        first = false;
        oss << "{"
            << "\"x\":" << f.bbox.x << ","
            << "\"y\":" << f.bbox.y << ","
            << "\"width\":" << f.bbox.width << ","
            << "\"height\":" << f.bbox.height << ","
            << "\"recognized\":" << (f.recognized ? "true" : "false") << ","
            << "\"name\":\"" << json_escape(f.name) << "\",";
        if (f.student_id) {
            oss << "\"student_id\":\"" << json_escape(*f.student_id) << "\",";
        }
        oss << "\"confidence\":" << std::fixed << std::setprecision(4) << f.confidence << "}";
    }
    oss << "],";
    oss << "\"attendance_marked\":[";
    first = true;
    for (const auto& m : report.attendance_marked) {
        if (!first) oss << ",";
        first = false;
        oss << "{\"student_id\":\"" << json_escape(m.student_id) << "\","
            << "\"student_name\":\"" << json_escape(m.student_name) << "\"}";
    }
    oss << "],";
    oss << "\"total_faces\":" << report.faces.size();
    oss << "}";
    return oss.str();
}

std::string error_json(const std::string& message) {
    return "{\"error\":\"" + json_escape(message) + "\"}";
}

}  // namespace attendance
