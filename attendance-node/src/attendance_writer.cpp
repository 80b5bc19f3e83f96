#include "attendance_writer.hpp"

#include <sstream>

#include <spdlog/spdlog.h>

#include "clock.hpp"

namespace attendance {

ApplyOutcome AttendanceWriter::apply(const TransitionIntent& intent, const std::string& class_name) {
    ApplyOutcome outcome = ApplyOutcome::INSERTED;
    {
        StoreTransaction tx(store_);
        const auto existing = store_.getLatestAttendance(intent.student_id, intent.class_id);
        if (existing) {
            store_.updateAttendance(existing->id, intent.status, intent.timestamp);
            outcome = ApplyOutcome::UPDATED;
            spdlog::info("UPDATED: {} attendance changed from {} to {}", intent.student_id,
                         status_to_string(existing->status), status_to_string(intent.status));
        } else {
            AttendanceRecord rec;
            rec.student_id = intent.student_id;
            rec.class_id = intent.class_id;
            rec.status = intent.status;
            rec.marked_at = intent.timestamp;
            store_.insertAttendance(rec);
            outcome = ApplyOutcome::INSERTED;
            spdlog::info("NEW RECORD: {} marked as {} at {}", intent.student_id,
                         status_to_string(intent.status), format_timestamp(intent.timestamp));
        }
        tx.commit();
    }

    std::ostringstream activity;
    activity << "Student " << intent.student_id << " marked " << status_to_string(intent.status)
             << " for class " << (class_name.empty() ? "ID " + std::to_string(intent.class_id) : class_name)
             << " at " << format_timestamp(intent.timestamp);
    if (intent.origin != "camera") activity << " via terminal " << intent.origin;

    try {
        store_.appendActivityLog(activity.str());
    } catch (const StoreError& e) {
        spdlog::error("Error logging activity: {}", e.what());
    }
    return outcome;
}

}  // namespace attendance
