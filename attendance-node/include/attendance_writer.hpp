#pragma once

#include "attendance_store.hpp"
#include "frame_types.hpp"

namespace attendance {

enum class ApplyOutcome { INSERTED, UPDATED };

inline const char* outcome_to_string(ApplyOutcome o) {
    return o == ApplyOutcome::INSERTED ? "inserted" : "updated";
}

// Applies transition intents as upsert-by-latest: one logical record per
// (student, class). Throws StoreError when the write did not commit.
class AttendanceWriter {
public:
    explicit AttendanceWriter(AttendanceStore& store) : store_(store) {}

    ApplyOutcome apply(const TransitionIntent& intent, const std::string& class_name = {});

private:
    AttendanceStore& store_;
};

}  // namespace attendance
