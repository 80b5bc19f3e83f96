#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "frame_types.hpp"

namespace attendance {

class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct StudentRow {
    std::string id;
    std::string name;
    std::string encoding;  // comma separated feature vector
};

// Record store the attendance core depends on. Every operation throws
// StoreError on failure.
class AttendanceStore {
public:
    virtual ~AttendanceStore() = default;

    // Opens the connection if it is not open yet. Operations reconnect on
    // their own after the connection was dropped.
    virtual void connect() = 0;
    virtual void close() = 0;

    virtual std::vector<StudentRow> getStudentsWithEncoding() = 0;
    virtual std::optional<ClassWindow> getActiveClassWindow(const std::string& date, TimeOfDay time) = 0;
    virtual std::optional<AttendanceRecord> getLatestAttendance(const std::string& student_id,
                                                                std::int64_t class_id) = 0;
    virtual std::int64_t insertAttendance(const AttendanceRecord& record) = 0;
    virtual void updateAttendance(std::int64_t id, AttendanceStatus status, TimePoint marked_at) = 0;
    virtual void appendActivityLog(const std::string& text) = 0;

    virtual void begin() = 0;
    virtual void commit() = 0;
    virtual void rollback() = 0;
};

// Rolls back on scope exit unless commit() succeeded.
class StoreTransaction {
public:
    explicit StoreTransaction(AttendanceStore& store) : store_(store) { store_.begin(); }
    ~StoreTransaction() {
        if (open_) {
            try {
                store_.rollback();
            } catch (const StoreError&) {
                // connection already gone; nothing left to undo
            }
        }
    }

    StoreTransaction(const StoreTransaction&) = delete;
    StoreTransaction& operator=(const StoreTransaction&) = delete;

    void commit() {
        store_.commit();
        open_ = false;
    }

private:
    AttendanceStore& store_;
    bool open_{true};
};

}  // namespace attendance
