#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "attendance_store.hpp"
#include "config.hpp"
#include "schedule_resolver.hpp"

struct sqlite3;

namespace attendance {

// AttendanceStore over a single SQLite connection. The connection is opened
// lazily and dropped after an I/O-class failure so the next call reconnects
// instead of reusing a broken handle.
class SqliteStore : public AttendanceStore {
public:
    explicit SqliteStore(const StoreConfig& cfg);
    ~SqliteStore() override;

    SqliteStore(const SqliteStore&) = delete;
    SqliteStore& operator=(const SqliteStore&) = delete;

    // Opens the connection and creates the schema if needed.
    void connect() override;
    bool connected() const { return db_ != nullptr; }
    void close() override;

    std::vector<StudentRow> getStudentsWithEncoding() override;
    std::optional<ClassWindow> getActiveClassWindow(const std::string& date, TimeOfDay time) override;
    std::optional<AttendanceRecord> getLatestAttendance(const std::string& student_id,
                                                        std::int64_t class_id) override;
    std::int64_t insertAttendance(const AttendanceRecord& record) override;
    void updateAttendance(std::int64_t id, AttendanceStatus status, TimePoint marked_at) override;
    void appendActivityLog(const std::string& text) override;

    void begin() override;
    void commit() override;
    void rollback() override;

    // Administrative helpers for seeding and inspection.
    void addStudent(const std::string& student_id, const std::string& name, const std::string& encoding);
    std::int64_t addClass(const std::string& name, const std::string& date, const RawTime& start,
                          const RawTime& end);
    std::size_t countAttendance(const std::string& student_id, std::int64_t class_id);
    std::vector<std::string> activityEntries();

private:
    sqlite3* handle();
    void exec(const char* sql);
    [[noreturn]] void fail(int rc, const std::string& what);

    StoreConfig cfg_;
    sqlite3* db_{nullptr};
};

}  // namespace attendance
