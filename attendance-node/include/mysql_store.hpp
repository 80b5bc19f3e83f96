#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <mysql.h>

#include "attendance_store.hpp"
#include "config.hpp"
#include "schedule_resolver.hpp"

namespace attendance {

// AttendanceStore over one libmysqlclient connection built from host, user,
// password, database and port. A lost server connection is closed so the
// next call reconnects.
class MysqlStore : public AttendanceStore {
public:
    explicit MysqlStore(const StoreConfig& cfg);
    ~MysqlStore() override;

    MysqlStore(const MysqlStore&) = delete;
    MysqlStore& operator=(const MysqlStore&) = delete;

    void connect() override;
    bool connected() const { return conn_ != nullptr; }
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

private:
    MYSQL* handle();
    void execute(const std::string& sql, const char* what);
    MYSQL_RES* select(const std::string& sql, const char* what);
    std::string escape(const std::string& value);
    [[noreturn]] void fail(const char* what);

    StoreConfig cfg_;
    MYSQL* conn_{nullptr};
};

}  // namespace attendance
