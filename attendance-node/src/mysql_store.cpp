#include "mysql_store.hpp"

#include <algorithm>
#include <cstdlib>
#include <memory>
#include <sstream>

#include <errmsg.h>

#include <spdlog/spdlog.h>

#include "clock.hpp"

namespace attendance {

namespace {

const char* const kSchema[] = {
    "CREATE TABLE IF NOT EXISTS students ("
    " id INT AUTO_INCREMENT PRIMARY KEY,"
    " student_id VARCHAR(50) UNIQUE NOT NULL,"
    " name VARCHAR(100) NOT NULL,"
    " email VARCHAR(100) NOT NULL DEFAULT '',"
    " face_encoding LONGTEXT NOT NULL,"
    " created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP)",
    "CREATE TABLE IF NOT EXISTS classes ("
    " id INT AUTO_INCREMENT PRIMARY KEY,"
    " class_name VARCHAR(100) NOT NULL,"
    " start_time TIME NOT NULL,"
    " end_time TIME NOT NULL,"
    " date DATE NOT NULL,"
    " INDEX idx_date (date))",
    "CREATE TABLE IF NOT EXISTS attendance ("
    " id INT AUTO_INCREMENT PRIMARY KEY,"
    " student_id VARCHAR(50) NOT NULL,"
    " class_id INT NOT NULL,"
    " status ENUM('present', 'absent') DEFAULT 'absent',"
    " marked_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP,"
    " updated_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP ON UPDATE CURRENT_TIMESTAMP,"
    " FOREIGN KEY (class_id) REFERENCES classes(id) ON DELETE CASCADE,"
    " UNIQUE KEY unique_student_class (student_id, class_id))",
    "CREATE TABLE IF NOT EXISTS activity_logs ("
    " id INT AUTO_INCREMENT PRIMARY KEY,"
    " activity TEXT NOT NULL,"
    " timestamp TIMESTAMP DEFAULT CURRENT_TIMESTAMP)",
};

using Result = std::unique_ptr<MYSQL_RES, decltype(&mysql_free_result)>;

// Client errors after which the connection is not usable any more.
bool is_disconnect_error(unsigned int err) {
    return err == CR_SERVER_GONE_ERROR || err == CR_SERVER_LOST || err == CR_CONNECTION_ERROR ||
           err == CR_CONN_HOST_ERROR;
}

std::string field(MYSQL_ROW row, unsigned int col) {
    return row[col] ? std::string(row[col]) : std::string();
}

std::int64_t int_field(MYSQL_ROW row, unsigned int col) {
    return row[col] ? std::strtoll(row[col], nullptr, 10) : 0;
}

bool is_integer_type(enum_field_types type) {
    switch (type) {
        case MYSQL_TYPE_TINY:
        case MYSQL_TYPE_SHORT:
        case MYSQL_TYPE_INT24:
        case MYSQL_TYPE_LONG:
        case MYSQL_TYPE_LONGLONG:
            return true;
        default:
            return false;
    }
}

// TIME columns arrive as clock text; integer columns hold seconds.
RawTime raw_time(MYSQL_ROW row, MYSQL_FIELD* fields, unsigned int col) {
    if (!row[col]) return std::string();
    if (is_integer_type(fields[col].type)) {
        char* end = nullptr;
        const long long secs = std::strtoll(row[col], &end, 10);
        if (end == row[col] || *end != '\0') return std::string();
        return static_cast<std::int64_t>(secs);
    }
    return std::string(row[col]);
}

}  // namespace

MysqlStore::MysqlStore(const StoreConfig& cfg) : cfg_(cfg) {}

MysqlStore::~MysqlStore() {
    close();
}

void MysqlStore::connect() {
    if (conn_) return;
    MYSQL* conn = mysql_init(nullptr);
    if (!conn) throw StoreError("cannot initialize MySQL handle");

    const unsigned int timeout_s = static_cast<unsigned int>(std::max(1, (cfg_.timeout_ms + 999) / 1000));
    mysql_options(conn, MYSQL_OPT_CONNECT_TIMEOUT, &timeout_s);
    mysql_options(conn, MYSQL_OPT_READ_TIMEOUT, &timeout_s);
    mysql_options(conn, MYSQL_OPT_WRITE_TIMEOUT, &timeout_s);

    // CLIENT_FOUND_ROWS: UPDATE reports matched rows, also when values are unchanged
    if (!mysql_real_connect(conn, cfg_.host.c_str(), cfg_.user.c_str(), cfg_.password.c_str(),
                            cfg_.database.c_str(), static_cast<unsigned int>(cfg_.port), nullptr,
                            CLIENT_FOUND_ROWS)) {
        std::string msg = "cannot connect to MySQL at " + cfg_.host + ":" + std::to_string(cfg_.port) + ": " +
                          mysql_error(conn);
        mysql_close(conn);
        throw StoreError(msg);
    }
    mysql_set_character_set(conn, "utf8mb4");
    conn_ = conn;
    try {
        for (const char* ddl : kSchema) execute(ddl, "create schema");
    } catch (const StoreError&) {
        close();
        throw;
    }
    spdlog::info("Database connection established ({}@{}:{}/{})", cfg_.user, cfg_.host, cfg_.port,
                 cfg_.database);
}

void MysqlStore::close() {
    if (conn_) {
        mysql_close(conn_);
        conn_ = nullptr;
    }
}

MYSQL* MysqlStore::handle() {
    if (!conn_) connect();
    return conn_;
}

void MysqlStore::fail(const char* what) {
    const unsigned int err = conn_ ? mysql_errno(conn_) : 0;
    std::string msg = std::string(what) + ": " + (conn_ ? mysql_error(conn_) : "no connection");
    if (is_disconnect_error(err)) {
        spdlog::warn("Dropping database connection after error: {}", msg);
        close();
    }
    throw StoreError(msg);
}

void MysqlStore::execute(const std::string& sql, const char* what) {
    if (mysql_query(handle(), sql.c_str()) != 0) fail(what);
}

MYSQL_RES* MysqlStore::select(const std::string& sql, const char* what) {
    execute(sql, what);
    MYSQL_RES* res = mysql_store_result(conn_);
    if (!res) fail(what);
    return res;
}

std::string MysqlStore::escape(const std::string& value) {
    std::string out(value.size() * 2 + 1, '\0');
    const unsigned long len = mysql_real_escape_string(handle(), &out[0], value.c_str(),
                                                       static_cast<unsigned long>(value.size()));
    out.resize(len);
    return out;
}

std::vector<StudentRow> MysqlStore::getStudentsWithEncoding() {
    Result res(select("SELECT student_id, name, face_encoding FROM students ORDER BY id", "read students"),
               &mysql_free_result);
    std::vector<StudentRow> rows;
    while (MYSQL_ROW row = mysql_fetch_row(res.get())) {
        rows.push_back(StudentRow{field(row, 0), field(row, 1), field(row, 2)});
    }
    return rows;
}

std::optional<ClassWindow> MysqlStore::getActiveClassWindow(const std::string& date, TimeOfDay time) {
    const std::string sql = "SELECT id, class_name, date, start_time, end_time FROM classes WHERE date = '" +
                            escape(date) + "'";
    Result res(select(sql, "read classes"), &mysql_free_result);
    MYSQL_FIELD* fields = mysql_fetch_fields(res.get());

    std::vector<ClassRow> rows;
    while (MYSQL_ROW row = mysql_fetch_row(res.get())) {
        rows.push_back(ClassRow{int_field(row, 0), field(row, 1), field(row, 2), raw_time(row, fields, 3),
                                raw_time(row, fields, 4)});
    }
    return select_active_window(normalize_rows(rows), time);
}

std::optional<AttendanceRecord> MysqlStore::getLatestAttendance(const std::string& student_id,
                                                                std::int64_t class_id) {
    std::ostringstream sql;
    sql << "SELECT id, student_id, class_id, status, marked_at FROM attendance WHERE student_id = '"
        << escape(student_id) << "' AND class_id = " << class_id << " ORDER BY marked_at DESC, id DESC LIMIT 1";
    Result res(select(sql.str(), "read attendance"), &mysql_free_result);

    MYSQL_ROW row = mysql_fetch_row(res.get());
    if (!row) return std::nullopt;

    AttendanceRecord rec;
    rec.id = int_field(row, 0);
    rec.student_id = field(row, 1);
    rec.class_id = int_field(row, 2);
    rec.status = status_from_string(field(row, 3)).value_or(AttendanceStatus::ABSENT);
    rec.marked_at = parse_timestamp(field(row, 4)).value_or(TimePoint{});
    return rec;
}

std::int64_t MysqlStore::insertAttendance(const AttendanceRecord& record) {
    std::ostringstream sql;
    sql << "INSERT INTO attendance (student_id, class_id, status, marked_at) VALUES ('"
        << escape(record.student_id) << "', " << record.class_id << ", '" << status_to_string(record.status)
        << "', '" << format_timestamp(record.marked_at) << "')";
    execute(sql.str(), "insert attendance");
    return static_cast<std::int64_t>(mysql_insert_id(conn_));
}

void MysqlStore::updateAttendance(std::int64_t id, AttendanceStatus status, TimePoint marked_at) {
    std::ostringstream sql;
    sql << "UPDATE attendance SET status = '" << status_to_string(status) << "', marked_at = '"
        << format_timestamp(marked_at) << "' WHERE id = " << id;
    execute(sql.str(), "update attendance");
    if (mysql_affected_rows(conn_) != 1) {
        throw StoreError("attendance row " + std::to_string(id) + " not found");
    }
}

void MysqlStore::appendActivityLog(const std::string& text) {
    execute("INSERT INTO activity_logs (activity) VALUES ('" + escape(text) + "')", "append activity log");
}

void MysqlStore::begin() {
    execute("START TRANSACTION", "begin transaction");
}

void MysqlStore::commit() {
    execute("COMMIT", "commit");
}

void MysqlStore::rollback() {
    if (!conn_) throw StoreError("rollback without connection");
    if (mysql_query(conn_, "ROLLBACK") != 0) fail("rollback");
}

}  // namespace attendance
