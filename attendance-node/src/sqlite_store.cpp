#include "sqlite_store.hpp"

#include <sqlite3.h>

#include <spdlog/spdlog.h>

#include "clock.hpp"

namespace attendance {

namespace {

const char* kSchema = R"(
CREATE TABLE IF NOT EXISTS students (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    student_id TEXT UNIQUE NOT NULL,
    name TEXT NOT NULL,
    email TEXT NOT NULL DEFAULT '',
    face_encoding TEXT NOT NULL,
    created_at TEXT DEFAULT CURRENT_TIMESTAMP
);
CREATE TABLE IF NOT EXISTS classes (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    class_name TEXT NOT NULL,
    start_time NOT NULL,
    end_time NOT NULL,
    date TEXT NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_classes_date ON classes(date);
CREATE TABLE IF NOT EXISTS attendance (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    student_id TEXT NOT NULL,
    class_id INTEGER NOT NULL REFERENCES classes(id) ON DELETE CASCADE,
    status TEXT NOT NULL DEFAULT 'absent' CHECK (status IN ('present', 'absent')),
    marked_at TEXT NOT NULL,
    updated_at TEXT DEFAULT CURRENT_TIMESTAMP,
    UNIQUE (student_id, class_id)
);
CREATE TABLE IF NOT EXISTS activity_logs (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    activity TEXT NOT NULL,
    timestamp TEXT DEFAULT CURRENT_TIMESTAMP
);
)";

// Errors after which the handle is not trusted any more.
bool is_connection_error(int rc) {
    switch (rc & 0xff) {
        case SQLITE_IOERR:
        case SQLITE_CANTOPEN:
        case SQLITE_CORRUPT:
        case SQLITE_NOTADB:
        case SQLITE_FULL:
        case SQLITE_PROTOCOL:
            return true;
        default:
            return false;
    }
}

class Statement {
public:
    Statement(sqlite3* db, const char* sql) {
        rc_ = sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr);
    }
    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    int prepare_rc() const { return rc_; }
    sqlite3_stmt* get() const { return stmt_; }

    void bind(int idx, const std::string& v) {
        sqlite3_bind_text(stmt_, idx, v.c_str(), -1, SQLITE_TRANSIENT);
    }
    void bind(int idx, std::int64_t v) { sqlite3_bind_int64(stmt_, idx, v); }
    void bind(int idx, const RawTime& v) {
        if (const auto* secs = std::get_if<std::int64_t>(&v)) {
            bind(idx, *secs);
        } else {
            bind(idx, std::get<std::string>(v));
        }
    }

    int step() { return sqlite3_step(stmt_); }

    std::string text(int col) const {
        const unsigned char* p = sqlite3_column_text(stmt_, col);
        return p ? reinterpret_cast<const char*>(p) : std::string();
    }
    std::int64_t int64(int col) const { return sqlite3_column_int64(stmt_, col); }

    RawTime raw_time(int col) const {
        switch (sqlite3_column_type(stmt_, col)) {
            case SQLITE_INTEGER:
                return int64(col);
            case SQLITE_TEXT:
                return text(col);
            default:
                // BLOB/REAL/NULL are not time values; normalization rejects ""
                return std::string();
        }
    }

private:
    sqlite3_stmt* stmt_{nullptr};
    int rc_{SQLITE_OK};
};

}  // namespace

SqliteStore::SqliteStore(const StoreConfig& cfg) : cfg_(cfg) {}

SqliteStore::~SqliteStore() {
    close();
}

void SqliteStore::connect() {
    if (db_) return;
    sqlite3* db = nullptr;
    const int rc = sqlite3_open_v2(cfg_.database.c_str(), &db,
                                   SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                                   nullptr);
    if (rc != SQLITE_OK) {
        std::string errmsg = db ? sqlite3_errmsg(db) : "Unknown SQLite error";
        sqlite3_close(db);
        throw StoreError("cannot open database " + cfg_.database + ": " + errmsg);
    }
    sqlite3_busy_timeout(db, cfg_.timeout_ms);
    db_ = db;
    try {
        exec("PRAGMA foreign_keys = ON;");
        exec(kSchema);
    } catch (const StoreError&) {
        close();
        throw;
    }
    spdlog::info("Database connection established ({})", cfg_.database);
}

void SqliteStore::close() {
    if (db_) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

sqlite3* SqliteStore::handle() {
    if (!db_) connect();
    return db_;
}

void SqliteStore::fail(int rc, const std::string& what) {
    std::string msg = what + ": " + (db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc));
    if (is_connection_error(rc)) {
        spdlog::warn("Dropping database connection after error: {}", msg);
        close();
    }
    throw StoreError(msg);
}

void SqliteStore::exec(const char* sql) {
    char* err = nullptr;
    const int rc = sqlite3_exec(handle(), sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : sqlite3_errstr(rc);
        sqlite3_free(err);
        fail(rc, std::string("exec failed (") + msg + ")");
    }
}

std::vector<StudentRow> SqliteStore::getStudentsWithEncoding() {
    Statement st(handle(), "SELECT student_id, name, face_encoding FROM students ORDER BY id");
    if (st.prepare_rc() != SQLITE_OK) fail(st.prepare_rc(), "prepare students query");

    std::vector<StudentRow> rows;
    int rc;
    while ((rc = st.step()) == SQLITE_ROW) {
        rows.push_back(StudentRow{st.text(0), st.text(1), st.text(2)});
    }
    if (rc != SQLITE_DONE) fail(rc, "read students");
    return rows;
}

std::optional<ClassWindow> SqliteStore::getActiveClassWindow(const std::string& date, TimeOfDay time) {
    Statement st(handle(), "SELECT id, class_name, date, start_time, end_time FROM classes WHERE date = ?");
    if (st.prepare_rc() != SQLITE_OK) fail(st.prepare_rc(), "prepare classes query");
    st.bind(1, date);

    std::vector<ClassRow> rows;
    int rc;
    while ((rc = st.step()) == SQLITE_ROW) {
        rows.push_back(ClassRow{st.int64(0), st.text(1), st.text(2), st.raw_time(3), st.raw_time(4)});
    }
    if (rc != SQLITE_DONE) fail(rc, "read classes");
    return select_active_window(normalize_rows(rows), time);
}

std::optional<AttendanceRecord> SqliteStore::getLatestAttendance(const std::string& student_id,
                                                                 std::int64_t class_id) {
    Statement st(handle(),
                 "SELECT id, student_id, class_id, status, marked_at FROM attendance "
                 "WHERE student_id = ? AND class_id = ? ORDER BY marked_at DESC, id DESC LIMIT 1");
    if (st.prepare_rc() != SQLITE_OK) fail(st.prepare_rc(), "prepare attendance lookup");
    st.bind(1, student_id);
    st.bind(2, class_id);

    const int rc = st.step();
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW) fail(rc, "read attendance");

    AttendanceRecord rec;
    rec.id = st.int64(0);
    rec.student_id = st.text(1);
    rec.class_id = st.int64(2);
    rec.status = status_from_string(st.text(3)).value_or(AttendanceStatus::ABSENT);
    rec.marked_at = parse_timestamp(st.text(4)).value_or(TimePoint{});
    return rec;
}

std::int64_t SqliteStore::insertAttendance(const AttendanceRecord& record) {
    Statement st(handle(),
                 "INSERT INTO attendance (student_id, class_id, status, marked_at) VALUES (?, ?, ?, ?)");
    if (st.prepare_rc() != SQLITE_OK) fail(st.prepare_rc(), "prepare attendance insert");
    st.bind(1, record.student_id);
    st.bind(2, record.class_id);
    st.bind(3, std::string(status_to_string(record.status)));
    st.bind(4, format_timestamp(record.marked_at));

    const int rc = st.step();
    if (rc != SQLITE_DONE) fail(rc, "insert attendance");
    return sqlite3_last_insert_rowid(db_);
}

void SqliteStore::updateAttendance(std::int64_t id, AttendanceStatus status, TimePoint marked_at) {
    Statement st(handle(),
                 "UPDATE attendance SET status = ?, marked_at = ?, updated_at = CURRENT_TIMESTAMP "
                 "WHERE id = ?");
    if (st.prepare_rc() != SQLITE_OK) fail(st.prepare_rc(), "prepare attendance update");
    st.bind(1, std::string(status_to_string(status)));
    st.bind(2, format_timestamp(marked_at));
    st.bind(3, id);

    const int rc = st.step();
    if (rc != SQLITE_DONE) fail(rc, "update attendance");
    if (sqlite3_changes(db_) != 1) {
        throw StoreError("attendance row " + std::to_string(id) + " not found");
    }
}

void SqliteStore::appendActivityLog(const std::string& text) {
    Statement st(handle(), "INSERT INTO activity_logs (activity) VALUES (?)");
    if (st.prepare_rc() != SQLITE_OK) fail(st.prepare_rc(), "prepare activity insert");
    st.bind(1, text);
    const int rc = st.step();
    if (rc != SQLITE_DONE) fail(rc, "append activity log");
}

void SqliteStore::begin() {
    exec("BEGIN IMMEDIATE;");
}

void SqliteStore::commit() {
    exec("COMMIT;");
}

void SqliteStore::rollback() {
    if (!db_) throw StoreError("rollback without connection");
    if (sqlite3_get_autocommit(db_)) return;  // nothing pending
    exec("ROLLBACK;");
}

void SqliteStore::addStudent(const std::string& student_id, const std::string& name,
                             const std::string& encoding) {
    Statement st(handle(), "INSERT INTO students (student_id, name, face_encoding) VALUES (?, ?, ?)");
    if (st.prepare_rc() != SQLITE_OK) fail(st.prepare_rc(), "prepare student insert");
    st.bind(1, student_id);
    st.bind(2, name);
    st.bind(3, encoding);
    const int rc = st.step();
    if (rc != SQLITE_DONE) fail(rc, "insert student");
}

std::int64_t SqliteStore::addClass(const std::string& name, const std::string& date, const RawTime& start,
                                   const RawTime& end) {
    Statement st(handle(), "INSERT INTO classes (class_name, date, start_time, end_time) VALUES (?, ?, ?, ?)");
    if (st.prepare_rc() != SQLITE_OK) fail(st.prepare_rc(), "prepare class insert");
    st.bind(1, name);
    st.bind(2, date);
    st.bind(3, start);
    st.bind(4, end);
    const int rc = st.step();
    if (rc != SQLITE_DONE) fail(rc, "insert class");
    return sqlite3_last_insert_rowid(db_);
}

std::size_t SqliteStore::countAttendance(const std::string& student_id, std::int64_t class_id) {
    Statement st(handle(), "SELECT COUNT(*) FROM attendance WHERE student_id = ? AND class_id = ?");
    if (st.prepare_rc() != SQLITE_OK) fail(st.prepare_rc(), "prepare attendance count");
    st.bind(1, student_id);
    st.bind(2, class_id);
    const int rc = st.step();
    if (rc != SQLITE_ROW) fail(rc, "count attendance");
    return static_cast<std::size_t>(st.int64(0));
}

std::vector<std::string> SqliteStore::activityEntries() {
    Statement st(handle(), "SELECT activity FROM activity_logs ORDER BY id");
    if (st.prepare_rc() != SQLITE_OK) fail(st.prepare_rc(), "prepare activity query");
    std::vector<std::string> out;
    int rc;
    while ((rc = st.step()) == SQLITE_ROW) out.push_back(st.text(0));
    if (rc != SQLITE_DONE) fail(rc, "read activity log");
    return out;
}

}  // namespace attendance
