#include <gtest/gtest.h>

#include "attendance_writer.hpp"
#include "test_doubles.hpp"

namespace attendance {
namespace {

using namespace std::chrono_literals;
using testing::FaultyStore;
using testing::local_time;

class AttendanceWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        class_id = store->addClass("Mathematics 101", "2026-10-19", std::string("10:00:00"), std::string("11:00:00"));
    }

    TransitionIntent intent(TimePoint at) const {
        return TransitionIntent{"S001", class_id, AttendanceStatus::PRESENT, at, "camera"};
    }

    std::unique_ptr<SqliteStore> store = testing::memory_store();
    std::int64_t class_id{0};
    TimePoint t0 = local_time(2026, 10, 19, 10, 5, 0);
};

TEST_F(AttendanceWriterTest, FirstApplyInsertsRecord) {
    AttendanceWriter writer(*store);
    EXPECT_EQ(writer.apply(intent(t0), "Mathematics 101"), ApplyOutcome::INSERTED);

    auto rec = store->getLatestAttendance("S001", class_id);
    ASSERT_TRUE(rec);
    EXPECT_EQ(rec->status, AttendanceStatus::PRESENT);
    EXPECT_EQ(rec->marked_at, t0);
    EXPECT_EQ(store->countAttendance("S001", class_id), 1u);
}

TEST_F(AttendanceWriterTest, ApplyingTwiceKeepsOneRecordWithLatestTimestamp) {
    AttendanceWriter writer(*store);
    EXPECT_EQ(writer.apply(intent(t0)), ApplyOutcome::INSERTED);
    EXPECT_EQ(writer.apply(intent(t0 + 4s)), ApplyOutcome::UPDATED);

    EXPECT_EQ(store->countAttendance("S001", class_id), 1u);
    auto rec = store->getLatestAttendance("S001", class_id);
    ASSERT_TRUE(rec);
    EXPECT_EQ(rec->marked_at, t0 + 4s);
}

TEST_F(AttendanceWriterTest, UpdateCorrectsStatus) {
    AttendanceRecord absent;
    absent.student_id = "S001";
    absent.class_id = class_id;
    absent.status = AttendanceStatus::ABSENT;
    absent.marked_at = t0;
    store->insertAttendance(absent);

    AttendanceWriter writer(*store);
    EXPECT_EQ(writer.apply(intent(t0 + 1s)), ApplyOutcome::UPDATED);
    EXPECT_EQ(store->getLatestAttendance("S001", class_id)->status, AttendanceStatus::PRESENT);
}

TEST_F(AttendanceWriterTest, AppendsAuditEntry) {
    AttendanceWriter writer(*store);
    writer.apply(intent(t0), "Mathematics 101");

    const auto entries = store->activityEntries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_NE(entries[0].find("Student S001 marked present for class Mathematics 101"), std::string::npos);
}

TEST_F(AttendanceWriterTest, TerminalOriginIsRecordedInAudit) {
    AttendanceWriter writer(*store);
    TransitionIntent in = intent(t0);
    in.origin = "T-12";
    writer.apply(in);

    const auto entries = store->activityEntries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_NE(entries[0].find("via terminal T-12"), std::string::npos);
}

TEST_F(AttendanceWriterTest, AuditFailureDoesNotUndoWrite) {
    FaultyStore faulty(*store);
    faulty.fail_activity = true;
    AttendanceWriter writer(faulty);

    EXPECT_EQ(writer.apply(intent(t0)), ApplyOutcome::INSERTED);
    EXPECT_EQ(store->countAttendance("S001", class_id), 1u);
    EXPECT_TRUE(store->activityEntries().empty());
}

TEST_F(AttendanceWriterTest, FailedCommitRollsBackAndRetrySucceeds) {
    FaultyStore faulty(*store);
    faulty.fail_commit = 1;
    AttendanceWriter writer(faulty);

    EXPECT_THROW(writer.apply(intent(t0)), StoreError);
    EXPECT_EQ(store->countAttendance("S001", class_id), 0u);

    EXPECT_EQ(writer.apply(intent(t0 + 1s)), ApplyOutcome::INSERTED);
    EXPECT_EQ(store->countAttendance("S001", class_id), 1u);
}

TEST_F(AttendanceWriterTest, FailedInsertLeavesNothingBehind) {
    FaultyStore faulty(*store);
    faulty.fail_insert = 1;
    AttendanceWriter writer(faulty);

    EXPECT_THROW(writer.apply(intent(t0)), StoreError);
    EXPECT_EQ(store->countAttendance("S001", class_id), 0u);
    EXPECT_TRUE(store->activityEntries().empty());
}

}  // namespace
}  // namespace attendance
