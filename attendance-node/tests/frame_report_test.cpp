#include <gtest/gtest.h>

#include "frame_report.hpp"
#include "test_doubles.hpp"

namespace attendance {
namespace {

using testing::FaultyStore;
using testing::local_time;
using testing::memory_store;
using testing::ScriptedEmbedder;
using testing::unit_vector;

Detection recognized(const std::string& id, const std::string& name, cv::Rect box) {
    Detection d;
    d.identity_id = id;
    d.name = name;
    d.confidence = 0.75f;
    d.distance = 0.25f;
    d.bbox = box;
    return d;
}

Detection unknown(cv::Rect box) {
    Detection d;
    d.bbox = box;
    return d;
}

TEST(JsonEscape, EscapesQuotesAndControlCharacters) {
    EXPECT_EQ(json_escape("a\"b\\c"), "a\\\"b\\\\c");
    EXPECT_EQ(json_escape("line\nbreak\t"), "line\\nbreak\\t");
    EXPECT_EQ(json_escape(std::string(1, '\x01')), "\\u0001");
}

TEST(ErrorJson, WrapsMessage) {
    EXPECT_EQ(error_json("Failed to read image"), "{\"error\":\"Failed to read image\"}");
}

TEST(ToJson, DescribesFacesAndMarks) {
    FrameReport report;
    FaceReport known;
    known.bbox = cv::Rect(1, 2, 3, 4);
    known.recognized = true;
    known.name = "Ada";
    known.student_id = std::string("S001");
    known.confidence = 0.75f;
    report.faces.push_back(known);
    FaceReport stranger;
    stranger.bbox = cv::Rect(5, 6, 7, 8);
    report.faces.push_back(stranger);
    report.attendance_marked.push_back(MarkedStudent{"S001", "Ada"});

    EXPECT_EQ(to_json(report),
              "{\"faces\":["
              "{\"x\":1,\"y\":2,\"width\":3,\"height\":4,\"recognized\":true,\"name\":\"Ada\","
              "\"student_id\":\"S001\",\"confidence\":0.7500},"
              "{\"x\":5,\"y\":6,\"width\":7,\"height\":8,\"recognized\":false,\"name\":\"Unknown\","
              "\"confidence\":0.0000}],"
              "\"attendance_marked\":[{\"student_id\":\"S001\",\"student_name\":\"Ada\"}],"
              "\"total_faces\":2}");
}

TEST(ToJson, EmptyReport) {
    EXPECT_EQ(to_json(FrameReport{}), "{\"faces\":[],\"attendance_marked\":[],\"total_faces\":0}");
}

class BuildReportTest : public ::testing::Test {
protected:
    void SetUp() override {
        class_id = store->addClass("History", "2026-10-19", std::string("13:00:00"), std::string("14:00:00"));
    }

    std::unique_ptr<SqliteStore> store = memory_store();
    std::int64_t class_id{0};
    TimePoint now = local_time(2026, 10, 19, 13, 20, 0);
};

TEST_F(BuildReportTest, MarksEachRecognizedStudentOnce) {
    AttendanceWriter writer(*store);
    const std::vector<Detection> dets{recognized("S001", "Ada", {0, 0, 10, 10}),
                                      unknown({20, 20, 10, 10}),
                                      recognized("S001", "Ada", {40, 40, 10, 10})};

    const FrameReport report = build_report(dets, writer, class_id, "T-7", now);

    EXPECT_EQ(report.faces.size(), 3u);
    EXPECT_TRUE(report.faces[0].recognized);
    EXPECT_FALSE(report.faces[1].recognized);
    EXPECT_FALSE(report.faces[1].student_id);
    ASSERT_EQ(report.attendance_marked.size(), 1u);
    EXPECT_EQ(report.attendance_marked[0].student_id, "S001");
    EXPECT_EQ(store->countAttendance("S001", class_id), 1u);

    const auto entries = store->activityEntries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_NE(entries[0].find("via terminal T-7"), std::string::npos);
}

TEST_F(BuildReportTest, RepeatedSubmissionUpdatesInsteadOfDuplicating) {
    AttendanceWriter writer(*store);
    const std::vector<Detection> dets{recognized("S001", "Ada", {0, 0, 10, 10})};
    build_report(dets, writer, class_id, "T-7", now);
    build_report(dets, writer, class_id, "T-7", now + std::chrono::seconds(30));

    EXPECT_EQ(store->countAttendance("S001", class_id), 1u);
    EXPECT_EQ(store->getLatestAttendance("S001", class_id)->marked_at, now + std::chrono::seconds(30));
}

TEST_F(BuildReportTest, FailedWriteLeavesStudentUnmarked) {
    FaultyStore faulty(*store);
    faulty.fail_insert = 1;
    AttendanceWriter writer(faulty);
    const std::vector<Detection> dets{recognized("S001", "Ada", {0, 0, 10, 10}),
                                      recognized("S002", "Bob", {30, 0, 10, 10})};

    const FrameReport report = build_report(dets, writer, class_id, "T-7", now);

    EXPECT_EQ(report.faces.size(), 2u);
    ASSERT_EQ(report.attendance_marked.size(), 1u);
    EXPECT_EQ(report.attendance_marked[0].student_id, "S002");
}

class HandleFrameTest : public BuildReportTest {
protected:
    void SetUp() override {
        BuildReportTest::SetUp();
        store->addStudent("S001", "Ada", testing::encode(unit_vector(128, 0)));
        embedder.standing = {FaceEmbedding{cv::Rect(5, 5, 40, 40), unit_vector(128, 0)}};
    }

    ScriptedEmbedder embedder;
    Recognizer recognizer{embedder, MatchParams{}};
    cv::Mat image = cv::Mat::zeros(120, 160, CV_8UC3);
};

TEST_F(HandleFrameTest, RecognizedFaceProducesReport) {
    const FrameOutcome out = handle_frame(image, recognizer, *store, 128, class_id, "T-7", now);
    EXPECT_TRUE(out.ok);
    EXPECT_NE(out.json.find("\"total_faces\":1"), std::string::npos);
    EXPECT_NE(out.json.find("\"student_id\":\"S001\",\"student_name\":\"Ada\""), std::string::npos);
    EXPECT_EQ(store->countAttendance("S001", class_id), 1u);
}

TEST_F(HandleFrameTest, VisionFailureBecomesErrorPayload) {
    embedder.fail_next = 1;
    FrameOutcome out;
    EXPECT_NO_THROW(out = handle_frame(image, recognizer, *store, 128, class_id, "T-7", now));
    EXPECT_FALSE(out.ok);
    EXPECT_EQ(out.json.rfind("{\"error\":\"", 0), 0u);
    EXPECT_NE(out.json.find("feature extraction failed"), std::string::npos);
    EXPECT_EQ(store->countAttendance("S001", class_id), 0u);
}

TEST_F(HandleFrameTest, StoreFailureBecomesErrorPayload) {
    FaultyStore faulty(*store);
    faulty.fail_students = 1;
    const FrameOutcome out = handle_frame(image, recognizer, faulty, 128, class_id, "T-7", now);
    EXPECT_FALSE(out.ok);
    EXPECT_EQ(out.json, error_json("students unavailable"));
    EXPECT_EQ(embedder.calls, 0);
}

}  // namespace
}  // namespace attendance
