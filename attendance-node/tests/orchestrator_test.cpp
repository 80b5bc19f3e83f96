#include <gtest/gtest.h>

#include <atomic>

#include "orchestrator.hpp"
#include "test_doubles.hpp"

namespace attendance {
namespace {

using namespace std::chrono_literals;
using testing::DeviceScript;
using testing::FakeClock;
using testing::FaultyStore;
using testing::fake_factory;
using testing::local_time;
using testing::memory_store;
using testing::offset;
using testing::ScriptedEmbedder;
using testing::unit_vector;

OrchestratorSettings fast_settings() {
    OrchestratorSettings s;
    s.frame_interval = 33ms;
    s.idle_poll = 10s;
    s.retry_backoff = 5s;
    s.cooldown = 3s;
    return s;
}

class OrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        store->addStudent("S001", "Ada", testing::encode(unit_vector(128, 0)));
        store->addStudent("S002", "Bob", testing::encode(unit_vector(128, 1)));
        class_id = store->addClass("Mathematics 101", "2026-10-19", std::string("10:00:00"), std::string("11:00:00"));
        gallery.replace(load_gallery(*store, 128).gallery);

        CaptureSettings cs;
        cs.backends = {"any"};
        source = std::make_unique<FrameSource>(cs, fake_factory(script));
        embedder.standing = {FaceEmbedding{cv::Rect(0, 0, 80, 80), offset(unit_vector(128, 0), 2, 0.3f)}};
    }

    Orchestrator make(AttendanceStore& s) {
        return Orchestrator(s, *source, recognizer, gallery, clock, fast_settings());
    }

    std::unique_ptr<SqliteStore> store = memory_store();
    std::int64_t class_id{0};
    GalleryHolder gallery;
    std::shared_ptr<DeviceScript> script = std::make_shared<DeviceScript>();
    std::unique_ptr<FrameSource> source;
    ScriptedEmbedder embedder;
    Recognizer recognizer{embedder, MatchParams{}};
    FakeClock clock{local_time(2026, 10, 19, 10, 5, 0)};
};

TEST_F(OrchestratorTest, NoClassKeepsCameraOff) {
    clock.set(local_time(2026, 10, 19, 9, 0, 0));
    auto loop = make(*store);

    EXPECT_EQ(loop.tick(), 10s);
    EXPECT_EQ(loop.tick(), 10s);
    EXPECT_EQ(loop.context().state, LoopState::IDLE);
    EXPECT_EQ(script->opens, 0);
    EXPECT_EQ(embedder.calls, 0);
    EXPECT_EQ(store->countAttendance("S001", class_id), 0u);
}

TEST_F(OrchestratorTest, RecognizedStudentIsMarkedOnce) {
    auto loop = make(*store);

    EXPECT_EQ(loop.tick(), 33ms);
    EXPECT_EQ(loop.context().state, LoopState::ACTIVE);
    EXPECT_EQ(loop.context().writes, 1u);
    auto rec = store->getLatestAttendance("S001", class_id);
    ASSERT_TRUE(rec);
    EXPECT_EQ(rec->status, AttendanceStatus::PRESENT);
    EXPECT_EQ(rec->marked_at, clock.now());

    clock.advance(1s);
    loop.tick();
    EXPECT_EQ(loop.context().writes, 1u);
    EXPECT_EQ(store->countAttendance("S001", class_id), 1u);
}

TEST_F(OrchestratorTest, CooldownExpiryRefreshesTimestamp) {
    auto loop = make(*store);
    const TimePoint first = clock.now();
    loop.tick();

    clock.advance(3s);
    loop.tick();
    EXPECT_EQ(loop.context().writes, 2u);
    EXPECT_EQ(store->countAttendance("S001", class_id), 1u);
    EXPECT_EQ(store->getLatestAttendance("S001", class_id)->marked_at, first + 3s);
}

TEST_F(OrchestratorTest, ClassStartIsRecordedInActivityLog) {
    auto loop = make(*store);
    loop.tick();
    const auto entries = store->activityEntries();
    ASSERT_FALSE(entries.empty());
    EXPECT_EQ(entries.front(), "Class started: Mathematics 101");
}

TEST_F(OrchestratorTest, UnreachableCameraRetriesAfterBackoff) {
    script->working_apis = {};
    auto loop = make(*store);

    EXPECT_EQ(loop.tick(), 5s);
    EXPECT_EQ(loop.context().state, LoopState::RECOVERING);
    EXPECT_EQ(embedder.calls, 0);

    clock.advance(2s);
    EXPECT_EQ(loop.tick(), 3s);
    EXPECT_EQ(script->attempted_apis.size(), 1u);

    script->working_apis = {cv::CAP_ANY};
    clock.advance(3s);
    EXPECT_EQ(loop.tick(), 33ms);
    EXPECT_EQ(loop.context().state, LoopState::ACTIVE);
    EXPECT_EQ(loop.context().writes, 1u);
}

TEST_F(OrchestratorTest, ReadFailureMovesToRecovering) {
    auto loop = make(*store);
    loop.tick();

    script->fail_reads = true;
    clock.advance(100ms);
    EXPECT_EQ(loop.tick(), 5s);
    EXPECT_EQ(loop.context().state, LoopState::RECOVERING);
    EXPECT_FALSE(source->is_open());
    EXPECT_EQ(script->releases, 1);

    script->fail_reads = false;
    clock.advance(5s);
    loop.tick();
    EXPECT_EQ(loop.context().state, LoopState::ACTIVE);
    EXPECT_EQ(script->opens, 2);
}

TEST_F(OrchestratorTest, ClassEndShutsCameraDown) {
    auto loop = make(*store);
    loop.tick();
    ASSERT_TRUE(source->is_open());

    clock.set(local_time(2026, 10, 19, 11, 0, 1));
    EXPECT_EQ(loop.tick(), 10s);
    EXPECT_EQ(loop.context().state, LoopState::IDLE);
    EXPECT_FALSE(loop.context().current_class);
    EXPECT_FALSE(source->is_open());
    EXPECT_EQ(loop.reconciler().debounce().size(), 0u);
    EXPECT_EQ(store->activityEntries().back(), "Camera shut down - no active class");
}

TEST_F(OrchestratorTest, ClassEndWhileRecoveringGoesIdleWithoutReopening) {
    script->working_apis = {};
    auto loop = make(*store);
    loop.tick();
    ASSERT_EQ(loop.context().state, LoopState::RECOVERING);
    ASSERT_EQ(script->attempted_apis.size(), 1u);

    clock.set(local_time(2026, 10, 19, 11, 0, 1));
    EXPECT_EQ(loop.tick(), 10s);
    EXPECT_EQ(loop.context().state, LoopState::IDLE);
    EXPECT_FALSE(loop.context().current_class);
    EXPECT_EQ(source->state(), FrameSource::State::CLOSED);
    EXPECT_EQ(script->attempted_apis.size(), 1u);
    EXPECT_EQ(embedder.calls, 0);
}

TEST_F(OrchestratorTest, RecognizerFailureIsAbsorbedAndLoopContinues) {
    embedder.fail_next = 1;
    auto loop = make(*store);

    EXPECT_EQ(loop.tick(), 33ms);
    EXPECT_EQ(loop.context().state, LoopState::ACTIVE);
    EXPECT_EQ(loop.context().tick_errors, 1u);
    EXPECT_EQ(loop.context().writes, 0u);
    EXPECT_TRUE(source->is_open());

    clock.advance(33ms);
    loop.tick();
    EXPECT_EQ(loop.context().tick_errors, 1u);
    EXPECT_EQ(loop.context().writes, 1u);
    EXPECT_EQ(store->countAttendance("S001", class_id), 1u);
}

TEST_F(OrchestratorTest, ClassChangeMarksStudentForNewClass) {
    const auto next_id =
        store->addClass("Physics", "2026-10-19", std::string("10:30:00"), std::string("11:30:00"));
    clock.set(local_time(2026, 10, 19, 10, 29, 59));
    auto loop = make(*store);
    loop.tick();
    EXPECT_EQ(store->countAttendance("S001", class_id), 1u);

    clock.advance(1s);
    loop.tick();
    ASSERT_TRUE(loop.context().current_class);
    EXPECT_EQ(loop.context().current_class->id, next_id);
    EXPECT_EQ(store->countAttendance("S001", next_id), 1u);
    EXPECT_EQ(script->opens, 1);
}

TEST_F(OrchestratorTest, ScheduleFailureBacksOffWithoutStateChange) {
    FaultyStore faulty(*store);
    auto loop = make(faulty);
    loop.tick();
    ASSERT_EQ(loop.context().state, LoopState::ACTIVE);

    faulty.fail_schedule = 1;
    clock.advance(100ms);
    EXPECT_EQ(loop.tick(), 5s);
    EXPECT_EQ(loop.context().state, LoopState::ACTIVE);
    EXPECT_EQ(loop.context().tick_errors, 1u);
    EXPECT_TRUE(source->is_open());

    clock.advance(100ms);
    EXPECT_EQ(loop.tick(), 33ms);
}

TEST_F(OrchestratorTest, FailedWriteIsRetriedOnNextSighting) {
    FaultyStore faulty(*store);
    faulty.fail_insert = 1;
    auto loop = make(faulty);

    loop.tick();
    EXPECT_EQ(loop.context().writes, 0u);
    EXPECT_EQ(loop.context().tick_errors, 1u);
    EXPECT_EQ(store->countAttendance("S001", class_id), 0u);

    clock.advance(33ms);
    loop.tick();
    EXPECT_EQ(loop.context().writes, 1u);
    EXPECT_EQ(store->countAttendance("S001", class_id), 1u);
}

TEST_F(OrchestratorTest, UnknownFacesAreNotMarked) {
    embedder.standing = {FaceEmbedding{cv::Rect(0, 0, 80, 80), unit_vector(128, 9)}};
    auto loop = make(*store);
    loop.tick();
    EXPECT_EQ(loop.context().frames, 1u);
    EXPECT_EQ(loop.context().writes, 0u);
}

TEST_F(OrchestratorTest, ObserverSeesEveryFrame) {
    auto loop = make(*store);
    int frames = 0;
    std::size_t seen_gallery = 0;
    loop.set_frame_observer([&](const FrameResult& r, const ClassWindow& cls, std::size_t size) {
        ++frames;
        seen_gallery = size;
        EXPECT_EQ(cls.id, class_id);
        EXPECT_EQ(r.dets.size(), 1u);
    });
    loop.tick();
    clock.advance(33ms);
    loop.tick();
    EXPECT_EQ(frames, 2);
    EXPECT_EQ(seen_gallery, 2u);
}

TEST_F(OrchestratorTest, RunReleasesCameraOnStop) {
    auto loop = make(*store);
    std::atomic<bool> stop{false};
    int ticks = 0;
    loop.run(stop, [&] {
        if (++ticks == 3) stop = true;
        clock.advance(33ms);
    });
    EXPECT_EQ(ticks, 3);
    EXPECT_FALSE(source->is_open());
    EXPECT_EQ(loop.context().state, LoopState::IDLE);
    EXPECT_EQ(store->countAttendance("S001", class_id), 1u);
}

TEST(LoopStateNames, AreLowercase) {
    EXPECT_STREQ(loop_state_to_string(LoopState::IDLE), "idle");
    EXPECT_STREQ(loop_state_to_string(LoopState::ACTIVE), "active");
    EXPECT_STREQ(loop_state_to_string(LoopState::RECOVERING), "recovering");
}

}  // namespace
}  // namespace attendance
