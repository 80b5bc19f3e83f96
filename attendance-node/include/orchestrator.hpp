#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>

#include "attendance_store.hpp"
#include "attendance_writer.hpp"
#include "clock.hpp"
#include "frame_source.hpp"
#include "frame_types.hpp"
#include "gallery_loader.hpp"
#include "reconciler.hpp"
#include "recognizer.hpp"
#include "schedule_resolver.hpp"

namespace attendance {

enum class LoopState { IDLE, ACTIVE, RECOVERING };

const char* loop_state_to_string(LoopState state);

struct OrchestratorSettings {
    std::chrono::milliseconds frame_interval{33};
    std::chrono::milliseconds idle_poll{10000};
    std::chrono::milliseconds retry_backoff{5000};
    std::chrono::milliseconds cooldown{3000};
};

// Everything the loop mutates between ticks.
struct OrchestratorContext {
    LoopState state{LoopState::IDLE};
    std::optional<ClassWindow> current_class;
    TimePoint next_retry{};
    std::uint64_t frames{0};
    std::uint64_t writes{0};
    std::uint64_t tick_errors{0};
};

// Called after every processed frame; rendering lives outside the core.
using FrameObserver = std::function<void(const FrameResult&, const ClassWindow&, std::size_t gallery_size)>;

class Orchestrator {
public:
    Orchestrator(AttendanceStore& store,
                 FrameSource& source,
                 Recognizer& recognizer,
                 const GalleryHolder& gallery,
                 const Clock& clock,
                 OrchestratorSettings settings);

    // Runs one scheduling step and returns the delay before the next one.
    std::chrono::milliseconds tick();

    // Ticks until `stop` is set. `between_ticks` runs on the loop thread
    // before every tick. The camera is released on every exit path.
    void run(const std::atomic<bool>& stop, const std::function<void()>& between_ticks = {});

    void set_frame_observer(FrameObserver observer) { observer_ = std::move(observer); }

    const OrchestratorContext& context() const { return ctx_; }
    const DetectionReconciler& reconciler() const { return reconciler_; }

private:
    void begin_class(const ClassWindow& window);
    void go_idle();
    bool open_source(TimePoint now);
    std::chrono::milliseconds process_frame(TimePoint now);
    void log_activity(const std::string& text);
    void shutdown();

    AttendanceStore& store_;
    FrameSource& source_;
    Recognizer& recognizer_;
    const GalleryHolder& gallery_;
    const Clock& clock_;
    OrchestratorSettings settings_;

    ScheduleResolver resolver_;
    DetectionReconciler reconciler_;
    AttendanceWriter writer_;
    OrchestratorContext ctx_;
    FrameObserver observer_;
};

}  // namespace attendance
