#include "orchestrator.hpp"

#include <algorithm>
#include <thread>

#include <spdlog/spdlog.h>

namespace attendance {

using namespace std::chrono_literals;

const char* loop_state_to_string(LoopState state) {
    switch (state) {
        case LoopState::IDLE: return "idle";
        case LoopState::ACTIVE: return "active";
        case LoopState::RECOVERING: return "recovering";
    }
    return "idle";
}

Orchestrator::Orchestrator(AttendanceStore& store,
                           FrameSource& source,
                           Recognizer& recognizer,
                           const GalleryHolder& gallery,
                           const Clock& clock,
                           OrchestratorSettings settings)
    : store_(store),
      source_(source),
      recognizer_(recognizer),
      gallery_(gallery),
      clock_(clock),
      settings_(settings),
      resolver_(store),
      reconciler_(settings.cooldown),
      writer_(store) {}

std::chrono::milliseconds Orchestrator::tick() {
    const TimePoint now = clock_.now();

    std::optional<ClassWindow> window;
    try {
        window = resolver_.resolve_active(now);
    } catch (const StoreError& e) {
        // Keep the current state; the schedule is unknown, not empty.
        spdlog::error("Error getting current class: {}", e.what());
        ++ctx_.tick_errors;
        return settings_.retry_backoff;
    }

    if (!window) {
        if (ctx_.state != LoopState::IDLE) go_idle();
        return settings_.idle_poll;
    }

    if (ctx_.state == LoopState::IDLE) {
        begin_class(*window);
        if (!open_source(now)) return settings_.retry_backoff;
    } else if (ctx_.current_class->id != window->id) {
        spdlog::info("*** CLASS ENDED: {} (ID: {}) ***", ctx_.current_class->name, ctx_.current_class->id);
        begin_class(*window);
    } else {
        ctx_.current_class = window;
    }

    if (ctx_.state == LoopState::RECOVERING) {
        if (now < ctx_.next_retry) {
            return std::max<std::chrono::milliseconds>(
                std::chrono::duration_cast<std::chrono::milliseconds>(ctx_.next_retry - now), 1ms);
        }
        if (!open_source(now)) return settings_.retry_backoff;
    }

    return process_frame(now);
}

void Orchestrator::begin_class(const ClassWindow& window) {
    ctx_.current_class = window;
    spdlog::info("*** CLASS STARTED: {} (ID: {}) {}-{} ***", window.name, window.id,
                 format_time_of_day(window.start), format_time_of_day(window.end));
    log_activity("Class started: " + window.name);
}

void Orchestrator::go_idle() {
    const LoopState from = ctx_.state;
    source_.close();
    reconciler_.reset();
    if (ctx_.current_class) {
        spdlog::info("*** CLASS ENDED: {} (ID: {}) ***", ctx_.current_class->name, ctx_.current_class->id);
    }
    ctx_.current_class.reset();
    ctx_.state = LoopState::IDLE;
    spdlog::info("No active class - camera shut down (was {})", loop_state_to_string(from));
    log_activity("Camera shut down - no active class");
}

bool Orchestrator::open_source(TimePoint now) {
    if (source_.open()) {
        ctx_.state = LoopState::ACTIVE;
        spdlog::info("Camera up ({}), class {} active", source_.active_backend(), ctx_.current_class->name);
        return true;
    }
    ctx_.state = LoopState::RECOVERING;
    ctx_.next_retry = now + settings_.retry_backoff;
    spdlog::error("Failed to initialize camera ({}), retrying in {} ms", source_.last_error(),
                  settings_.retry_backoff.count());
    return false;
}

std::chrono::milliseconds Orchestrator::process_frame(TimePoint now) {
    cv::Mat frame;
    if (!source_.read(frame)) {
        spdlog::warn("Camera down: {}", source_.last_error());
        source_.close();
        ctx_.state = LoopState::RECOVERING;
        ctx_.next_retry = now + settings_.retry_backoff;
        return settings_.retry_backoff;
    }
    ++ctx_.frames;

    try {
        const GallerySnapshot gallery = gallery_.snapshot();
        FrameResult result;
        result.frame = frame;
        result.timestamp = now;
        if (gallery) {
            result.dets = recognizer_.detect(frame, *gallery);
        }

        const ClassWindow& cls = *ctx_.current_class;
        for (const auto& intent : reconciler_.reconcile(ctx_.current_class, result.dets, now)) {
            try {
                writer_.apply(intent, cls.name);
                ++ctx_.writes;
            } catch (const StoreError& e) {
                spdlog::error("Error marking attendance for {}: {}", intent.student_id, e.what());
                reconciler_.release(intent.student_id);
                ++ctx_.tick_errors;
            }
        }

        if (observer_) observer_(result, cls, gallery ? gallery->size() : 0);
    } catch (const std::exception& e) {
        spdlog::error("Frame processing error: {}", e.what());
        ++ctx_.tick_errors;
    }
    return settings_.frame_interval;
}

void Orchestrator::log_activity(const std::string& text) {
    try {
        store_.appendActivityLog(text);
    } catch (const StoreError& e) {
        spdlog::error("Error logging activity: {}", e.what());
    }
}

void Orchestrator::shutdown() {
    source_.close();
    reconciler_.reset();
    ctx_.current_class.reset();
    ctx_.state = LoopState::IDLE;
}

void Orchestrator::run(const std::atomic<bool>& stop, const std::function<void()>& between_ticks) {
    spdlog::info("Starting main attendance marking loop");
    try {
        while (!stop.load()) {
            if (between_ticks) between_ticks();
            auto remaining = tick();
            // Sleep in short slices so a stop request is honored promptly.
            while (remaining > 0ms && !stop.load()) {
                const auto slice = std::min<std::chrono::milliseconds>(remaining, 100ms);
                std::this_thread::sleep_for(slice);
                remaining -= slice;
            }
        }
    } catch (...) {
        shutdown();
        throw;
    }
    shutdown();
    spdlog::info("Attendance loop stopped ({} frames, {} writes, {} errors)", ctx_.frames, ctx_.writes,
                 ctx_.tick_errors);
}

}  // namespace attendance
