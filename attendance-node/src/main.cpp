#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>

#include <opencv2/highgui.hpp>
#include <opencv2/imgproc.hpp>

#include <spdlog/spdlog.h>

#include "clock.hpp"
#include "config.hpp"
#include "face_embedder.hpp"
#include "frame_source.hpp"
#include "gallery_loader.hpp"
#include "logging.hpp"
#include "orchestrator.hpp"
#include "recognizer.hpp"
#include "schedule_resolver.hpp"
#include "store_factory.hpp"

using namespace std::chrono_literals;

namespace {

std::atomic<bool> g_stop{false};
std::atomic<bool> g_reload{false};

void on_signal(int sig) {
    if (sig == SIGHUP) {
        g_reload = true;
    } else {
        g_stop = true;
    }
}

cv::Mat annotate(const attendance::FrameResult& result, const attendance::ClassWindow& cls,
                 std::size_t gallery_size) {
    cv::Mat view = result.frame.clone();
    std::size_t recognized = 0;
    for (const auto& d : result.dets) {
        if (!d.matched()) continue;
        ++recognized;
        const cv::Scalar green(0, 255, 0);
        cv::rectangle(view, d.bbox, green, 2);
        const cv::Rect label_bg(d.bbox.x, d.bbox.y + d.bbox.height - 35, d.bbox.width, 35);
        cv::rectangle(view, label_bg, green, cv::FILLED);
        cv::putText(view, cv::format("%s (%.2f)", d.name.c_str(), d.confidence),
                    cv::Point(d.bbox.x + 6, d.bbox.y + d.bbox.height - 6),
                    cv::FONT_HERSHEY_DUPLEX, 0.6, cv::Scalar(255, 255, 255), 1);
    }
    cv::putText(view, "Class: " + cls.name, cv::Point(10, 30),
                cv::FONT_HERSHEY_SIMPLEX, 0.7, cv::Scalar(255, 255, 255), 2);
    cv::putText(view, cv::format("Known Students: %zu", gallery_size), cv::Point(10, 60),
                cv::FONT_HERSHEY_SIMPLEX, 0.7, cv::Scalar(255, 255, 255), 2);
    cv::putText(view, cv::format("Detected: %zu", recognized), cv::Point(10, 90),
                cv::FONT_HERSHEY_SIMPLEX, 0.7, cv::Scalar(0, 255, 0), 2);
    return view;
}

bool reload_gallery(attendance::AttendanceStore& store, attendance::GalleryHolder& holder, std::size_t dim) {
    try {
        attendance::GalleryLoad load = attendance::load_gallery(store, dim);
        if (!load.ok()) {
            spdlog::warn("Gallery reload found no valid encodings; keeping the current gallery");
            return false;
        }
        holder.replace(load.gallery);
        spdlog::info("Gallery reloaded: {} identities", load.valid);
        return true;
    } catch (const attendance::StoreError& e) {
        spdlog::error("Gallery reload failed: {}", e.what());
        return false;
    }
}

}  // namespace

int main(int argc, char** argv) {
    attendance::AppConfig cfg;
    try {
        cfg = attendance::parse_args(argc, argv);
        attendance::setup_logging(cfg.log_file, cfg.log_level);
        attendance::validate_config(cfg);
    } catch (const attendance::ConfigError& e) {
        std::cerr << "[ERROR] Configuration: " << e.what() << std::endl;
        return 2;
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "[ERROR] Logging setup: " << e.what() << std::endl;
        return 2;
    }

    spdlog::info("=== Attendance node starting ===");
    spdlog::info("source: {} | store: {} {} ({}@{}:{}) | cooldown: {} ms", cfg.source, cfg.store.backend,
                 cfg.store.database, cfg.store.user, cfg.store.host, cfg.store.port, cfg.cooldown_ms);

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
    std::signal(SIGHUP, on_signal);

    std::unique_ptr<attendance::AttendanceStore> store = attendance::make_store(cfg.store);
    const auto dim = static_cast<std::size_t>(cfg.dimension);

    // The store may come up after us; keep trying until it answers or we are told to stop.
    attendance::GalleryLoad load;
    for (;;) {
        try {
            store->connect();
            load = attendance::load_gallery(*store, dim);
            break;
        } catch (const attendance::StoreError& e) {
            spdlog::error("Database connection failed: {}; retrying in {} ms", e.what(), cfg.retry_backoff_ms);
        }
        for (int waited = 0; waited < cfg.retry_backoff_ms && !g_stop; waited += 100) {
            std::this_thread::sleep_for(100ms);
        }
        if (g_stop) return 0;
    }
    if (!load.ok()) {
        spdlog::error("No valid face encodings loaded - cannot start system");
        return 1;
    }

    attendance::GalleryHolder gallery;
    gallery.replace(load.gallery);

    attendance::SfaceEmbedder embedder(cfg.detector_model, cfg.recognizer_model, cfg.detect_threshold);
    if (!embedder.ready()) {
        spdlog::error("Face models unavailable - cannot start system");
        return 2;
    }
    attendance::Recognizer recognizer(embedder, attendance::MatchParams{cfg.match_threshold, cfg.match_tolerance});

    attendance::CaptureSettings capture;
    capture.source = cfg.source;
    capture.backends = cfg.backends;
    capture.width = cfg.frame_width;
    capture.height = cfg.frame_height;
    capture.fps = cfg.target_fps;
    capture.open_timeout_ms = cfg.open_timeout_ms;
    capture.read_timeout_ms = cfg.read_timeout_ms;
    attendance::FrameSource source(capture, [] { return std::make_unique<attendance::CvVideoDevice>(); });

    attendance::SystemClock clock;
    attendance::OrchestratorSettings settings;
    settings.frame_interval =
        std::max<std::chrono::milliseconds>(1ms, std::chrono::milliseconds(1000 / cfg.target_fps));
    settings.idle_poll = std::chrono::milliseconds(cfg.idle_poll_ms);
    settings.retry_backoff = std::chrono::milliseconds(cfg.retry_backoff_ms);
    settings.cooldown = std::chrono::milliseconds(cfg.cooldown_ms);

    try {
        attendance::ScheduleResolver resolver(*store);
        if (auto current = resolver.resolve_active(clock.now())) {
            spdlog::info("Active class found: {}", current->name);
        } else {
            spdlog::warn("No active class currently - waiting for class to start");
        }
    } catch (const attendance::StoreError& e) {
        spdlog::warn("Could not check the schedule yet: {}", e.what());
    }

    attendance::Orchestrator loop(*store, source, recognizer, gallery, clock, settings);

    bool window_open = false;
    if (cfg.show_window) {
        spdlog::info("Controls: press 'q' in the preview window to quit");
        loop.set_frame_observer([&](const attendance::FrameResult& result, const attendance::ClassWindow& cls,
                                    std::size_t gallery_size) {
            cv::imshow("Attendance Node", annotate(result, cls, gallery_size));
            window_open = true;
            const int key = cv::waitKey(1);
            if (key == 'q' || key == 27) {
                spdlog::info("User requested system shutdown");
                g_stop = true;
            }
        });
    }

    try {
        loop.run(g_stop, [&] {
            if (g_reload.exchange(false)) reload_gallery(*store, gallery, dim);
            if (window_open && loop.context().state != attendance::LoopState::ACTIVE) {
                cv::destroyAllWindows();
                window_open = false;
            }
        });
    } catch (const std::exception& e) {
        spdlog::critical("Attendance loop aborted: {}", e.what());
        if (cfg.show_window) cv::destroyAllWindows();
        return 1;
    }

    if (cfg.show_window) cv::destroyAllWindows();
    store->close();
    spdlog::info("=== Attendance node stopped ===");
    return 0;
}
