#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include <opencv2/imgcodecs.hpp>

#include <spdlog/spdlog.h>

#include "clock.hpp"
#include "config.hpp"
#include "face_embedder.hpp"
#include "frame_report.hpp"
#include "logging.hpp"
#include "recognizer.hpp"
#include "store_factory.hpp"

// Single-shot frame check for web terminals:
//   attendance_frame <image_path> <class_id> <terminal_id>
// stdout carries exactly one JSON object.
int main(int argc, char** argv) {
    if (argc != 4) {
        std::cout << attendance::error_json("Usage: attendance_frame <image_path> <class_id> <terminal_id>")
                  << std::endl;
        return 1;
    }
    const std::string image_path = argv[1];
    const std::string terminal_id = argv[3];

    char* end = nullptr;
    const long long class_id = std::strtoll(argv[2], &end, 10);
    if (end == argv[2] || *end != '\0' || class_id <= 0) {
        std::cout << attendance::error_json(std::string("Invalid class id: ") + argv[2]) << std::endl;
        return 1;
    }

    attendance::AppConfig cfg;
    try {
        char* no_args[] = {argv[0], nullptr};
        cfg = attendance::parse_args(1, no_args);
        attendance::setup_stderr_logging(cfg.log_level);
        attendance::validate_config(cfg);
    } catch (const attendance::ConfigError& e) {
        std::cout << attendance::error_json(e.what()) << std::endl;
        return 2;
    }

    cv::Mat image = cv::imread(image_path, cv::IMREAD_COLOR);
    if (image.empty()) {
        spdlog::error("Could not load image {}", image_path);
        std::cout << attendance::error_json("Could not load image") << std::endl;
        return 1;
    }

    attendance::SfaceEmbedder embedder(cfg.detector_model, cfg.recognizer_model, cfg.detect_threshold);
    if (!embedder.ready()) {
        std::cout << attendance::error_json("Face models unavailable") << std::endl;
        return 2;
    }
    attendance::Recognizer recognizer(embedder, attendance::MatchParams{cfg.match_threshold, cfg.match_tolerance});

    std::unique_ptr<attendance::AttendanceStore> store = attendance::make_store(cfg.store);
    try {
        store->connect();
    } catch (const attendance::StoreError& e) {
        spdlog::error("Database connection failed: {}", e.what());
        std::cout << attendance::error_json(e.what()) << std::endl;
        return 2;
    }

    const attendance::FrameOutcome outcome =
        attendance::handle_frame(image, recognizer, *store, static_cast<std::size_t>(cfg.dimension), class_id,
                                 terminal_id, attendance::WallClock::now());
    std::cout << outcome.json << std::endl;
    if (!outcome.ok) return 2;
    return 0;
}
