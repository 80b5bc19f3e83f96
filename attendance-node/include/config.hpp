#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace attendance {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

constexpr int kMaxFps = 1000;

struct StoreConfig {
    std::string backend{"mysql"};     // "mysql" or "sqlite"
    std::string host{"localhost"};
    std::string user{};
    std::string password{};
    std::string database{};           // schema name, or the file path for sqlite
    int port{3306};
    int timeout_ms{5000};
};

struct AppConfig {
    StoreConfig store{};

    std::string source{"0"};          // camera index as string or URL/path
    std::vector<std::string> backends{"v4l2", "any"};
    int frame_width{640};
    int frame_height{480};
    int target_fps{30};
    int open_timeout_ms{5000};
    int read_timeout_ms{2000};

    std::string detector_model{"models/face_detection_yunet_2023mar.onnx"};
    std::string recognizer_model{"models/face_recognition_sface_2021dec.onnx"};
    float detect_threshold{0.9f};
    float match_threshold{0.6f};      // distance must be strictly below
    float match_tolerance{0.6f};      // match flag: distance <= tolerance
    int dimension{128};

    int cooldown_ms{3000};
    int idle_poll_ms{10000};
    int retry_backoff_ms{5000};

    std::string log_file{"attendance_system.log"};
    std::string log_level{"info"};
    bool show_window{false};
};

// Defaults, then environment, then command line.
AppConfig parse_args(int argc, char** argv);

// Throws ConfigError describing the first invalid option.
// The frame rate is capped at kMaxFps so the frame interval stays >= 1 ms.
void validate_config(const AppConfig& cfg);

// cv::VideoCaptureAPIs value for a backend name, or -1 when unknown.
int backend_api(const std::string& name);

std::vector<std::string> split_list(const std::string& csv);

}  // namespace attendance
