#include "config.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <sstream>

#include <opencv2/videoio.hpp>

namespace attendance {

static bool arg_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

static int to_int(const char* s, const char* what) {
    char* end = nullptr;
    errno = 0;
    const long v = std::strtol(s, &end, 10);
    if (end == s || *end != '\0') {
        throw ConfigError(std::string("invalid integer for ") + what + ": " + s);
    }
    if (errno == ERANGE || v < INT_MIN || v > INT_MAX) {
        throw ConfigError(std::string("integer out of range for ") + what + ": " + s);
    }
    return static_cast<int>(v);
}

static float to_float(const char* s, const char* what) {
    char* end = nullptr;
    const float v = std::strtof(s, &end);
    if (end == s || *end != '\0') {
        throw ConfigError(std::string("invalid number for ") + what + ": " + s);
    }
    return v;
}

std::vector<std::string> split_list(const std::string& csv) {
    std::vector<std::string> out;
    std::stringstream ss(csv);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item.erase(std::remove_if(item.begin(), item.end(),
                                  [](unsigned char c) { return std::isspace(c); }),
                   item.end());
        if (!item.empty()) out.push_back(item);
    }
    return out;
}

int backend_api(const std::string& name) {
    std::string n;
    for (char c : name) n.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (n == "any") return cv::CAP_ANY;
    if (n == "v4l2" || n == "v4l") return cv::CAP_V4L2;
    if (n == "gstreamer") return cv::CAP_GSTREAMER;
    if (n == "ffmpeg") return cv::CAP_FFMPEG;
    if (n == "dshow") return cv::CAP_DSHOW;
    if (n == "msmf") return cv::CAP_MSMF;
    if (n == "avfoundation") return cv::CAP_AVFOUNDATION;
    return -1;
}

static void print_usage() {
    std::cout << "Usage: attendance_node [--source <src>] [--backends <a,b,..>]\n"
              << "                       [--width <px>] [--height <px>] [--fps <int>]\n"
              << "                       [--open-timeout-ms <ms>] [--read-timeout-ms <ms>]\n"
              << "                       [--detector-model <onnx>] [--recognizer-model <onnx>]\n"
              << "                       [--detect-threshold <f>] [--match-threshold <f>]\n"
              << "                       [--match-tolerance <f>] [--dimension <int>]\n"
              << "                       [--cooldown-ms <ms>] [--idle-poll-ms <ms>]\n"
              << "                       [--retry-backoff-ms <ms>] [--db-backend mysql|sqlite]\n"
              << "                       [--db-timeout-ms <ms>]\n"
              << "                       [--log-file <path>] [--log-level <lvl>] [--show-window]\n"
              << "Store: DB_BACKEND (mysql|sqlite), DB_HOST, DB_USER, DB_PASSWORD, DB_PORT,\n"
              << "       DB_NAME (schema name, or database file for sqlite)\n";
}

AppConfig parse_args(int argc, char** argv) {
    AppConfig cfg;

    if (const char* v = std::getenv("DB_BACKEND")) cfg.store.backend = v;
    if (const char* v = std::getenv("DB_HOST")) cfg.store.host = v;
    if (const char* v = std::getenv("DB_USER")) cfg.store.user = v;
    if (const char* v = std::getenv("DB_PASSWORD")) cfg.store.password = v;
    if (const char* v = std::getenv("DB_NAME")) cfg.store.database = v;
    if (const char* v = std::getenv("DB_PORT")) cfg.store.port = to_int(v, "DB_PORT");
    if (const char* v = std::getenv("VIDEO_SOURCE")) cfg.source = v;
    if (const char* v = std::getenv("CAMERA_BACKENDS")) cfg.backends = split_list(v);
    if (const char* v = std::getenv("DETECTOR_MODEL")) cfg.detector_model = v;
    if (const char* v = std::getenv("RECOGNIZER_MODEL")) cfg.recognizer_model = v;
    if (const char* v = std::getenv("LOG_FILE")) cfg.log_file = v;
    if (const char* v = std::getenv("LOG_LEVEL")) cfg.log_level = v;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        auto next = [&](int offset = 1) -> const char* {
            if (i + offset < argc) return argv[i + offset];
            return nullptr;
        };

        if (arg_eq(arg, "--source") && next()) {
            cfg.source = next();
            i++;
        } else if (arg_eq(arg, "--backends") && next()) {
            cfg.backends = split_list(next());
            i++;
        } else if (arg_eq(arg, "--width") && next()) {
            cfg.frame_width = to_int(next(), "--width");
            i++;
        } else if (arg_eq(arg, "--height") && next()) {
            cfg.frame_height = to_int(next(), "--height");
            i++;
        } else if (arg_eq(arg, "--fps") && next()) {
            cfg.target_fps = to_int(next(), "--fps");
            i++;
        } else if (arg_eq(arg, "--open-timeout-ms") && next()) {
            cfg.open_timeout_ms = to_int(next(), "--open-timeout-ms");
            i++;
        } else if (arg_eq(arg, "--read-timeout-ms") && next()) {
            cfg.read_timeout_ms = to_int(next(), "--read-timeout-ms");
            i++;
        } else if (arg_eq(arg, "--detector-model") && next()) {
            cfg.detector_model = next();
            i++;
        } else if (arg_eq(arg, "--recognizer-model") && next()) {
            cfg.recognizer_model = next();
            i++;
        } else if (arg_eq(arg, "--detect-threshold") && next()) {
            cfg.detect_threshold = to_float(next(), "--detect-threshold");
            i++;
        } else if (arg_eq(arg, "--match-threshold") && next()) {
            cfg.match_threshold = to_float(next(), "--match-threshold");
            i++;
        } else if (arg_eq(arg, "--match-tolerance") && next()) {
            cfg.match_tolerance = to_float(next(), "--match-tolerance");
            i++;
        } else if (arg_eq(arg, "--dimension") && next()) {
            cfg.dimension = to_int(next(), "--dimension");
            i++;
        } else if (arg_eq(arg, "--cooldown-ms") && next()) {
            cfg.cooldown_ms = to_int(next(), "--cooldown-ms");
            i++;
        } else if (arg_eq(arg, "--idle-poll-ms") && next()) {
            cfg.idle_poll_ms = to_int(next(), "--idle-poll-ms");
            i++;
        } else if (arg_eq(arg, "--retry-backoff-ms") && next()) {
            cfg.retry_backoff_ms = to_int(next(), "--retry-backoff-ms");
            i++;
        } else if (arg_eq(arg, "--db-backend") && next()) {
            cfg.store.backend = next();
            i++;
        } else if (arg_eq(arg, "--db-timeout-ms") && next()) {
            cfg.store.timeout_ms = to_int(next(), "--db-timeout-ms");
            i++;
        } else if (arg_eq(arg, "--log-file") && next()) {
            cfg.log_file = next();
            i++;
        } else if (arg_eq(arg, "--log-level") && next()) {
            cfg.log_level = next();
            i++;
        } else if (arg_eq(arg, "--show-window")) {
            cfg.show_window = true;
        } else if (arg_eq(arg, "--help")) {
            print_usage();
            std::exit(0);
        } else {
            throw ConfigError(std::string("unrecognized option: ") + arg);
        }
    }

    return cfg;
}

void validate_config(const AppConfig& cfg) {
    if (cfg.store.backend != "mysql" && cfg.store.backend != "sqlite") {
        throw ConfigError("unknown store backend: " + cfg.store.backend);
    }
    if (cfg.store.database.empty()) {
        throw ConfigError("DB_NAME is not set");
    }
    if (cfg.store.backend == "mysql" && (cfg.store.host.empty() || cfg.store.user.empty())) {
        throw ConfigError("DB_HOST and DB_USER are required for the mysql store");
    }
    if (cfg.store.port <= 0 || cfg.store.port > 65535) {
        throw ConfigError("DB_PORT out of range: " + std::to_string(cfg.store.port));
    }
    if (cfg.store.timeout_ms <= 0) throw ConfigError("store timeout must be positive");
    if (cfg.source.empty()) throw ConfigError("video source is empty");
    if (cfg.backends.empty()) throw ConfigError("no camera backends configured");
    for (const auto& b : cfg.backends) {
        if (backend_api(b) < 0) throw ConfigError("unknown camera backend: " + b);
    }
    if (cfg.target_fps <= 0 || cfg.target_fps > kMaxFps) {
        throw ConfigError("fps must be in 1.." + std::to_string(kMaxFps));
    }
    if (cfg.open_timeout_ms <= 0 || cfg.read_timeout_ms <= 0) {
        throw ConfigError("camera timeouts must be positive");
    }
    if (cfg.match_threshold <= 0.0f || cfg.match_threshold > 2.0f ||
        cfg.match_tolerance <= 0.0f || cfg.match_tolerance > 2.0f) {
        throw ConfigError("match threshold/tolerance must be in (0, 2]");
    }
    if (cfg.dimension <= 0) throw ConfigError("feature dimension must be positive");
    if (cfg.cooldown_ms <= 0 || cfg.idle_poll_ms <= 0 || cfg.retry_backoff_ms <= 0) {
        throw ConfigError("cooldown, idle poll and retry backoff must be positive");
    }
}

}  // namespace attendance
