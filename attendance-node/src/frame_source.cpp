#include "frame_source.hpp"

#include <spdlog/spdlog.h>

#include "config.hpp"

namespace attendance {

bool CvVideoDevice::open(const std::string& source, int api, const std::vector<int>& params) {
    try {
        // Allow numeric index or URL
        std::size_t used = 0;
        int idx = -1;
        try {
            idx = std::stoi(source, &used);
        } catch (const std::exception&) {
            used = 0;
        }
        if (used == source.size() && idx >= 0) {
            return cap_.open(idx, api, params);
        }
        return cap_.open(source, api, params);
    } catch (const cv::Exception& e) {
        spdlog::warn("Capture open raised: {}", e.what());
        cap_.release();
        return false;
    }
}

bool CvVideoDevice::read(cv::Mat& frame) {
    try {
        return cap_.read(frame) && !frame.empty();
    } catch (const cv::Exception& e) {
        spdlog::warn("Capture read raised: {}", e.what());
        return false;
    }
}

void CvVideoDevice::configure(int width, int height, int fps) {
    cap_.set(cv::CAP_PROP_FRAME_WIDTH, width);
    cap_.set(cv::CAP_PROP_FRAME_HEIGHT, height);
    cap_.set(cv::CAP_PROP_FPS, fps);
}

const char* state_to_string(FrameSource::State state) {
    switch (state) {
        case FrameSource::State::CLOSED: return "closed";
        case FrameSource::State::OPENING: return "opening";
        case FrameSource::State::OPEN: return "open";
        case FrameSource::State::RETRYING: return "retrying";
    }
    return "closed";
}

FrameSource::FrameSource(CaptureSettings settings, DeviceFactory factory)
    : settings_(std::move(settings)), factory_(std::move(factory)) {}

FrameSource::~FrameSource() {
    close();
}

bool FrameSource::open() {
    if (state_ == State::OPEN) return true;
    state_ = State::OPENING;
    last_error_.clear();

    const std::vector<int> params{
        cv::CAP_PROP_OPEN_TIMEOUT_MSEC, settings_.open_timeout_ms,
        cv::CAP_PROP_READ_TIMEOUT_MSEC, settings_.read_timeout_ms,
    };

    for (const auto& name : settings_.backends) {
        const int api = backend_api(name);
        if (api < 0) {
            spdlog::warn("Skipping unknown camera backend: {}", name);
            continue;
        }
        spdlog::info("Trying camera {} with backend: {}", settings_.source, name);

        std::unique_ptr<VideoDevice> dev = factory_();
        if (!dev || !dev->open(settings_.source, api, params) || !dev->is_opened()) {
            last_error_ = "backend " + name + " failed to open";
            spdlog::warn("Backend {} failed to open", name);
            if (dev) dev->release();
            continue;
        }

        cv::Mat first;
        if (!dev->read(first) || first.empty()) {
            last_error_ = "backend " + name + " opened but delivered no frame";
            spdlog::warn("Backend {} opened but delivered no frame", name);
            dev->release();
            continue;
        }

        dev->configure(settings_.width, settings_.height, settings_.fps);
        device_ = std::move(dev);
        primed_ = first;
        active_backend_ = name;
        state_ = State::OPEN;
        spdlog::info("Camera initialized successfully with backend {}", name);
        return true;
    }

    if (last_error_.empty()) last_error_ = "no usable camera backend";
    spdlog::error("All camera backends failed: {}", last_error_);
    state_ = State::RETRYING;
    return false;
}

bool FrameSource::read(cv::Mat& frame) {
    if (state_ != State::OPEN || !device_) return false;
    if (!primed_.empty()) {
        frame = primed_;
        primed_.release();
        return true;
    }
    if (!device_->read(frame) || frame.empty()) {
        last_error_ = "frame read failed";
        return false;
    }
    return true;
}

void FrameSource::close() {
    if (device_) {
        device_->release();
        device_.reset();
        spdlog::info("Camera released");
    }
    primed_.release();
    active_backend_.clear();
    state_ = State::CLOSED;
}

}  // namespace attendance
