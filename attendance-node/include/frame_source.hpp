#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>

namespace attendance {

// Capture device boundary. Implementations never throw.
class VideoDevice {
public:
    virtual ~VideoDevice() = default;
    virtual bool open(const std::string& source, int api, const std::vector<int>& params) = 0;
    virtual bool read(cv::Mat& frame) = 0;
    virtual void configure(int width, int height, int fps) = 0;
    virtual bool is_opened() const = 0;
    virtual void release() = 0;
};

class CvVideoDevice : public VideoDevice {
public:
    bool open(const std::string& source, int api, const std::vector<int>& params) override;
    bool read(cv::Mat& frame) override;
    void configure(int width, int height, int fps) override;
    bool is_opened() const override { return cap_.isOpened(); }
    void release() override { cap_.release(); }

private:
    cv::VideoCapture cap_;
};

struct CaptureSettings {
    std::string source{"0"};
    std::vector<std::string> backends{"v4l2", "any"};
    int width{640};
    int height{480};
    int fps{30};
    int open_timeout_ms{5000};
    int read_timeout_ms{2000};
};

using DeviceFactory = std::function<std::unique_ptr<VideoDevice>()>;

class FrameSource {
public:
    enum class State { CLOSED, OPENING, OPEN, RETRYING };

    FrameSource(CaptureSettings settings, DeviceFactory factory);
    ~FrameSource();

    FrameSource(const FrameSource&) = delete;
    FrameSource& operator=(const FrameSource&) = delete;

    // Tries each backend in order and commits to the first that delivers a
    // real frame. false leaves the source in RETRYING.
    bool open();

    // false means the source must be closed and reopened.
    bool read(cv::Mat& frame);

    void close();

    State state() const { return state_; }
    bool is_open() const { return state_ == State::OPEN; }
    const std::string& active_backend() const { return active_backend_; }
    const std::string& last_error() const { return last_error_; }

private:
    CaptureSettings settings_;
    DeviceFactory factory_;
    std::unique_ptr<VideoDevice> device_;
    cv::Mat primed_;  // frame read while confirming the backend
    State state_{State::CLOSED};
    std::string active_backend_;
    std::string last_error_;
};

const char* state_to_string(FrameSource::State state);

}  // namespace attendance
