#pragma once

#include <string>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/objdetect.hpp>

namespace attendance {

struct FaceEmbedding {
    cv::Rect bbox;
    std::vector<float> feature;
};

// External face capability: locate faces in a BGR frame and extract one
// feature vector per face.
class FaceEmbedder {
public:
    virtual ~FaceEmbedder() = default;
    virtual std::vector<FaceEmbedding> embed(const cv::Mat& frame) = 0;
};

// YuNet detector + SFace recognizer from OpenCV's objdetect module. Features
// are L2 normalized so Euclidean distances fall in [0, 2].
class SfaceEmbedder : public FaceEmbedder {
public:
    SfaceEmbedder(const std::string& detector_model,
                  const std::string& recognizer_model,
                  float score_threshold);

    bool ready() const { return ready_; }

    std::vector<FaceEmbedding> embed(const cv::Mat& frame) override;

private:
    cv::Ptr<cv::FaceDetectorYN> detector_;
    cv::Ptr<cv::FaceRecognizerSF> recognizer_;
    bool ready_{false};
};

}  // namespace attendance
