#include "face_embedder.hpp"

#include <opencv2/dnn.hpp>

#include <spdlog/spdlog.h>

namespace attendance {

SfaceEmbedder::SfaceEmbedder(const std::string& detector_model,
                             const std::string& recognizer_model,
                             float score_threshold) {
    try {
        detector_ = cv::FaceDetectorYN::create(detector_model, "", cv::Size(320, 320),
                                               score_threshold, 0.3f, 5000,
                                               cv::dnn::DNN_BACKEND_OPENCV, cv::dnn::DNN_TARGET_CPU);
        recognizer_ = cv::FaceRecognizerSF::create(recognizer_model, "",
                                                   cv::dnn::DNN_BACKEND_OPENCV, cv::dnn::DNN_TARGET_CPU);
        ready_ = !detector_.empty() && !recognizer_.empty();
        spdlog::info("Loaded face models: {} / {}", detector_model, recognizer_model);
    } catch (const cv::Exception& e) {
        spdlog::error("Could not load face models: {}", e.what());
        ready_ = false;
    }
}

std::vector<FaceEmbedding> SfaceEmbedder::embed(const cv::Mat& frame) {
    std::vector<FaceEmbedding> out;
    if (!ready_ || frame.empty()) return out;

    cv::Mat faces;
    detector_->setInputSize(frame.size());
    detector_->detect(frame, faces);
    if (faces.empty()) return out;

    const cv::Rect bounds(0, 0, frame.cols, frame.rows);
    for (int i = 0; i < faces.rows; ++i) {
        cv::Mat aligned, feature;
        recognizer_->alignCrop(frame, faces.row(i), aligned);
        recognizer_->feature(aligned, feature);

        cv::Mat normalized;
        cv::normalize(feature.reshape(1, 1), normalized);
        normalized.convertTo(normalized, CV_32F);

        FaceEmbedding emb;
        emb.bbox = cv::Rect(static_cast<int>(faces.at<float>(i, 0)), static_cast<int>(faces.at<float>(i, 1)),
                            static_cast<int>(faces.at<float>(i, 2)), static_cast<int>(faces.at<float>(i, 3))) &
                   bounds;
        emb.feature.assign(normalized.ptr<float>(0), normalized.ptr<float>(0) + normalized.cols);
        out.push_back(std::move(emb));
    }
    return out;
}

}  // namespace attendance
