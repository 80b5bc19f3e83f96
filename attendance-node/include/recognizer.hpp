#pragma once

#include <vector>

#include <opencv2/core.hpp>

#include "face_embedder.hpp"
#include "frame_types.hpp"

namespace attendance {

struct MatchParams {
    float threshold{0.6f};   // accepted distance is strictly below this
    float tolerance{0.6f};   // match flag: distance <= tolerance
};

class Recognizer {
public:
    Recognizer(FaceEmbedder& embedder, MatchParams params);

    // One Detection per face found, matched or not.
    std::vector<Detection> detect(const cv::Mat& frame, const Gallery& gallery);

    // Best gallery match for a single feature vector.
    Detection match(const FaceEmbedding& face, const Gallery& gallery) const;

private:
    FaceEmbedder& embedder_;
    MatchParams params_;
};

float euclidean_distance(const std::vector<float>& a, const std::vector<float>& b);

}  // namespace attendance
