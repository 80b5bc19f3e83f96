#include "recognizer.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include <spdlog/spdlog.h>

namespace attendance {

float euclidean_distance(const std::vector<float>& a, const std::vector<float>& b) {
    double sum = 0.0;
    for (std::size_t i = 0; i < a.size(); ++i) {
        const double d = static_cast<double>(a[i]) - static_cast<double>(b[i]);
        sum += d * d;
    }
    return static_cast<float>(std::sqrt(sum));
}

Recognizer::Recognizer(FaceEmbedder& embedder, MatchParams params)
    : embedder_(embedder), params_(params) {}

Detection Recognizer::match(const FaceEmbedding& face, const Gallery& gallery) const {
    Detection det;
    det.bbox = face.bbox;
    if (gallery.empty()) return det;

    if (face.feature.size() != gallery.dimension) {
        spdlog::warn("Face feature has {} values, gallery expects {}; reporting as unmatched",
                     face.feature.size(), gallery.dimension);
        return det;
    }

    std::size_t best = 0;
    float best_distance = std::numeric_limits<float>::max();
    for (std::size_t i = 0; i < gallery.identities.size(); ++i) {
        const float d = euclidean_distance(face.feature, gallery.identities[i].feature);
        if (d < best_distance) {
            best_distance = d;
            best = i;
        }
    }

    det.distance = best_distance;
    const bool match_flag = best_distance <= params_.tolerance;
    if (match_flag && best_distance < params_.threshold) {
        const Identity& who = gallery.identities[best];
        det.identity_id = who.id;
        det.name = who.name;
        det.confidence = std::clamp(1.0f - best_distance, 0.0f, 1.0f);
    }
    return det;
}

std::vector<Detection> Recognizer::detect(const cv::Mat& frame, const Gallery& gallery) {
    std::vector<Detection> dets;
    for (const auto& face : embedder_.embed(frame)) {
        Detection det = match(face, gallery);
        if (det.matched()) {
            spdlog::info("RECOGNIZED: {} ({}) - confidence {:.2f}", det.name, *det.identity_id, det.confidence);
        }
        dets.push_back(std::move(det));
    }
    return dets;
}

}  // namespace attendance
