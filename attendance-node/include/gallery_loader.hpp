#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "attendance_store.hpp"
#include "frame_types.hpp"

namespace attendance {

enum class GalleryStatus { OK, EMPTY };

struct GalleryLoad {
    GallerySnapshot gallery;
    std::size_t valid{0};
    std::size_t invalid{0};
    GalleryStatus status{GalleryStatus::EMPTY};

    bool ok() const { return status == GalleryStatus::OK; }
};

// Parses a comma separated feature vector. nullopt when the payload is
// empty, holds a non-numeric or non-finite token, or has the wrong length.
std::optional<std::vector<float>> parse_feature_vector(const std::string& text, std::size_t dimension);

// Reads every student row and keeps those with a valid feature vector.
// Store failures propagate as StoreError.
GalleryLoad load_gallery(AttendanceStore& store, std::size_t dimension);

// Publishes the current gallery snapshot; reload swaps the whole pointer.
class GalleryHolder {
public:
    GallerySnapshot snapshot() const {
        std::lock_guard<std::mutex> lock(mu_);
        return current_;
    }

    void replace(GallerySnapshot next) {
        std::lock_guard<std::mutex> lock(mu_);
        current_ = std::move(next);
    }

private:
    mutable std::mutex mu_;
    GallerySnapshot current_;
};

}  // namespace attendance
