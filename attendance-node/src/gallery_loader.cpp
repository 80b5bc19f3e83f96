#include "gallery_loader.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <memory>

#include <spdlog/spdlog.h>

namespace attendance {

std::optional<std::vector<float>> parse_feature_vector(const std::string& text, std::size_t dimension) {
    std::vector<float> out;
    out.reserve(dimension);

    const char* p = text.c_str();
    const char* const end = p + text.size();
    while (p < end && std::isspace(static_cast<unsigned char>(*p))) ++p;
    if (p == end) return std::nullopt;

    while (p < end) {
        char* stop = nullptr;
        errno = 0;
        const float v = std::strtof(p, &stop);
        if (stop == p || errno == ERANGE || !std::isfinite(v)) return std::nullopt;
        out.push_back(v);
        p = stop;
        while (p < end && std::isspace(static_cast<unsigned char>(*p))) ++p;
        if (p == end) break;
        if (*p != ',') return std::nullopt;
        ++p;
        if (p == end) return std::nullopt;  // dangling separator
    }

    if (out.size() != dimension) return std::nullopt;
    return out;
}

GalleryLoad load_gallery(AttendanceStore& store, std::size_t dimension) {
    const std::vector<StudentRow> rows = store.getStudentsWithEncoding();

    auto gallery = std::make_shared<Gallery>();
    gallery->dimension = dimension;

    GalleryLoad result;
    for (const auto& row : rows) {
        auto feature = parse_feature_vector(row.encoding, dimension);
        if (!feature) {
            ++result.invalid;
            spdlog::warn("Skipped invalid encoding for {} ({})", row.name, row.id);
            continue;
        }
        gallery->identities.push_back(Identity{row.id, row.name, std::move(*feature)});
        ++result.valid;
        spdlog::debug("Loaded valid encoding for {} ({})", row.name, row.id);
    }

    spdlog::info("Face encoding summary: {} valid, {} invalid", result.valid, result.invalid);
    if (result.valid == 0) {
        spdlog::error("No valid face encodings found");
        result.status = GalleryStatus::EMPTY;
    } else {
        result.status = GalleryStatus::OK;
    }
    result.gallery = std::move(gallery);
    return result;
}

}  // namespace attendance
