#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "frame_types.hpp"

namespace attendance {

// Expiring student-id -> deadline map, swept on use instead of one timer per
// student.
class DebounceSet {
public:
    bool contains(const std::string& id) const { return entries_.count(id) != 0; }
    void arm(const std::string& id, TimePoint expiry) { entries_[id] = expiry; }
    void erase(const std::string& id) { entries_.erase(id); }
    std::size_t sweep(TimePoint now);
    void clear() { entries_.clear(); }
    std::size_t size() const { return entries_.size(); }

private:
    std::unordered_map<std::string, TimePoint> entries_;
};

// Turns one frame of detections into attendance transition intents, at most
// one per student per cool-down within a class. Single-threaded.
class DetectionReconciler {
public:
    explicit DetectionReconciler(std::chrono::milliseconds cooldown) : cooldown_(cooldown) {}

    std::vector<TransitionIntent> reconcile(const std::optional<ClassWindow>& window,
                                            const std::vector<Detection>& dets,
                                            TimePoint now);

    // Drops the class context and every pending cool-down.
    void reset();

    // Lifts the cool-down of one student so the next sighting retries a
    // write that did not commit.
    void release(const std::string& student_id) { debounce_.erase(student_id); }

    const DebounceSet& debounce() const { return debounce_; }
    std::optional<std::int64_t> current_class() const { return class_id_; }

private:
    std::chrono::milliseconds cooldown_;
    DebounceSet debounce_;
    std::optional<std::int64_t> class_id_;
};

}  // namespace attendance
