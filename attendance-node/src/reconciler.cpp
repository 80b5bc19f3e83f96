#include "reconciler.hpp"

#include <spdlog/spdlog.h>

namespace attendance {

std::size_t DebounceSet::sweep(TimePoint now) {
    std::size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second <= now) {
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

std::vector<TransitionIntent> DetectionReconciler::reconcile(const std::optional<ClassWindow>& window,
                                                             const std::vector<Detection>& dets,
                                                             TimePoint now) {
    std::vector<TransitionIntent> intents;
    if (!window) {
        reset();
        return intents;
    }

    debounce_.sweep(now);

    if (class_id_ != window->id) {
        if (class_id_) {
            spdlog::info("Class context changed {} -> {}; clearing {} cool-downs",
                         *class_id_, window->id, debounce_.size());
        }
        debounce_.clear();
        class_id_ = window->id;
    }

    for (const auto& det : dets) {
        if (!det.matched()) continue;
        const std::string& id = *det.identity_id;
        if (debounce_.contains(id)) {
            spdlog::debug("Suppressed repeat detection of {}", id);
            continue;
        }
        intents.push_back(TransitionIntent{id, window->id, AttendanceStatus::PRESENT, now, "camera"});
        debounce_.arm(id, now + cooldown_);
    }
    return intents;
}

void DetectionReconciler::reset() {
    debounce_.clear();
    class_id_.reset();
}

}  // namespace attendance
