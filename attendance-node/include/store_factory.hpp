#pragma once

#include <memory>

#include "attendance_store.hpp"
#include "config.hpp"

namespace attendance {

// Unconnected store for cfg.backend ("mysql" or "sqlite"). Throws
// ConfigError for any other backend name.
std::unique_ptr<AttendanceStore> make_store(const StoreConfig& cfg);

}  // namespace attendance
