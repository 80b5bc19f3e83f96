#include "store_factory.hpp"

#include "mysql_store.hpp"
#include "sqlite_store.hpp"

namespace attendance {

std::unique_ptr<AttendanceStore> make_store(const StoreConfig& cfg) {
    if (cfg.backend == "mysql") return std::make_unique<MysqlStore>(cfg);
    if (cfg.backend == "sqlite") return std::make_unique<SqliteStore>(cfg);
    throw ConfigError("unknown store backend: " + cfg.backend);
}

}  // namespace attendance
