#include "strata/config.hpp"
#include <cstdlib>

namespace strata {

configuration configuration::from_environment() {
    configuration config;
    if (const char* path = std::getenv("STRATA_DATABASE_PATH"); path && *path) {
        config.path = path;
    }
    if (const char* level = std::getenv("STRATA_LOG_LEVEL"); level && *level) {
        config.level = log_level_from_string(level);
    }
    return config;
}

} // namespace strata
