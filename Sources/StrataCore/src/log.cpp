#include "strata/log.hpp"
#include "strata/errors.hpp"
#include <cctype>
#include <string>

namespace strata {

// Single definition of the global log level (declared extern in log.hpp).
std::atomic<log_level> g_log_level{log_level::off};

log_level log_level_from_string(const char* name) {
    std::string s(name ? name : "");
    for (char& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (s == "off") return log_level::off;
    if (s == "error") return log_level::error;
    if (s == "warn") return log_level::warn;
    if (s == "info") return log_level::info;
    if (s == "debug") return log_level::debug;
    throw invalid_argument_error("Unknown log level '" + std::string(name ? name : "") + "'");
}

} // namespace strata
