/// @file src/core/config.cpp
/// @brief EngineConfig environment overrides.

#include "topsis/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

namespace topsis::core {

namespace {

/// True for "1", "true", "yes", "on" (case-insensitive).
bool is_truthy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value == "1" || value == "true" || value == "yes" || value == "on";
}

}  // anonymous namespace

EngineConfig config_from_environment() {
    EngineConfig config;
    if (const char* verbose = std::getenv("TOPSIS_VERBOSE")) {
        config.verbose = is_truthy(verbose);
    }
    return config;
}

}  // namespace topsis::core
