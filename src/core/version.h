#pragma once
#include <string_view>

namespace core {
    constexpr std::string_view APP_NAME = "EnvGrid Engine";
    constexpr std::string_view APP_VERSION = "1.2.0";
    // Bumped whenever the on-disk run layout changes.
    constexpr int ARTIFACT_SCHEMA_VERSION = 1;
}
