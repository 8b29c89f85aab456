#pragma once
#include <string>

namespace ResponseManager {
    // Random phrase for a key; unknown keys are returned unchanged
    std::string get(const std::string& keyOrMessage);
}
