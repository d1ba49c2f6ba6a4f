#pragma once

#include <optional>
#include <string>

namespace Env {
    // true if the variable is set to anything but "" or "0"
    bool                       envEnabled(const std::string& env);

    std::optional<std::string> envValue(const std::string& env);

    bool                       isTrace();
};
