#pragma once

#include "OverrideTypes.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace Override {
    struct SResolvedKey {
        std::string                key;
        std::optional<std::string> previousValue;
    };

    // Picks the canonical key for the memory card value in settings.section and reads what it currently holds.
    // Falls back to the first known card key, with no previous value, if neither the configured key nor any known key is present.
    SResolvedKey resolveKey(const SOverrideSettings& settings);

    // '\\', '/' or ':' anywhere in the value marks it as a path rather than a bare file name
    bool         containsPathSeparator(std::string_view value);

    bool         shouldWriteFileNameOnly(const SOverrideSettings& settings, const std::optional<std::string>& previousValue);
};
