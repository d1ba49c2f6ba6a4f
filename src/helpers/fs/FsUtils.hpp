#pragma once
#include <expected>
#include <optional>
#include <string>

namespace NFsUtils {
    // Returns the memlane directory in config home (with trailing slash). Does not create it.
    std::optional<std::string>        getConfigHome();

    // Reads the whole file, verbatim. nullopt if missing or unreadable.
    std::optional<std::string>        readFileAsString(const std::string& path);

    // overwrites the file if exists
    bool                              writeToFile(const std::string& path, const std::string& content);

    // copies from -> to, creating the parent folders of to. Fails if to exists.
    std::expected<void, std::string> copyFile(const std::string& from, const std::string& to);
};
