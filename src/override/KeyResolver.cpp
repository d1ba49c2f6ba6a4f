#include "KeyResolver.hpp"
#include "../ini/IniEditor.hpp"
#include "../debug/log/Logger.hpp"

#include <hyprutils/string/String.hpp>

using namespace Override;
using namespace Hyprutils::String;

static std::optional<SResolvedKey> fromConfiguredKey(const SOverrideSettings& settings) {
    auto value = Ini::readValue(settings.configPath, settings.section, settings.key);
    if (!value)
        return std::nullopt;

    return SResolvedKey{.key = settings.key, .previousValue = std::move(value)};
}

static std::optional<SResolvedKey> fromDiscoveredKey(const SOverrideSettings& settings) {
    auto key = Ini::findCandidateKey(settings.configPath, settings.section, MEMORY_CARD_KEYS);
    if (!key)
        return std::nullopt;

    auto value = Ini::readValue(settings.configPath, settings.section, *key);
    return SResolvedKey{.key = std::move(*key), .previousValue = std::move(value)};
}

SResolvedKey Override::resolveKey(const SOverrideSettings& settings) {
    const bool DISCOVER_FIRST = settings.policy == KEY_RESOLUTION_DISCOVERED_FIRST;

    auto       resolved = DISCOVER_FIRST ? fromDiscoveredKey(settings) : fromConfiguredKey(settings);
    if (!resolved)
        resolved = DISCOVER_FIRST ? fromConfiguredKey(settings) : fromDiscoveredKey(settings);

    if (resolved) {
        Log::logger->log(Log::DEBUG, "resolveKey: using [{}] {} (previous value {})", settings.section, resolved->key, resolved->previousValue ? "found" : "not found");
        return std::move(*resolved);
    }

    Log::logger->log(Log::DEBUG, "resolveKey: no card key in [{}], defaulting to {}", settings.section, MEMORY_CARD_KEYS.front());
    return SResolvedKey{.key = MEMORY_CARD_KEYS.front(), .previousValue = std::nullopt};
}

bool Override::containsPathSeparator(std::string_view value) {
    return value.find_first_of("\\/:") != std::string_view::npos;
}

bool Override::shouldWriteFileNameOnly(const SOverrideSettings& settings, const std::optional<std::string>& previousValue) {
    if (settings.writeFileNameOnly)
        return true;

    if (!previousValue || trim(std::string_view{*previousValue}).empty())
        return false;

    return !containsPathSeparator(*previousValue);
}
