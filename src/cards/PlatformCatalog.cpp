#include "PlatformCatalog.hpp"
#include "../ini/IniEditor.hpp"
#include "../debug/log/Logger.hpp"

#include <algorithm>
#include <array>

using namespace Cards;

static constexpr std::array<const char*, 3> PS2_PLATFORM_NAMES = {"Sony PlayStation 2", "PlayStation 2", "PS2"};

CPlatformCatalog::CPlatformCatalog(std::vector<SPlatform> platforms) : m_platforms(std::move(platforms)) {
    ;
}

std::optional<std::string> CPlatformCatalog::resolvePlatformId(const std::string& configured) {
    if (!configured.empty()) {
        const auto IT = std::ranges::find_if(m_platforms, [&configured](const auto& p) { return p.id == configured; });
        if (IT != m_platforms.end())
            return IT->id;

        Log::logger->log(Log::WARN, "CPlatformCatalog: configured platform {} is unknown, trying auto-detect", configured);
    }

    for (const auto& name : PS2_PLATFORM_NAMES) {
        const auto IT = std::ranges::find_if(m_platforms, [name](const auto& p) { return Ini::equalsIgnoreCase(p.name, name); });
        if (IT != m_platforms.end())
            return IT->id;
    }

    return std::nullopt;
}

bool CPlatformCatalog::isInScope(const Override::SGame& game, const std::string& platformId) {
    return std::ranges::find(game.platformIds, platformId) != game.platformIds.end();
}
