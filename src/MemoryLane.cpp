#include "MemoryLane.hpp"
#include "override/SessionStore.hpp"
#include "debug/log/Logger.hpp"

using namespace Override;

CMemoryLane::CMemoryLane(const std::string& settingsPath, std::vector<Cards::SPlatform> platforms) {
    m_settings  = makeUnique<Settings::CSettingsManager>(settingsPath);
    m_platforms = makeShared<Cards::CPlatformCatalog>(std::move(platforms));
    m_cards     = makeShared<Cards::CMemoryCardManager>();
    m_session   = makeUnique<COverrideSession>(makeShared<CMemorySessionStore>(), m_platforms, m_cards);

    if (const auto RET = reloadSettings(); !RET)
        Log::logger->log(Log::WARN, "CMemoryLane: starting with partial settings: {}", RET.error());
}

std::expected<void, std::string> CMemoryLane::reloadSettings() {
    return m_settings->reload();
}

std::expected<eApplyResult, SOverrideError> CMemoryLane::onGameStarting(const SGame& game) {
    return m_session->apply(game.id, game, m_settings->settings());
}

eRevertResult CMemoryLane::onGameStopped(const SGame& game) {
    const auto& SETTINGS = m_settings->settings();
    if (!SETTINGS.enableAutoSwitch || !SETTINGS.restoreOnExit)
        return REVERT_RESULT_NOOP;

    return m_session->revert(game.id);
}

Cards::SCardCreationResult CMemoryLane::createMemoryCards(const std::vector<SGame>& games) {
    const auto& SETTINGS = m_settings->settings();
    const auto  PLATFORM = m_platforms->resolvePlatformId(SETTINGS.platformId);

    return m_cards->createMemoryCards(games, PLATFORM.value_or(""), SETTINGS.templatePath, SETTINGS.outputFolder);
}

const SOverrideSettings& CMemoryLane::settings() const {
    return m_settings->settings();
}

const COverrideSession& CMemoryLane::session() const {
    return *m_session;
}
