#pragma once

#include "override/OverrideSession.hpp"
#include "cards/MemoryCardManager.hpp"
#include "cards/PlatformCatalog.hpp"
#include "settings/SettingsManager.hpp"
#include "helpers/memory/Memory.hpp"

#include <expected>
#include <string>
#include <vector>

// Entry point for the embedding host. The host owns the lifecycle and calls
// onGameStarting / onGameStopped once each, with the same game.
class CMemoryLane {
  public:
    CMemoryLane(const std::string& settingsPath, std::vector<Cards::SPlatform> platforms);
    ~CMemoryLane() = default;

    CMemoryLane(const CMemoryLane&) = delete;
    CMemoryLane(CMemoryLane&)       = delete;
    CMemoryLane(CMemoryLane&&)      = delete;

    std::expected<void, std::string>                                reloadSettings();

    std::expected<Override::eApplyResult, Override::SOverrideError> onGameStarting(const Override::SGame& game);
    Override::eRevertResult                                         onGameStopped(const Override::SGame& game);

    Cards::SCardCreationResult                                      createMemoryCards(const std::vector<Override::SGame>& games);

    const Override::SOverrideSettings&                              settings() const;
    const Override::COverrideSession&                               session() const;

  private:
    UP<Settings::CSettingsManager>  m_settings;
    SP<Cards::CPlatformCatalog>     m_platforms;
    SP<Cards::CMemoryCardManager>   m_cards;
    UP<Override::COverrideSession>  m_session;
};
