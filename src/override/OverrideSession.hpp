#pragma once

#include "OverrideTypes.hpp"
#include "Collaborators.hpp"
#include "SessionStore.hpp"
#include "../helpers/memory/Memory.hpp"

#include <expected>
#include <optional>
#include <string>

namespace Override {
    /*
        Points the emulator config at a per-game card for the duration of one session.

        apply() remembers which key it overwrote and what that key held before,
        revert() writes exactly that value back to exactly that key. Only one
        override is tracked, a second apply() silently supersedes the first.
    */
    class COverrideSession {
      public:
        COverrideSession(SP<ISessionStore> store, SP<ITargetResolver> targets, SP<ICardProvider> cards);
        ~COverrideSession() = default;

        COverrideSession(const COverrideSession&) = delete;
        COverrideSession(COverrideSession&)       = delete;
        COverrideSession(COverrideSession&&)      = delete;

        std::expected<eApplyResult, SOverrideError> apply(const std::string& sessionId, const SGame& game, const SOverrideSettings& settings);
        eRevertResult                               revert(const std::string& sessionId);

        bool                                        hasActiveOverride() const;
        const std::optional<SSessionRecord>&        activeRecord() const;

      private:
        // platform id if the game should be handled, nullopt if it is silently out of scope
        std::expected<std::optional<std::string>, SOverrideError> checkPreconditions(const SGame& game, const SOverrideSettings& settings);
        void                                                      syncAlternateKeys(const SOverrideSettings& settings, const std::string& activeKey, const std::string& value);
        void                                                      ensureSlotEnabled(const SOverrideSettings& settings);

        SP<ISessionStore>                                         m_store;
        SP<ITargetResolver>                                       m_targets;
        SP<ICardProvider>                                         m_cards;
    };
};
