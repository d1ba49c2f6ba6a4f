#pragma once

#include "OverrideTypes.hpp"

#include <expected>
#include <optional>
#include <string>

namespace Override {
    // decides whether a game is handled at all
    class ITargetResolver {
      protected:
        ITargetResolver() = default;

      public:
        virtual ~ITargetResolver() = default;

        virtual std::optional<std::string> resolvePlatformId(const std::string& configured) = 0;
        virtual bool                       isInScope(const SGame& game, const std::string& platformId) = 0;
    };

    // produces the card the config should point at, creating it if allowed
    class ICardProvider {
      protected:
        ICardProvider() = default;

      public:
        virtual ~ICardProvider() = default;

        virtual std::expected<SCardFile, SOverrideError> provideCard(const SGame& game, const std::string& platformId, const SOverrideSettings& settings) = 0;
    };
};
