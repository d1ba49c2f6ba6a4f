#pragma once

#include "../override/Collaborators.hpp"

#include <string>
#include <vector>

namespace Cards {
    struct SPlatform {
        std::string id;
        std::string name;
    };

    class CPlatformCatalog : public Override::ITargetResolver {
      public:
        CPlatformCatalog(std::vector<SPlatform> platforms);
        virtual ~CPlatformCatalog() = default;

        // a configured id that exists wins, otherwise auto-detect the PS2 platform by name
        virtual std::optional<std::string> resolvePlatformId(const std::string& configured);
        virtual bool                       isInScope(const Override::SGame& game, const std::string& platformId);

      private:
        std::vector<SPlatform> m_platforms;
    };
};
