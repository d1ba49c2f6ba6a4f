#pragma once

#include "../override/Collaborators.hpp"

#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace Cards {
    inline constexpr const char* DEFAULT_CARD_EXTENSION = ".ps2";

    struct SCardCreationResult {
        size_t                   totalGames = 0;
        size_t                   created    = 0;
        size_t                   skipped    = 0;
        size_t                   failed     = 0;

        std::vector<std::string> errors;
        std::vector<std::string> notes;

        void                     addError(const std::string& message);
        void                     addNote(const std::string& message);

        // counts, then notes, then errors
        std::string buildSummaryMessage() const;
    };

    // trims and replaces characters that can't appear in a file name with '_'
    std::string safeFileName(std::string_view name);

    // extension of the template including the dot, DEFAULT_CARD_EXTENSION if it has none
    std::string templateExtension(const std::string& templatePath);

    // <safe name><ext>, or <safe name>_<id prefix><ext> if the name was already used in this run.
    // usedNames holds lowercased names.
    std::string cardFileName(const Override::SGame& game, const std::string& extension, std::unordered_set<std::string>& usedNames);

    class CMemoryCardManager : public Override::ICardProvider {
      public:
        CMemoryCardManager()          = default;
        virtual ~CMemoryCardManager() = default;

        virtual std::expected<Override::SCardFile, Override::SOverrideError> provideCard(const Override::SGame& game, const std::string& platformId,
                                                                                         const Override::SOverrideSettings& settings);

        // one card per game of the platform, existing cards are left alone
        SCardCreationResult createMemoryCards(const std::vector<Override::SGame>& games, const std::string& platformId, const std::string& templatePath,
                                              const std::string& outputFolder);

      private:
        bool validateInputs(const std::string& platformId, const std::string& templatePath, const std::string& outputFolder, SCardCreationResult& result);
    };
};
