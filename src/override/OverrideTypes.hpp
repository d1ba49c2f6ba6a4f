#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Override {
    // keys PCSX2 has used for the slot 1 card over its versions, in priority order
    inline const std::array<std::string, 2> MEMORY_CARD_KEYS = {"Slot1_Filename", "Mcd001"};
    inline const std::array<std::string, 1> SLOT_ENABLE_KEYS = {"Slot1_Enable"};

    inline constexpr const char*            FOLDERS_SECTION     = "Folders";
    inline constexpr const char*            FOLDERS_CARDS_KEY   = "MemoryCards";
    inline constexpr const char*            SLOT_ENABLED_VALUE  = "true";

    enum eKeyResolutionPolicy : uint8_t {
        KEY_RESOLUTION_CONFIGURED_FIRST = 0,
        KEY_RESOLUTION_DISCOVERED_FIRST,
    };

    struct SOverrideSettings {
        bool                 enableAutoSwitch      = false;
        bool                 restoreOnExit         = true;
        std::string          platformId            = "";
        std::string          outputFolder          = "";
        std::string          templatePath          = "";
        bool                 autoCreateMissingCard = false;
        bool                 writeFileNameOnly     = false;
        std::string          configPath            = "";
        std::string          section               = "MemoryCards";
        std::string          key                   = "Slot1_Filename";
        eKeyResolutionPolicy policy                = KEY_RESOLUTION_CONFIGURED_FIRST;
    };

    struct SGame {
        std::string              id;
        std::string              name;
        std::vector<std::string> platformIds;
    };

    struct SCardFile {
        std::string fileName;
        std::string fullPath;
    };

    enum eOverrideError : uint8_t {
        OVERRIDE_ERROR_VALIDATION = 0,
        OVERRIDE_ERROR_IO,
    };

    struct SOverrideError {
        eOverrideError type = OVERRIDE_ERROR_VALIDATION;
        std::string    message;
    };

    enum eApplyResult : uint8_t {
        APPLY_RESULT_APPLIED = 0,
        APPLY_RESULT_SKIPPED, // disabled, or the game is out of scope
    };

    enum eRevertResult : uint8_t {
        REVERT_RESULT_NOOP = 0,
        REVERT_RESULT_RESTORED,
        REVERT_RESULT_FAILED,
    };

    struct SSessionRecord {
        std::string                sessionId;
        std::string                configPath;
        std::string                section;
        std::string                key;
        std::optional<std::string> previousValue; // nullopt: the key had no value before the override
    };
};
