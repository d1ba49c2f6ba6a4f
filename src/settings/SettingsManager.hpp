#pragma once

#include "../override/OverrideTypes.hpp"
#include "../debug/log/Logger.hpp"
#include "../helpers/memory/Memory.hpp"

#include <hyprlang.hpp>

#include <expected>
#include <string>

#define STRVAL_EMPTY "[[EMPTY]]"

namespace Settings {
    class CSettingsManager {
      public:
        // missing files are fine, every value has a default
        CSettingsManager(const std::string& path);
        ~CSettingsManager() = default;

        CSettingsManager(const CSettingsManager&) = delete;
        CSettingsManager(CSettingsManager&)       = delete;
        CSettingsManager(CSettingsManager&&)      = delete;

        // $XDG_CONFIG_HOME/memlane/memlane.conf, or ~/.config/memlane/memlane.conf
        static std::string                 defaultPath();

        std::expected<void, std::string>   reload();

        const Override::SOverrideSettings& settings() const;
        const Log::SLogSettings&           logSettings() const;
        const std::string&                 path() const;

      private:
        void                        registerSettingsVar(const char* name, const Hyprlang::INT& val);
        void                        registerSettingsVar(const char* name, const Hyprlang::STRING& val);

        void                        refreshSnapshot();
        std::string                 getString(const char* name);
        bool                        getBool(const char* name);

        UP<Hyprlang::CConfig>       m_config;
        std::string                 m_path;

        Override::SOverrideSettings m_settings;
        Log::SLogSettings           m_logSettings;
    };
};
