#include "SettingsManager.hpp"
#include "../helpers/fs/FsUtils.hpp"
#include "../ini/IniEditor.hpp"

#include <any>

using namespace Settings;

CSettingsManager::CSettingsManager(const std::string& path) : m_path(path) {
    m_config = makeUnique<Hyprlang::CConfig>(m_path.c_str(), Hyprlang::SConfigOptions{.throwAllErrors = true, .allowMissingConfig = true});

    registerSettingsVar("general:enable_auto_switch", Hyprlang::INT{0});
    registerSettingsVar("general:restore_on_exit", Hyprlang::INT{1});
    registerSettingsVar("general:platform", {STRVAL_EMPTY});

    registerSettingsVar("cards:output_folder", {STRVAL_EMPTY});
    registerSettingsVar("cards:template", {STRVAL_EMPTY});
    registerSettingsVar("cards:auto_create", Hyprlang::INT{0});
    registerSettingsVar("cards:write_file_name_only", Hyprlang::INT{0});

    registerSettingsVar("pcsx2:config_path", {STRVAL_EMPTY});
    registerSettingsVar("pcsx2:section", {"MemoryCards"});
    registerSettingsVar("pcsx2:key", {"Slot1_Filename"});
    registerSettingsVar("pcsx2:resolution", {"configured"});

    registerSettingsVar("debug:disable_logs", Hyprlang::INT{0});
    registerSettingsVar("debug:disable_time", Hyprlang::INT{1});
    registerSettingsVar("debug:enable_stdout_logs", Hyprlang::INT{1});
    registerSettingsVar("debug:colored_stdout_logs", Hyprlang::INT{0});
    registerSettingsVar("debug:log_file", {STRVAL_EMPTY});

    m_config->commence();

    refreshSnapshot();
}

std::string CSettingsManager::defaultPath() {
    const auto HOME = NFsUtils::getConfigHome();
    if (!HOME)
        return "memlane.conf";

    return *HOME + "memlane.conf";
}

void CSettingsManager::registerSettingsVar(const char* name, const Hyprlang::INT& val) {
    m_config->addConfigValue(name, val);
}

void CSettingsManager::registerSettingsVar(const char* name, const Hyprlang::STRING& val) {
    m_config->addConfigValue(name, val);
}

std::expected<void, std::string> CSettingsManager::reload() {
    const auto RESULT = m_config->parse();

    // keep whatever parsed, hyprlang falls back to defaults for broken lines
    refreshSnapshot();
    Log::logger->recheckCfg(m_logSettings);

    if (RESULT.error) {
        Log::logger->log(Log::ERR, "CSettingsManager: errors in {}: {}", m_path, RESULT.getError());
        return std::unexpected(std::string{RESULT.getError()});
    }

    Log::logger->log(Log::DEBUG, "CSettingsManager: loaded {}", m_path);
    return {};
}

const Override::SOverrideSettings& CSettingsManager::settings() const {
    return m_settings;
}

const Log::SLogSettings& CSettingsManager::logSettings() const {
    return m_logSettings;
}

const std::string& CSettingsManager::path() const {
    return m_path;
}

std::string CSettingsManager::getString(const char* name) {
    const std::string VAL = std::any_cast<Hyprlang::STRING>(m_config->getConfigValue(name));
    return VAL == STRVAL_EMPTY ? "" : VAL;
}

bool CSettingsManager::getBool(const char* name) {
    return std::any_cast<Hyprlang::INT>(m_config->getConfigValue(name)) != 0;
}

void CSettingsManager::refreshSnapshot() {
    Override::SOverrideSettings s;

    s.enableAutoSwitch      = getBool("general:enable_auto_switch");
    s.restoreOnExit         = getBool("general:restore_on_exit");
    s.platformId            = getString("general:platform");
    s.outputFolder          = getString("cards:output_folder");
    s.templatePath          = getString("cards:template");
    s.autoCreateMissingCard = getBool("cards:auto_create");
    s.writeFileNameOnly     = getBool("cards:write_file_name_only");
    s.configPath            = getString("pcsx2:config_path");
    s.section               = getString("pcsx2:section");
    s.key                   = getString("pcsx2:key");

    const auto POLICY = getString("pcsx2:resolution");
    if (Ini::equalsIgnoreCase(POLICY, "discovered"))
        s.policy = Override::KEY_RESOLUTION_DISCOVERED_FIRST;
    else {
        if (!Ini::equalsIgnoreCase(POLICY, "configured"))
            Log::logger->log(Log::WARN, "CSettingsManager: unknown pcsx2:resolution \"{}\", using configured", POLICY);
        s.policy = Override::KEY_RESOLUTION_CONFIGURED_FIRST;
    }

    m_settings = std::move(s);

    m_logSettings = Log::SLogSettings{
        .disableLogs   = getBool("debug:disable_logs"),
        .disableTime   = getBool("debug:disable_time"),
        .enableStdout  = getBool("debug:enable_stdout_logs"),
        .coloredStdout = getBool("debug:colored_stdout_logs"),
        .logFile       = getString("debug:log_file"),
    };
}
