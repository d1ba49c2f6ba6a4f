#include "Logger.hpp"

using namespace Log;

CLogger::CLogger() {
    const auto IS_TRACE = Env::isTrace();
    m_logger.setLogLevel(IS_TRACE ? Hyprutils::CLI::LOG_TRACE : Hyprutils::CLI::LOG_DEBUG);
    m_logger.setEnableRolling(true);
    m_logger.setEnableColor(false);
    m_logger.setEnableStdout(true);
    m_logger.setTime(false);
}

void CLogger::log(Hyprutils::CLI::eLogLevel level, const std::string_view& str) {

    static bool TRACE = Env::isTrace();

    if (!m_logsEnabled)
        return;

    if (level == Hyprutils::CLI::LOG_TRACE && !TRACE)
        return;

    m_logger.log(level, str);
}

void CLogger::recheckCfg(const SLogSettings& settings) {
    m_logger.setEnableStdout(!settings.disableLogs && settings.enableStdout);
    m_logsEnabled = !settings.disableLogs;
    m_logger.setTime(!settings.disableTime);
    m_logger.setEnableColor(settings.coloredStdout);

    // only reopen when the target changed, the rolling log survives reloads
    if (!settings.logFile.empty() && settings.logFile != m_logFile) {
        m_logFile = settings.logFile;
        // NOLINTNEXTLINE
        m_logger.setOutputFile(m_logFile);
    }
}

const std::string& CLogger::rolling() {
    return m_logger.rollingLog();
}
