#pragma once

#include <hyprutils/cli/Logger.hpp>

#include <format>
#include <string>
#include <string_view>

#include "../../helpers/memory/Memory.hpp"
#include "../../helpers/env/Env.hpp"

namespace Log {
    struct SLogSettings {
        bool        disableLogs   = false;
        bool        disableTime   = true;
        bool        enableStdout  = true;
        bool        coloredStdout = false;
        std::string logFile       = "";
    };

    class CLogger {
      public:
        CLogger();
        ~CLogger() = default;

        void recheckCfg(const SLogSettings& settings);

        void log(Hyprutils::CLI::eLogLevel level, const std::string_view& str);

        template <typename... Args>
        //NOLINTNEXTLINE
        void log(Hyprutils::CLI::eLogLevel level, std::format_string<Args...> fmt, Args&&... args) {
            static bool TRACE = Env::isTrace();

            if (!m_logsEnabled)
                return;

            if (level == Hyprutils::CLI::LOG_TRACE && !TRACE)
                return;

            std::string logMsg = "";

            // std::format_string<Args...> catches bad specifiers at compile time, vformat won't throw here
            logMsg += std::vformat(fmt.get(), std::make_format_args(args...));

            log(level, logMsg);
        }

        // recent output, kept in memory regardless of the file/stdout targets
        const std::string& rolling();

      private:
        Hyprutils::CLI::CLogger m_logger;
        bool                    m_logsEnabled = true;
        std::string             m_logFile;
    };

    inline UP<CLogger> logger = makeUnique<CLogger>();

    //
    inline constexpr const Hyprutils::CLI::eLogLevel DEBUG = Hyprutils::CLI::LOG_DEBUG;
    inline constexpr const Hyprutils::CLI::eLogLevel WARN  = Hyprutils::CLI::LOG_WARN;
    inline constexpr const Hyprutils::CLI::eLogLevel ERR   = Hyprutils::CLI::LOG_ERR;
    inline constexpr const Hyprutils::CLI::eLogLevel CRIT  = Hyprutils::CLI::LOG_CRIT;
    inline constexpr const Hyprutils::CLI::eLogLevel TRACE = Hyprutils::CLI::LOG_TRACE;
};
