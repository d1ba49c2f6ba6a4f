#include "FsUtils.hpp"
#include "../../debug/log/Logger.hpp"
#include "../env/Env.hpp"

#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>

std::optional<std::string> NFsUtils::getConfigHome() {
    const auto  CONFIG_HOME = Env::envValue("XDG_CONFIG_HOME");

    std::string configRoot;

    if (!CONFIG_HOME) {
        const auto HOME = Env::envValue("HOME");

        if (!HOME) {
            Log::logger->log(Log::ERR, "FsUtils::getConfigHome: can't get config home: no $HOME or $XDG_CONFIG_HOME");
            return std::nullopt;
        }

        configRoot = *HOME + "/.config/";
    } else
        configRoot = *CONFIG_HOME + "/";

    return configRoot + "memlane/";
}

std::optional<std::string> NFsUtils::readFileAsString(const std::string& path) {
    std::error_code ec;

    if (!std::filesystem::is_regular_file(path, ec) || ec)
        return std::nullopt;

    std::ifstream file(path, std::ios::binary);
    if (!file.good())
        return std::nullopt;

    std::string content((std::istreambuf_iterator<char>(file)), (std::istreambuf_iterator<char>()));
    if (file.bad())
        return std::nullopt;

    return content;
}

bool NFsUtils::writeToFile(const std::string& path, const std::string& content) {
    std::ofstream of(path, std::ios::binary | std::ios::trunc);
    if (!of.good()) {
        Log::logger->log(Log::ERR, "FsUtils::writeToFile: couldn't open {} for writing", path);
        return false;
    }

    of << content;
    of.close();

    if (of.fail()) {
        Log::logger->log(Log::ERR, "FsUtils::writeToFile: write to {} failed", path);
        return false;
    }

    return true;
}

std::expected<void, std::string> NFsUtils::copyFile(const std::string& from, const std::string& to) {
    std::error_code ec;

    const auto      PARENT = std::filesystem::path{to}.parent_path();
    if (!PARENT.empty() && !std::filesystem::exists(PARENT, ec)) {
        std::filesystem::create_directories(PARENT, ec);
        if (ec)
            return std::unexpected(std::format("Failed to create folder {}: {}", PARENT.string(), ec.message()));
    }

    if (!std::filesystem::copy_file(from, to, std::filesystem::copy_options::none, ec) || ec)
        return std::unexpected(std::format("Failed to copy {} to {}: {}", from, to, ec ? ec.message() : std::string{"destination exists"}));

    return {};
}
