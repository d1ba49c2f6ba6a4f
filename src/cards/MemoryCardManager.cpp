#include "MemoryCardManager.hpp"
#include "../helpers/fs/FsUtils.hpp"
#include "../debug/log/Logger.hpp"

#include <hyprutils/string/String.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <format>

using namespace Cards;
using namespace Override;
using namespace Hyprutils::String;

static std::string toLower(std::string_view in) {
    std::string out{in};
    std::ranges::transform(out, out.begin(), [](unsigned char c) { return std::tolower(c); });
    return out;
}

static bool isInvalidFileNameChar(unsigned char c) {
    if (c < 32)
        return true;

    switch (c) {
        case '<':
        case '>':
        case ':':
        case '"':
        case '/':
        case '\\':
        case '|':
        case '?':
        case '*': return true;
        default: return false;
    }
}

static std::string shortId(const std::string& id) {
    std::string compact;
    for (const auto& c : id) {
        if (c != '-' && c != '{' && c != '}')
            compact += c;
    }

    return toLower(compact.substr(0, 8));
}

void SCardCreationResult::addError(const std::string& message) {
    if (!trim(std::string_view{message}).empty())
        errors.emplace_back(message);
}

void SCardCreationResult::addNote(const std::string& message) {
    if (!trim(std::string_view{message}).empty())
        notes.emplace_back(message);
}

std::string SCardCreationResult::buildSummaryMessage() const {
    std::string builder;
    builder += std::format("Games scanned: {}\n", totalGames);
    builder += std::format("Created: {}\n", created);
    builder += std::format("Skipped (already exists): {}\n", skipped);
    builder += std::format("Failed: {}\n", failed);

    if (!notes.empty()) {
        builder += "\nNotes:\n";
        for (const auto& n : notes) {
            builder += n + "\n";
        }
    }

    if (!errors.empty()) {
        builder += "\nErrors:\n";
        for (const auto& e : errors) {
            builder += e + "\n";
        }
    }

    return std::string{trim(std::string_view{builder})};
}

std::string Cards::safeFileName(std::string_view name) {
    std::string safe{trim(name)};

    for (auto& c : safe) {
        if (isInvalidFileNameChar(c))
            c = '_';
    }

    return std::string{trim(std::string_view{safe})};
}

std::string Cards::templateExtension(const std::string& templatePath) {
    const auto EXT = std::filesystem::path{templatePath}.extension().string();
    return EXT.empty() || EXT == "." ? DEFAULT_CARD_EXTENSION : EXT;
}

std::string Cards::cardFileName(const SGame& game, const std::string& extension, std::unordered_set<std::string>& usedNames) {
    auto safeName = safeFileName(game.name);
    if (safeName.empty())
        safeName = game.id;

    const auto FILE_NAME = safeName + extension;
    if (usedNames.emplace(toLower(FILE_NAME)).second)
        return FILE_NAME;

    const auto UNIQUE_NAME = std::format("{}_{}{}", safeName, shortId(game.id), extension);
    usedNames.emplace(toLower(UNIQUE_NAME));
    return UNIQUE_NAME;
}

std::expected<SCardFile, SOverrideError> CMemoryCardManager::provideCard(const SGame& game, const std::string& platformId, const SOverrideSettings& settings) {
    std::unordered_set<std::string> usedNames;

    SCardFile                       card;
    card.fileName = cardFileName(game, templateExtension(settings.templatePath), usedNames);
    card.fullPath = (std::filesystem::path{settings.outputFolder} / card.fileName).string();

    std::error_code ec;
    if (std::filesystem::exists(card.fullPath, ec) && !ec)
        return card;

    if (!settings.autoCreateMissingCard)
        return std::unexpected(SOverrideError{.type = OVERRIDE_ERROR_VALIDATION, .message = std::format("Memory card does not exist for \"{}\".", game.name)});

    if (trim(std::string_view{settings.templatePath}).empty() || !std::filesystem::is_regular_file(settings.templatePath, ec) || ec)
        return std::unexpected(SOverrideError{.type = OVERRIDE_ERROR_VALIDATION, .message = "Auto-create is enabled but the template memory card path is invalid."});

    if (const auto RET = NFsUtils::copyFile(settings.templatePath, card.fullPath); !RET)
        return std::unexpected(SOverrideError{.type = OVERRIDE_ERROR_IO, .message = std::format("Failed to create memory card from template: {}", RET.error())});

    Log::logger->log(Log::DEBUG, "CMemoryCardManager: created {} for {} (platform {})", card.fullPath, game.name, platformId);

    return card;
}

bool CMemoryCardManager::validateInputs(const std::string& platformId, const std::string& templatePath, const std::string& outputFolder, SCardCreationResult& result) {
    std::error_code ec;

    if (platformId.empty())
        result.addError("Please select a platform.");

    if (trim(std::string_view{templatePath}).empty() || !std::filesystem::is_regular_file(templatePath, ec) || ec)
        result.addError("Template memory card file is missing or invalid.");

    if (trim(std::string_view{outputFolder}).empty())
        result.addError("Please select an output folder.");

    return result.errors.empty();
}

SCardCreationResult CMemoryCardManager::createMemoryCards(const std::vector<SGame>& games, const std::string& platformId, const std::string& templatePath,
                                                          const std::string& outputFolder) {
    SCardCreationResult result;
    if (!validateInputs(platformId, templatePath, outputFolder, result))
        return result;

    std::vector<const SGame*> selected;
    for (const auto& g : games) {
        if (std::ranges::find(g.platformIds, platformId) != g.platformIds.end())
            selected.emplace_back(&g);
    }

    std::ranges::sort(selected, [](const SGame* a, const SGame* b) {
        const auto LA = toLower(a->name), LB = toLower(b->name);
        if (LA != LB)
            return LA < LB;
        return a->id < b->id;
    });

    result.totalGames = selected.size();
    if (selected.empty()) {
        result.addNote("No games found for the selected platform.");
        return result;
    }

    std::error_code ec;
    std::filesystem::create_directories(outputFolder, ec);
    if (ec) {
        result.addError(std::format("Failed to create output folder {}: {}", outputFolder, ec.message()));
        return result;
    }

    std::unordered_set<std::string> usedNames;
    const auto                      EXTENSION = templateExtension(templatePath);

    for (const auto* game : selected) {
        const auto FILE_NAME   = cardFileName(*game, EXTENSION, usedNames);
        const auto DESTINATION = (std::filesystem::path{outputFolder} / FILE_NAME).string();

        if (std::filesystem::exists(DESTINATION, ec) && !ec) {
            result.skipped++;
            continue;
        }

        if (const auto RET = NFsUtils::copyFile(templatePath, DESTINATION); !RET) {
            result.failed++;
            result.addError(std::format("Failed to create memory card for \"{}\": {}", game->name, RET.error()));
            continue;
        }

        result.created++;
    }

    Log::logger->log(Log::DEBUG, "CMemoryCardManager::createMemoryCards: {} created, {} skipped, {} failed", result.created, result.skipped, result.failed);

    return result;
}
