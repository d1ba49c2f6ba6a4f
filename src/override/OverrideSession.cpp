#include "OverrideSession.hpp"
#include "KeyResolver.hpp"
#include "../ini/IniEditor.hpp"
#include "../debug/log/Logger.hpp"

#include <hyprutils/string/String.hpp>

#include <filesystem>
#include <format>
#include <vector>

using namespace Override;
using namespace Hyprutils::String;

static bool isBlank(const std::string& s) {
    return trim(std::string_view{s}).empty();
}

static std::unexpected<SOverrideError> validationError(std::string message) {
    Log::logger->log(Log::WARN, "COverrideSession: {}", message);
    return std::unexpected(SOverrideError{.type = OVERRIDE_ERROR_VALIDATION, .message = std::move(message)});
}

static std::unexpected<SOverrideError> ioError(std::string message) {
    Log::logger->log(Log::ERR, "COverrideSession: {}", message);
    return std::unexpected(SOverrideError{.type = OVERRIDE_ERROR_IO, .message = std::move(message)});
}

COverrideSession::COverrideSession(SP<ISessionStore> store, SP<ITargetResolver> targets, SP<ICardProvider> cards) :
    m_store(std::move(store)), m_targets(std::move(targets)), m_cards(std::move(cards)) {
    ;
}

std::expected<std::optional<std::string>, SOverrideError> COverrideSession::checkPreconditions(const SGame& game, const SOverrideSettings& settings) {
    if (!settings.enableAutoSwitch)
        return std::nullopt;

    const auto PLATFORM = m_targets->resolvePlatformId(settings.platformId);
    if (!PLATFORM)
        return validationError("Auto-switch is enabled but platform is not configured and auto-detect failed.");

    if (!m_targets->isInScope(game, *PLATFORM))
        return std::nullopt;

    if (isBlank(settings.outputFolder))
        return validationError("Auto-switch is enabled but output folder is not configured.");

    std::error_code ec;
    if (isBlank(settings.configPath) || !std::filesystem::is_regular_file(settings.configPath, ec) || ec)
        return validationError("Auto-switch is enabled but PCSX2 config path is missing or invalid.");

    if (isBlank(settings.section) || isBlank(settings.key))
        return validationError("Auto-switch is enabled but INI section/key are not configured.");

    return PLATFORM;
}

std::expected<eApplyResult, SOverrideError> COverrideSession::apply(const std::string& sessionId, const SGame& game, const SOverrideSettings& settings) {
    const auto PRECONDITIONS = checkPreconditions(game, settings);
    if (!PRECONDITIONS)
        return std::unexpected(PRECONDITIONS.error());

    if (!PRECONDITIONS->has_value()) {
        Log::logger->log(Log::TRACE, "COverrideSession::apply: skipping {}", game.name);
        return APPLY_RESULT_SKIPPED;
    }

    const auto& PLATFORM       = **PRECONDITIONS;
    auto        resolved       = resolveKey(settings);
    const bool  FILE_NAME_ONLY = shouldWriteFileNameOnly(settings, resolved.previousValue);

    const auto  CARD = m_cards->provideCard(game, PLATFORM, settings);
    if (!CARD) {
        if (CARD.error().type == OVERRIDE_ERROR_IO)
            return ioError(CARD.error().message);
        return validationError(CARD.error().message);
    }

    const auto& VALUE = FILE_NAME_ONLY ? CARD->fileName : CARD->fullPath;

    std::vector<Ini::SIniEntry> entries;

    // bare file names are resolved by PCSX2 against its memory card folder
    if (FILE_NAME_ONLY)
        entries.emplace_back(Ini::SIniEntry{.section = FOLDERS_SECTION, .key = FOLDERS_CARDS_KEY, .value = settings.outputFolder});

    entries.emplace_back(Ini::SIniEntry{.section = settings.section, .key = resolved.key, .value = VALUE});

    if (const auto RET = Ini::writeValues(settings.configPath, entries); !RET)
        return ioError(std::format("Failed to update PCSX2 config: {}", RET.error()));

    syncAlternateKeys(settings, resolved.key, VALUE);
    ensureSlotEnabled(settings);

    if (const auto& OLD = m_store->get(); OLD && OLD->sessionId != sessionId)
        Log::logger->log(Log::WARN, "COverrideSession::apply: superseding unreverted override for session {}", OLD->sessionId);

    Log::logger->log(Log::DEBUG, "COverrideSession::apply: {} -> [{}] {}={}", game.name, settings.section, resolved.key, VALUE);

    m_store->set(SSessionRecord{
        .sessionId     = sessionId,
        .configPath    = settings.configPath,
        .section       = settings.section,
        .key           = std::move(resolved.key),
        .previousValue = std::move(resolved.previousValue),
    });

    return APPLY_RESULT_APPLIED;
}

eRevertResult COverrideSession::revert(const std::string& sessionId) {
    const auto& RECORD = m_store->get();

    if (!RECORD || RECORD->sessionId != sessionId)
        return REVERT_RESULT_NOOP;

    // nothing was there before, leave the card we wrote in place
    if (!RECORD->previousValue || isBlank(RECORD->configPath) || isBlank(RECORD->section) || isBlank(RECORD->key)) {
        m_store->clear();
        return REVERT_RESULT_NOOP;
    }

    const auto RET    = Ini::writeValue(RECORD->configPath, RECORD->section, RECORD->key, *RECORD->previousValue);
    auto       result = REVERT_RESULT_RESTORED;

    if (!RET) {
        Log::logger->log(Log::ERR, "COverrideSession::revert: Failed to restore PCSX2 config: {}", RET.error());
        result = REVERT_RESULT_FAILED;
    } else
        Log::logger->log(Log::DEBUG, "COverrideSession::revert: restored [{}] {}={}", RECORD->section, RECORD->key, *RECORD->previousValue);

    m_store->clear();
    return result;
}

bool COverrideSession::hasActiveOverride() const {
    return m_store->get().has_value();
}

const std::optional<SSessionRecord>& COverrideSession::activeRecord() const {
    return m_store->get();
}

void COverrideSession::syncAlternateKeys(const SOverrideSettings& settings, const std::string& activeKey, const std::string& value) {
    for (const auto& key : MEMORY_CARD_KEYS) {
        if (Ini::equalsIgnoreCase(key, activeKey))
            continue;

        if (const auto RET = Ini::writeValue(settings.configPath, settings.section, key, value); !RET)
            Log::logger->log(Log::WARN, "COverrideSession: couldn't sync {}: {}", key, RET.error());
    }
}

void COverrideSession::ensureSlotEnabled(const SOverrideSettings& settings) {
    const auto KEY = Ini::findCandidateKey(settings.configPath, settings.section, SLOT_ENABLE_KEYS);
    if (!KEY)
        return;

    if (const auto RET = Ini::writeValue(settings.configPath, settings.section, *KEY, SLOT_ENABLED_VALUE); !RET)
        Log::logger->log(Log::WARN, "COverrideSession: couldn't enable slot via {}: {}", *KEY, RET.error());
}
