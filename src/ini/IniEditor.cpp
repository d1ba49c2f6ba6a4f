#include "IniEditor.hpp"
#include "../helpers/fs/FsUtils.hpp"
#include "../debug/log/Logger.hpp"

#include <hyprutils/string/String.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <format>

using namespace Hyprutils::String;

bool Ini::equalsIgnoreCase(std::string_view a, std::string_view b) {
    return std::ranges::equal(a, b, [](unsigned char x, unsigned char y) { return std::tolower(x) == std::tolower(y); });
}

static void insertLine(Ini::SIniDocument& doc, size_t at, std::string line) {
    if (doc.eols.size() == doc.lines.size())
        doc.eols.insert(doc.eols.begin() + at, doc.eol);

    doc.lines.insert(doc.lines.begin() + at, std::move(line));
}

Ini::SIniDocument Ini::parseDocument(const std::string& content) {
    SIniDocument     doc;
    std::string_view view = content;

    if (view.starts_with(UTF8_BOM)) {
        doc.bom = true;
        view.remove_prefix(UTF8_BOM.size());
    }

    size_t head     = 0;
    bool   eolKnown = false;

    while (head < view.size()) {
        const auto       NEWLINE = view.find('\n', head);
        std::string_view line    = view.substr(head, NEWLINE == std::string_view::npos ? std::string_view::npos : NEWLINE - head);

        if (NEWLINE == std::string_view::npos) {
            // unterminated last line, gets the document terminator on write
            doc.lines.emplace_back(line);
            doc.eols.emplace_back(doc.eol);
            break;
        }

        std::string lineEol = "\n";
        if (line.ends_with('\r')) {
            lineEol = "\r\n";
            line.remove_suffix(1);
        }

        if (!eolKnown) {
            doc.eol  = lineEol;
            eolKnown = true;
        }

        doc.lines.emplace_back(line);
        doc.eols.emplace_back(std::move(lineEol));
        head = NEWLINE + 1;
    }

    return doc;
}

std::string Ini::serializeDocument(const SIniDocument& doc) {
    std::string result = doc.bom ? std::string{UTF8_BOM} : "";

    for (size_t i = 0; i < doc.lines.size(); ++i) {
        result += doc.lines[i];
        result += i < doc.eols.size() ? doc.eols[i] : doc.eol;
    }

    return result;
}

std::optional<Ini::SIniDocument> Ini::loadDocument(const std::string& path) {
    const auto CONTENT = NFsUtils::readFileAsString(path);
    if (!CONTENT)
        return std::nullopt;

    return parseDocument(*CONTENT);
}

bool Ini::saveDocument(const std::string& path, const SIniDocument& doc) {
    return NFsUtils::writeToFile(path, serializeDocument(doc));
}

bool Ini::isSectionHeader(std::string_view line) {
    const auto T = trim(line);
    return !T.empty() && T.starts_with('[') && T.ends_with(']');
}

bool Ini::isCommentOrBlank(std::string_view line) {
    const auto T = trim(line);
    return T.empty() || T.starts_with(';') || T.starts_with('#');
}

std::optional<Ini::SKeyValue> Ini::parseKeyValue(std::string_view line) {
    if (isCommentOrBlank(line))
        return std::nullopt;

    const auto T   = trim(line);
    const auto SEP = T.find('=');

    // no separator, or an empty key ("=value")
    if (SEP == std::string_view::npos || SEP == 0)
        return std::nullopt;

    const auto KEY = trim(T.substr(0, SEP));
    if (KEY.empty())
        return std::nullopt;

    return SKeyValue{.key = std::string{KEY}, .value = std::string{trim(T.substr(SEP + 1))}};
}

std::optional<size_t> Ini::findSection(const SIniDocument& doc, std::string_view section) {
    if (trim(section).empty())
        return std::nullopt;

    const auto HEADER = std::format("[{}]", section);

    for (size_t i = 0; i < doc.lines.size(); ++i) {
        if (equalsIgnoreCase(trim(std::string_view{doc.lines[i]}), HEADER))
            return i;
    }

    return std::nullopt;
}

size_t Ini::sectionEnd(const SIniDocument& doc, size_t sectionIndex) {
    for (size_t i = sectionIndex + 1; i < doc.lines.size(); ++i) {
        if (isSectionHeader(doc.lines[i]))
            return i;
    }

    return doc.lines.size();
}

std::optional<Ini::SKeyMatch> Ini::findKeyInSection(const SIniDocument& doc, size_t sectionIndex, std::span<const std::string> candidates) {
    if (candidates.empty())
        return std::nullopt;

    const auto END = sectionEnd(doc, sectionIndex);

    for (size_t i = sectionIndex + 1; i < END; ++i) {
        const auto KV = parseKeyValue(doc.lines[i]);
        if (!KV)
            continue;

        if (std::ranges::any_of(candidates, [&KV](const auto& c) { return equalsIgnoreCase(c, KV->key); }))
            return SKeyMatch{.line = i, .key = KV->key};
    }

    return std::nullopt;
}

void Ini::setValue(SIniDocument& doc, const std::string& section, const std::string& key, const std::string& value) {
    const auto ENTRY   = std::format("{}={}", key, value);
    const auto SECTION = findSection(doc, section);

    if (!SECTION) {
        if (!doc.lines.empty() && !trim(std::string_view{doc.lines.back()}).empty())
            insertLine(doc, doc.lines.size(), "");

        insertLine(doc, doc.lines.size(), std::format("[{}]", section));
        insertLine(doc, doc.lines.size(), ENTRY);
        return;
    }

    const std::string KEYS[] = {key};
    if (const auto MATCH = findKeyInSection(doc, *SECTION, KEYS); MATCH) {
        doc.lines[MATCH->line] = ENTRY;
        return;
    }

    insertLine(doc, sectionEnd(doc, *SECTION), ENTRY);
}

std::optional<std::string> Ini::findCandidateKey(const std::string& path, const std::string& section, std::span<const std::string> candidates) {
    if (trim(std::string_view{path}).empty() || candidates.empty())
        return std::nullopt;

    const auto DOC = loadDocument(path);
    if (!DOC)
        return std::nullopt;

    const auto SECTION = findSection(*DOC, section);
    if (!SECTION)
        return std::nullopt;

    auto match = findKeyInSection(*DOC, *SECTION, candidates);
    if (!match)
        return std::nullopt;

    return std::move(match->key);
}

std::optional<std::string> Ini::readValue(const std::string& path, const std::string& section, const std::string& key) {
    if (trim(std::string_view{path}).empty())
        return std::nullopt;

    const auto DOC = loadDocument(path);
    if (!DOC)
        return std::nullopt;

    const auto SECTION = findSection(*DOC, section);
    if (!SECTION)
        return std::nullopt;

    const std::string KEYS[] = {key};
    const auto        MATCH  = findKeyInSection(*DOC, *SECTION, KEYS);
    if (!MATCH)
        return std::nullopt;

    // findKeyInSection only returns parseable lines
    return parseKeyValue(DOC->lines[MATCH->line])->value;
}

std::expected<void, std::string> Ini::writeValue(const std::string& path, const std::string& section, const std::string& key, const std::string& value) {
    const SIniEntry ENTRIES[] = {{.section = section, .key = key, .value = value}};
    return writeValues(path, ENTRIES);
}

std::expected<void, std::string> Ini::writeValues(const std::string& path, std::span<const SIniEntry> entries) {
    if (trim(std::string_view{path}).empty())
        return std::unexpected("INI path is empty.");

    for (const auto& e : entries) {
        if (trim(std::string_view{e.section}).empty() || trim(std::string_view{e.key}).empty())
            return std::unexpected("INI section or key is empty.");
    }

    std::error_code ec;
    if (!std::filesystem::exists(path, ec) || ec)
        return std::unexpected("INI file does not exist.");

    auto doc = loadDocument(path);
    if (!doc)
        return std::unexpected(std::format("INI file {} could not be read.", path));

    for (const auto& e : entries) {
        setValue(*doc, e.section, e.key, e.value);
    }

    if (!saveDocument(path, *doc))
        return std::unexpected(std::format("INI file {} could not be written.", path));

    for (const auto& e : entries) {
        Log::logger->log(Log::TRACE, "Ini::writeValues: [{}] {}={} -> {}", e.section, e.key, e.value, path);
    }

    return {};
}
