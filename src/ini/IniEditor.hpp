#pragma once

#include <cstddef>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/*
    Minimal, structure-preserving INI reader / writer.

    Every mutation is a whole-file read-modify-write. Lines that an operation
    does not explicitly rewrite are kept byte-for-byte and in order.
*/

namespace Ini {
    inline constexpr std::string_view UTF8_BOM = "\xEF\xBB\xBF";

    struct SIniDocument {
        std::vector<std::string> lines;
        std::vector<std::string> eols;       // terminator of each line as read, parallel to lines
        std::string              eol = "\n"; // terminator of the first line, used for new lines
        bool                     bom = false;
    };

    struct SIniEntry {
        std::string section;
        std::string key;
        std::string value;
    };

    struct SKeyValue {
        std::string key;
        std::string value;
    };

    struct SKeyMatch {
        size_t      line = 0;
        std::string key; // spelling as found in the document
    };

    // ascii, case-insensitive
    bool                             equalsIgnoreCase(std::string_view a, std::string_view b);

    SIniDocument                     parseDocument(const std::string& content);
    std::string                      serializeDocument(const SIniDocument& doc);

    std::optional<SIniDocument>      loadDocument(const std::string& path);
    bool                             saveDocument(const std::string& path, const SIniDocument& doc);

    bool                             isSectionHeader(std::string_view line);
    bool                             isCommentOrBlank(std::string_view line);
    std::optional<SKeyValue>         parseKeyValue(std::string_view line);

    // index of the first "[section]" header line, case-insensitive
    std::optional<size_t>            findSection(const SIniDocument& doc, std::string_view section);

    // one past the last line owned by the section whose header is at sectionIndex
    size_t                           sectionEnd(const SIniDocument& doc, size_t sectionIndex);

    // first entry in the section matching any of the candidates
    std::optional<SKeyMatch>         findKeyInSection(const SIniDocument& doc, size_t sectionIndex, std::span<const std::string> candidates);

    // in-memory write: update the first match, insert at the end of the section, or append a new section
    void                             setValue(SIniDocument& doc, const std::string& section, const std::string& key, const std::string& value);

    // file-level operations. Missing file / section / key is a normal not-found result.
    std::optional<std::string>       findCandidateKey(const std::string& path, const std::string& section, std::span<const std::string> candidates);
    std::optional<std::string>       readValue(const std::string& path, const std::string& section, const std::string& key);
    std::expected<void, std::string> writeValue(const std::string& path, const std::string& section, const std::string& key, const std::string& value);

    // all entries in one read-modify-write, nothing is written if any entry is invalid
    std::expected<void, std::string> writeValues(const std::string& path, std::span<const SIniEntry> entries);
};
