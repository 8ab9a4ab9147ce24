// =================================================================
// src/RepoLens/ReferenceExtractors.cpp
// =================================================================
// Implementation for the per-language reference extractors.
//
// Each line is scanned with a fresh std::sregex_iterator; compiled patterns
// are shared read-only and carry no scan position between calls.

#include "RepoLens/ReferenceExtractors.hpp"
#include <algorithm>
#include <cctype>
#include <regex>
#include <unordered_set>

namespace RepoLens {

namespace {

std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

bool isIdentifier(const std::string& s) {
    if (s.empty() || std::isdigit(static_cast<unsigned char>(s[0]))) {
        return false;
    }
    for (char c : s) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') {
            return false;
        }
    }
    return true;
}

RawReference makeReference(const std::string& text, int line_number,
                           RelationshipKind kind = RelationshipKind::Import) {
    RawReference reference;
    reference.text = text;
    reference.line_number = line_number;
    reference.kind = kind;
    return reference;
}

bool exceedsLineLimit(const std::string& line, const ExtractorOptions& options) {
    return line.size() > std::min(options.max_line_length, kMaxLineLengthLimit);
}

void collectMatches(const std::string& line, const std::regex& pattern, int line_number,
                    RelationshipKind kind, std::vector<RawReference>& out) {
    for (std::sregex_iterator it(line.begin(), line.end(), pattern), end; it != end; ++it) {
        const std::smatch& match = *it;
        if (match.size() > 1 && match[1].matched && match[1].length() > 0) {
            out.push_back(makeReference(match[1].str(), line_number, kind));
        }
    }
}

std::string stripComment(std::string line) {
    size_t comment = line.find('#');
    if (comment != std::string::npos) {
        line.erase(comment);
    }
    return line;
}

RawReference makeMemberReference(const std::string& text, int line_number) {
    RawReference reference = makeReference(text, line_number);
    reference.member_reference = true;
    return reference;
}

// Names imported by `from <dots> import a, b as c, (d)`
std::vector<std::string> parseImportedNames(const std::string& line) {
    std::string names = stripComment(line);

    std::string cleaned;
    for (char c : names) {
        if (c != '(' && c != ')' && c != '\\') {
            cleaned += c;
        }
    }

    std::vector<std::string> result;
    size_t start = 0;
    while (start <= cleaned.size()) {
        size_t comma = cleaned.find(',', start);
        std::string item = trim(cleaned.substr(start, comma == std::string::npos ? std::string::npos : comma - start));

        size_t space = item.find_first_of(" \t");
        if (space != std::string::npos) {
            item.erase(space);
        }
        if (isIdentifier(item)) {
            result.push_back(item);
        }

        if (comma == std::string::npos) {
            break;
        }
        start = comma + 1;
    }
    return result;
}

} // namespace

std::vector<std::string> splitLines(const std::string& content) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start <= content.size()) {
        size_t newline = content.find('\n', start);
        std::string line = content.substr(start, newline == std::string::npos ? std::string::npos : newline - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(std::move(line));
        if (newline == std::string::npos) {
            break;
        }
        start = newline + 1;
    }
    return lines;
}

std::vector<RawReference> extractJavaScriptReferences(const std::string& content,
                                                      const ExtractorOptions& options) {
    static const std::regex import_from(R"re(import\s+.*\s+from\s+['"](.+?)['"])re");
    static const std::regex bare_import(R"re(import\s+['"](.+?)['"])re");
    static const std::regex require_call(R"re(require\s*\(\s*['"](.+?)['"]\s*\))re");
    static const std::regex dynamic_import(R"re(import\s*\(\s*['"](.+?)['"]\s*\))re");
    static const std::regex export_from(R"re(export\s+.*\s+from\s+['"](.+?)['"])re");
    static const std::regex open_block(R"re(^\s*(import|export)\b[^'"]*\{[^}]*$)re");
    static const std::regex close_from(R"re(\}\s*from\s+['"](.+?)['"])re");

    std::vector<RawReference> references;
    if (content.empty()) {
        return references;
    }

    // Kind of the `import {` / `export {` block still waiting for its `} from`
    bool in_block = false;
    RelationshipKind block_kind = RelationshipKind::Import;

    std::vector<std::string> lines = splitLines(content);
    for (size_t i = 0; i < lines.size(); ++i) {
        const std::string& line = lines[i];
        int line_number = static_cast<int>(i) + 1;
        if (exceedsLineLimit(line, options)) {
            continue;
        }

        if (in_block) {
            std::smatch match;
            if (std::regex_search(line, match, close_from)) {
                references.push_back(makeReference(match[1].str(), line_number, block_kind));
                in_block = false;
                continue;
            }
            if (line.find('}') != std::string::npos) {
                in_block = false;
            }
            continue;
        }

        size_t before = references.size();
        collectMatches(line, import_from, line_number, RelationshipKind::Import, references);
        collectMatches(line, bare_import, line_number, RelationshipKind::Import, references);
        collectMatches(line, require_call, line_number, RelationshipKind::Import, references);
        collectMatches(line, dynamic_import, line_number, RelationshipKind::Import, references);
        collectMatches(line, export_from, line_number, RelationshipKind::Export, references);

        std::smatch open;
        if (references.size() == before && std::regex_search(line, open, open_block)) {
            in_block = true;
            block_kind = open[1].str() == "export" ? RelationshipKind::Export : RelationshipKind::Import;
        }
    }

    return references;
}

std::vector<RawReference> extractPythonReferences(const std::string& content,
                                                  const ExtractorOptions& options) {
    static const std::regex plain_import(R"re(^import\s+(.+))re");
    static const std::regex module_item(R"re(^([A-Za-z0-9_.]+)(?:\s+as\s+\w+)?)re");
    static const std::regex relative_from(R"re(^from\s+(\.+)([A-Za-z0-9_.]*)\s+import\b(.*))re");
    static const std::regex absolute_from(R"re(^from\s+([A-Za-z0-9_.]+)\s+import\b)re");

    std::vector<RawReference> references;
    std::vector<std::string> lines = splitLines(content);

    // Dots of a relative `from . import (` list still waiting for its `)`,
    // or of a list continued with a trailing backslash
    std::string open_dots;
    bool open_parenthesised = false;
    size_t open_names = 0;

    for (size_t i = 0; i < lines.size(); ++i) {
        if (exceedsLineLimit(lines[i], options)) {
            continue;
        }
        std::string trimmed = trim(lines[i]);
        int line_number = static_cast<int>(i) + 1;
        std::smatch match;

        if (!open_dots.empty()) {
            std::string body = trim(stripComment(trimmed));
            size_t close = body.find(')');
            bool closes = open_parenthesised ? close != std::string::npos
                                             : (body.empty() || body.back() != '\\');
            if (open_parenthesised && closes) {
                body.erase(close);
            }
            for (const auto& name : parseImportedNames(body)) {
                references.push_back(makeMemberReference(open_dots + name, line_number));
                ++open_names;
            }
            if (closes) {
                if (open_names == 0) {
                    references.push_back(makeReference(open_dots, line_number));
                }
                open_dots.clear();
            }
            continue;
        }

        if (std::regex_search(trimmed, match, plain_import)) {
            std::string modules = match[1].str();
            size_t start = 0;
            while (start <= modules.size()) {
                size_t comma = modules.find(',', start);
                std::string item = trim(modules.substr(start, comma == std::string::npos ? std::string::npos : comma - start));

                std::smatch item_match;
                if (std::regex_search(item, item_match, module_item) && item_match[1].str().front() != '.') {
                    references.push_back(makeReference(item_match[1].str(), line_number));
                }

                if (comma == std::string::npos) {
                    break;
                }
                start = comma + 1;
            }
            continue;
        }

        if (std::regex_search(trimmed, match, relative_from)) {
            std::string dots = match[1].str();
            std::string module = match[2].str();

            if (!module.empty()) {
                references.push_back(makeReference(dots + module, line_number));
                continue;
            }

            std::string rest = trim(stripComment(match[3].str()));
            std::vector<std::string> names = parseImportedNames(rest);
            for (const auto& name : names) {
                references.push_back(makeMemberReference(dots + name, line_number));
            }

            bool parenthesised = rest.find('(') != std::string::npos && rest.find(')') == std::string::npos;
            bool continued = !parenthesised && !rest.empty() && rest.back() == '\\';
            if (parenthesised || continued) {
                open_dots = dots;
                open_parenthesised = parenthesised;
                open_names = names.size();
                continue;
            }

            if (names.empty()) {
                references.push_back(makeReference(dots, line_number));
            }
            continue;
        }

        if (std::regex_search(trimmed, match, absolute_from)) {
            references.push_back(makeReference(match[1].str(), line_number));
        }
    }

    return references;
}

std::vector<RawReference> extractJavaReferences(const std::string& content,
                                                const ExtractorOptions& options) {
    static const std::regex import_statement(R"re(^import\s+(static\s+)?([A-Za-z0-9_.]+)\s*;)re");

    std::vector<RawReference> references;
    std::vector<std::string> lines = splitLines(content);

    for (size_t i = 0; i < lines.size(); ++i) {
        if (exceedsLineLimit(lines[i], options)) {
            continue;
        }
        std::string trimmed = trim(lines[i]);
        std::smatch match;
        if (std::regex_search(trimmed, match, import_statement) && match[2].length() > 0) {
            RawReference reference = makeReference(match[2].str(), static_cast<int>(i) + 1);
            reference.member_reference = match[1].matched;
            references.push_back(std::move(reference));
        }
    }

    return references;
}

std::vector<RawReference> extractGoReferences(const std::string& content,
                                              const ExtractorOptions& options) {
    static const std::regex single_import(R"re(^import\s+(?:[A-Za-z_.][A-Za-z0-9_]*\s+)?"([^"]+)")re");
    static const std::regex block_open(R"re(^import\s*\()re");
    static const std::regex block_entry(R"re(^(?:[A-Za-z_.][A-Za-z0-9_]*\s+)?"([^"]+)")re");

    std::vector<RawReference> references;
    std::vector<std::string> lines = splitLines(content);
    bool in_block = false;

    for (size_t i = 0; i < lines.size(); ++i) {
        if (exceedsLineLimit(lines[i], options)) {
            continue;
        }
        std::string trimmed = trim(lines[i]);
        int line_number = static_cast<int>(i) + 1;
        std::smatch match;

        if (in_block) {
            if (!trimmed.empty() && trimmed.front() == ')') {
                in_block = false;
            } else if (std::regex_search(trimmed, match, block_entry)) {
                references.push_back(makeReference(match[1].str(), line_number));
            }
            continue;
        }

        if (std::regex_search(trimmed, match, single_import)) {
            references.push_back(makeReference(match[1].str(), line_number));
        } else if (std::regex_search(trimmed, match, block_open)) {
            in_block = trimmed.find(')') == std::string::npos;
        }
    }

    return references;
}

std::vector<RawReference> extractCFamilyReferences(const std::string& content,
                                                   const ExtractorOptions& options) {
    static const std::regex quoted_include(R"re(^#\s*include\s*"([^"]+)")re");
    static const std::regex angled_include(R"re(^#\s*include\s*<([^>]+)>)re");

    std::vector<RawReference> references;
    std::vector<std::string> lines = splitLines(content);

    for (size_t i = 0; i < lines.size(); ++i) {
        if (exceedsLineLimit(lines[i], options)) {
            continue;
        }
        std::string trimmed = trim(lines[i]);
        std::smatch match;
        if (std::regex_search(trimmed, match, quoted_include) ||
            std::regex_search(trimmed, match, angled_include)) {
            references.push_back(makeReference(match[1].str(), static_cast<int>(i) + 1));
        }
    }

    return references;
}

std::vector<RawReference> extractRustReferences(const std::string& content,
                                                const ExtractorOptions& options) {
    static const std::regex use_statement(R"re(^(?:pub(?:\([^)]*\))?\s+)?use\s+([A-Za-z0-9_:]+))re");
    static const std::regex mod_statement(R"re(^(?:pub(?:\([^)]*\))?\s+)?mod\s+([A-Za-z0-9_]+))re");

    std::vector<RawReference> references;
    std::vector<std::string> lines = splitLines(content);

    for (size_t i = 0; i < lines.size(); ++i) {
        if (exceedsLineLimit(lines[i], options)) {
            continue;
        }
        std::string trimmed = trim(lines[i]);
        std::smatch match;
        if (std::regex_search(trimmed, match, use_statement) ||
            std::regex_search(trimmed, match, mod_statement)) {
            references.push_back(makeReference(match[1].str(), static_cast<int>(i) + 1));
        }
    }

    return references;
}

std::vector<TypeDeclaration> extractSwiftDeclarations(const std::string& content,
                                                      const ExtractorOptions& options) {
    static const std::regex type_declaration(
        R"re(^\s*(?:(?:public|private|internal|open|fileprivate|final|indirect)\s+)*(class|struct|protocol|enum|actor)\s+([A-Za-z_][A-Za-z0-9_]*))re");
    // `class func`, `class var` and friends declare members, not types
    static const std::unordered_set<std::string> member_keywords = {
        "func", "var", "let", "subscript", "init", "deinit", "static", "override"
    };

    std::vector<TypeDeclaration> declarations;
    std::vector<std::string> lines = splitLines(content);

    for (size_t i = 0; i < lines.size(); ++i) {
        if (exceedsLineLimit(lines[i], options)) {
            continue;
        }
        std::smatch match;
        if (std::regex_search(lines[i], match, type_declaration)) {
            std::string name = match[2].str();
            if (member_keywords.count(name) == 0) {
                declarations.push_back({name, static_cast<int>(i) + 1});
            }
        }
    }

    return declarations;
}

std::unordered_map<std::string, int> identifierFirstLines(const std::string& content) {
    std::unordered_map<std::string, int> first_lines;
    int line_number = 1;
    std::string token;

    auto flush = [&]() {
        if (!token.empty()) {
            first_lines.emplace(token, line_number);
            token.clear();
        }
    };

    for (char c : content) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '_') {
            token += c;
            continue;
        }
        flush();
        if (c == '\n') {
            ++line_number;
        }
    }
    flush();

    return first_lines;
}

} // namespace RepoLens
