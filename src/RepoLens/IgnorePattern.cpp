// =================================================================
// src/RepoLens/IgnorePattern.cpp
// =================================================================
// Implementation for gitignore-style path filtering.

#include "RepoLens/IgnorePattern.hpp"
#include "RepoLens/Logger.hpp"
#include <fstream>

namespace RepoLens {

IgnorePattern::IgnorePattern(const std::string& pattern)
    : m_original_pattern(pattern),
      m_is_negation(false),
      m_directory_only(false),
      m_is_anchored(false),
      m_is_empty(false)
{
    processPattern(pattern);
}

bool IgnorePattern::matches(const std::string& path, bool is_directory) const {
    if (m_is_empty || path.empty()) {
        return false;
    }

    if (!m_directory_only || is_directory) {
        if (matchesPath(path)) {
            return true;
        }
    }

    // "build/" excludes build/out/app.js as well as build itself
    if (m_directory_only) {
        size_t slash = path.find('/');
        while (slash != std::string::npos) {
            if (matchesPath(path.substr(0, slash))) {
                return true;
            }
            slash = path.find('/', slash + 1);
        }
    }
    return false;
}

bool IgnorePattern::matchesPath(const std::string& path) const {
    try {
        return std::regex_match(path, m_regex);
    } catch (const std::regex_error& e) {
        LOG_WARNING("IgnorePattern", "Regex error in pattern '" + m_original_pattern + "': " + e.what());
        return false;
    }
}

void IgnorePattern::processPattern(const std::string& pattern) {
    std::string working = pattern;

    // Trailing '\r' from files with Windows line endings
    if (!working.empty() && working.back() == '\r') {
        working.pop_back();
    }

    working.erase(0, working.find_first_not_of(" \t"));
    size_t last = working.find_last_not_of(" \t");
    working.erase(last == std::string::npos ? 0 : last + 1);

    if (working.empty() || working[0] == '#') {
        m_is_empty = true;
        return;
    }

    if (working[0] == '!') {
        m_is_negation = true;
        working = working.substr(1);
    }

    if (!working.empty() && working.back() == '/') {
        m_directory_only = true;
        working.pop_back();
    }

    if (!working.empty() && working[0] == '/') {
        m_is_anchored = true;
        working = working.substr(1);
    }

    if (working.empty()) {
        m_is_empty = true;
        return;
    }

    try {
        m_regex = std::regex(globToRegex(working), std::regex_constants::ECMAScript);
    } catch (const std::regex_error& e) {
        LOG_WARNING("IgnorePattern", "Failed to compile pattern '" + pattern + "': " + e.what());
        m_is_empty = true;
    }
}

std::string IgnorePattern::globToRegex(const std::string& glob_pattern) const {
    std::string body;
    bool in_brackets = false;

    for (size_t i = 0; i < glob_pattern.length(); ++i) {
        char c = glob_pattern[i];

        switch (c) {
            case '*':
                if (i + 1 < glob_pattern.length() && glob_pattern[i + 1] == '*') {
                    if (i + 2 < glob_pattern.length() && glob_pattern[i + 2] == '/') {
                        // "**/" spans zero or more directories
                        body += "(?:.*/)?";
                        i += 2;
                    } else {
                        body += ".*";
                        i += 1;
                    }
                } else {
                    body += "[^/]*";
                }
                break;

            case '?':
                body += "[^/]";
                break;

            case '[':
                in_brackets = true;
                body += '[';
                break;

            case ']':
                in_brackets = false;
                body += ']';
                break;

            case '\\':
                if (i + 1 < glob_pattern.length()) {
                    body += '\\';
                    body += glob_pattern[++i];
                } else {
                    body += "\\\\";
                }
                break;

            default:
                if (!in_brackets && (c == '.' || c == '^' || c == '$' || c == '+' ||
                    c == '{' || c == '}' || c == '|' || c == '(' || c == ')')) {
                    body += '\\';
                }
                body += c;
                break;
        }
    }

    // A rule with an inner slash is relative to the root, like an anchored one
    bool rooted = m_is_anchored || glob_pattern.find('/') != std::string::npos;
    if (rooted) {
        return body + "(?:/.*)?";
    }
    return "(?:.*/)?" + body + "(?:/.*)?";
}

// ============================================================================
// IgnorePatternSet
// ============================================================================

void IgnorePatternSet::addPattern(const std::string& pattern) {
    IgnorePattern ignore_pattern(pattern);
    if (!ignore_pattern.isEmpty()) {
        m_patterns.push_back(std::move(ignore_pattern));
    }
}

void IgnorePatternSet::addPatterns(const std::vector<std::string>& patterns) {
    for (const auto& pattern : patterns) {
        addPattern(pattern);
    }
}

size_t IgnorePatternSet::loadFromFile(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        return 0;
    }

    size_t loaded = 0;
    std::string line;
    while (std::getline(file, line)) {
        size_t before = m_patterns.size();
        addPattern(line);
        loaded += m_patterns.size() - before;
    }

    LOG_DEBUG("IgnorePattern", "Loaded " + std::to_string(loaded) + " rules from " + file_path);
    return loaded;
}

bool IgnorePatternSet::shouldIgnore(const std::string& path, bool is_directory) const {
    bool ignored = false;
    for (const auto& pattern : m_patterns) {
        if (pattern.matches(path, is_directory)) {
            ignored = !pattern.isNegation();
        }
    }
    return ignored;
}

const std::vector<std::string>& IgnorePatternSet::defaultPatterns() {
    static const std::vector<std::string> patterns = {
        ".git/",
        ".hg/",
        ".svn/",
        ".repolens/",
        "node_modules/",
        "bower_components/",
        "__pycache__/",
        ".venv/",
        "venv/",
        "target/",
        "build/",
        "dist/",
        "cmake-build-*/",
        ".idea/",
        ".vscode/",
        "*.min.js",
        "*.map",
        "*.pyc",
        "*.o",
        "*.obj",
        "*.so",
        "*.dylib",
        "*.dll",
        "*.exe",
        ".DS_Store",
        "*.swp",
        "*~"
    };
    return patterns;
}

} // namespace RepoLens
