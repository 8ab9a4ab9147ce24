// =================================================================
// include/RepoLens/IgnorePattern.hpp
// =================================================================
// Header for gitignore-style path filtering used by the scanner.

#pragma once

#include <regex>
#include <string>
#include <vector>

namespace RepoLens {

/**
 * @brief One gitignore-style rule
 *
 * Supported syntax:
 * - Wildcards: *, **, ?
 * - Negation: !pattern
 * - Directory-only rules: pattern/
 * - Anchored rules: /pattern
 * - Comment lines: # comment
 */
class IgnorePattern {
public:
    explicit IgnorePattern(const std::string& pattern);

    /**
     * @brief Check a repository-relative path against this rule
     * @param path Slash-separated path relative to the scan root
     * @param is_directory True if path names a directory
     * @return true if the rule applies to path
     *
     * A directory-only rule also applies to files below a matching directory.
     */
    bool matches(const std::string& path, bool is_directory = false) const;

    bool isNegation() const { return m_is_negation; }
    bool isDirectoryOnly() const { return m_directory_only; }
    bool isAnchored() const { return m_is_anchored; }

    /**
     * @brief True for blank lines, comments and rules that failed to compile
     */
    bool isEmpty() const { return m_is_empty; }

    const std::string& getPattern() const { return m_original_pattern; }

private:
    void processPattern(const std::string& pattern);
    std::string globToRegex(const std::string& glob_pattern) const;
    bool matchesPath(const std::string& path) const;

    std::string m_original_pattern;
    bool m_is_negation;
    bool m_directory_only;
    bool m_is_anchored;
    bool m_is_empty;
    std::regex m_regex;
};

/**
 * @brief Ordered rule list; the last matching rule decides
 */
class IgnorePatternSet {
public:
    void addPattern(const std::string& pattern);
    void addPatterns(const std::vector<std::string>& patterns);

    /**
     * @brief Load rules from an ignore file such as .repolensignore
     * @param file_path Path to the ignore file
     * @return Number of rules loaded, 0 if the file does not exist
     */
    size_t loadFromFile(const std::string& file_path);

    /**
     * @brief Check if a path is excluded by the rule list
     * @param path Relative path from the scan root
     * @param is_directory True if path names a directory
     */
    bool shouldIgnore(const std::string& path, bool is_directory = false) const;

    size_t size() const { return m_patterns.size(); }
    void clear() { m_patterns.clear(); }

    /**
     * @brief Rules every scan starts with (VCS metadata, build output, caches)
     */
    static const std::vector<std::string>& defaultPatterns();

private:
    std::vector<IgnorePattern> m_patterns;
};

} // namespace RepoLens
