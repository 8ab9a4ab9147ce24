// =================================================================
// include/RepoLens/RepositoryScanner.hpp
// =================================================================
// Header for building the analyzer's input tree from a directory.

#pragma once

#include "RepoLens/FileTree.hpp"
#include "RepoLens/IgnorePattern.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace RepoLens {

/**
 * @brief Scanner settings, usually taken from AnalyzerConfig
 */
struct ScanOptions {
    size_t max_file_size = 10 * 1024 * 1024;   ///< Larger files are kept without content
    bool follow_symlinks = false;              ///< Descend into symlinked directories, each real directory once
    bool use_default_ignores = true;
    bool use_ignore_file = true;               ///< Read <root>/.repolensignore
    std::vector<std::string> ignore_patterns;
};

/**
 * @brief Counters of the most recent scan
 */
struct ScanStats {
    size_t files = 0;
    size_t directories = 0;
    size_t files_with_content = 0;
    size_t ignored = 0;          ///< Files and directories pruned by ignore rules
    size_t oversized = 0;
    size_t binary = 0;
    size_t errors = 0;
    long duration_ms = 0;
};

/**
 * @brief Walks a repository and builds the TreeNode tree consumed by FileIndex
 *
 * Children are sorted by name and paths are relative to the root with '/'
 * separators. Every file gets a language tag from its extension; content is
 * loaded only for files of a supported language that look like text and fit
 * the size limit. Filesystem errors are logged and leave a partial tree.
 */
class RepositoryScanner {
public:
    explicit RepositoryScanner(const std::string& root_path, const ScanOptions& options = ScanOptions());

    /**
     * @brief Scan the repository
     * @return Root directory node (path ""); empty if the root is not a directory
     */
    TreeNode scan();

    void addIgnorePattern(const std::string& pattern);
    void setMaxFileSize(size_t max_size);

    const std::string& rootPath() const { return m_root_path; }
    const ScanStats& lastStats() const { return m_stats; }

    /**
     * @brief Heuristic text check on a leading sample of a file
     *
     * Rejects samples containing NUL bytes or with 5% or more non-printable
     * characters. An empty sample counts as text.
     */
    static bool looksLikeText(const std::string& sample);

private:
    TreeNode scanDirectory(const std::filesystem::path& directory, const std::string& relative_path);
    TreeNode scanFile(const std::filesystem::directory_entry& entry, const std::string& relative_path);
    std::optional<std::string> readContent(const std::filesystem::path& file_path, size_t size);
    void loadIgnoreFile();
    /// False if the directory's canonical path was already scanned
    bool markVisited(const std::filesystem::path& directory);

    std::string m_root_path;
    ScanOptions m_options;
    IgnorePatternSet m_ignore_patterns;
    ScanStats m_stats;
    std::unordered_set<std::string> m_visited_directories;  ///< Canonical paths of this scan
};

} // namespace RepoLens
