// =================================================================
// include/RepoLens/FileIndex.hpp
// =================================================================
// Read-only lookup structure over a scanned repository snapshot.

#pragma once

#include "RepoLens/FileTree.hpp"
#include "RepoLens/Language.hpp"
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace RepoLens {

/**
 * @brief One indexed file
 */
struct FileRecord {
    std::string path;
    std::string name;
    Language language = Language::Other;
    std::optional<std::string> content;
    std::optional<std::string> relative_path;

    bool hasContent() const { return content.has_value() && !content->empty(); }
};

/**
 * @brief Lookup structure built once per repository snapshot
 *
 * Every file leaf of the tree is stored exactly once, in traversal order.
 * A file is addressable by its path and, when present, by its relative path.
 * Secondary lookups (by file name, by path suffix, by containing directory)
 * return the first match in insertion order; with duplicate basenames that
 * order decides which file wins.
 *
 * The index is immutable after build(). Pointers it hands out stay valid for
 * the lifetime of the index.
 */
class FileIndex {
public:
    FileIndex() = default;

    /**
     * @brief Build the index from the root of a scanned tree
     * @param root Root directory node (a single file node is accepted too)
     * @return Fully built index
     */
    static FileIndex build(const TreeNode& root);

    /**
     * @brief Exact lookup by path or relative path
     * @return Matching record or nullptr
     */
    const FileRecord* find(const std::string& key) const;

    /**
     * @brief First key ending with any of the given suffixes
     *
     * Keys are visited in insertion order and each key is tested against every
     * suffix before moving on. A suffix only matches at a path segment boundary:
     * "os.py" matches "lib/os.py" but not "lib/photos.py".
     *
     * @param suffixes Candidate suffixes
     * @return Matching record or nullptr
     */
    const FileRecord* findBySuffix(const std::vector<std::string>& suffixes) const;

    /**
     * @brief First file whose base name equals name
     */
    const FileRecord* findByName(const std::string& name) const;

    /**
     * @brief All files with the given base name, in insertion order
     */
    std::vector<const FileRecord*> filesNamed(const std::string& name) const;

    /**
     * @brief First file whose parent directory is, or ends with, directory
     * @param directory Slash-separated directory path without trailing slash
     */
    const FileRecord* findInDirectory(const std::string& directory) const;

    bool contains(const std::string& key) const { return m_by_key.count(key) > 0; }

    const std::vector<FileRecord>& files() const { return m_files; }

    size_t size() const { return m_files.size(); }
    bool empty() const { return m_files.empty(); }

    /**
     * @brief Number of lookup keys (paths plus distinct relative paths)
     */
    size_t keyCount() const { return m_keys.size(); }

    /**
     * @brief True if path ends with suffix at a segment boundary
     */
    static bool endsWithSegment(const std::string& path, const std::string& suffix);

private:
    void collect(const TreeNode& node);
    void addKey(const std::string& key, size_t file_index);

    std::vector<FileRecord> m_files;
    std::vector<std::pair<std::string, size_t>> m_keys;
    std::unordered_map<std::string, size_t> m_by_key;
    std::unordered_map<std::string, std::vector<size_t>> m_by_name;
};

} // namespace RepoLens
