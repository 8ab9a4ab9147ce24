// =================================================================
// include/RepoLens/PathResolver.hpp
// =================================================================
// Shared resolution steps used by the per-language strategies.

#pragma once

#include "RepoLens/FileIndex.hpp"
#include <string>
#include <vector>

namespace RepoLens {

/**
 * @brief Lookup primitives over a FileIndex plus path arithmetic
 *
 * Each language strategy composes these steps into its own fallback
 * chain: relative resolution, exact lookup, extension-augmented lookup,
 * root-stripped lookup, fuzzy suffix match and filename-only match.
 * Every step returns nullptr when it finds nothing.
 */
class PathResolver {
public:
    explicit PathResolver(const FileIndex& index);

    const FileIndex& index() const { return m_index; }

    /**
     * @brief Exact lookup of a candidate path
     */
    const FileRecord* exact(const std::string& candidate) const;

    /**
     * @brief Exact lookup of candidate + each extension, in order
     * @param candidate Path without extension
     * @param extensions Suffixes such as ".ts" or "/index.ts"
     */
    const FileRecord* withExtensions(const std::string& candidate,
                                     const std::vector<std::string>& extensions) const;

    /**
     * @brief First index key ending with any of the suffixes
     *
     * Ties go to the earliest key in index insertion order.
     */
    const FileRecord* bySuffix(const std::vector<std::string>& suffixes) const;

    /**
     * @brief First file with the given base name
     */
    const FileRecord* byFileName(const std::string& file_name) const;

    /**
     * @brief First file located in a directory ending with the given path
     */
    const FileRecord* inDirectory(const std::string& directory) const;

    /**
     * @brief Build candidate + extension for every extension
     */
    static std::vector<std::string> expand(const std::string& candidate,
                                           const std::vector<std::string>& extensions);

    /**
     * @brief True for "./x", "../x", "." and ".."
     */
    static bool isRelative(const std::string& reference);

    /**
     * @brief Directory part of a path, "" for files at the root
     */
    static std::string directoryOf(const std::string& path);

    /**
     * @brief Pop up to levels trailing segments off a directory
     *
     * Ascending past the root stops at the root ("").
     */
    static std::string ascend(const std::string& directory, size_t levels);

    /**
     * @brief Append a relative path to a directory, folding "." and ".."
     */
    static std::string joinPath(const std::string& directory, const std::string& relative);

    /**
     * @brief Resolve a "./" or "../" reference against the referencing file
     * @param from_file Path of the referencing file
     * @param reference Relative reference text
     * @return Normalized candidate path, without extension augmentation
     */
    static std::string resolveRelative(const std::string& from_file, const std::string& reference);

    /**
     * @brief Last '/'-separated segment of a path
     */
    static std::string baseName(const std::string& path);

    /**
     * @brief Split text on a separator, dropping empty pieces
     */
    static std::vector<std::string> split(const std::string& text, const std::string& separator);

private:
    const FileIndex& m_index;
};

} // namespace RepoLens
