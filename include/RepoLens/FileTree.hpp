// =================================================================
// include/RepoLens/FileTree.hpp
// =================================================================
// Input tree handed to the analyzer by the repository scanner.

#pragma once

#include "RepoLens/Language.hpp"
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace RepoLens {

enum class NodeType {
    File,
    Directory
};

/**
 * @brief One node of a scanned repository tree
 *
 * Directories carry ordered children; files carry a language tag and,
 * when the scanner could read them as text, their raw content.
 */
struct TreeNode {
    NodeType type = NodeType::Directory;
    std::string name;
    std::string path;
    std::optional<std::string> relative_path;

    // File attributes
    Language language = Language::Other;
    std::optional<std::string> content;
    size_t size = 0;
    std::filesystem::file_time_type last_modified{};

    // Directory attributes
    std::vector<TreeNode> children;

    bool isFile() const { return type == NodeType::File; }
    bool isDirectory() const { return type == NodeType::Directory; }
};

/**
 * @brief Build a file node; name and size are derived from the path and content
 * @param path Repository-relative path
 * @param language Language tag
 * @param content Raw text, absent for binary or oversized files
 */
TreeNode makeFileNode(const std::string& path, Language language,
                      std::optional<std::string> content = std::nullopt);

/**
 * @brief Build a directory node
 * @param path Repository-relative path ("" for the root)
 * @param children Ordered child nodes
 */
TreeNode makeDirectoryNode(const std::string& path, std::vector<TreeNode> children = {});

/**
 * @brief Count file leaves below a node
 */
size_t countFiles(const TreeNode& node);

/**
 * @brief Count directories below a node, the node itself excluded
 */
size_t countDirectories(const TreeNode& node);

} // namespace RepoLens
