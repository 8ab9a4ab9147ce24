// =================================================================
// src/RepoLens/FileTree.cpp
// =================================================================
// Construction helpers for the scanned repository tree.

#include "RepoLens/FileTree.hpp"

namespace RepoLens {

static std::string baseName(const std::string& path) {
    size_t slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

TreeNode makeFileNode(const std::string& path, Language language,
                      std::optional<std::string> content) {
    TreeNode node;
    node.type = NodeType::File;
    node.name = baseName(path);
    node.path = path;
    node.language = language;
    node.size = content ? content->size() : 0;
    node.content = std::move(content);
    return node;
}

TreeNode makeDirectoryNode(const std::string& path, std::vector<TreeNode> children) {
    TreeNode node;
    node.type = NodeType::Directory;
    node.name = baseName(path);
    node.path = path;
    node.children = std::move(children);
    return node;
}

size_t countFiles(const TreeNode& node) {
    if (node.isFile()) {
        return 1;
    }

    size_t total = 0;
    for (const auto& child : node.children) {
        total += countFiles(child);
    }
    return total;
}

size_t countDirectories(const TreeNode& node) {
    size_t total = 0;
    for (const auto& child : node.children) {
        if (child.isDirectory()) {
            total += 1 + countDirectories(child);
        }
    }
    return total;
}

} // namespace RepoLens
