// =================================================================
// src/RepoLens/FileIndex.cpp
// =================================================================
// Implementation for the repository file index.

#include "RepoLens/FileIndex.hpp"
#include "RepoLens/Logger.hpp"

namespace RepoLens {

FileIndex FileIndex::build(const TreeNode& root) {
    FileIndex index;
    index.collect(root);

    LOG_DEBUG("FileIndex", "Indexed " + std::to_string(index.m_files.size()) + " files under " +
              std::to_string(index.m_keys.size()) + " keys");
    return index;
}

void FileIndex::collect(const TreeNode& node) {
    if (node.isDirectory()) {
        for (const auto& child : node.children) {
            collect(child);
        }
        return;
    }

    if (m_by_key.count(node.path) > 0) {
        LOG_DEBUG("FileIndex", "Duplicate path ignored: " + node.path);
        return;
    }

    FileRecord record;
    record.path = node.path;
    record.name = node.name;
    record.language = node.language;
    record.content = node.content;
    record.relative_path = node.relative_path;

    size_t file_index = m_files.size();
    m_files.push_back(std::move(record));

    addKey(node.path, file_index);
    if (node.relative_path && !node.relative_path->empty()) {
        addKey(*node.relative_path, file_index);
    }
    m_by_name[node.name].push_back(file_index);
}

void FileIndex::addKey(const std::string& key, size_t file_index) {
    // First writer keeps the key; a later file cannot shadow it
    if (m_by_key.emplace(key, file_index).second) {
        m_keys.emplace_back(key, file_index);
    }
}

const FileRecord* FileIndex::find(const std::string& key) const {
    auto it = m_by_key.find(key);
    if (it == m_by_key.end()) {
        return nullptr;
    }
    return &m_files[it->second];
}

const FileRecord* FileIndex::findBySuffix(const std::vector<std::string>& suffixes) const {
    for (const auto& entry : m_keys) {
        for (const auto& suffix : suffixes) {
            if (!suffix.empty() && endsWithSegment(entry.first, suffix)) {
                return &m_files[entry.second];
            }
        }
    }
    return nullptr;
}

const FileRecord* FileIndex::findByName(const std::string& name) const {
    auto it = m_by_name.find(name);
    if (it == m_by_name.end() || it->second.empty()) {
        return nullptr;
    }
    return &m_files[it->second.front()];
}

std::vector<const FileRecord*> FileIndex::filesNamed(const std::string& name) const {
    std::vector<const FileRecord*> result;
    auto it = m_by_name.find(name);
    if (it != m_by_name.end()) {
        for (size_t file_index : it->second) {
            result.push_back(&m_files[file_index]);
        }
    }
    return result;
}

const FileRecord* FileIndex::findInDirectory(const std::string& directory) const {
    if (directory.empty()) {
        return nullptr;
    }

    for (const auto& file : m_files) {
        size_t slash = file.path.find_last_of('/');
        if (slash == std::string::npos) {
            continue;
        }
        std::string parent = file.path.substr(0, slash);
        if (endsWithSegment(parent, directory)) {
            return &file;
        }
    }
    return nullptr;
}

bool FileIndex::endsWithSegment(const std::string& path, const std::string& suffix) {
    if (suffix.empty() || path.size() < suffix.size()) {
        return false;
    }
    if (path.compare(path.size() - suffix.size(), suffix.size(), suffix) != 0) {
        return false;
    }
    if (path.size() == suffix.size() || suffix.front() == '/') {
        return true;
    }
    return path[path.size() - suffix.size() - 1] == '/';
}

} // namespace RepoLens
