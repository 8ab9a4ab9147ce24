// =================================================================
// src/RepoLens/PathResolver.cpp
// =================================================================
// Implementation for the shared resolution steps.

#include "RepoLens/PathResolver.hpp"

namespace RepoLens {

PathResolver::PathResolver(const FileIndex& index)
    : m_index(index)
{
}

const FileRecord* PathResolver::exact(const std::string& candidate) const {
    if (candidate.empty()) {
        return nullptr;
    }
    return m_index.find(candidate);
}

const FileRecord* PathResolver::withExtensions(const std::string& candidate,
                                               const std::vector<std::string>& extensions) const {
    for (const auto& path : expand(candidate, extensions)) {
        if (const FileRecord* record = exact(path)) {
            return record;
        }
    }
    return nullptr;
}

const FileRecord* PathResolver::bySuffix(const std::vector<std::string>& suffixes) const {
    return m_index.findBySuffix(suffixes);
}

const FileRecord* PathResolver::byFileName(const std::string& file_name) const {
    if (file_name.empty()) {
        return nullptr;
    }
    return m_index.findByName(file_name);
}

const FileRecord* PathResolver::inDirectory(const std::string& directory) const {
    return m_index.findInDirectory(directory);
}

std::vector<std::string> PathResolver::expand(const std::string& candidate,
                                              const std::vector<std::string>& extensions) {
    std::vector<std::string> result;
    result.reserve(extensions.size());
    for (const auto& extension : extensions) {
        // "/index.ts" against the repository root is just "index.ts"
        if (candidate.empty() && !extension.empty() && extension.front() == '/') {
            result.push_back(extension.substr(1));
        } else if (!candidate.empty()) {
            result.push_back(candidate + extension);
        }
    }
    return result;
}

bool PathResolver::isRelative(const std::string& reference) {
    return reference == "." || reference == ".." ||
           reference.rfind("./", 0) == 0 || reference.rfind("../", 0) == 0;
}

std::string PathResolver::directoryOf(const std::string& path) {
    size_t slash = path.find_last_of('/');
    return slash == std::string::npos ? "" : path.substr(0, slash);
}

std::string PathResolver::ascend(const std::string& directory, size_t levels) {
    std::string current = directory;
    for (size_t i = 0; i < levels && !current.empty(); ++i) {
        current = directoryOf(current);
    }
    return current;
}

std::string PathResolver::joinPath(const std::string& directory, const std::string& relative) {
    std::vector<std::string> parts = split(directory, "/");

    for (const auto& part : split(relative, "/")) {
        if (part == "..") {
            if (!parts.empty()) {
                parts.pop_back();
            }
        } else if (part != ".") {
            parts.push_back(part);
        }
    }

    std::string joined;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            joined += '/';
        }
        joined += parts[i];
    }
    return joined;
}

std::string PathResolver::resolveRelative(const std::string& from_file, const std::string& reference) {
    return joinPath(directoryOf(from_file), reference);
}

std::string PathResolver::baseName(const std::string& path) {
    size_t slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

std::vector<std::string> PathResolver::split(const std::string& text, const std::string& separator) {
    std::vector<std::string> parts;
    if (separator.empty()) {
        if (!text.empty()) {
            parts.push_back(text);
        }
        return parts;
    }

    size_t start = 0;
    while (start <= text.size()) {
        size_t found = text.find(separator, start);
        std::string part = text.substr(start, found == std::string::npos ? std::string::npos : found - start);
        if (!part.empty()) {
            parts.push_back(part);
        }
        if (found == std::string::npos) {
            break;
        }
        start = found + separator.size();
    }
    return parts;
}

} // namespace RepoLens
