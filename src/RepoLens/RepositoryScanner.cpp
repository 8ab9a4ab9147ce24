// =================================================================
// src/RepoLens/RepositoryScanner.cpp
// =================================================================
// Implementation for the repository tree scanner.

#include "RepoLens/RepositoryScanner.hpp"
#include "RepoLens/Language.hpp"
#include "RepoLens/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <fstream>

namespace RepoLens {

namespace fs = std::filesystem;

namespace {

std::string normalizedRoot(const std::string& root_path) {
    fs::path root = fs::absolute(root_path).lexically_normal();
    // "repo/" normalizes to "repo/" with an empty filename
    if (!root.has_filename() && root.has_parent_path() && root != root.root_path()) {
        root = root.parent_path();
    }
    return root.string();
}

} // namespace

RepositoryScanner::RepositoryScanner(const std::string& root_path, const ScanOptions& options)
    : m_root_path(normalizedRoot(root_path)),
      m_options(options)
{
    if (m_options.use_default_ignores) {
        m_ignore_patterns.addPatterns(IgnorePatternSet::defaultPatterns());
    }
    m_ignore_patterns.addPatterns(m_options.ignore_patterns);
    if (m_options.use_ignore_file) {
        loadIgnoreFile();
    }
}

TreeNode RepositoryScanner::scan() {
    auto start_time = std::chrono::steady_clock::now();
    m_stats = ScanStats();

    TreeNode root = makeDirectoryNode("");
    root.name = fs::path(m_root_path).filename().string();

    std::error_code ec;
    if (!fs::is_directory(m_root_path, ec)) {
        LOG_ERROR("RepositoryScanner", "Not a directory: " + m_root_path);
        ++m_stats.errors;
        return root;
    }

    m_visited_directories.clear();
    markVisited(m_root_path);
    root.children = scanDirectory(m_root_path, "").children;

    auto end_time = std::chrono::steady_clock::now();
    m_stats.duration_ms = static_cast<long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count());

    Logger::getInstance().logScanSummary(m_root_path, m_stats.files, m_stats.directories,
                                         m_stats.ignored, m_stats.duration_ms);
    return root;
}

TreeNode RepositoryScanner::scanDirectory(const fs::path& directory, const std::string& relative_path) {
    TreeNode node = makeDirectoryNode(relative_path);

    std::vector<fs::directory_entry> entries;
    std::error_code ec;
    for (fs::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec)) {
        entries.push_back(*it);
    }
    if (ec) {
        LOG_WARNING("RepositoryScanner", "Cannot read directory " + directory.string() + ": " + ec.message());
        ++m_stats.errors;
    }

    std::sort(entries.begin(), entries.end(),
              [](const fs::directory_entry& a, const fs::directory_entry& b) {
                  return a.path().filename().string() < b.path().filename().string();
              });

    for (const auto& entry : entries) {
        std::string name = entry.path().filename().string();
        std::string child_path = relative_path.empty() ? name : relative_path + "/" + name;

        std::error_code status_ec;
        bool is_symlink = entry.is_symlink(status_ec);
        bool is_directory = entry.is_directory(status_ec);

        if (m_ignore_patterns.shouldIgnore(child_path, is_directory)) {
            ++m_stats.ignored;
            continue;
        }

        if (is_directory) {
            if (is_symlink && !m_options.follow_symlinks) {
                LOG_DEBUG("RepositoryScanner", "Not following symlinked directory " + child_path);
                continue;
            }
            if (!markVisited(entry.path())) {
                LOG_WARNING("RepositoryScanner", "Skipping " + child_path + ": directory already scanned (symlink cycle)");
                continue;
            }
            ++m_stats.directories;
            node.children.push_back(scanDirectory(entry.path(), child_path));
        } else if (entry.is_regular_file(status_ec)) {
            node.children.push_back(scanFile(entry, child_path));
        }
    }

    return node;
}

bool RepositoryScanner::markVisited(const fs::path& directory) {
    std::error_code ec;
    fs::path canonical = fs::canonical(directory, ec);
    if (ec) {
        // Unresolvable paths cannot be compared; let the walk report them
        return true;
    }
    return m_visited_directories.insert(canonical.string()).second;
}

TreeNode RepositoryScanner::scanFile(const fs::directory_entry& entry, const std::string& relative_path) {
    ++m_stats.files;

    Language language = detectLanguage(relative_path);
    TreeNode node = makeFileNode(relative_path, language);

    std::error_code ec;
    uintmax_t size = entry.file_size(ec);
    node.size = ec ? 0 : static_cast<size_t>(size);
    node.last_modified = entry.last_write_time(ec);

    if (familyOf(language) == LanguageFamily::Unsupported) {
        return node;
    }

    if (node.size > m_options.max_file_size) {
        LOG_INFO("RepositoryScanner", "Skipping content of large file: " + relative_path +
                 " (" + std::to_string(node.size) + " bytes)");
        ++m_stats.oversized;
        return node;
    }

    node.content = readContent(entry.path(), node.size);
    if (node.content) {
        ++m_stats.files_with_content;
    }
    return node;
}

std::optional<std::string> RepositoryScanner::readContent(const fs::path& file_path, size_t size) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        LOG_WARNING("RepositoryScanner", "Cannot open " + file_path.string());
        ++m_stats.errors;
        return std::nullopt;
    }

    std::string content(size, '\0');
    file.read(&content[0], static_cast<std::streamsize>(size));
    content.resize(static_cast<size_t>(file.gcount()));

    constexpr size_t sample_size = 512;
    if (!looksLikeText(content.substr(0, sample_size))) {
        ++m_stats.binary;
        return std::nullopt;
    }
    return content;
}

bool RepositoryScanner::looksLikeText(const std::string& sample) {
    if (sample.empty()) {
        return true;
    }

    size_t printable_chars = 0;
    for (char c : sample) {
        if (c == '\0') {
            return false;
        }
        unsigned char uc = static_cast<unsigned char>(c);
        // UTF-8 multibyte sequences count as printable
        if (std::isprint(uc) || std::isspace(uc) || uc >= 0x80) {
            ++printable_chars;
        }
    }

    return static_cast<double>(printable_chars) / sample.size() > 0.95;
}

void RepositoryScanner::addIgnorePattern(const std::string& pattern) {
    m_ignore_patterns.addPattern(pattern);
}

void RepositoryScanner::setMaxFileSize(size_t max_size) {
    m_options.max_file_size = max_size;
}

void RepositoryScanner::loadIgnoreFile() {
    std::string ignore_file_path = (fs::path(m_root_path) / ".repolensignore").string();
    size_t patterns_loaded = m_ignore_patterns.loadFromFile(ignore_file_path);

    if (patterns_loaded > 0) {
        LOG_INFO("RepositoryScanner", "Loaded .repolensignore with " + std::to_string(patterns_loaded) + " patterns");
    }
}

} // namespace RepoLens
