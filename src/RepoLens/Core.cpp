// =================================================================
// src/RepoLens/Core.cpp
// =================================================================
// Implementation for the main application logic.

#include "RepoLens/Core.hpp"
#include "RepoLens/CodeAnalyzer.hpp"
#include "RepoLens/Language.hpp"
#include "RepoLens/Logger.hpp"
#include "RepoLens/ReportWriter.hpp"
#include "RepoLens/RepositoryScanner.hpp"
#include <csignal>
#include <filesystem>
#include <iomanip>
#include <iostream>

namespace RepoLens {

namespace {

void handleInterrupt(int) {
    Core::cancelFlag().store(true);
}

} // namespace

Core::Core(const Commands& commands)
    : m_commands(commands)
{
}

std::atomic<bool>& Core::cancelFlag() {
    static std::atomic<bool> flag{false};
    return flag;
}

int Core::run() {
    if (m_commands.active_command == "analyze") {
        return handleAnalyze();
    } else if (m_commands.active_command == "stats") {
        return handleStats();
    } else if (m_commands.active_command == "languages") {
        return handleLanguages();
    } else if (m_commands.active_command == "init") {
        return handleInit();
    } else if (m_commands.active_command.empty()) {
        std::cout << "No command given. Run 'repolens --help' for usage." << std::endl;
        return 0;
    }

    std::cerr << "Error: Unknown command '" << m_commands.active_command << "'." << std::endl;
    return 1;
}

std::string Core::configPath() const {
    if (!m_commands.config_path.empty()) {
        return m_commands.config_path;
    }
    return (std::filesystem::path(m_commands.repo_path) / ".repolens" / "config.yml").string();
}

bool Core::loadConfiguration() {
    if (!m_commands.config_path.empty() && !std::filesystem::exists(m_commands.config_path)) {
        LOG_ERROR("Core", "Configuration file not found: " + m_commands.config_path);
        return false;
    }

    m_config.loadFromFile(configPath());
    m_config.applyCommandOverrides(m_commands);
    return m_config.validate();
}

void Core::configureLogging() const {
    Logger& logger = Logger::getInstance();
    logger.setConsoleLogLevel(m_config.consoleLogLevel());
    if (m_config.file_logging) {
        logger.initialize(m_config.log_directory);
    }
}

RelationshipGraph Core::buildGraph(FileIndex& index) {
    RepositoryScanner scanner(m_commands.repo_path, m_config.scanOptions());
    TreeNode root = scanner.scan();
    index = FileIndex::build(root);

    AnalyzerOptions options = m_config.analyzerOptions();
    options.cancel_flag = &cancelFlag();
    options.on_file_done = [](size_t done, size_t total) {
        if (done % 500 == 0 || done == total) {
            LOG_DEBUG("Core", "Analyzed " + std::to_string(done) + "/" + std::to_string(total) + " files");
        }
    };

    cancelFlag().store(false);
    std::signal(SIGINT, handleInterrupt);

    CodeAnalyzer analyzer(index, options);
    RelationshipGraph graph = analyzer.analyze();

    std::signal(SIGINT, SIG_DFL);

    if (analyzer.lastSummary().cancelled) {
        LOG_WARNING("Core", "Interrupted: report covers " +
                    std::to_string(analyzer.lastSummary().files_analyzed) + " analyzed files");
    }
    return graph;
}

int Core::handleAnalyze() {
    if (!loadConfiguration()) {
        return 1;
    }
    configureLogging();

    std::vector<RelationshipKind> kinds;
    for (const auto& name : m_commands.kinds) {
        if (auto kind = relationshipKindFromName(name)) {
            kinds.push_back(*kind);
        }
    }

    FileIndex index;
    RelationshipGraph graph = buildGraph(index);

    ReportWriter writer(index, graph);
    writer.setKindFilter(kinds);

    ReportFormat format = reportFormatFromName(m_config.format);
    if (!m_config.output_path.empty()) {
        return writer.writeToFile(m_config.output_path, format) ? 0 : 1;
    }

    writer.write(std::cout, format);
    return 0;
}

int Core::handleStats() {
    if (!loadConfiguration()) {
        return 1;
    }
    configureLogging();

    FileIndex index;
    RelationshipGraph graph = buildGraph(index);
    GraphStats stats = graph.stats();

    size_t with_content = 0;
    for (const auto& file : index.files()) {
        if (file.hasContent()) {
            ++with_content;
        }
    }

    std::cout << "Files indexed:        " << index.size() << " (" << with_content << " with content)\n";
    std::cout << "Relationships:        " << stats.total << "\n";
    for (const auto& entry : stats.by_kind) {
        std::cout << "  " << std::left << std::setw(20) << relationshipKindName(entry.first)
                  << entry.second << "\n";
    }
    std::cout << "Distinct edges:       " << graph.distinctEdges().size() << "\n";
    std::cout << "Referencing files:    " << stats.source_files << "\n";
    std::cout << "Referenced files:     " << stats.target_files << "\n";

    auto top = graph.mostReferenced(m_commands.top);
    if (!top.empty()) {
        std::cout << "\nMost referenced files:\n";
        for (const auto& entry : top) {
            std::cout << "  " << std::right << std::setw(5) << entry.second << "  " << entry.first << "\n";
        }
    }
    std::cout << std::flush;
    return 0;
}

int Core::handleLanguages() {
    for (Language language : supportedLanguages()) {
        std::cout << std::left << std::setw(20) << languageName(language)
                  << familyName(familyOf(language)) << "\n";
    }
    std::cout << std::flush;
    return 0;
}

int Core::handleInit() {
    std::cout << "Initializing RepoLens configuration..." << std::endl;

    const std::string path = ".repolens/config.yml";
    if (!AnalyzerConfig::writeDefault(path, m_commands.force)) {
        return 1;
    }

    std::cout << "Wrote " << path << std::endl;
    return 0;
}

} // namespace RepoLens
