// =================================================================
// include/RepoLens/Core.hpp
// =================================================================
// Defines the core application orchestrator.

#pragma once

#include "RepoLens/AnalyzerConfig.hpp"
#include "RepoLens/CliParser.hpp"
#include "RepoLens/FileIndex.hpp"
#include "RepoLens/Relationship.hpp"
#include <atomic>
#include <string>

namespace RepoLens {

class Core {
public:
    /**
     * @brief Constructs the Core application object.
     * @param commands The parsed command-line arguments.
     */
    explicit Core(const Commands& commands);

    /**
     * @brief Runs the command selected on the command line.
     * @return An integer exit code (0 for success).
     */
    int run();

    /**
     * @brief Flag raised by SIGINT; the analyzer stops starting new files.
     */
    static std::atomic<bool>& cancelFlag();

private:
    // Command Handlers
    int handleAnalyze();
    int handleStats();
    int handleLanguages();
    int handleInit();

    bool loadConfiguration();
    void configureLogging() const;

    /**
     * @brief Scan the repository and analyze it
     * @param index Receives the index; it must outlive the returned graph's use
     */
    RelationshipGraph buildGraph(FileIndex& index);

    std::string configPath() const;

    const Commands& m_commands;
    AnalyzerConfig m_config;
};

} // namespace RepoLens
