// =================================================================
// include/RepoLens/CliParser.hpp
// =================================================================
// Defines the interface for parsing command-line arguments.
// This class encapsulates all interaction with the CLI11 library.

#pragma once

#include "CLI/CLI.hpp"
#include <memory>
#include <string>
#include <vector>

namespace RepoLens {

// Parsed command information. Zero or empty values mean "not given on the
// command line" and leave the configured value in place.
struct Commands {
    std::string active_command; // Name of the subcommand triggered

    // Shared by 'analyze' and 'stats'
    std::string repo_path = ".";
    std::string config_path;
    std::vector<std::string> exclude_patterns;
    size_t max_file_size = 0;
    size_t workers = 0;
    bool verbose = false;

    // Options for 'analyze'
    std::string format;
    std::string output_path;
    std::vector<std::string> kinds;

    // Options for 'stats'
    size_t top = 10;

    // Options for 'init'
    bool force = false;
};

class CliParser {
public:
    CliParser() = default;

    /**
     * @brief Sets up all CLI commands, options, and flags.
     * @return A shared pointer to the configured CLI::App object.
     */
    std::shared_ptr<CLI::App> setupCli();

    /**
     * @brief Retrieves the parsed command data.
     * @return A const reference to the Commands struct.
     */
    const Commands& getCommands() const;

private:
    void setupAnalyzeCommand(CLI::App& app);
    void setupStatsCommand(CLI::App& app);
    void setupLanguagesCommand(CLI::App& app);
    void setupInitCommand(CLI::App& app);
    void addScanOptions(CLI::App& sub);

    std::shared_ptr<CLI::App> m_app;
    Commands m_commands;
};

} // namespace RepoLens
