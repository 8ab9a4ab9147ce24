// =================================================================
// src/RepoLens/CliParser.cpp
// =================================================================
// Implementation for the CLI parser.

#include "RepoLens/CliParser.hpp"

namespace RepoLens {

std::shared_ptr<CLI::App> CliParser::setupCli() {
    m_app = std::make_shared<CLI::App>("RepoLens: cross-language dependency graphs for source repositories.");
    m_app->require_subcommand(0, 1);

    // Set command callback to store which subcommand was used
    m_app->callback([this]() {
        for (auto* subcommand : m_app->get_subcommands()) {
            if (subcommand->parsed()) {
                m_commands.active_command = subcommand->get_name();
                break;
            }
        }
    });

    setupAnalyzeCommand(*m_app);
    setupStatsCommand(*m_app);
    setupLanguagesCommand(*m_app);
    setupInitCommand(*m_app);

    return m_app;
}

const Commands& CliParser::getCommands() const {
    return m_commands;
}

void CliParser::addScanOptions(CLI::App& sub) {
    sub.add_option("path", m_commands.repo_path, "Repository root to analyze (default: current directory).")
        ->check(CLI::ExistingDirectory);
    sub.add_option("-c,--config", m_commands.config_path,
                   "Configuration file (default: <path>/.repolens/config.yml).");
    sub.add_option("-j,--workers", m_commands.workers, "Number of analysis threads.")
        ->check(CLI::Range(1, 256));
    sub.add_option("--exclude", m_commands.exclude_patterns,
                   "Additional gitignore-style pattern to skip (repeatable).");
    sub.add_option("--max-file-size", m_commands.max_file_size,
                   "Files larger than this many bytes are indexed without content.");
    sub.add_flag("-v,--verbose", m_commands.verbose, "Show debug output.");
}

void CliParser::setupAnalyzeCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("analyze", "Resolves inter-file references and writes the relationship graph.");
    addScanOptions(*sub);
    sub->add_option("-f,--format", m_commands.format, "Report format: json, text or dot.")
        ->check(CLI::IsMember({"json", "text", "dot"}));
    sub->add_option("-o,--output", m_commands.output_path, "Write the report to a file instead of stdout.");
    sub->add_option("--kind", m_commands.kinds,
                    "Only report relationships of this kind (import, export, function-call, variable-ref).")
        ->check(CLI::IsMember({"import", "export", "function-call", "variable-ref"}));
}

void CliParser::setupStatsCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("stats", "Prints relationship counts and the most referenced files.");
    addScanOptions(*sub);
    sub->add_option("--top", m_commands.top, "Number of most referenced files to list (default: 10).");
}

void CliParser::setupLanguagesCommand(CLI::App& app) {
    app.add_subcommand("languages", "Lists the languages whose references can be resolved.");
}

void CliParser::setupInitCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("init", "Writes a default .repolens/config.yml in the current directory.");
    sub->add_flag("--force", m_commands.force, "Overwrite an existing configuration file.");
}

} // namespace RepoLens
