// =================================================================
// include/RepoLens/AnalyzerConfig.hpp
// =================================================================
// Configuration for scanning, analysis, reports and logging.

#pragma once

#include "RepoLens/CodeAnalyzer.hpp"
#include "RepoLens/Logger.hpp"
#include "RepoLens/RepositoryScanner.hpp"
#include <string>
#include <vector>

namespace RepoLens {

struct Commands;

/**
 * @brief Settings read from .repolens/config.yml
 *
 * Every field has a default, so a missing file or a missing key is never an
 * error. Malformed values are reported as warnings and keep the default.
 */
struct AnalyzerConfig {
    // scan:
    size_t max_file_size = 10 * 1024 * 1024;
    std::vector<std::string> ignore_patterns;
    bool follow_symlinks = false;

    // analysis:
    size_t workers = 1;
    size_t max_line_length = 4000;

    // output:
    std::string format = "json";
    std::string output_path;

    // logging:
    std::string log_directory = ".repolens/logs";
    std::string console_level = "INFO";
    bool file_logging = false;

    /**
     * @brief Load settings from a YAML file
     * @param config_path Path to the configuration file
     * @return true if the file existed and parsed; false leaves defaults in place
     */
    bool loadFromFile(const std::string& config_path);

    /**
     * @brief Apply command-line overrides on top of the loaded values
     */
    void applyCommandOverrides(const Commands& commands);

    /**
     * @brief Check value ranges, logging every problem found
     * @return True if configuration is valid
     */
    bool validate() const;

    ScanOptions scanOptions() const;
    AnalyzerOptions analyzerOptions() const;
    LogLevel consoleLogLevel() const;

    /**
     * @brief Write the default configuration file
     * @param config_path Destination; parent directories are created
     * @param overwrite Replace an existing file
     * @return true if the file was written
     */
    static bool writeDefault(const std::string& config_path, bool overwrite = false);

    /**
     * @brief Commented YAML text written by writeDefault()
     */
    static std::string defaultConfigText();
};

} // namespace RepoLens
