// =================================================================
// src/RepoLens/AnalyzerConfig.cpp
// =================================================================
// Implementation for YAML configuration loading.

#include "RepoLens/AnalyzerConfig.hpp"
#include "RepoLens/CliParser.hpp"
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <fstream>

namespace RepoLens {

namespace {

template<typename T>
void readValue(const YAML::Node& section, const std::string& section_name,
               const std::string& key, T& target) {
    if (!section[key]) {
        return;
    }
    try {
        target = section[key].as<T>();
    } catch (const YAML::Exception& e) {
        LOG_WARNING("AnalyzerConfig", "Invalid value for " + section_name + "." + key +
                    ", using default (" + e.what() + ")");
    }
}

bool isKnownFormat(const std::string& format) {
    return format == "json" || format == "text" || format == "dot";
}

} // namespace

bool AnalyzerConfig::loadFromFile(const std::string& config_path) {
    std::error_code ec;
    if (!std::filesystem::exists(config_path, ec)) {
        LOG_DEBUG("AnalyzerConfig", "No configuration at " + config_path + ", using defaults");
        return false;
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(config_path);
    } catch (const YAML::Exception& e) {
        LOG_ERROR("AnalyzerConfig", "Failed to parse configuration file " + config_path + ": " + e.what());
        return false;
    }

    if (!root.IsMap()) {
        if (!root.IsNull()) {
            LOG_WARNING("AnalyzerConfig", "Configuration root is not a mapping, using defaults");
        }
        return true;
    }

    if (const YAML::Node scan = root["scan"]) {
        readValue(scan, "scan", "max_file_size", max_file_size);
        readValue(scan, "scan", "follow_symlinks", follow_symlinks);
        if (scan["ignore"]) {
            if (scan["ignore"].IsSequence()) {
                for (const auto& item : scan["ignore"]) {
                    try {
                        ignore_patterns.push_back(item.as<std::string>());
                    } catch (const YAML::Exception& e) {
                        LOG_WARNING("AnalyzerConfig", std::string("Skipping ignore entry: ") + e.what());
                    }
                }
            } else {
                LOG_WARNING("AnalyzerConfig", "scan.ignore must be a list, ignoring it");
            }
        }
    }

    if (const YAML::Node analysis = root["analysis"]) {
        readValue(analysis, "analysis", "workers", workers);
        readValue(analysis, "analysis", "max_line_length", max_line_length);
    }

    if (const YAML::Node output = root["output"]) {
        std::string configured_format = format;
        readValue(output, "output", "format", configured_format);
        if (isKnownFormat(configured_format)) {
            format = configured_format;
        } else {
            LOG_WARNING("AnalyzerConfig", "Unknown output.format '" + configured_format + "', using " + format);
        }
        readValue(output, "output", "path", output_path);
    }

    if (const YAML::Node logging = root["logging"]) {
        readValue(logging, "logging", "directory", log_directory);
        readValue(logging, "logging", "console_level", console_level);
        readValue(logging, "logging", "file_logging", file_logging);
    }

    LOG_DEBUG("AnalyzerConfig", "Loaded configuration from " + config_path);
    return true;
}

void AnalyzerConfig::applyCommandOverrides(const Commands& commands) {
    if (commands.max_file_size > 0) {
        max_file_size = commands.max_file_size;
    }
    if (commands.workers > 0) {
        workers = commands.workers;
    }
    if (!commands.format.empty()) {
        format = commands.format;
    }
    if (!commands.output_path.empty()) {
        output_path = commands.output_path;
    }
    if (commands.verbose) {
        console_level = "DEBUG";
    }
    ignore_patterns.insert(ignore_patterns.end(),
                           commands.exclude_patterns.begin(), commands.exclude_patterns.end());
}

bool AnalyzerConfig::validate() const {
    bool valid = true;

    if (max_file_size == 0) {
        LOG_ERROR("AnalyzerConfig", "scan.max_file_size must be greater than 0");
        valid = false;
    }

    if (workers == 0 || workers > 256) {
        LOG_ERROR("AnalyzerConfig", "analysis.workers must be between 1 and 256");
        valid = false;
    }

    if (max_line_length < 80 || max_line_length > kMaxLineLengthLimit) {
        LOG_ERROR("AnalyzerConfig", "analysis.max_line_length must be between 80 and " +
                  std::to_string(kMaxLineLengthLimit));
        valid = false;
    }

    if (!isKnownFormat(format)) {
        LOG_ERROR("AnalyzerConfig", "output.format must be one of json, text, dot");
        valid = false;
    }

    // Unknown names fall back to whichever default is passed in
    if (Logger::parseLevel(console_level, LogLevel::DEBUG) != Logger::parseLevel(console_level, LogLevel::CRITICAL)) {
        LOG_ERROR("AnalyzerConfig", "logging.console_level '" + console_level + "' is not a log level");
        valid = false;
    }

    if (file_logging && log_directory.empty()) {
        LOG_ERROR("AnalyzerConfig", "logging.directory cannot be empty when file_logging is on");
        valid = false;
    }

    return valid;
}

ScanOptions AnalyzerConfig::scanOptions() const {
    ScanOptions options;
    options.max_file_size = max_file_size;
    options.follow_symlinks = follow_symlinks;
    options.ignore_patterns = ignore_patterns;
    return options;
}

AnalyzerOptions AnalyzerConfig::analyzerOptions() const {
    AnalyzerOptions options;
    options.workers = workers;
    options.max_line_length = max_line_length;
    return options;
}

LogLevel AnalyzerConfig::consoleLogLevel() const {
    return Logger::parseLevel(console_level, LogLevel::INFO);
}

bool AnalyzerConfig::writeDefault(const std::string& config_path, bool overwrite) {
    namespace fs = std::filesystem;

    std::error_code ec;
    if (fs::exists(config_path, ec) && !overwrite) {
        LOG_WARNING("AnalyzerConfig", config_path + " already exists (use --force to overwrite)");
        return false;
    }

    fs::path parent = fs::path(config_path).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            LOG_ERROR("AnalyzerConfig", "Cannot create " + parent.string() + ": " + ec.message());
            return false;
        }
    }

    std::ofstream file(config_path);
    if (!file.is_open()) {
        LOG_ERROR("AnalyzerConfig", "Cannot write " + config_path);
        return false;
    }
    file << defaultConfigText();
    return static_cast<bool>(file);
}

std::string AnalyzerConfig::defaultConfigText() {
    return R"(# RepoLens configuration

scan:
  # Files larger than this (bytes) are indexed without content
  max_file_size: 10485760
  follow_symlinks: false
  # Extra gitignore-style patterns; .repolensignore is read as well
  ignore:
    - 'vendor/'
    - '*.generated.*'

analysis:
  workers: 1
  # Lines longer than this are skipped (minified bundles)
  max_line_length: 4000

output:
  format: json   # json, text or dot
  path: ''       # empty writes to stdout

logging:
  directory: .repolens/logs
  console_level: INFO
  file_logging: false
)";
}

} // namespace RepoLens
