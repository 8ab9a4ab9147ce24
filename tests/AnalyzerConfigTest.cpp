// =================================================================
// tests/AnalyzerConfigTest.cpp
// =================================================================
// Unit tests for YAML configuration loading and command overrides.

#include "RepoLens/AnalyzerConfig.hpp"
#include "RepoLens/CliParser.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <vector>

namespace fs = std::filesystem;

class AnalyzerConfigTest {
private:
    std::string test_dir;

    void writeFile(const std::string& name, const std::string& content) {
        fs::create_directories(test_dir);
        std::ofstream(test_dir + "/" + name) << content;
    }

    void cleanupTestFiles() {
        if (fs::exists(test_dir)) {
            fs::remove_all(test_dir);
        }
    }

    static RepoLens::Commands parse(RepoLens::CliParser& parser, std::vector<const char*> argv) {
        auto app = parser.setupCli();
        app->parse(static_cast<int>(argv.size()), argv.data());
        return parser.getCommands();
    }

public:
    AnalyzerConfigTest() : test_dir("test_analyzer_config") {}

    void testDefaults() {
        std::cout << "Testing default configuration..." << std::endl;

        RepoLens::AnalyzerConfig config;
        assert(config.validate());
        assert(config.workers == 1);
        assert(config.max_line_length == 4000);
        assert(config.format == "json");
        assert(config.consoleLogLevel() == RepoLens::LogLevel::INFO);

        assert(!config.loadFromFile("test_analyzer_config_missing.yml") && "A missing file keeps defaults");
        assert(config.max_file_size == 10 * 1024 * 1024);

        std::cout << "✓ Default configuration test passed" << std::endl;
    }

    void testLoadFromFile() {
        std::cout << "Testing configuration loading..." << std::endl;

        writeFile("config.yml",
                  "scan:\n"
                  "  max_file_size: 2048\n"
                  "  follow_symlinks: true\n"
                  "  ignore:\n"
                  "    - 'vendor/'\n"
                  "    - '*.gen.ts'\n"
                  "analysis:\n"
                  "  workers: 4\n"
                  "  max_line_length: 1000\n"
                  "output:\n"
                  "  format: dot\n"
                  "  path: graph.dot\n"
                  "logging:\n"
                  "  console_level: debug\n"
                  "  file_logging: true\n");

        RepoLens::AnalyzerConfig config;
        assert(config.loadFromFile(test_dir + "/config.yml"));
        assert(config.max_file_size == 2048);
        assert(config.follow_symlinks);
        assert(config.ignore_patterns.size() == 2);
        assert(config.ignore_patterns[1] == "*.gen.ts");
        assert(config.workers == 4);
        assert(config.max_line_length == 1000);
        assert(config.format == "dot");
        assert(config.output_path == "graph.dot");
        assert(config.file_logging);
        assert(config.log_directory == ".repolens/logs" && "Missing keys keep their default");
        assert(config.consoleLogLevel() == RepoLens::LogLevel::DEBUG);
        assert(config.validate());

        RepoLens::ScanOptions scan = config.scanOptions();
        assert(scan.max_file_size == 2048);
        assert(scan.follow_symlinks);
        assert(scan.ignore_patterns.size() == 2);

        RepoLens::AnalyzerOptions analysis = config.analyzerOptions();
        assert(analysis.workers == 4);
        assert(analysis.max_line_length == 1000);
        assert(analysis.cancel_flag == nullptr);

        cleanupTestFiles();
        std::cout << "✓ Configuration loading test passed" << std::endl;
    }

    void testMalformedValues() {
        std::cout << "Testing malformed values..." << std::endl;

        writeFile("bad.yml",
                  "analysis:\n"
                  "  workers: many\n"
                  "output:\n"
                  "  format: xml\n"
                  "scan:\n"
                  "  ignore: 'vendor/'\n");

        RepoLens::AnalyzerConfig config;
        assert(config.loadFromFile(test_dir + "/bad.yml"));
        assert(config.workers == 1 && "Unparseable values keep the default");
        assert(config.format == "json" && "Unknown formats keep the default");
        assert(config.ignore_patterns.empty() && "A scalar is not a pattern list");

        writeFile("broken.yml", "scan: [unclosed\n");
        RepoLens::AnalyzerConfig broken;
        assert(!broken.loadFromFile(test_dir + "/broken.yml"));
        assert(broken.validate());

        writeFile("empty.yml", "");
        RepoLens::AnalyzerConfig empty;
        assert(empty.loadFromFile(test_dir + "/empty.yml"));
        assert(empty.validate());

        cleanupTestFiles();
        std::cout << "✓ Malformed values test passed" << std::endl;
    }

    void testValidation() {
        std::cout << "Testing validation..." << std::endl;

        RepoLens::Logger::getInstance().setConsoleLogging(false);

        RepoLens::AnalyzerConfig config;
        config.workers = 0;
        assert(!config.validate());

        config = RepoLens::AnalyzerConfig();
        config.workers = 257;
        assert(!config.validate());

        config = RepoLens::AnalyzerConfig();
        config.max_file_size = 0;
        assert(!config.validate());

        config = RepoLens::AnalyzerConfig();
        config.max_line_length = 79;
        assert(!config.validate());

        config = RepoLens::AnalyzerConfig();
        config.max_line_length = RepoLens::kMaxLineLengthLimit;
        assert(config.validate());
        config.max_line_length = RepoLens::kMaxLineLengthLimit + 1;
        assert(!config.validate() && "Lines beyond the hard limit cannot be scanned");

        config = RepoLens::AnalyzerConfig();
        config.format = "xml";
        assert(!config.validate());

        config = RepoLens::AnalyzerConfig();
        config.console_level = "loud";
        assert(!config.validate());

        config = RepoLens::AnalyzerConfig();
        config.console_level = "Warning";
        assert(config.validate() && "Level names are case-insensitive");

        config = RepoLens::AnalyzerConfig();
        config.file_logging = true;
        config.log_directory.clear();
        assert(!config.validate());

        RepoLens::Logger::getInstance().setConsoleLogging(true);

        std::cout << "✓ Validation test passed" << std::endl;
    }

    void testCommandOverrides() {
        std::cout << "Testing command-line overrides..." << std::endl;

        RepoLens::CliParser parser;
        RepoLens::Commands commands = parse(parser, {
            "repolens", "analyze", ".", "-j", "3", "--format", "text", "-o", "report.txt",
            "--exclude", "fixtures/", "--exclude", "*.snap", "--max-file-size", "4096",
            "--kind", "import", "-v"
        });

        assert(commands.active_command == "analyze");
        assert(commands.repo_path == ".");
        assert(commands.workers == 3);
        assert(commands.kinds.size() == 1 && commands.kinds[0] == "import");

        RepoLens::AnalyzerConfig config;
        config.ignore_patterns = {"vendor/"};
        config.format = "dot";
        config.applyCommandOverrides(commands);

        assert(config.workers == 3);
        assert(config.format == "text");
        assert(config.output_path == "report.txt");
        assert(config.max_file_size == 4096);
        assert(config.console_level == "DEBUG");
        assert(config.ignore_patterns.size() == 3 && "Command-line patterns add to configured ones");
        assert(config.ignore_patterns[0] == "vendor/");
        assert(config.ignore_patterns[2] == "*.snap");

        RepoLens::CliParser stats_parser;
        RepoLens::Commands stats = parse(stats_parser, {"repolens", "stats", "--top", "3"});
        assert(stats.active_command == "stats");
        assert(stats.top == 3);

        RepoLens::AnalyzerConfig untouched;
        untouched.workers = 2;
        untouched.applyCommandOverrides(stats);
        assert(untouched.workers == 2 && "Options not given leave the configuration alone");
        assert(untouched.format == "json");

        std::cout << "✓ Command-line overrides test passed" << std::endl;
    }

    void testInvalidArguments() {
        std::cout << "Testing invalid arguments..." << std::endl;

        bool rejected = false;
        try {
            RepoLens::CliParser parser;
            parse(parser, {"repolens", "analyze", "--format", "xml"});
        } catch (const CLI::ParseError&) {
            rejected = true;
        }
        assert(rejected && "Unknown formats are rejected by the parser");

        rejected = false;
        try {
            RepoLens::CliParser parser;
            parse(parser, {"repolens", "analyze", "-j", "0"});
        } catch (const CLI::ParseError&) {
            rejected = true;
        }
        assert(rejected && "Worker count must be positive");

        std::cout << "✓ Invalid arguments test passed" << std::endl;
    }

    void testWriteDefault() {
        std::cout << "Testing default configuration file..." << std::endl;

        std::string path = test_dir + "/.repolens/config.yml";
        assert(RepoLens::AnalyzerConfig::writeDefault(path));
        assert(fs::exists(path));

        RepoLens::AnalyzerConfig config;
        assert(config.loadFromFile(path));
        assert(config.validate() && "The generated file must load cleanly");
        assert(config.ignore_patterns.size() == 2);
        assert(config.max_file_size == 10485760);

        RepoLens::Logger::getInstance().setConsoleLogging(false);
        assert(!RepoLens::AnalyzerConfig::writeDefault(path) && "Existing files are kept");
        RepoLens::Logger::getInstance().setConsoleLogging(true);
        assert(RepoLens::AnalyzerConfig::writeDefault(path, true));

        cleanupTestFiles();
        std::cout << "✓ Default configuration file test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running AnalyzerConfig unit tests..." << std::endl;

        testDefaults();
        testLoadFromFile();
        testMalformedValues();
        testValidation();
        testCommandOverrides();
        testInvalidArguments();
        testWriteDefault();

        std::cout << "All AnalyzerConfig tests passed!" << std::endl;
    }
};

int main() {
    try {
        AnalyzerConfigTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
