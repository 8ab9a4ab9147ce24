// =================================================================
// tests/RepositoryScannerTest.cpp
// =================================================================
// Unit tests for RepositoryScanner component.

#include "RepoLens/CodeAnalyzer.hpp"
#include "RepoLens/FileIndex.hpp"
#include "RepoLens/RepositoryScanner.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

class RepositoryScannerTest {
private:
    std::string test_dir;

    void setupTestFiles() {
        fs::create_directories(test_dir + "/src");
        fs::create_directories(test_dir + "/docs");
        fs::create_directories(test_dir + "/empty");
        fs::create_directories(test_dir + "/build");
        fs::create_directories(test_dir + "/generated");
        fs::create_directories(test_dir + "/node_modules/react");

        std::ofstream(test_dir + "/src/index.ts") << "import { helper } from './utils'\n";
        std::ofstream(test_dir + "/src/utils.ts") << "export const helper = 1\n";
        std::ofstream(test_dir + "/src/big.py") << std::string(200, '#') << "\n";
        std::ofstream(test_dir + "/docs/README.md") << "# Documentation\n";
        std::ofstream(test_dir + "/build/out.js") << "require('./x')\n";
        std::ofstream(test_dir + "/generated/api.ts") << "export {}\n";
        std::ofstream(test_dir + "/node_modules/react/index.js") << "module.exports = {}\n";
        std::ofstream(test_dir + "/.repolensignore") << "# local rules\ngenerated/\n";

        std::ofstream blob(test_dir + "/src/blob.c", std::ios::binary);
        const char bytes[] = {'\x7f', 'E', 'L', 'F', '\0', '\0', '\x01', '\x02'};
        blob.write(bytes, sizeof(bytes));
    }

    void cleanupTestFiles() {
        if (fs::exists(test_dir)) {
            fs::remove_all(test_dir);
        }
    }

    static const RepoLens::TreeNode* child(const RepoLens::TreeNode& node, const std::string& name) {
        for (const auto& entry : node.children) {
            if (entry.name == name) {
                return &entry;
            }
        }
        return nullptr;
    }

public:
    RepositoryScannerTest() : test_dir("test_repository_scanner") {}

    void testTreeStructure() {
        std::cout << "Testing tree structure..." << std::endl;

        setupTestFiles();

        RepoLens::RepositoryScanner scanner(test_dir);
        RepoLens::TreeNode root = scanner.scan();

        assert(root.isDirectory());
        assert(root.path.empty() && "The root has an empty relative path");
        assert(root.name == "test_repository_scanner");

        // Sorted by name; build/, node_modules/ and generated/ are pruned
        assert(root.children.size() == 4);
        assert(root.children[0].name == ".repolensignore");
        assert(root.children[1].name == "docs");
        assert(root.children[2].name == "empty");
        assert(root.children[3].name == "src");

        const RepoLens::TreeNode* src = child(root, "src");
        assert(src != nullptr && src->isDirectory());
        assert(src->path == "src");
        assert(src->children.size() == 4);
        assert(src->children[0].name == "big.py");
        assert(src->children[1].name == "blob.c");
        assert(src->children[2].name == "index.ts");

        const RepoLens::TreeNode* index = child(*src, "index.ts");
        assert(index->path == "src/index.ts" && "Paths are relative with forward slashes");
        assert(index->language == RepoLens::Language::TypeScript);
        assert(index->content && *index->content == "import { helper } from './utils'\n");
        assert(index->size == index->content->size());

        const RepoLens::TreeNode* readme = child(*child(root, "docs"), "README.md");
        assert(readme->language == RepoLens::Language::Other);
        assert(!readme->content && "Unsupported languages are not read");

        assert(!child(*src, "blob.c")->content && "Binary files carry no content");
        assert(child(root, "empty")->children.empty());

        const RepoLens::ScanStats& stats = scanner.lastStats();
        assert(stats.files == 6);
        assert(stats.directories == 3);
        assert(stats.ignored == 3);
        assert(stats.files_with_content == 3);
        assert(stats.binary == 1);
        assert(stats.oversized == 0);
        assert(stats.errors == 0);

        cleanupTestFiles();
        std::cout << "✓ Tree structure test passed" << std::endl;
    }

    void testFileSizeLimit() {
        std::cout << "Testing file size limit..." << std::endl;

        setupTestFiles();

        RepoLens::RepositoryScanner scanner(test_dir);
        scanner.setMaxFileSize(64);
        RepoLens::TreeNode root = scanner.scan();

        const RepoLens::TreeNode* big = child(*child(root, "src"), "big.py");
        assert(big != nullptr && "Oversized files stay in the tree");
        assert(!big->content);
        assert(big->size == 201);
        assert(child(*child(root, "src"), "utils.ts")->content);
        assert(scanner.lastStats().oversized == 1);

        cleanupTestFiles();
        std::cout << "✓ File size limit test passed" << std::endl;
    }

    void testIgnoreOptions() {
        std::cout << "Testing ignore options..." << std::endl;

        setupTestFiles();

        RepoLens::ScanOptions options;
        options.use_ignore_file = false;
        options.ignore_patterns = {"docs/", "*.py"};

        RepoLens::RepositoryScanner scanner(test_dir, options);
        scanner.addIgnorePattern("empty/");
        RepoLens::TreeNode root = scanner.scan();

        assert(child(root, "generated") != nullptr && "The ignore file was not read");
        assert(child(root, "docs") == nullptr);
        assert(child(root, "empty") == nullptr);
        assert(child(root, "build") == nullptr && "Default rules still apply");
        assert(child(*child(root, "src"), "big.py") == nullptr);

        RepoLens::ScanOptions bare;
        bare.use_default_ignores = false;
        bare.use_ignore_file = false;
        RepoLens::TreeNode everything = RepoLens::RepositoryScanner(test_dir, bare).scan();
        assert(child(everything, "node_modules") != nullptr);
        assert(child(everything, "build") != nullptr);

        cleanupTestFiles();
        std::cout << "✓ Ignore options test passed" << std::endl;
    }

    void testMissingRoot() {
        std::cout << "Testing missing root..." << std::endl;

        RepoLens::RepositoryScanner scanner("test_repository_scanner_missing");
        RepoLens::TreeNode root = scanner.scan();

        assert(root.isDirectory());
        assert(root.children.empty());
        assert(scanner.lastStats().errors == 1);

        std::cout << "✓ Missing root test passed" << std::endl;
    }

    void testTextHeuristic() {
        std::cout << "Testing text detection..." << std::endl;

        assert(RepoLens::RepositoryScanner::looksLikeText(""));
        assert(RepoLens::RepositoryScanner::looksLikeText("int main() {\n\treturn 0;\n}\n"));
        assert(RepoLens::RepositoryScanner::looksLikeText("let s = \"caf\xc3\xa9\"\n") && "UTF-8 is text");
        assert(!RepoLens::RepositoryScanner::looksLikeText(std::string("ab\0cd", 5)));
        assert(!RepoLens::RepositoryScanner::looksLikeText(std::string(40, 'a') + std::string(10, '\x01')));

        std::cout << "✓ Text detection test passed" << std::endl;
    }

    void testSymlinkCycles() {
        std::cout << "Testing symlink cycles..." << std::endl;

        std::string links_dir = test_dir + "_links";
        fs::remove_all(links_dir);
        fs::create_directories(links_dir + "/a");
        std::ofstream(links_dir + "/a/file.ts") << "export {}\n";
        fs::create_directory_symlink("..", links_dir + "/a/loop");
        fs::create_directory_symlink("a", links_dir + "/alias");

        RepoLens::ScanOptions options;
        options.follow_symlinks = true;
        RepoLens::RepositoryScanner scanner(links_dir, options);
        RepoLens::TreeNode root = scanner.scan();

        assert(RepoLens::countFiles(root) == 1 && "Each real directory is scanned once");
        assert(scanner.lastStats().directories == 1);
        const RepoLens::TreeNode* a = child(root, "a");
        assert(a != nullptr && child(*a, "file.ts") != nullptr);
        assert(child(*a, "loop") == nullptr && "A link back to the root is not followed");
        assert(child(root, "alias") == nullptr && "A second route to a scanned directory is skipped");

        RepoLens::TreeNode unfollowed = RepoLens::RepositoryScanner(links_dir).scan();
        assert(RepoLens::countFiles(unfollowed) == 1);

        fs::remove_all(links_dir);
        std::cout << "✓ Symlink cycles test passed" << std::endl;
    }

    void testScanFeedsAnalyzer() {
        std::cout << "Testing scan to analysis pipeline..." << std::endl;

        setupTestFiles();

        RepoLens::RepositoryScanner scanner(test_dir);
        RepoLens::FileIndex index = RepoLens::FileIndex::build(scanner.scan());
        assert(index.size() == 6);

        RepoLens::CodeAnalyzer analyzer(index);
        RepoLens::RelationshipGraph graph = analyzer.analyze();
        assert(graph.size() == 1);
        assert(graph.relationships()[0].from_file == "src/index.ts");
        assert(graph.relationships()[0].to_file == "src/utils.ts");

        cleanupTestFiles();
        std::cout << "✓ Scan to analysis pipeline test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running RepositoryScanner unit tests..." << std::endl;

        testTreeStructure();
        testFileSizeLimit();
        testIgnoreOptions();
        testMissingRoot();
        testTextHeuristic();
        testSymlinkCycles();
        testScanFeedsAnalyzer();

        std::cout << "All RepositoryScanner tests passed!" << std::endl;
    }
};

int main() {
    try {
        RepositoryScannerTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
