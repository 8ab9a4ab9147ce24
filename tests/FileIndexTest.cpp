// =================================================================
// tests/FileIndexTest.cpp
// =================================================================
// Unit tests for the repository file index.

#include "RepoLens/FileIndex.hpp"
#include "RepoLens/FileTree.hpp"
#include <cassert>
#include <iostream>

using namespace RepoLens;

class FileIndexTest {
private:
    TreeNode sampleTree() {
        return makeDirectoryNode("", {
            makeDirectoryNode("src", {
                makeFileNode("src/index.ts", Language::TypeScript, std::string("import './utils'")),
                makeFileNode("src/utils.ts", Language::TypeScript, std::string("")),
                makeDirectoryNode("src/lib", {
                    makeFileNode("src/lib/os.py", Language::Python, std::string("x = 1")),
                    makeFileNode("src/lib/photos.py", Language::Python, std::string("y = 2"))
                })
            }),
            makeDirectoryNode("test", {
                makeFileNode("test/utils.ts", Language::TypeScript)
            }),
            makeDirectoryNode("empty"),
            makeFileNode("logo.png", Language::Other)
        });
    }

public:
    void testBuildIndexesEveryFileOnce() {
        std::cout << "Testing index construction..." << std::endl;

        FileIndex index = FileIndex::build(sampleTree());

        assert(index.size() == 6 && "Every file leaf should be indexed");
        assert(index.keyCount() == 6 && "No relative paths, one key per file");
        assert(index.contains("src/index.ts"));
        assert(index.contains("logo.png"));
        assert(!index.contains("src") && "Directories are not indexed");
        assert(!index.contains("empty"));

        // Traversal order is depth-first in child order
        assert(index.files()[0].path == "src/index.ts");
        assert(index.files()[5].path == "logo.png");

        const FileRecord* record = index.find("src/index.ts");
        assert(record != nullptr);
        assert(record->name == "index.ts");
        assert(record->language == Language::TypeScript);
        assert(record->hasContent());

        assert(!index.find("src/utils.ts")->hasContent() && "Empty content counts as no content");
        assert(!index.find("test/utils.ts")->hasContent());

        std::cout << "✓ Index construction test passed" << std::endl;
    }

    void testEmptyTree() {
        std::cout << "Testing empty tree..." << std::endl;

        FileIndex index = FileIndex::build(makeDirectoryNode(""));
        assert(index.empty());
        assert(index.find("anything") == nullptr);
        assert(index.findBySuffix({"a.ts"}) == nullptr);
        assert(index.findByName("a.ts") == nullptr);
        assert(index.findInDirectory("src") == nullptr);

        std::cout << "✓ Empty tree test passed" << std::endl;
    }

    void testRelativePathKeys() {
        std::cout << "Testing relative path keys..." << std::endl;

        TreeNode file = makeFileNode("/home/dev/app/src/main.go", Language::Go, std::string("package main"));
        file.relative_path = "src/main.go";
        FileIndex index = FileIndex::build(makeDirectoryNode("", {file}));

        assert(index.size() == 1 && "A file is stored once even with two keys");
        assert(index.keyCount() == 2);
        assert(index.find("src/main.go") == index.find("/home/dev/app/src/main.go"));
        assert(index.find("src/main.go")->path == "/home/dev/app/src/main.go");

        std::cout << "✓ Relative path keys test passed" << std::endl;
    }

    void testDuplicatePathsKeepFirst() {
        std::cout << "Testing duplicate paths..." << std::endl;

        FileIndex index = FileIndex::build(makeDirectoryNode("", {
            makeFileNode("a.py", Language::Python, std::string("first")),
            makeFileNode("a.py", Language::Python, std::string("second"))
        }));

        assert(index.size() == 1);
        assert(*index.find("a.py")->content == "first");

        std::cout << "✓ Duplicate paths test passed" << std::endl;
    }

    void testSuffixLookupRespectsSegments() {
        std::cout << "Testing suffix lookup..." << std::endl;

        FileIndex index = FileIndex::build(sampleTree());

        const FileRecord* os = index.findBySuffix({"os.py"});
        assert(os != nullptr && os->path == "src/lib/os.py" && "os.py must not match photos.py");

        assert(index.findBySuffix({"hotos.py"}) == nullptr && "Suffix must start at a segment boundary");
        assert(index.findBySuffix({"lib/photos.py"})->path == "src/lib/photos.py");
        assert(index.findBySuffix({"src/lib/photos.py"})->path == "src/lib/photos.py");

        // First key in insertion order wins across duplicates
        assert(index.findBySuffix({"utils.ts"})->path == "src/utils.ts");

        // Every suffix is tried on a key before moving to the next key
        assert(index.findBySuffix({"nothing.ts", "index.ts"})->path == "src/index.ts");
        assert(index.findBySuffix({"", "missing"}) == nullptr);

        assert(FileIndex::endsWithSegment("a/b/c.ts", "b/c.ts"));
        assert(FileIndex::endsWithSegment("c.ts", "c.ts"));
        assert(!FileIndex::endsWithSegment("a/bc.ts", "c.ts"));
        assert(!FileIndex::endsWithSegment("c.ts", "a/c.ts"));

        std::cout << "✓ Suffix lookup test passed" << std::endl;
    }

    void testNameLookup() {
        std::cout << "Testing file name lookup..." << std::endl;

        FileIndex index = FileIndex::build(sampleTree());

        assert(index.findByName("utils.ts")->path == "src/utils.ts");
        auto all = index.filesNamed("utils.ts");
        assert(all.size() == 2);
        assert(all[0]->path == "src/utils.ts");
        assert(all[1]->path == "test/utils.ts");
        assert(index.filesNamed("none.ts").empty());

        std::cout << "✓ File name lookup test passed" << std::endl;
    }

    void testDirectoryLookup() {
        std::cout << "Testing directory lookup..." << std::endl;

        FileIndex index = FileIndex::build(sampleTree());

        assert(index.findInDirectory("lib")->path == "src/lib/os.py");
        assert(index.findInDirectory("src/lib")->path == "src/lib/os.py");
        assert(index.findInDirectory("src")->path == "src/index.ts" && "Only direct children count");
        assert(index.findInDirectory("ib") == nullptr);
        assert(index.findInDirectory("") == nullptr);

        std::cout << "✓ Directory lookup test passed" << std::endl;
    }

    void testTreeHelpers() {
        std::cout << "Testing tree helpers..." << std::endl;

        TreeNode tree = sampleTree();
        assert(countFiles(tree) == 6);
        assert(countDirectories(tree) == 4);

        TreeNode file = makeFileNode("a/b/c.rs", Language::Rust, std::string("mod x;"));
        assert(file.isFile());
        assert(file.name == "c.rs");
        assert(file.size == 6);

        std::cout << "✓ Tree helpers test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running FileIndex unit tests..." << std::endl;

        testBuildIndexesEveryFileOnce();
        testEmptyTree();
        testRelativePathKeys();
        testDuplicatePathsKeepFirst();
        testSuffixLookupRespectsSegments();
        testNameLookup();
        testDirectoryLookup();
        testTreeHelpers();

        std::cout << "All FileIndex tests passed!" << std::endl;
    }
};

int main() {
    try {
        FileIndexTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
