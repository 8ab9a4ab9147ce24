// =================================================================
// tests/PathResolverTest.cpp
// =================================================================
// Unit tests for the shared resolution steps and path arithmetic.

#include "RepoLens/FileIndex.hpp"
#include "RepoLens/PathResolver.hpp"
#include <cassert>
#include <iostream>

using namespace RepoLens;

class PathResolverTest {
private:
    FileIndex m_index;

public:
    PathResolverTest()
        : m_index(FileIndex::build(makeDirectoryNode("", {
              makeFileNode("index.ts", Language::TypeScript, std::string("x")),
              makeFileNode("src/c.ts", Language::TypeScript, std::string("x")),
              makeFileNode("src/components/index.tsx", Language::TypeScriptReact, std::string("x")),
              makeFileNode("lib/os.py", Language::Python, std::string("x")),
              makeFileNode("lib/photos.py", Language::Python, std::string("x"))
          })))
    {
    }

    void testPathArithmetic() {
        std::cout << "Testing path arithmetic..." << std::endl;

        assert(PathResolver::directoryOf("src/a/b.ts") == "src/a");
        assert(PathResolver::directoryOf("b.ts") == "");
        assert(PathResolver::joinPath("src/a", "../c") == "src/c");
        assert(PathResolver::joinPath("src/a", "./d/./e") == "src/a/d/e");
        assert(PathResolver::joinPath("", "x") == "x");
        assert(PathResolver::joinPath("src", "../../../x") == "x" && "Popping past the root stops at the root");
        assert(PathResolver::resolveRelative("src/a/b.ts", "../c") == "src/c");
        assert(PathResolver::resolveRelative("src/a/b.ts", "./utils") == "src/a/utils");
        assert(PathResolver::resolveRelative("main.ts", "./utils") == "utils");

        assert(PathResolver::ascend("a/b/c", 0) == "a/b/c");
        assert(PathResolver::ascend("a/b/c", 2) == "a");
        assert(PathResolver::ascend("a/b/c", 5) == "");

        assert(PathResolver::baseName("a/b/c.h") == "c.h");
        assert(PathResolver::baseName("c.h") == "c.h");

        std::cout << "✓ Path arithmetic test passed" << std::endl;
    }

    void testRelativeDetection() {
        std::cout << "Testing relative reference detection..." << std::endl;

        assert(PathResolver::isRelative("./x"));
        assert(PathResolver::isRelative("../x"));
        assert(PathResolver::isRelative("."));
        assert(PathResolver::isRelative(".."));
        assert(!PathResolver::isRelative("react"));
        assert(!PathResolver::isRelative(".hidden"));
        assert(!PathResolver::isRelative("@scope/pkg"));

        std::cout << "✓ Relative reference detection test passed" << std::endl;
    }

    void testSplit() {
        std::cout << "Testing split..." << std::endl;

        auto parts = PathResolver::split("crate::models::user", "::");
        assert(parts.size() == 3 && parts[0] == "crate" && parts[2] == "user");
        assert(PathResolver::split("a..b", ".").size() == 2 && "Empty pieces are dropped");
        assert(PathResolver::split("", "/").empty());

        std::cout << "✓ Split test passed" << std::endl;
    }

    void testLookupSteps() {
        std::cout << "Testing lookup steps..." << std::endl;

        PathResolver resolver(m_index);

        assert(resolver.exact("src/c.ts")->path == "src/c.ts");
        assert(resolver.exact("src/c") == nullptr);
        assert(resolver.exact("") == nullptr);

        const std::vector<std::string> extensions = {".ts", ".tsx", "/index.ts", "/index.tsx"};
        assert(resolver.withExtensions("src/c", extensions)->path == "src/c.ts");
        assert(resolver.withExtensions("src/components", extensions)->path == "src/components/index.tsx");
        assert(resolver.withExtensions("", extensions)->path == "index.ts" && "The root directory has an index too");
        assert(resolver.withExtensions("src/missing", extensions) == nullptr);

        assert(resolver.bySuffix({"os.py"})->path == "lib/os.py");
        assert(resolver.byFileName("photos.py")->path == "lib/photos.py");
        assert(resolver.byFileName("") == nullptr);
        assert(resolver.inDirectory("components")->path == "src/components/index.tsx");

        std::cout << "✓ Lookup steps test passed" << std::endl;
    }

    void testExpand() {
        std::cout << "Testing candidate expansion..." << std::endl;

        auto expanded = PathResolver::expand("pkg/mod", {".py", "/__init__.py"});
        assert(expanded.size() == 2);
        assert(expanded[0] == "pkg/mod.py");
        assert(expanded[1] == "pkg/mod/__init__.py");

        auto at_root = PathResolver::expand("", {".py", "/__init__.py"});
        assert(at_root.size() == 1 && at_root[0] == "__init__.py");

        std::cout << "✓ Candidate expansion test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running PathResolver unit tests..." << std::endl;

        testPathArithmetic();
        testRelativeDetection();
        testSplit();
        testLookupSteps();
        testExpand();

        std::cout << "All PathResolver tests passed!" << std::endl;
    }
};

int main() {
    try {
        PathResolverTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
