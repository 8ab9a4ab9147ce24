// =================================================================
// src/RepoLens/LanguageStrategies.cpp
// =================================================================
// Implementation for the per-language extractor/resolver strategies.

#include "RepoLens/LanguageStrategy.hpp"
#include "RepoLens/Logger.hpp"
#include <regex>

namespace RepoLens {

namespace {

const std::vector<std::string> kScriptExtensions = {
    ".ts", ".tsx", ".js", ".jsx", ".mjs",
    "/index.ts", "/index.tsx", "/index.js", "/index.jsx"
};

const std::vector<std::string> kPythonExtensions = {".py", "/__init__.py"};

std::string joinSegments(const std::vector<std::string>& segments, size_t count, const std::string& separator) {
    std::string joined;
    for (size_t i = 0; i < count && i < segments.size(); ++i) {
        if (i > 0) {
            joined += separator;
        }
        joined += segments[i];
    }
    return joined;
}

std::string dotsToSlashes(const std::string& module) {
    return joinSegments(PathResolver::split(module, "."), std::string::npos, "/");
}

} // namespace

// ============================================================================
// LanguageStrategy
// ============================================================================

std::vector<RawReference> LanguageStrategy::attachSource(std::vector<RawReference> references,
                                                         const FileRecord& file) {
    for (auto& reference : references) {
        reference.source_file = file.path;
    }
    return references;
}

// ============================================================================
// JavaScript / TypeScript
// ============================================================================

std::vector<RawReference> JavaScriptStrategy::extract(const FileRecord& file) const {
    if (!file.hasContent()) {
        return {};
    }
    return attachSource(extractJavaScriptReferences(*file.content, m_options), file);
}

const FileRecord* JavaScriptStrategy::resolve(const RawReference& reference,
                                              const PathResolver& resolver) const {
    std::string candidate = reference.text;
    if (PathResolver::isRelative(reference.text)) {
        candidate = PathResolver::resolveRelative(reference.source_file, reference.text);
    }

    if (const FileRecord* record = resolver.exact(candidate)) {
        return record;
    }
    if (const FileRecord* record = resolver.withExtensions(candidate, kScriptExtensions)) {
        return record;
    }
    if (candidate.empty()) {
        return nullptr;
    }
    return resolver.bySuffix({candidate, candidate + ".ts", candidate + ".tsx", candidate + ".js"});
}

// ============================================================================
// Python
// ============================================================================

std::vector<RawReference> PythonStrategy::extract(const FileRecord& file) const {
    if (!file.hasContent()) {
        return {};
    }
    return attachSource(extractPythonReferences(*file.content, m_options), file);
}

const FileRecord* PythonStrategy::resolve(const RawReference& reference,
                                          const PathResolver& resolver) const {
    if (reference.text.empty()) {
        return nullptr;
    }
    if (reference.text.front() == '.') {
        return resolveRelative(reference, resolver);
    }
    return resolveAbsolute(reference, resolver);
}

const FileRecord* PythonStrategy::resolveRelative(const RawReference& reference,
                                                  const PathResolver& resolver) const {
    size_t dots = reference.text.find_first_not_of('.');
    if (dots == std::string::npos) {
        dots = reference.text.size();
    }

    // One dot is the current package, each further dot one level up
    std::string package = PathResolver::ascend(PathResolver::directoryOf(reference.source_file), dots - 1);
    std::string module = dotsToSlashes(reference.text.substr(dots));

    // A bare `from . import *` names the package, never a sibling pkg.py
    if (module.empty()) {
        return resolver.withExtensions(package, {"/__init__.py"});
    }

    std::string candidate = PathResolver::joinPath(package, module);
    if (const FileRecord* record = resolver.exact(candidate)) {
        return record;
    }
    if (const FileRecord* record = resolver.withExtensions(candidate, kPythonExtensions)) {
        return record;
    }

    // `from . import name` may name a member of the package itself
    if (reference.member_reference) {
        return resolver.withExtensions(package, {"/__init__.py"});
    }
    return nullptr;
}

const FileRecord* PythonStrategy::resolveAbsolute(const RawReference& reference,
                                                  const PathResolver& resolver) const {
    std::vector<std::string> segments = PathResolver::split(reference.text, ".");
    if (segments.empty()) {
        return nullptr;
    }

    std::string module = joinSegments(segments, segments.size(), "/");
    if (const FileRecord* record = resolver.exact(module)) {
        return record;
    }
    if (const FileRecord* record = resolver.withExtensions(module, kPythonExtensions)) {
        return record;
    }

    // The project's own top-level package is often not a path prefix in the index
    std::string stripped;
    if (segments.size() > 1) {
        stripped = joinSegments(std::vector<std::string>(segments.begin() + 1, segments.end()),
                                segments.size() - 1, "/");
        if (const FileRecord* record = resolver.withExtensions(stripped, kPythonExtensions)) {
            return record;
        }
    }

    if (const FileRecord* record = resolver.bySuffix(PathResolver::expand(module, kPythonExtensions))) {
        return record;
    }
    if (!stripped.empty()) {
        return resolver.bySuffix(PathResolver::expand(stripped, kPythonExtensions));
    }
    return nullptr;
}

// ============================================================================
// Java
// ============================================================================

std::vector<RawReference> JavaStrategy::extract(const FileRecord& file) const {
    if (!file.hasContent()) {
        return {};
    }
    return attachSource(extractJavaReferences(*file.content, m_options), file);
}

const FileRecord* JavaStrategy::resolve(const RawReference& reference,
                                        const PathResolver& resolver) const {
    std::vector<std::string> segments = PathResolver::split(reference.text, ".");
    if (reference.member_reference && segments.size() > 1) {
        segments.pop_back();
    }
    if (segments.empty()) {
        return nullptr;
    }

    std::string qualified = joinSegments(segments, segments.size(), "/") + ".java";
    if (const FileRecord* record = resolver.exact(qualified)) {
        return record;
    }
    if (const FileRecord* record = resolver.bySuffix({qualified})) {
        return record;
    }
    return resolver.byFileName(segments.back() + ".java");
}

// ============================================================================
// Go
// ============================================================================

std::vector<RawReference> GoStrategy::extract(const FileRecord& file) const {
    if (!file.hasContent()) {
        return {};
    }
    return attachSource(extractGoReferences(*file.content, m_options), file);
}

const FileRecord* GoStrategy::resolve(const RawReference& reference,
                                      const PathResolver& resolver) const {
    std::vector<std::string> segments = PathResolver::split(reference.text, "/");
    if (segments.empty()) {
        return nullptr;
    }

    if (const FileRecord* record = resolver.byFileName(segments.back() + ".go")) {
        return record;
    }

    // "github.com/acme/app/internal/store" -> "app/internal/store", ..., "store"
    for (size_t count = segments.size(); count > 0; --count) {
        std::string tail = joinSegments(std::vector<std::string>(segments.end() - count, segments.end()),
                                        count, "/");
        if (const FileRecord* record = resolver.inDirectory(tail)) {
            return record;
        }
    }
    return nullptr;
}

// ============================================================================
// C / C++
// ============================================================================

std::vector<RawReference> CFamilyStrategy::extract(const FileRecord& file) const {
    if (!file.hasContent()) {
        return {};
    }
    return attachSource(extractCFamilyReferences(*file.content, m_options), file);
}

const FileRecord* CFamilyStrategy::resolve(const RawReference& reference,
                                           const PathResolver& resolver) const {
    if (reference.text.empty()) {
        return nullptr;
    }

    if (const FileRecord* record =
            resolver.exact(PathResolver::resolveRelative(reference.source_file, reference.text))) {
        return record;
    }
    if (const FileRecord* record = resolver.exact(reference.text)) {
        return record;
    }
    if (const FileRecord* record = resolver.bySuffix({reference.text})) {
        return record;
    }
    return resolver.byFileName(PathResolver::baseName(reference.text));
}

// ============================================================================
// Rust
// ============================================================================

std::vector<RawReference> RustStrategy::extract(const FileRecord& file) const {
    if (!file.hasContent()) {
        return {};
    }
    return attachSource(extractRustReferences(*file.content, m_options), file);
}

std::string RustStrategy::moduleName(const std::string& path) {
    for (const auto& segment : PathResolver::split(path, "::")) {
        if (segment != "crate" && segment != "self" && segment != "super") {
            return segment;
        }
    }
    return "";
}

const FileRecord* RustStrategy::resolve(const RawReference& reference,
                                        const PathResolver& resolver) const {
    std::string module = moduleName(reference.text);
    if (module.empty()) {
        return nullptr;
    }

    std::string directory = PathResolver::directoryOf(reference.source_file);
    if (const FileRecord* record = resolver.exact(PathResolver::joinPath(directory, module + ".rs"))) {
        return record;
    }
    if (const FileRecord* record = resolver.exact(PathResolver::joinPath(directory, module + "/mod.rs"))) {
        return record;
    }
    if (const FileRecord* record = resolver.byFileName(module + ".rs")) {
        return record;
    }
    return resolver.bySuffix({module + "/mod.rs"});
}

// ============================================================================
// Swift
// ============================================================================

SwiftStrategy::SwiftStrategy(const FileIndex& index, const ExtractorOptions& options)
    : m_options(options)
{
    for (const auto& file : index.files()) {
        if (familyOf(file.language) != LanguageFamily::Swift || !file.hasContent()) {
            continue;
        }
        try {
            for (const auto& declaration : extractSwiftDeclarations(*file.content, m_options)) {
                m_declarations.push_back({declaration.name, file.path, declaration.line_number});
            }
        } catch (const std::regex_error& e) {
            LOG_WARNING("SwiftStrategy", "Skipping declarations of " + file.path + ": " + e.what());
        }
    }

    LOG_DEBUG("SwiftStrategy", "Indexed " + std::to_string(m_declarations.size()) + " type declarations");
}

std::vector<RawReference> SwiftStrategy::extract(const FileRecord& file) const {
    std::vector<RawReference> references;
    if (!file.hasContent() || m_declarations.empty()) {
        return references;
    }

    std::unordered_map<std::string, int> tokens = identifierFirstLines(*file.content);
    for (const auto& declaration : m_declarations) {
        if (declaration.file == file.path) {
            continue;
        }
        auto it = tokens.find(declaration.name);
        if (it == tokens.end()) {
            continue;
        }

        RawReference reference;
        reference.text = declaration.name;
        // First use in this file; the declaration's own line is not reported
        reference.line_number = it->second;
        reference.source_file = file.path;
        reference.declaring_file = declaration.file;
        references.push_back(std::move(reference));
    }
    return references;
}

const FileRecord* SwiftStrategy::resolve(const RawReference& reference,
                                         const PathResolver& resolver) const {
    return resolver.exact(reference.declaring_file);
}

// ============================================================================
// StrategyRegistry
// ============================================================================

StrategyRegistry::StrategyRegistry(const FileIndex& index, const ExtractorOptions& options) {
    for (size_t i = 0; i < kFamilyCount; ++i) {
        m_strategies[i] = createStrategy(static_cast<LanguageFamily>(i), index, options);
    }
}

const LanguageStrategy* StrategyRegistry::forFamily(LanguageFamily family) const {
    size_t slot = static_cast<size_t>(family);
    if (slot >= kFamilyCount) {
        return nullptr;
    }
    return m_strategies[slot].get();
}

const LanguageStrategy* StrategyRegistry::forLanguage(Language language) const {
    return forFamily(familyOf(language));
}

std::unique_ptr<LanguageStrategy> StrategyRegistry::createStrategy(LanguageFamily family,
                                                                   const FileIndex& index,
                                                                   const ExtractorOptions& options) {
    switch (family) {
        case LanguageFamily::JavaScript:
            return std::make_unique<JavaScriptStrategy>(options);
        case LanguageFamily::Python:
            return std::make_unique<PythonStrategy>(options);
        case LanguageFamily::Java:
            return std::make_unique<JavaStrategy>(options);
        case LanguageFamily::Go:
            return std::make_unique<GoStrategy>(options);
        case LanguageFamily::CFamily:
            return std::make_unique<CFamilyStrategy>(options);
        case LanguageFamily::Rust:
            return std::make_unique<RustStrategy>(options);
        case LanguageFamily::Swift:
            return std::make_unique<SwiftStrategy>(index, options);
        case LanguageFamily::Unsupported:
            return nullptr;
    }
    return nullptr;
}

} // namespace RepoLens
