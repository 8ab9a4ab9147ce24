// =================================================================
// include/RepoLens/LanguageStrategy.hpp
// =================================================================
// Extractor/resolver pairs, one per language family.

#pragma once

#include "RepoLens/FileIndex.hpp"
#include "RepoLens/Language.hpp"
#include "RepoLens/PathResolver.hpp"
#include "RepoLens/ReferenceExtractors.hpp"
#include <array>
#include <memory>
#include <string>
#include <vector>

namespace RepoLens {

/**
 * @brief Abstract strategy pairing an extractor with its resolution chain
 *
 * Implementations are stateless after construction and may be shared by
 * concurrent workers.
 */
class LanguageStrategy {
public:
    virtual ~LanguageStrategy() = default;

    virtual LanguageFamily family() const = 0;

    /**
     * @brief Extract raw references from one file
     * @param file Indexed file; files without content yield nothing
     * @return References with source_file set to file.path
     */
    virtual std::vector<RawReference> extract(const FileRecord& file) const = 0;

    /**
     * @brief Resolve one reference to an indexed file
     * @return Target record, or nullptr when the reference stays unresolved
     */
    virtual const FileRecord* resolve(const RawReference& reference,
                                      const PathResolver& resolver) const = 0;

protected:
    static std::vector<RawReference> attachSource(std::vector<RawReference> references,
                                                  const FileRecord& file);
};

class JavaScriptStrategy : public LanguageStrategy {
public:
    explicit JavaScriptStrategy(const ExtractorOptions& options) : m_options(options) {}

    LanguageFamily family() const override { return LanguageFamily::JavaScript; }
    std::vector<RawReference> extract(const FileRecord& file) const override;
    const FileRecord* resolve(const RawReference& reference, const PathResolver& resolver) const override;

private:
    ExtractorOptions m_options;
};

class PythonStrategy : public LanguageStrategy {
public:
    explicit PythonStrategy(const ExtractorOptions& options) : m_options(options) {}

    LanguageFamily family() const override { return LanguageFamily::Python; }
    std::vector<RawReference> extract(const FileRecord& file) const override;
    const FileRecord* resolve(const RawReference& reference, const PathResolver& resolver) const override;

private:
    const FileRecord* resolveRelative(const RawReference& reference, const PathResolver& resolver) const;
    const FileRecord* resolveAbsolute(const RawReference& reference, const PathResolver& resolver) const;

    ExtractorOptions m_options;
};

class JavaStrategy : public LanguageStrategy {
public:
    explicit JavaStrategy(const ExtractorOptions& options) : m_options(options) {}

    LanguageFamily family() const override { return LanguageFamily::Java; }
    std::vector<RawReference> extract(const FileRecord& file) const override;
    const FileRecord* resolve(const RawReference& reference, const PathResolver& resolver) const override;

private:
    ExtractorOptions m_options;
};

class GoStrategy : public LanguageStrategy {
public:
    explicit GoStrategy(const ExtractorOptions& options) : m_options(options) {}

    LanguageFamily family() const override { return LanguageFamily::Go; }
    std::vector<RawReference> extract(const FileRecord& file) const override;
    const FileRecord* resolve(const RawReference& reference, const PathResolver& resolver) const override;

private:
    ExtractorOptions m_options;
};

class CFamilyStrategy : public LanguageStrategy {
public:
    explicit CFamilyStrategy(const ExtractorOptions& options) : m_options(options) {}

    LanguageFamily family() const override { return LanguageFamily::CFamily; }
    std::vector<RawReference> extract(const FileRecord& file) const override;
    const FileRecord* resolve(const RawReference& reference, const PathResolver& resolver) const override;

private:
    ExtractorOptions m_options;
};

class RustStrategy : public LanguageStrategy {
public:
    explicit RustStrategy(const ExtractorOptions& options) : m_options(options) {}

    LanguageFamily family() const override { return LanguageFamily::Rust; }
    std::vector<RawReference> extract(const FileRecord& file) const override;
    const FileRecord* resolve(const RawReference& reference, const PathResolver& resolver) const override;

    /**
     * @brief Module named by a use/mod path, skipping crate/self/super
     * @return Module name, empty if the path names none
     */
    static std::string moduleName(const std::string& path);

private:
    ExtractorOptions m_options;
};

/**
 * @brief Swift usage detection
 *
 * Swift files reference each other without import statements. At
 * construction every Swift file in the index is scanned once for type
 * declarations; extracting a file then checks, by whole-word match, which
 * types declared in *other* files it mentions. The direction of the
 * resulting edge follows usage: the mentioning file points at the
 * declaring file.
 *
 * Like every other relationship, line_number refers to the source file:
 * it is the first line of the mentioning file that names the type, not
 * the declaration line in the declaring file.
 */
class SwiftStrategy : public LanguageStrategy {
public:
    SwiftStrategy(const FileIndex& index, const ExtractorOptions& options);

    LanguageFamily family() const override { return LanguageFamily::Swift; }
    std::vector<RawReference> extract(const FileRecord& file) const override;
    const FileRecord* resolve(const RawReference& reference, const PathResolver& resolver) const override;

    size_t declarationCount() const { return m_declarations.size(); }

private:
    struct Declaration {
        std::string name;
        std::string file;
        int line_number;
    };

    std::vector<Declaration> m_declarations;
    ExtractorOptions m_options;
};

/**
 * @brief Dispatch table from language family to strategy
 *
 * Built once per index; Unsupported has no strategy.
 */
class StrategyRegistry {
public:
    StrategyRegistry(const FileIndex& index, const ExtractorOptions& options = ExtractorOptions());

    const LanguageStrategy* forFamily(LanguageFamily family) const;
    const LanguageStrategy* forLanguage(Language language) const;

    static std::unique_ptr<LanguageStrategy> createStrategy(LanguageFamily family,
                                                            const FileIndex& index,
                                                            const ExtractorOptions& options);

private:
    static constexpr size_t kFamilyCount = static_cast<size_t>(LanguageFamily::Unsupported);

    std::array<std::unique_ptr<LanguageStrategy>, kFamilyCount> m_strategies;
};

} // namespace RepoLens
