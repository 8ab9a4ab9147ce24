// =================================================================
// include/RepoLens/ReferenceExtractors.hpp
// =================================================================
// Line-oriented extraction of import/include/use statements.

#pragma once

#include "RepoLens/Relationship.hpp"
#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace RepoLens {

/**
 * @brief Unresolved reference found in one file
 *
 * Produced and consumed within a single file's analysis step.
 */
struct RawReference {
    std::string text;                 ///< Reference as written, e.g. "./utils" or "pkg.mod"
    int line_number = 0;              ///< 1-based line in the referencing file
    std::string source_file;          ///< Path of the referencing file
    RelationshipKind kind = RelationshipKind::Import;

    /// The last segment may name a member of the target rather than the target
    /// itself (`from . import x`, `import static a.B.member;`)
    bool member_reference = false;

    /// Swift only: file declaring the referenced type
    std::string declaring_file;
};

/// Hard upper bound on max_line_length. std::regex matches recursively, so
/// longer lines can exhaust the stack instead of raising std::regex_error.
constexpr size_t kMaxLineLengthLimit = 10000;

/**
 * @brief Limits applied by every extractor
 */
struct ExtractorOptions {
    /// Lines longer than this are skipped (minified bundles, generated data).
    /// Values above kMaxLineLengthLimit are treated as the limit.
    size_t max_line_length = 4000;
};

/**
 * @brief Top-level type declaration found in a Swift file
 */
struct TypeDeclaration {
    std::string name;
    int line_number = 0;
};

// Every extractor is total: any input, including empty or binary-looking
// text, yields a (possibly empty) sequence and never throws on content.
// source_file is left empty; the caller attaches it.

std::vector<RawReference> extractJavaScriptReferences(const std::string& content,
                                                      const ExtractorOptions& options = ExtractorOptions());

std::vector<RawReference> extractPythonReferences(const std::string& content,
                                                  const ExtractorOptions& options = ExtractorOptions());

std::vector<RawReference> extractJavaReferences(const std::string& content,
                                                const ExtractorOptions& options = ExtractorOptions());

std::vector<RawReference> extractGoReferences(const std::string& content,
                                              const ExtractorOptions& options = ExtractorOptions());

std::vector<RawReference> extractCFamilyReferences(const std::string& content,
                                                   const ExtractorOptions& options = ExtractorOptions());

std::vector<RawReference> extractRustReferences(const std::string& content,
                                                const ExtractorOptions& options = ExtractorOptions());

/**
 * @brief Find class/struct/protocol/enum/actor declarations in Swift source
 */
std::vector<TypeDeclaration> extractSwiftDeclarations(const std::string& content,
                                                      const ExtractorOptions& options = ExtractorOptions());

/**
 * @brief Map every identifier token in content to the first line it appears on
 *
 * A token is a maximal run of [A-Za-z0-9_], so membership is a whole-word match.
 */
std::unordered_map<std::string, int> identifierFirstLines(const std::string& content);

/**
 * @brief Split text into lines, dropping a trailing '\r' from each
 */
std::vector<std::string> splitLines(const std::string& content);

} // namespace RepoLens
