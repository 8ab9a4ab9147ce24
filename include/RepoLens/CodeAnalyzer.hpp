// =================================================================
// include/RepoLens/CodeAnalyzer.hpp
// =================================================================
// Builds the relationship graph of an indexed repository.

#pragma once

#include "RepoLens/FileIndex.hpp"
#include "RepoLens/LanguageStrategy.hpp"
#include "RepoLens/PathResolver.hpp"
#include "RepoLens/Relationship.hpp"
#include <atomic>
#include <functional>
#include <string>
#include <vector>

namespace RepoLens {

/**
 * @brief Options controlling one analysis run
 */
struct AnalyzerOptions {
    size_t workers = 1;                              ///< 1 runs inline, more uses a ThreadPool
    size_t max_line_length = 4000;                   ///< Longer lines are not scanned; capped at kMaxLineLengthLimit
    const std::atomic<bool>* cancel_flag = nullptr;  ///< Raised to stop starting new files

    /// Called after each file with (files finished, files to analyze). Runs on
    /// worker threads when workers > 1.
    std::function<void(size_t, size_t)> on_file_done;
};

/**
 * @brief Counters of the most recent analyze() call
 */
struct AnalysisSummary {
    size_t files_analyzed = 0;
    size_t files_skipped = 0;    ///< Not started because of cancellation
    size_t files_failed = 0;     ///< Regex engine gave up on the content
    size_t relationships = 0;
    long duration_ms = 0;
    bool cancelled = false;
};

/**
 * @brief Relationship graph builder
 *
 * For every indexed file with content, runs the extractor of its language
 * family and resolves each reference through the family's resolution chain.
 * Each successful resolution becomes one Relationship; unresolved references
 * (external packages, system headers) are dropped silently.
 *
 * The index must be fully built before the analyzer is constructed and must
 * outlive it. analyze() never throws on file content.
 */
class CodeAnalyzer {
public:
    explicit CodeAnalyzer(const FileIndex& index, const AnalyzerOptions& options = AnalyzerOptions());

    /**
     * @brief Analyze every file in the index
     * @return Relationships in index order of their source file
     *
     * Files are started in index order. When the cancel flag is raised the
     * files already started run to completion and the rest are skipped, so a
     * cancelled run covers a prefix of the index.
     */
    RelationshipGraph analyze();

    /**
     * @brief Analyze a single indexed file
     * @param file Record owned by the index
     * @return Resolved relationships originating in file
     */
    std::vector<Relationship> analyzeFile(const FileRecord& file) const;

    /**
     * @brief Raw references of a file, unresolved
     *
     * May throw std::regex_error on pathological content; analyzeFile()
     * handles that case.
     */
    std::vector<RawReference> extractReferences(const FileRecord& file) const;

    /**
     * @brief Resolve one reference using the strategy of its source file
     * @return Target record, or nullptr
     */
    const FileRecord* resolveReference(const RawReference& reference) const;

    /**
     * @brief True if the file has content and a strategy for its language
     */
    bool isAnalyzable(const FileRecord& file) const;

    const AnalysisSummary& lastSummary() const { return m_summary; }
    const AnalyzerOptions& options() const { return m_options; }

private:
    struct FileOutcome {
        bool started = false;
        bool failed = false;
        std::vector<Relationship> relationships;
    };

    FileOutcome runFile(const FileRecord& file) const;
    bool cancellationRequested() const;
    void reportProgress(size_t done, size_t total) const;

    std::vector<FileOutcome> analyzeSequential(const std::vector<const FileRecord*>& files) const;
    std::vector<FileOutcome> analyzeParallel(const std::vector<const FileRecord*>& files) const;

    const FileIndex& m_index;
    AnalyzerOptions m_options;
    PathResolver m_resolver;
    StrategyRegistry m_strategies;
    AnalysisSummary m_summary;
};

} // namespace RepoLens
