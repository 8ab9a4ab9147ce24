// =================================================================
// src/RepoLens/CodeAnalyzer.cpp
// =================================================================
// Implementation for the relationship graph builder.

#include "RepoLens/CodeAnalyzer.hpp"
#include "RepoLens/Logger.hpp"
#include "RepoLens/ThreadPool.hpp"
#include <algorithm>
#include <chrono>
#include <future>
#include <regex>

namespace RepoLens {

namespace {

ExtractorOptions extractorOptions(const AnalyzerOptions& options) {
    ExtractorOptions extractor;
    extractor.max_line_length = std::min(options.max_line_length, kMaxLineLengthLimit);
    return extractor;
}

} // namespace

CodeAnalyzer::CodeAnalyzer(const FileIndex& index, const AnalyzerOptions& options)
    : m_index(index)
    , m_options(options)
    , m_resolver(index)
    , m_strategies(index, extractorOptions(options))
{
}

RelationshipGraph CodeAnalyzer::analyze() {
    auto start_time = std::chrono::steady_clock::now();
    m_summary = AnalysisSummary();

    std::vector<const FileRecord*> files;
    for (const auto& file : m_index.files()) {
        if (isAnalyzable(file)) {
            files.push_back(&file);
        }
    }

    LOG_DEBUG("CodeAnalyzer", "Analyzing " + std::to_string(files.size()) + " of " +
              std::to_string(m_index.size()) + " files with " + std::to_string(m_options.workers) + " worker(s)");

    std::vector<FileOutcome> outcomes = (m_options.workers > 1 && files.size() > 1)
        ? analyzeParallel(files)
        : analyzeSequential(files);

    RelationshipGraph graph;
    for (auto& outcome : outcomes) {
        if (!outcome.started) {
            ++m_summary.files_skipped;
            continue;
        }
        ++m_summary.files_analyzed;
        if (outcome.failed) {
            ++m_summary.files_failed;
        }
        graph.append(std::move(outcome.relationships));
    }

    auto end_time = std::chrono::steady_clock::now();
    m_summary.relationships = graph.size();
    m_summary.cancelled = m_summary.files_skipped > 0;
    m_summary.duration_ms = static_cast<long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count());

    Logger::getInstance().logAnalysisSummary(m_summary.files_analyzed, m_summary.relationships,
                                             m_summary.duration_ms, m_summary.cancelled);
    return graph;
}

std::vector<CodeAnalyzer::FileOutcome> CodeAnalyzer::analyzeSequential(
    const std::vector<const FileRecord*>& files) const {
    std::vector<FileOutcome> outcomes(files.size());
    for (size_t i = 0; i < files.size(); ++i) {
        if (cancellationRequested()) {
            LOG_INFO("CodeAnalyzer", "Analysis cancelled after " + std::to_string(i) + " files");
            break;
        }
        outcomes[i] = runFile(*files[i]);
        reportProgress(i + 1, files.size());
    }
    return outcomes;
}

std::vector<CodeAnalyzer::FileOutcome> CodeAnalyzer::analyzeParallel(
    const std::vector<const FileRecord*>& files) const {
    // Each task claims the next unstarted file, so the started files are
    // always files[0..next) whatever order the workers run in
    std::vector<FileOutcome> outcomes(files.size());
    std::atomic<size_t> next(0);
    std::atomic<size_t> done(0);

    // Declared after the state its tasks reference so it joins first
    ThreadPool pool(std::min(m_options.workers, files.size()));

    std::vector<std::future<void>> futures;
    futures.reserve(files.size());
    for (size_t task = 0; task < files.size(); ++task) {
        futures.push_back(pool.enqueue([this, &files, &outcomes, &next, &done]() {
            if (cancellationRequested()) {
                return;
            }
            size_t i = next.fetch_add(1);
            outcomes[i] = runFile(*files[i]);
            reportProgress(done.fetch_add(1) + 1, files.size());
        }));
    }

    for (auto& future : futures) {
        future.get();
    }
    if (next.load() < files.size()) {
        LOG_INFO("CodeAnalyzer", "Analysis cancelled after " + std::to_string(next.load()) + " files");
    }
    return outcomes;
}

CodeAnalyzer::FileOutcome CodeAnalyzer::runFile(const FileRecord& file) const {
    FileOutcome outcome;
    outcome.started = true;
    try {
        std::vector<RawReference> references = extractReferences(file);
        for (const auto& reference : references) {
            const FileRecord* target = resolveReference(reference);
            if (target == nullptr) {
                continue;
            }

            Relationship relationship;
            relationship.from_file = file.path;
            relationship.to_file = target->path;
            relationship.kind = reference.kind;
            relationship.line_number = reference.line_number;
            relationship.identifier = reference.text;
            outcome.relationships.push_back(std::move(relationship));
        }
    } catch (const std::regex_error& e) {
        LOG_WARNING("CodeAnalyzer", "Skipping " + file.path + ": pattern matching failed (" + e.what() + ")");
        outcome.failed = true;
        outcome.relationships.clear();
    }
    return outcome;
}

std::vector<Relationship> CodeAnalyzer::analyzeFile(const FileRecord& file) const {
    if (!isAnalyzable(file)) {
        return {};
    }
    return runFile(file).relationships;
}

std::vector<RawReference> CodeAnalyzer::extractReferences(const FileRecord& file) const {
    const LanguageStrategy* strategy = m_strategies.forLanguage(file.language);
    if (strategy == nullptr || !file.hasContent()) {
        return {};
    }
    return strategy->extract(file);
}

const FileRecord* CodeAnalyzer::resolveReference(const RawReference& reference) const {
    const FileRecord* source = m_index.find(reference.source_file);
    if (source == nullptr) {
        return nullptr;
    }
    const LanguageStrategy* strategy = m_strategies.forLanguage(source->language);
    if (strategy == nullptr) {
        return nullptr;
    }
    return strategy->resolve(reference, m_resolver);
}

bool CodeAnalyzer::isAnalyzable(const FileRecord& file) const {
    return file.hasContent() && m_strategies.forLanguage(file.language) != nullptr;
}

bool CodeAnalyzer::cancellationRequested() const {
    return m_options.cancel_flag != nullptr && m_options.cancel_flag->load();
}

void CodeAnalyzer::reportProgress(size_t done, size_t total) const {
    if (m_options.on_file_done) {
        m_options.on_file_done(done, total);
    }
}

} // namespace RepoLens
