#pragma once

#include "core/generation/generation_runner.h"
#include "core/shared/errors.h"
#include "core/shared/search_result.h"
#include "core/shared/types.h"
#include "core/vector/vector_store.h"

#include <QString>
#include <QStringList>

#include <atomic>
#include <vector>

namespace dw {

class DocumentAnalyzer;
class GenerationClient;
struct Settings;

struct SearchEngineOptions {
    int maxContextChars = 6000;
    bool refreshBeforeQuery = true;
    RetryPolicy retry;
    GenerationRunner::SleepFn sleep;     // empty = real sleep
};

// SearchEngine -- question answering over the managed collection.
//
// comprehensiveSearch(): optional freshness sweep, question embedding with
// the analyzer's embedder, balanced hybrid search sized by the analysis
// depth, budgeted context assembly, then generation with bounded retry.
// A failed generation still returns context, citations and a fallback
// digest alongside the GenerationError.
class SearchEngine {
public:
    SearchEngine(VectorStore& store, DocumentAnalyzer& analyzer, GenerationClient& generator,
                 SearchEngineOptions options = {});

    static SearchEngineOptions optionsFromSettings(const Settings& settings);

    // The managed collection. Until set, no freshness sweep runs.
    void setCollection(const QStringList& paths);
    QStringList collection() const { return m_collection; }

    // Recursive scan for files with a supported extension, sorted.
    static QStringList scanDataDirectory(const QString& directory);

    // ensureFresh over the managed collection; persists the graphs when
    // anything changed.
    FreshnessReport refresh(const std::atomic<bool>* cancel = nullptr);

    AnswerResult comprehensiveSearch(const QString& question, AnalysisDepth depth);

    std::vector<DocumentInfo> listDocuments() const;

    // Looks up by document id, then exact file name, then path substring.
    Result<DocumentSummary> documentSummary(const QString& idOrFileName) const;

    CollectionAnalysis analyzeCollection() const;

private:
    VectorStore& m_store;
    DocumentAnalyzer& m_analyzer;
    GenerationClient& m_generator;
    SearchEngineOptions m_options;
    QStringList m_collection;
    bool m_collectionSet = false;
};

} // namespace dw
