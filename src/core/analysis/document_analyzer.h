#pragma once

#include "core/analysis/analysis_types.h"
#include "core/analysis/chunker.h"
#include "core/shared/document.h"
#include "core/shared/errors.h"

#include <QByteArray>
#include <QString>
#include <QStringList>

#include <atomic>
#include <vector>

namespace dw {

class Embedder;
struct Settings;

struct AnalysisFailure {
    QString path;
    Error error;
};

struct BatchAnalysis {
    std::vector<AnalyzedDocument> documents;
    std::vector<AnalysisFailure> failures;
};

// DocumentAnalyzer -- turns one source file into a Document plus its
// embedded Chunks.
//
// Pipeline: read -> classify -> extract -> per-type structure/chunking ->
// topics + summary -> one batched embedding call for the chunks and one
// for the summary. Each file type has its own handler; the result is
// all-or-nothing (any failure, including cancellation, yields an Error and
// no partial document).
//
// Not thread-safe: one analyzer per worker. The cancel flag may be raised
// from any thread.
class DocumentAnalyzer {
public:
    DocumentAnalyzer(Embedder& embedder, const AnalyzerOptions& options = {});

    static AnalyzerOptions optionsFromSettings(const Settings& settings);

    Result<AnalyzedDocument> analyze(const QString& path);

    // Same as analyze() for bytes the caller already read. `path` is still
    // used for classification, ids and the docx reader.
    Result<AnalyzedDocument> analyzeContent(const QString& path, const QByteArray& bytes);

    // Files are processed in order; one failure never stops the batch.
    BatchAnalysis analyzeBatch(const QStringList& paths);

    void requestCancel() { m_cancelled.store(true); }
    void clearCancel() { m_cancelled.store(false); }
    bool isCancelled() const { return m_cancelled.load(); }

    const AnalyzerOptions& options() const { return m_options; }
    Embedder& embedder() { return m_embedder; }

private:
    Result<TypeAnalysis> analyzeByType(FileType type, const QString& path, const QByteArray& bytes) const;

    QString buildSummary(const QString& fileName, FileType type,
                         const TypeAnalysis& analysis, const QStringList& topics) const;

    Embedder& m_embedder;
    AnalyzerOptions m_options;
    Chunker m_chunker;
    std::atomic<bool> m_cancelled{false};
};

} // namespace dw
