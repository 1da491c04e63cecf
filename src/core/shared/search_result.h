#pragma once

#include "core/shared/errors.h"
#include "core/shared/types.h"

#include <QJsonObject>
#include <QString>
#include <QStringList>

#include <cstdint>
#include <map>
#include <optional>
#include <vector>

namespace dw {

// One hit from a document- or chunk-level similarity search.
struct ScoredId {
    QString id;
    double score = 0.0;
};

// One entry of a balanced hybrid search result. rank is the 1-based
// position in the interleaved output; fill is set for entries taken
// after per-document quotas were exhausted.
struct BalancedChunk {
    QString chunkId;
    QString documentId;
    int sequenceIndex = 0;
    QString text;
    QString locator;
    double score = 0.0;
    int rank = 0;
    bool fill = false;
};

struct DocumentInfo {
    QString documentId;
    QString sourcePath;
    QString fileName;
    FileType fileType = FileType::Text;
    QStringList topics;
    int chunkCount = 0;
    int64_t sizeBytes = 0;
};

struct DocumentSummary {
    QString documentId;
    QString sourcePath;
    FileType fileType = FileType::Text;
    QString summaryText;
    QJsonObject structure;
    QStringList topics;
};

struct CollectionAnalysis {
    int totalDocuments = 0;
    int totalChunks = 0;
    std::map<QString, int> typesBreakdown;
    std::vector<DocumentSummary> documents;
};

struct PhaseTiming {
    int64_t indexMs = 0;
    int64_t searchMs = 0;
    int64_t generationMs = 0;
};

// Answer to one comprehensiveSearch() call. On failure error is set; when
// retrieval succeeded the context, citations and fallbackAnswer are still
// populated so the retrieval work remains usable.
struct AnswerResult {
    QString question;
    AnalysisDepth depth = AnalysisDepth::Deep;
    QString answer;
    QStringList citations;
    std::map<QString, int> perDocumentChunkCounts;
    PhaseTiming timing;
    QString contextUsed;
    std::vector<BalancedChunk> retrieved;
    QString fallbackAnswer;
    std::optional<Error> error;

    bool ok() const { return !error.has_value(); }
};

QJsonObject answerResultToJson(const AnswerResult& result);
QJsonObject collectionAnalysisToJson(const CollectionAnalysis& analysis);

} // namespace dw
