#include "core/shared/search_result.h"

#include <QFileInfo>
#include <QJsonArray>

namespace dw {

namespace {

QJsonObject countsToJson(const std::map<QString, int>& counts)
{
    QJsonObject json;
    for (const auto& [key, count] : counts) {
        json.insert(key, count);
    }
    return json;
}

} // namespace

QJsonObject answerResultToJson(const AnswerResult& result)
{
    QJsonObject json;
    json[QStringLiteral("question")] = result.question;
    json[QStringLiteral("analysis_depth")] = analysisDepthToString(result.depth);
    json[QStringLiteral("answer")] = result.answer;
    json[QStringLiteral("citations")] = QJsonArray::fromStringList(result.citations);
    json[QStringLiteral("per_document_chunk_counts")] = countsToJson(result.perDocumentChunkCounts);

    QJsonObject timing;
    timing[QStringLiteral("index_ms")] = static_cast<qint64>(result.timing.indexMs);
    timing[QStringLiteral("search_ms")] = static_cast<qint64>(result.timing.searchMs);
    timing[QStringLiteral("generation_ms")] = static_cast<qint64>(result.timing.generationMs);
    json[QStringLiteral("timing")] = timing;

    if (result.error) {
        QJsonObject error;
        error[QStringLiteral("code")] = errorCodeToString(result.error->code);
        error[QStringLiteral("message")] = result.error->message;
        json[QStringLiteral("error")] = error;
        if (!result.fallbackAnswer.isEmpty()) {
            json[QStringLiteral("fallback_answer")] = result.fallbackAnswer;
        }
    }
    return json;
}

QJsonObject collectionAnalysisToJson(const CollectionAnalysis& analysis)
{
    QJsonObject json;
    json[QStringLiteral("total_documents")] = analysis.totalDocuments;
    json[QStringLiteral("total_chunks")] = analysis.totalChunks;
    json[QStringLiteral("types_breakdown")] = countsToJson(analysis.typesBreakdown);

    QJsonArray documents;
    for (const DocumentSummary& doc : analysis.documents) {
        QJsonObject entry;
        entry[QStringLiteral("document_id")] = doc.documentId;
        entry[QStringLiteral("file_name")] = QFileInfo(doc.sourcePath).fileName();
        entry[QStringLiteral("file_type")] = fileTypeToString(doc.fileType);
        entry[QStringLiteral("key_topics")] = QJsonArray::fromStringList(doc.topics);
        entry[QStringLiteral("summary")] = doc.summaryText;
        documents.append(entry);
    }
    json[QStringLiteral("documents")] = documents;
    return json;
}

} // namespace dw
