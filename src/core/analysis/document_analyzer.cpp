#include "core/analysis/document_analyzer.h"
#include "core/analysis/record_analyzer.h"
#include "core/analysis/tabular_analyzer.h"
#include "core/analysis/text_structure.h"
#include "core/analysis/topic_extractor.h"
#include "core/analysis/word_analyzer.h"
#include "core/embedding/embedder.h"
#include "core/extraction/delimited_parser.h"
#include "core/extraction/docx_extractor.h"
#include "core/extraction/file_classifier.h"
#include "core/extraction/pdf_extractor.h"
#include "core/extraction/record_extractor.h"
#include "core/extraction/spreadsheet_extractor.h"
#include "core/extraction/text_extractor.h"
#include "core/shared/file_reader.h"
#include "core/shared/logging.h"
#include "core/shared/settings.h"

#include <QElapsedTimer>
#include <QFileInfo>

#include <algorithm>

namespace dw {

namespace {

constexpr int kSniffBytes = 4096;
constexpr int kSummaryHeadings = 10;

Error cancelledError(const QString& path)
{
    return Error{ErrorCode::Cancelled, QStringLiteral("Analysis cancelled: %1").arg(path)};
}

} // namespace

// ── Construction ────────────────────────────────────────────

DocumentAnalyzer::DocumentAnalyzer(Embedder& embedder, const AnalyzerOptions& options)
    : m_embedder(embedder)
    , m_options(options)
    , m_chunker(options.chunker)
{
}

AnalyzerOptions DocumentAnalyzer::optionsFromSettings(const Settings& settings)
{
    AnalyzerOptions options;
    options.chunker.targetSize = static_cast<size_t>(std::max(settings.chunkTargetSize, 1));
    options.chunker.minSize = static_cast<size_t>(std::max(settings.chunkMinSize, 0));
    options.chunker.maxSize = static_cast<size_t>(std::max(settings.chunkMaxSize, settings.chunkTargetSize));
    options.rowsPerChunk = settings.rowsPerChunk;
    options.paragraphsPerChunk = settings.paragraphsPerChunk;
    options.recordChunkBudget = settings.recordChunkBudget;
    options.maxTopics = settings.maxTopics;
    options.summaryMaxChars = settings.summaryMaxChars;
    options.maxFileSize = settings.maxFileSize;
    return options;
}

// ── Public entry points ─────────────────────────────────────

Result<AnalyzedDocument> DocumentAnalyzer::analyze(const QString& path)
{
    if (isCancelled()) {
        return cancelledError(path);
    }
    auto bytes = readFileBytes(path, m_options.maxFileSize);
    if (!bytes) {
        LOG_WARN(dwAnalysis, "Cannot read %s: %s", qUtf8Printable(path),
                 qUtf8Printable(bytes.error().toString()));
        return bytes.error();
    }
    return analyzeContent(path, bytes.value());
}

Result<AnalyzedDocument> DocumentAnalyzer::analyzeContent(const QString& path, const QByteArray& bytes)
{
    QElapsedTimer timer;
    timer.start();

    const QFileInfo info(path);
    const QString absolutePath = info.absoluteFilePath();

    const std::optional<FileType> type = classifyFileType(absolutePath, bytes.left(kSniffBytes));
    if (!type.has_value()) {
        LOG_INFO(dwAnalysis, "Unsupported file type: %s", qUtf8Printable(absolutePath));
        return Error{ErrorCode::UnsupportedType,
                     QStringLiteral("Unsupported file type: %1").arg(info.fileName())};
    }

    if (isCancelled()) {
        return cancelledError(absolutePath);
    }

    auto typed = analyzeByType(*type, absolutePath, bytes);
    if (!typed) {
        LOG_WARN(dwAnalysis, "Extraction failed for %s: %s", qUtf8Printable(absolutePath),
                 qUtf8Printable(typed.error().toString()));
        return typed.error();
    }
    TypeAnalysis& analysis = typed.value();
    if (analysis.chunks.empty()) {
        return Error{ErrorCode::CorruptInput,
                     QStringLiteral("No extractable content: %1").arg(info.fileName())};
    }

    const QStringList topics = extractTopics(analysis.fullText, analysis.headings, m_options.maxTopics);
    const QString summary = buildSummary(info.fileName(), *type, analysis, topics);

    if (isCancelled()) {
        return cancelledError(absolutePath);
    }

    // Stage: embeddings (one batch for chunks, one call for the summary)
    std::vector<QString> texts;
    texts.reserve(analysis.chunks.size());
    for (const ChunkDraft& draft : analysis.chunks) {
        texts.push_back(draft.text);
    }

    const int dimensions = m_embedder.dimensions();
    std::vector<std::vector<float>> vectors = m_embedder.encodeBatch(texts);
    if (vectors.size() != texts.size()) {
        LOG_ERROR(dwAnalysis, "Embedder returned %zu vectors for %zu chunks (%s)",
                  vectors.size(), texts.size(), qUtf8Printable(absolutePath));
        return Error{ErrorCode::EmbeddingFailed,
                     QStringLiteral("Expected %1 chunk vectors, got %2")
                         .arg(texts.size())
                         .arg(vectors.size())};
    }
    for (const std::vector<float>& vec : vectors) {
        if (static_cast<int>(vec.size()) != dimensions) {
            return Error{ErrorCode::EmbeddingFailed,
                         QStringLiteral("Chunk vector has %1 dimensions, expected %2")
                             .arg(vec.size())
                             .arg(dimensions)};
        }
    }

    std::vector<float> summaryVector = m_embedder.encode(summary);
    if (static_cast<int>(summaryVector.size()) != dimensions) {
        return Error{ErrorCode::EmbeddingFailed,
                     QStringLiteral("Summary vector has %1 dimensions, expected %2")
                         .arg(summaryVector.size())
                         .arg(dimensions)};
    }

    if (isCancelled()) {
        return cancelledError(absolutePath);
    }

    AnalyzedDocument result;
    Document& doc = result.document;
    doc.documentId = computeDocumentId(absolutePath);
    doc.sourcePath = absolutePath;
    doc.fileType = *type;
    doc.contentHash = computeContentHash(bytes);
    doc.rawStructure = std::move(analysis.rawStructure);
    doc.summaryText = summary;
    doc.summaryVector = std::move(summaryVector);
    doc.topics = topics;
    doc.sizeBytes = bytes.size();

    result.chunks.reserve(analysis.chunks.size());
    for (size_t i = 0; i < analysis.chunks.size(); ++i) {
        Chunk chunk;
        chunk.text = analysis.chunks[i].text;
        chunk.locator = analysis.chunks[i].locator;
        chunk.vector = std::move(vectors[i]);
        result.chunks.push_back(std::move(chunk));
    }
    linkChunks(doc, result.chunks);

    LOG_INFO(dwAnalysis, "Analyzed %s (%s): %zu chunks, %lld topics in %lld ms",
             qUtf8Printable(info.fileName()), qUtf8Printable(fileTypeToString(*type)),
             result.chunks.size(), static_cast<long long>(topics.size()),
             static_cast<long long>(timer.elapsed()));
    return result;
}

BatchAnalysis DocumentAnalyzer::analyzeBatch(const QStringList& paths)
{
    BatchAnalysis batch;
    for (const QString& path : paths) {
        if (isCancelled()) {
            batch.failures.push_back(AnalysisFailure{path, cancelledError(path)});
            continue;
        }
        auto analyzed = analyze(path);
        if (analyzed) {
            batch.documents.push_back(std::move(analyzed).value());
        } else {
            batch.failures.push_back(AnalysisFailure{path, analyzed.error()});
        }
    }
    LOG_INFO(dwAnalysis, "Batch analysis: %zu analyzed, %zu failed",
             batch.documents.size(), batch.failures.size());
    return batch;
}

// ── Per-type dispatch ───────────────────────────────────────

Result<TypeAnalysis> DocumentAnalyzer::analyzeByType(FileType type, const QString& path,
                                                     const QByteArray& bytes) const
{
    switch (type) {
    case FileType::Pdf: {
        auto pages = PdfExtractor::extract(path, bytes);
        if (!pages) {
            return pages.error();
        }
        return analyzePdfPages(pages.value(), m_chunker);
    }
    case FileType::Text: {
        auto text = TextExtractor::extract(path, bytes);
        if (!text) {
            return text.error();
        }
        return analyzePlainText(text.value(), m_chunker);
    }
    case FileType::Tabular: {
        auto table = DelimitedParser::parse(TextExtractor::decode(bytes),
                                            DelimitedParser::delimiterForPath(path));
        if (!table) {
            return table.error();
        }
        return analyzeTables({table.value()}, m_options.rowsPerChunk, false);
    }
    case FileType::Spreadsheet: {
        auto tables = SpreadsheetExtractor::extract(path, bytes);
        if (!tables) {
            return tables.error();
        }
        return analyzeTables(tables.value(), m_options.rowsPerChunk, true);
    }
    case FileType::Word: {
        auto paragraphs = DocxExtractor::extract(path, bytes);
        if (!paragraphs) {
            return paragraphs.error();
        }
        return analyzeWordParagraphs(paragraphs.value(), m_chunker, m_options.paragraphsPerChunk);
    }
    case FileType::StructuredRecord: {
        auto record = RecordExtractor::extract(path, bytes);
        if (!record) {
            return record.error();
        }
        return analyzeRecords(record.value(), m_options.recordChunkBudget);
    }
    }
    return Error{ErrorCode::UnsupportedType, QStringLiteral("Unhandled file type")};
}

// ── Summary ─────────────────────────────────────────────────

QString DocumentAnalyzer::buildSummary(const QString& fileName, FileType type,
                                       const TypeAnalysis& analysis,
                                       const QStringList& topics) const
{
    QStringList parts;
    parts.append(QStringLiteral("%1 (%2)").arg(fileName, fileTypeToString(type)));
    if (!analysis.headings.isEmpty()) {
        parts.append(QStringLiteral("Headings: %1")
                         .arg(analysis.headings.mid(0, kSummaryHeadings).join(QStringLiteral("; "))));
    }
    if (!analysis.highlights.isEmpty()) {
        parts.append(analysis.highlights);
    }
    if (!topics.isEmpty()) {
        parts.append(QStringLiteral("Key topics: %1").arg(topics.mid(0, 10).join(QStringLiteral(", "))));
    }

    QString summary = parts.join(QLatin1Char('\n'));
    const size_t leading = std::min(analysis.chunks.size(),
                                    static_cast<size_t>(std::max(m_options.summaryChunkCount, 0)));
    for (size_t i = 0; i < leading; ++i) {
        summary += QStringLiteral("\n\n");
        summary += analysis.chunks[i].text;
    }

    const int limit = std::max(m_options.summaryMaxChars, 4);
    if (summary.size() > limit) {
        summary = summary.left(limit - 3).trimmed() + QStringLiteral("...");
    }
    return summary;
}

} // namespace dw
