#include "core/search/search_engine.h"
#include "core/analysis/document_analyzer.h"
#include "core/embedding/embedder.h"
#include "core/extraction/file_classifier.h"
#include "core/generation/generation_client.h"
#include "core/search/context_assembler.h"
#include "core/shared/logging.h"
#include "core/shared/settings.h"

#include <QDirIterator>
#include <QElapsedTimer>
#include <QFileInfo>
#include <QHash>

#include <algorithm>

namespace dw {

namespace {

constexpr int kCollectionTopics = 10;
constexpr int kCollectionSummaryChars = 200;

DocumentSummary toSummary(const Document& document)
{
    DocumentSummary summary;
    summary.documentId = document.documentId;
    summary.sourcePath = document.sourcePath;
    summary.fileType = document.fileType;
    summary.summaryText = document.summaryText;
    summary.structure = document.rawStructure;
    summary.topics = document.topics;
    return summary;
}

} // namespace

SearchEngine::SearchEngine(VectorStore& store, DocumentAnalyzer& analyzer, GenerationClient& generator,
                           SearchEngineOptions options)
    : m_store(store)
    , m_analyzer(analyzer)
    , m_generator(generator)
    , m_options(std::move(options))
{
}

SearchEngineOptions SearchEngine::optionsFromSettings(const Settings& settings)
{
    SearchEngineOptions options;
    options.maxContextChars = settings.maxContextChars;
    options.refreshBeforeQuery = settings.refreshBeforeQuery;
    options.retry = GenerationRunner::policyFromSettings(settings);
    return options;
}

// ── Collection ──────────────────────────────────────────────

void SearchEngine::setCollection(const QStringList& paths)
{
    m_collection.clear();
    for (const QString& path : paths) {
        const QString absolute = QFileInfo(path).absoluteFilePath();
        if (!m_collection.contains(absolute)) {
            m_collection.append(absolute);
        }
    }
    m_collectionSet = true;
}

QStringList SearchEngine::scanDataDirectory(const QString& directory)
{
    QStringList paths;
    QDirIterator it(directory, QDir::Files | QDir::NoDotAndDotDot, QDirIterator::Subdirectories);
    while (it.hasNext()) {
        const QString path = it.next();
        if (hasSupportedExtension(path)) {
            paths.append(QFileInfo(path).absoluteFilePath());
        }
    }
    paths.sort();
    LOG_INFO(dwSearch, "Found %lld supported files under %s",
             static_cast<long long>(paths.size()), qUtf8Printable(directory));
    return paths;
}

FreshnessReport SearchEngine::refresh(const std::atomic<bool>* cancel)
{
    FreshnessReport report = m_store.ensureFresh(m_collection, m_analyzer, cancel);
    for (const AnalysisFailure& failure : report.failures) {
        LOG_WARN(dwSearch, "Not indexed: %s (%s)", qUtf8Printable(failure.path),
                 qUtf8Printable(failure.error.toString()));
    }
    if (report.changed()) {
        if (auto error = m_store.save()) {
            LOG_ERROR(dwSearch, "Failed to persist index: %s", qUtf8Printable(error->toString()));
        }
    }
    return report;
}

// ── Question answering ──────────────────────────────────────

AnswerResult SearchEngine::comprehensiveSearch(const QString& question, AnalysisDepth depth)
{
    AnswerResult result;
    result.question = question;
    result.depth = depth;

    // Step 1: freshness
    if (m_options.refreshBeforeQuery && m_collectionSet) {
        QElapsedTimer indexTimer;
        indexTimer.start();
        refresh();
        result.timing.indexMs = indexTimer.elapsed();
    }

    // Step 2: empty collection
    if (m_store.documentCount() == 0) {
        result.error = Error{ErrorCode::NoDocumentsIndexed,
                             QStringLiteral("No documents are indexed; add documents first")};
        return result;
    }

    QElapsedTimer searchTimer;
    searchTimer.start();

    // Step 3: embed with the indexing embedder
    const std::vector<float> query = m_analyzer.embedder().encode(question);
    if (query.empty()) {
        result.error = Error{ErrorCode::EmbeddingFailed, QStringLiteral("Failed to embed the question")};
        return result;
    }

    // Step 4: balanced retrieval
    const DepthParameters params = depthParameters(depth);
    auto retrieved = m_store.hybridSearch(query, params.numDocuments, params.numChunks);
    if (!retrieved) {
        result.error = retrieved.error();
        result.timing.searchMs = searchTimer.elapsed();
        return result;
    }
    result.retrieved = std::move(retrieved).value();

    // Step 5-6: context assembly within budget
    QHash<QString, ContextDocument> documents;
    std::vector<ContextDocument> documentsInOrder;
    for (const BalancedChunk& chunk : result.retrieved) {
        if (documents.contains(chunk.documentId)) {
            continue;
        }
        ContextDocument entry;
        entry.documentId = chunk.documentId;
        if (const std::optional<Document> document = m_store.document(chunk.documentId)) {
            entry.fileName = QFileInfo(document->sourcePath).fileName();
            entry.summary = document->summaryText;
            entry.topics = document->topics;
        }
        documents.insert(chunk.documentId, entry);
        documentsInOrder.push_back(entry);
    }

    const ContextAssembler assembler(m_options.maxContextChars);
    const AssembledContext context = assembler.assemble(result.retrieved, documents);
    result.contextUsed = context.text;
    result.citations = context.citations;
    result.perDocumentChunkCounts = context.perDocumentChunkCounts;
    result.timing.searchMs = searchTimer.elapsed();

    // Step 7-8: generation
    QElapsedTimer generationTimer;
    generationTimer.start();
    GenerationRunner runner(m_generator, m_options.retry, m_options.sleep);
    const GenerationResponse response = runner.run(ContextAssembler::buildPrompt(context.text, question));
    result.timing.generationMs = generationTimer.elapsed();

    if (!response.ok()) {
        const GenerationFailure& failure = *response.failure;
        result.error = Error{ErrorCode::GenerationError,
                             QStringLiteral("%1 after %2 attempt(s): %3")
                                 .arg(generationFailureKindToString(failure.kind))
                                 .arg(runner.lastAttempts())
                                 .arg(failure.message)};
        result.fallbackAnswer = ContextAssembler::buildFallbackAnswer(question, documentsInOrder,
                                                                      context.included);
        LOG_WARN(dwSearch, "Answer generation failed: %s", qUtf8Printable(result.error->toString()));
        return result;
    }

    result.answer = response.text;
    LOG_INFO(dwSearch, "Answered (%s): %lld citations, index %lld ms, search %lld ms, generation %lld ms",
             qUtf8Printable(analysisDepthToString(depth)),
             static_cast<long long>(result.citations.size()),
             static_cast<long long>(result.timing.indexMs),
             static_cast<long long>(result.timing.searchMs),
             static_cast<long long>(result.timing.generationMs));
    return result;
}

// ── Collection API ──────────────────────────────────────────

std::vector<DocumentInfo> SearchEngine::listDocuments() const
{
    return m_store.listDocuments();
}

Result<DocumentSummary> SearchEngine::documentSummary(const QString& idOrFileName) const
{
    if (const std::optional<Document> document = m_store.document(idOrFileName)) {
        return toSummary(*document);
    }

    const std::vector<DocumentInfo> documents = m_store.listDocuments();
    auto byName = std::find_if(documents.begin(), documents.end(), [&](const DocumentInfo& info) {
        return info.fileName == idOrFileName;
    });
    if (byName == documents.end()) {
        byName = std::find_if(documents.begin(), documents.end(), [&](const DocumentInfo& info) {
            return !idOrFileName.isEmpty() && info.sourcePath.contains(idOrFileName);
        });
    }
    if (byName != documents.end()) {
        if (const std::optional<Document> document = m_store.document(byName->documentId)) {
            return toSummary(*document);
        }
    }
    return Error{ErrorCode::NotFound,
                 QStringLiteral("Document '%1' not found in the collection").arg(idOrFileName)};
}

CollectionAnalysis SearchEngine::analyzeCollection() const
{
    CollectionAnalysis analysis;
    analysis.totalDocuments = m_store.documentCount();
    analysis.totalChunks = m_store.chunkCount();
    analysis.typesBreakdown = m_store.typeBreakdown();

    for (const DocumentInfo& info : m_store.listDocuments()) {
        const std::optional<Document> document = m_store.document(info.documentId);
        if (!document) {
            continue;
        }
        DocumentSummary summary = toSummary(*document);
        summary.topics = summary.topics.mid(0, kCollectionTopics);
        if (summary.summaryText.size() > kCollectionSummaryChars) {
            summary.summaryText = summary.summaryText.left(kCollectionSummaryChars) + QStringLiteral("...");
        }
        analysis.documents.push_back(std::move(summary));
    }
    return analysis;
}

} // namespace dw
