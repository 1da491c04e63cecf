#include "core/vector/vector_store.h"
#include "core/shared/file_reader.h"
#include "core/shared/logging.h"
#include "core/vector/balanced_selector.h"

#include <QDir>
#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>

#include <algorithm>
#include <mutex>

namespace dw {

namespace {

constexpr const char* kDatabaseFile = "metadata.db";
constexpr const char* kDocumentsIndex = "documents";
constexpr const char* kChunksIndex = "chunks";

const QString kMetaDimensions = QStringLiteral("dimensions");
const QString kMetaModelId = QStringLiteral("model_id");

void sortByScore(std::vector<ScoredId>& hits)
{
    std::sort(hits.begin(), hits.end(), [](const ScoredId& a, const ScoredId& b) {
        if (a.score != b.score) {
            return a.score > b.score;
        }
        return a.id < b.id;
    });
}

Error storageError(const QString& message)
{
    return Error{ErrorCode::StorageError, message};
}

} // namespace

QString upsertOutcomeToString(UpsertOutcome outcome)
{
    switch (outcome) {
    case UpsertOutcome::Inserted:  return QStringLiteral("inserted");
    case UpsertOutcome::Replaced:  return QStringLiteral("replaced");
    case UpsertOutcome::Unchanged: return QStringLiteral("unchanged");
    }
    return QStringLiteral("unknown");
}

VectorStore::VectorStore() = default;

VectorStore::~VectorStore() = default;

// ── Lifecycle ───────────────────────────────────────────────

std::optional<Error> VectorStore::init(const QString& storeDir, int dimensions, const QString& modelId)
{
    if (dimensions <= 0) {
        return Error{ErrorCode::InvalidArgument,
                     QStringLiteral("Vector dimension must be positive (got %1)").arg(dimensions)};
    }

    std::unique_lock<std::shared_mutex> lock(m_mutex);

    if (!QDir().mkpath(storeDir)) {
        return storageError(QStringLiteral("Cannot create store directory %1").arg(storeDir));
    }

    m_storeDir = QDir(storeDir).absolutePath();
    m_dimensions = dimensions;
    m_modelId = modelId;

    m_meta = MetadataStore::open(QDir(m_storeDir).filePath(QString::fromLatin1(kDatabaseFile)));
    if (!m_meta) {
        return storageError(QStringLiteral("Cannot open metadata database in %1").arg(m_storeDir));
    }

    const std::optional<QString> storedDimensions = m_meta->metaValue(kMetaDimensions);
    const std::optional<QString> storedModel = m_meta->metaValue(kMetaModelId);
    const bool incompatible = (storedDimensions && storedDimensions->toInt() != dimensions)
        || (storedModel && *storedModel != modelId);
    if (incompatible) {
        LOG_WARN(dwIndex, "Store was built with model %s (%s dims); resetting for %s (%d dims)",
                 qUtf8Printable(storedModel.value_or(QStringLiteral("?"))),
                 qUtf8Printable(storedDimensions.value_or(QStringLiteral("?"))),
                 qUtf8Printable(modelId), dimensions);
        if (!m_meta->deleteAll()) {
            return storageError(QStringLiteral("Failed to reset incompatible store"));
        }
        for (const char* name : {kDocumentsIndex, kChunksIndex}) {
            QFile::remove(indexPath(name));
            QFile::remove(metaPath(name));
        }
    }
    if (!m_meta->setMetaValue(kMetaDimensions, QString::number(dimensions))
        || !m_meta->setMetaValue(kMetaModelId, modelId)) {
        return storageError(QStringLiteral("Failed to record store metadata"));
    }

    return loadUnlocked();
}

bool VectorStore::isInitialized() const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_meta.has_value() && m_documentIndex && m_chunkIndex;
}

std::optional<Error> VectorStore::load()
{
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    return loadUnlocked();
}

std::optional<Error> VectorStore::loadUnlocked()
{
    if (!m_meta) {
        return storageError(QStringLiteral("Vector store is not initialised"));
    }

    m_documentIndex = loadIndex(kDocumentsIndex, m_meta->documentCount());
    if (!m_documentIndex && !rebuildDocumentIndex()) {
        return storageError(QStringLiteral("Failed to rebuild the document index"));
    }
    m_chunkIndex = loadIndex(kChunksIndex, m_meta->chunkCount());
    if (!m_chunkIndex && !rebuildChunkIndex()) {
        return storageError(QStringLiteral("Failed to rebuild the chunk index"));
    }
    rebuildLabelMaps();
    reserveStoredLabels();

    LOG_INFO(dwIndex, "Vector store ready: %d documents, %d chunks (%s)",
             static_cast<int>(m_labelByDocument.size()),
             static_cast<int>(m_chunkByLabel.size()),
             qUtf8Printable(m_storeDir));
    return std::nullopt;
}

std::optional<Error> VectorStore::save()
{
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    return saveUnlocked();
}

std::optional<Error> VectorStore::saveUnlocked()
{
    if (!m_documentIndex || !m_chunkIndex) {
        return storageError(QStringLiteral("Vector store is not initialised"));
    }

    const uint64_t generation = m_meta->generation();
    m_documentIndex->setStoreGeneration(generation);
    m_chunkIndex->setStoreGeneration(generation);

    std::optional<Error> error = m_documentIndex->save(indexPath(kDocumentsIndex), metaPath(kDocumentsIndex));
    if (!error) {
        error = m_chunkIndex->save(indexPath(kChunksIndex), metaPath(kChunksIndex));
    }
    if (error) {
        LOG_ERROR(dwIndex, "%s", qUtf8Printable(error->toString()));
        return storageError(QStringLiteral("Failed to save vector indices to %1").arg(m_storeDir));
    }
    LOG_DEBUG(dwIndex, "Saved vector indices (%d document, %d chunk vectors)",
              m_documentIndex->liveSize(), m_chunkIndex->liveSize());
    return std::nullopt;
}

std::optional<Error> VectorStore::teardown()
{
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    if (!m_meta) {
        return storageError(QStringLiteral("Vector store is not initialised"));
    }
    if (!m_meta->deleteAll()) {
        return storageError(QStringLiteral("Failed to clear metadata"));
    }
    for (const char* name : {kDocumentsIndex, kChunksIndex}) {
        QFile::remove(indexPath(name));
        QFile::remove(metaPath(name));
    }
    if (!rebuildDocumentIndex() || !rebuildChunkIndex()) {
        return storageError(QStringLiteral("Failed to reset vector indices"));
    }
    rebuildLabelMaps();
    LOG_INFO(dwIndex, "Vector store cleared: %s", qUtf8Printable(m_storeDir));
    return std::nullopt;
}

// ── Load / rebuild ──────────────────────────────────────────

IndexIdentity VectorStore::indexIdentity() const
{
    return IndexIdentity{m_dimensions, m_modelId};
}

// A persisted graph is reused only when it was saved at the current
// metadata generation, matches the row count and is not overdue for
// compaction; nullptr means the caller rebuilds from SQLite.
std::unique_ptr<VectorIndex> VectorStore::loadIndex(const char* name, int rows) const
{
    auto index = std::make_unique<VectorIndex>(indexIdentity());
    const std::optional<Error> error = index->load(indexPath(name), metaPath(name));
    if (error) {
        LOG_INFO(dwIndex, "%s index not reused: %s", name, qUtf8Printable(error->toString()));
        return nullptr;
    }
    const uint64_t generation = m_meta->generation();
    if (index->storeGeneration() != generation) {
        LOG_INFO(dwIndex, "%s index saved at generation %llu, metadata is at %llu",
                 name, static_cast<unsigned long long>(index->storeGeneration()),
                 static_cast<unsigned long long>(generation));
        return nullptr;
    }
    if (index->liveSize() != rows || index->needsRebuild()) {
        LOG_INFO(dwIndex, "%s index is stale (%d live vectors, %d rows, %d tombstones)",
                 name, index->liveSize(), rows, index->tombstones());
        return nullptr;
    }
    return index;
}

bool VectorStore::rebuildDocumentIndex()
{
    const std::vector<MetadataStore::DocumentRow> rows = m_meta->allDocuments(true);
    auto index = std::make_unique<VectorIndex>(indexIdentity());
    if (!index->create(std::max(VectorIndex::kInitialCapacity, static_cast<int>(rows.size()) * 2))) {
        return false;
    }
    for (const MetadataStore::DocumentRow& row : rows) {
        if (static_cast<int>(row.document.summaryVector.size()) != m_dimensions) {
            LOG_WARN(dwIndex, "Skipping document %s with %zu-dim vector during rebuild",
                     qUtf8Printable(row.document.documentId), row.document.summaryVector.size());
            continue;
        }
        if (!index->addWithLabel(row.document.summaryVector, row.hnswLabel)) {
            return false;
        }
    }
    LOG_INFO(dwIndex, "Rebuilt document index from %zu rows", rows.size());
    m_documentIndex = std::move(index);
    return true;
}

bool VectorStore::rebuildChunkIndex()
{
    const std::vector<MetadataStore::ChunkRow> rows = m_meta->allChunks(true);
    auto index = std::make_unique<VectorIndex>(indexIdentity());
    if (!index->create(std::max(VectorIndex::kInitialCapacity, static_cast<int>(rows.size()) * 2))) {
        return false;
    }
    for (const MetadataStore::ChunkRow& row : rows) {
        if (static_cast<int>(row.chunk.vector.size()) != m_dimensions) {
            LOG_WARN(dwIndex, "Skipping chunk %s with %zu-dim vector during rebuild",
                     qUtf8Printable(row.chunk.chunkId), row.chunk.vector.size());
            continue;
        }
        if (!index->addWithLabel(row.chunk.vector, row.hnswLabel)) {
            return false;
        }
    }
    LOG_INFO(dwIndex, "Rebuilt chunk index from %zu rows", rows.size());
    m_chunkIndex = std::move(index);
    return true;
}

void VectorStore::rebuildLabelMaps()
{
    m_documentByLabel.clear();
    m_labelByDocument.clear();
    m_chunkByLabel.clear();
    m_chunkLabelsByDocument.clear();

    for (const MetadataStore::LabelRow& row : m_meta->documentLabels()) {
        m_documentByLabel[row.hnswLabel] = row.id;
        m_labelByDocument.insert(row.id, row.hnswLabel);
    }
    for (const MetadataStore::LabelRow& row : m_meta->chunkLabels()) {
        m_chunkByLabel[row.hnswLabel] = ChunkRef{row.id, row.documentId};
        m_chunkLabelsByDocument[row.documentId].push_back(row.hnswLabel);
    }
}

// New labels must not collide with rows SQLite already holds.
void VectorStore::reserveStoredLabels()
{
    uint64_t nextDocument = 0;
    for (const auto& entry : m_documentByLabel) {
        nextDocument = std::max(nextDocument, entry.first + 1);
    }
    uint64_t nextChunk = 0;
    for (const auto& entry : m_chunkByLabel) {
        nextChunk = std::max(nextChunk, entry.first + 1);
    }
    m_documentIndex->reserveLabelsBelow(nextDocument);
    m_chunkIndex->reserveLabelsBelow(nextChunk);
}

// ── Writes ──────────────────────────────────────────────────

Result<UpsertOutcome> VectorStore::upsert(const AnalyzedDocument& analyzed)
{
    const Document& doc = analyzed.document;

    if (static_cast<int>(doc.summaryVector.size()) != m_dimensions) {
        return Error{ErrorCode::DimensionMismatch,
                     QStringLiteral("Summary vector has %1 dimensions, store expects %2")
                         .arg(doc.summaryVector.size())
                         .arg(m_dimensions)};
    }
    for (const Chunk& chunk : analyzed.chunks) {
        if (static_cast<int>(chunk.vector.size()) != m_dimensions) {
            return Error{ErrorCode::DimensionMismatch,
                         QStringLiteral("Chunk %1 has %2 dimensions, store expects %3")
                             .arg(chunk.sequenceIndex)
                             .arg(chunk.vector.size())
                             .arg(m_dimensions)};
        }
    }

    std::unique_lock<std::shared_mutex> lock(m_mutex);
    if (!m_meta || !m_documentIndex || !m_chunkIndex) {
        return storageError(QStringLiteral("Vector store is not initialised"));
    }

    const bool existed = m_labelByDocument.contains(doc.documentId);
    if (existed) {
        const std::optional<QString> storedHash = m_meta->contentHash(doc.documentId);
        const auto labels = m_chunkLabelsByDocument.constFind(doc.documentId);
        const size_t storedChunks = labels == m_chunkLabelsByDocument.constEnd() ? 0 : labels->size();
        if (storedHash && *storedHash == doc.contentHash && storedChunks == analyzed.chunks.size()) {
            LOG_DEBUG(dwIndex, "Upsert skipped (unchanged): %s", qUtf8Printable(doc.sourcePath));
            return UpsertOutcome::Unchanged;
        }
    }

    // Stage 1: new vectors into both graphs.
    std::vector<uint64_t> newChunkLabels;
    newChunkLabels.reserve(analyzed.chunks.size());
    const uint64_t newDocumentLabel = m_documentIndex->add(doc.summaryVector);
    bool added = newDocumentLabel != VectorIndex::kInvalidLabel;
    for (size_t i = 0; added && i < analyzed.chunks.size(); ++i) {
        const uint64_t label = m_chunkIndex->add(analyzed.chunks[i].vector);
        added = label != VectorIndex::kInvalidLabel;
        if (added) {
            newChunkLabels.push_back(label);
        }
    }

    auto discardNewLabels = [&]() {
        if (newDocumentLabel != VectorIndex::kInvalidLabel) {
            m_documentIndex->remove(newDocumentLabel);
        }
        for (uint64_t label : newChunkLabels) {
            m_chunkIndex->remove(label);
        }
    };

    if (!added) {
        discardNewLabels();
        return storageError(QStringLiteral("Failed to add vectors for %1").arg(doc.sourcePath));
    }

    // Stage 2: metadata swap in one transaction.
    if (!m_meta->replaceDocument(doc, newDocumentLabel, analyzed.chunks, newChunkLabels)) {
        discardNewLabels();
        return storageError(QStringLiteral("Failed to write metadata for %1").arg(doc.sourcePath));
    }

    // Stage 3: retire the previous labels.
    removeDocumentUnlocked(doc.documentId);
    m_documentByLabel[newDocumentLabel] = doc.documentId;
    m_labelByDocument.insert(doc.documentId, newDocumentLabel);
    std::vector<uint64_t>& chunkLabels = m_chunkLabelsByDocument[doc.documentId];
    for (size_t i = 0; i < analyzed.chunks.size(); ++i) {
        m_chunkByLabel[newChunkLabels[i]] = ChunkRef{analyzed.chunks[i].chunkId, doc.documentId};
        chunkLabels.push_back(newChunkLabels[i]);
    }

    const UpsertOutcome outcome = existed ? UpsertOutcome::Replaced : UpsertOutcome::Inserted;
    LOG_INFO(dwIndex, "Upsert %s: %s (%zu chunks)",
             qUtf8Printable(upsertOutcomeToString(outcome)),
             qUtf8Printable(doc.sourcePath), analyzed.chunks.size());
    return outcome;
}

std::optional<Error> VectorStore::removeDocument(const QString& documentId)
{
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    if (!m_meta) {
        return storageError(QStringLiteral("Vector store is not initialised"));
    }
    if (!m_labelByDocument.contains(documentId)) {
        return Error{ErrorCode::NotFound, QStringLiteral("Unknown document %1").arg(documentId)};
    }
    if (!m_meta->deleteDocument(documentId)) {
        return storageError(QStringLiteral("Failed to delete document %1").arg(documentId));
    }
    removeDocumentUnlocked(documentId);
    LOG_INFO(dwIndex, "Removed document %s", qUtf8Printable(documentId));
    return std::nullopt;
}

// Drops graph labels and map entries; SQLite rows are handled by callers.
void VectorStore::removeDocumentUnlocked(const QString& documentId)
{
    auto documentLabel = m_labelByDocument.find(documentId);
    if (documentLabel != m_labelByDocument.end()) {
        m_documentIndex->remove(documentLabel.value());
        m_documentByLabel.erase(documentLabel.value());
        m_labelByDocument.erase(documentLabel);
    }

    auto chunkLabels = m_chunkLabelsByDocument.find(documentId);
    if (chunkLabels != m_chunkLabelsByDocument.end()) {
        for (uint64_t label : chunkLabels.value()) {
            m_chunkIndex->remove(label);
            m_chunkByLabel.erase(label);
        }
        m_chunkLabelsByDocument.erase(chunkLabels);
    }
}

// ── Staleness ───────────────────────────────────────────────

bool VectorStore::isStale(const QString& documentId) const
{
    std::optional<QString> storedHash;
    std::optional<QString> path;
    {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        if (!m_meta || !m_labelByDocument.contains(documentId)) {
            return true;
        }
        storedHash = m_meta->contentHash(documentId);
        path = m_meta->sourcePath(documentId);
    }
    if (!storedHash || !path) {
        return true;
    }

    auto bytes = readFileBytes(*path);
    if (!bytes) {
        return true;
    }
    return computeContentHash(bytes.value()) != *storedHash;
}

FreshnessReport VectorStore::ensureFresh(const QStringList& paths, DocumentAnalyzer& analyzer,
                                         const std::atomic<bool>* cancel)
{
    QElapsedTimer timer;
    timer.start();

    FreshnessReport report;
    QSet<QString> managed;

    auto isCancelled = [&]() {
        return (cancel && cancel->load()) || analyzer.isCancelled();
    };

    for (const QString& rawPath : paths) {
        if (isCancelled()) {
            report.cancelled = true;
            break;
        }

        const QString path = QFileInfo(rawPath).absoluteFilePath();
        if (managed.contains(path)) {
            continue;
        }
        managed.insert(path);

        auto bytes = readFileBytes(path, analyzer.options().maxFileSize);
        if (!bytes) {
            LOG_WARN(dwIndex, "Skipping %s: %s", qUtf8Printable(path),
                     qUtf8Printable(bytes.error().toString()));
            report.failures.push_back(AnalysisFailure{path, bytes.error()});
            continue;
        }

        const QString documentId = computeDocumentId(path);
        const QString hash = computeContentHash(bytes.value());
        std::optional<QString> storedHash;
        {
            std::shared_lock<std::shared_mutex> lock(m_mutex);
            if (m_meta && m_labelByDocument.contains(documentId)) {
                storedHash = m_meta->contentHash(documentId);
            }
        }
        if (storedHash && *storedHash == hash) {
            report.unchanged.append(path);
            continue;
        }

        auto analyzed = analyzer.analyzeContent(path, bytes.value());
        if (!analyzed) {
            if (analyzed.error().code == ErrorCode::Cancelled) {
                report.cancelled = true;
                break;
            }
            report.failures.push_back(AnalysisFailure{path, analyzed.error()});
            continue;
        }
        if (isCancelled()) {
            report.cancelled = true;
            break;
        }

        auto outcome = upsert(analyzed.value());
        if (!outcome) {
            LOG_ERROR(dwIndex, "Upsert failed for %s: %s", qUtf8Printable(path),
                      qUtf8Printable(outcome.error().toString()));
            report.failures.push_back(AnalysisFailure{path, outcome.error()});
            continue;
        }
        switch (outcome.value()) {
        case UpsertOutcome::Inserted:
            report.added.append(path);
            break;
        case UpsertOutcome::Replaced:
            report.updated.append(path);
            break;
        case UpsertOutcome::Unchanged:
            report.unchanged.append(path);
            break;
        }
    }

    if (!report.cancelled && isCancelled()) {
        report.cancelled = true;
    }

    if (!report.cancelled) {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        if (m_meta) {
            for (const MetadataStore::DocumentRow& row : m_meta->allDocuments()) {
                const QString& path = row.document.sourcePath;
                if (managed.contains(path) && QFileInfo::exists(path)) {
                    continue;
                }
                if (!m_meta->deleteDocument(row.document.documentId)) {
                    LOG_ERROR(dwIndex, "Failed to prune %s", qUtf8Printable(path));
                    continue;
                }
                removeDocumentUnlocked(row.document.documentId);
                report.removed.append(row.document.documentId);
                LOG_INFO(dwIndex, "Pruned document no longer in collection: %s", qUtf8Printable(path));
            }
        }
    } else {
        LOG_INFO(dwIndex, "Freshness sweep cancelled");
    }

    report.durationMs = timer.elapsed();
    LOG_INFO(dwIndex,
             "Freshness sweep: %lld added, %lld updated, %lld unchanged, %lld removed, %zu failed (%lld ms)",
             static_cast<long long>(report.added.size()),
             static_cast<long long>(report.updated.size()),
             static_cast<long long>(report.unchanged.size()),
             static_cast<long long>(report.removed.size()),
             report.failures.size(),
             static_cast<long long>(report.durationMs));
    return report;
}

// ── Search ──────────────────────────────────────────────────

std::optional<Error> VectorStore::checkQuery(const std::vector<float>& query) const
{
    if (!m_documentIndex || !m_chunkIndex || m_labelByDocument.isEmpty()) {
        return Error{ErrorCode::EmptyIndex, QStringLiteral("No documents are indexed")};
    }
    if (static_cast<int>(query.size()) != m_dimensions) {
        return Error{ErrorCode::DimensionMismatch,
                     QStringLiteral("Query has %1 dimensions, index has %2")
                         .arg(query.size())
                         .arg(m_dimensions)};
    }
    return std::nullopt;
}

std::vector<ScoredId> VectorStore::searchDocumentsUnlocked(const std::vector<float>& query, int topK) const
{
    std::vector<ScoredId> hits;
    for (const VectorIndex::Hit& result : m_documentIndex->search(query, topK)) {
        auto it = m_documentByLabel.find(result.label);
        if (it == m_documentByLabel.end()) {
            continue;
        }
        hits.push_back(ScoredId{it->second, 1.0 - static_cast<double>(result.distance)});
    }
    sortByScore(hits);
    return hits;
}

std::vector<ScoredId> VectorStore::searchChunksUnlocked(const std::vector<float>& query, int topK,
                                                        const std::unordered_set<uint64_t>* allowed) const
{
    std::vector<ScoredId> hits;
    for (const VectorIndex::Hit& result : m_chunkIndex->search(query, topK, allowed)) {
        auto it = m_chunkByLabel.find(result.label);
        if (it == m_chunkByLabel.end()) {
            continue;
        }
        hits.push_back(ScoredId{it->second.chunkId, 1.0 - static_cast<double>(result.distance)});
    }
    sortByScore(hits);
    return hits;
}

Result<std::vector<ScoredId>> VectorStore::searchDocuments(const std::vector<float>& query, int topK) const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    if (auto error = checkQuery(query)) {
        return *error;
    }
    return searchDocumentsUnlocked(query, topK);
}

Result<std::vector<ScoredId>> VectorStore::searchChunks(const std::vector<float>& query, int topK) const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    if (auto error = checkQuery(query)) {
        return *error;
    }
    return searchChunksUnlocked(query, topK, nullptr);
}

Result<std::vector<ScoredId>> VectorStore::searchChunks(const std::vector<float>& query, int topK,
                                                        const QSet<QString>& documentIds) const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    if (auto error = checkQuery(query)) {
        return *error;
    }

    std::unordered_set<uint64_t> allowed;
    for (const QString& documentId : documentIds) {
        auto labels = m_chunkLabelsByDocument.constFind(documentId);
        if (labels != m_chunkLabelsByDocument.constEnd()) {
            allowed.insert(labels->begin(), labels->end());
        }
    }
    if (allowed.empty()) {
        return std::vector<ScoredId>{};
    }
    return searchChunksUnlocked(query, topK, &allowed);
}

Result<std::vector<BalancedChunk>> VectorStore::hybridSearch(const std::vector<float>& query,
                                                             int numDocuments, int numChunks) const
{
    if (numDocuments <= 0 || numChunks <= 0) {
        return Error{ErrorCode::InvalidArgument,
                     QStringLiteral("numDocuments and numChunks must be positive")};
    }

    std::shared_lock<std::shared_mutex> lock(m_mutex);
    if (auto error = checkQuery(query)) {
        return *error;
    }

    // Step 1: most relevant documents.
    const std::vector<ScoredId> documents = searchDocumentsUnlocked(query, numDocuments);
    QStringList documentOrder;
    std::unordered_set<uint64_t> allowed;
    for (const ScoredId& hit : documents) {
        documentOrder.append(hit.id);
        auto labels = m_chunkLabelsByDocument.constFind(hit.id);
        if (labels != m_chunkLabelsByDocument.constEnd()) {
            allowed.insert(labels->begin(), labels->end());
        }
    }
    if (allowed.empty()) {
        return std::vector<BalancedChunk>{};
    }

    // Step 2: over-fetch chunk candidates from those documents only.
    std::vector<ChunkCandidate> candidates;
    const int poolSize = kCandidateMultiplier * numChunks;
    for (const VectorIndex::Hit& result : m_chunkIndex->search(query, poolSize, &allowed)) {
        auto it = m_chunkByLabel.find(result.label);
        if (it == m_chunkByLabel.end()) {
            continue;
        }
        candidates.push_back(ChunkCandidate{it->second.chunkId, it->second.documentId,
                                            1.0 - static_cast<double>(result.distance)});
    }

    // Steps 3-5: quota round-robin, then score-ordered fill.
    const std::vector<BalancedSelection> selections =
        selectBalanced(documentOrder, std::move(candidates), numDocuments, numChunks);

    std::vector<BalancedChunk> balanced;
    balanced.reserve(selections.size());
    for (const BalancedSelection& selection : selections) {
        const std::optional<MetadataStore::ChunkRow> row = m_meta->getChunk(selection.candidate.chunkId);
        if (!row) {
            LOG_WARN(dwSearch, "Chunk %s missing from metadata", qUtf8Printable(selection.candidate.chunkId));
            continue;
        }
        BalancedChunk chunk;
        chunk.chunkId = selection.candidate.chunkId;
        chunk.documentId = selection.candidate.documentId;
        chunk.sequenceIndex = row->chunk.sequenceIndex;
        chunk.text = row->chunk.text;
        chunk.locator = row->chunk.locator;
        chunk.score = selection.candidate.score;
        chunk.fill = selection.fill;
        chunk.rank = static_cast<int>(balanced.size()) + 1;
        balanced.push_back(std::move(chunk));
    }

    LOG_DEBUG(dwSearch, "Hybrid search: %zu documents, %zu chunks (quota %d)",
              documents.size(), balanced.size(), perDocumentQuota(numDocuments, numChunks));
    return balanced;
}

// ── Read APIs ───────────────────────────────────────────────

std::vector<DocumentInfo> VectorStore::listDocuments() const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    std::vector<DocumentInfo> infos;
    if (!m_meta) {
        return infos;
    }
    for (const MetadataStore::DocumentRow& row : m_meta->allDocuments()) {
        DocumentInfo info;
        info.documentId = row.document.documentId;
        info.sourcePath = row.document.sourcePath;
        info.fileName = QFileInfo(row.document.sourcePath).fileName();
        info.fileType = row.document.fileType;
        info.topics = row.document.topics;
        info.chunkCount = static_cast<int>(row.document.chunkIds.size());
        info.sizeBytes = row.document.sizeBytes;
        infos.push_back(std::move(info));
    }
    return infos;
}

std::optional<Document> VectorStore::document(const QString& documentId) const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    if (!m_meta) {
        return std::nullopt;
    }
    auto row = m_meta->getDocument(documentId, true);
    if (!row) {
        return std::nullopt;
    }
    return row->document;
}

std::optional<Chunk> VectorStore::chunk(const QString& chunkId) const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    if (!m_meta) {
        return std::nullopt;
    }
    auto row = m_meta->getChunk(chunkId, true);
    if (!row) {
        return std::nullopt;
    }
    return row->chunk;
}

std::vector<Chunk> VectorStore::chunksForDocument(const QString& documentId) const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    std::vector<Chunk> chunks;
    if (!m_meta) {
        return chunks;
    }
    for (MetadataStore::ChunkRow& row : m_meta->chunksForDocument(documentId, true)) {
        chunks.push_back(std::move(row.chunk));
    }
    return chunks;
}

int VectorStore::documentCount() const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return static_cast<int>(m_labelByDocument.size());
}

int VectorStore::chunkCount() const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return static_cast<int>(m_chunkByLabel.size());
}

std::map<QString, int> VectorStore::typeBreakdown() const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    if (!m_meta) {
        return {};
    }
    return m_meta->typeBreakdown();
}

QString VectorStore::indexPath(const char* name) const
{
    return QDir(m_storeDir).filePath(QString::fromLatin1(name) + QStringLiteral(".hnsw"));
}

QString VectorStore::metaPath(const char* name) const
{
    return QDir(m_storeDir).filePath(QString::fromLatin1(name) + QStringLiteral(".meta.json"));
}

} // namespace dw
