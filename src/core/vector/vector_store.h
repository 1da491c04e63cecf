#pragma once

#include "core/analysis/document_analyzer.h"
#include "core/index/metadata_store.h"
#include "core/shared/document.h"
#include "core/shared/errors.h"
#include "core/shared/search_result.h"
#include "core/vector/vector_index.h"

#include <QHash>
#include <QSet>
#include <QString>
#include <QStringList>

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace dw {

enum class UpsertOutcome {
    Inserted,
    Replaced,
    Unchanged,
};

QString upsertOutcomeToString(UpsertOutcome outcome);

// Result of one ensureFresh() sweep. Paths are absolute.
struct FreshnessReport {
    QStringList added;
    QStringList updated;
    QStringList unchanged;
    QStringList removed;          // document ids pruned from the store
    std::vector<AnalysisFailure> failures;
    bool cancelled = false;
    int64_t durationMs = 0;

    bool changed() const { return !added.isEmpty() || !updated.isEmpty() || !removed.isEmpty(); }
};

// VectorStore -- dual-granularity semantic index.
//
// A document-level HNSW graph over summary vectors and a chunk-level graph
// over chunk vectors, with SQLite holding ids, text, structure and the raw
// vectors. Label <-> id maps are kept in memory and rebuilt from SQLite on
// load.
//
// Thread-safety: one shared mutex. upsert/remove/ensureFresh writes and
// save/load take it exclusively; searches and read APIs share it.
// Analysis in ensureFresh runs outside the lock.
class VectorStore {
public:
    static constexpr int kCandidateMultiplier = 3;

    VectorStore();
    ~VectorStore();

    VectorStore(const VectorStore&) = delete;
    VectorStore& operator=(const VectorStore&) = delete;

    // Opens (or creates) the store under storeDir. A store built for a
    // different model or dimension is reset so it can be re-indexed.
    std::optional<Error> init(const QString& storeDir, int dimensions, const QString& modelId);
    bool isInitialized() const;

    Result<UpsertOutcome> upsert(const AnalyzedDocument& analyzed);
    std::optional<Error> removeDocument(const QString& documentId);

    // True when the document is unknown, its source cannot be read, or the
    // source bytes no longer hash to the stored content hash.
    bool isStale(const QString& documentId) const;

    Result<std::vector<ScoredId>> searchDocuments(const std::vector<float>& query, int topK) const;
    Result<std::vector<ScoredId>> searchChunks(const std::vector<float>& query, int topK) const;
    Result<std::vector<ScoredId>> searchChunks(const std::vector<float>& query, int topK,
                                               const QSet<QString>& documentIds) const;

    // Top numDocuments documents, then up to kCandidateMultiplier x
    // numChunks chunk candidates from them, balanced by selectBalanced().
    Result<std::vector<BalancedChunk>> hybridSearch(const std::vector<float>& query,
                                                    int numDocuments, int numChunks) const;

    // Brings the store in line with `paths`, which is the complete managed
    // collection: new or changed files are analyzed and upserted, unchanged
    // ones skipped, and stored documents outside the list (or whose file is
    // gone) are removed. Per-file failures are collected. The sweep stops
    // between files once `cancel` (or the analyzer's own flag) is raised;
    // pruning is skipped for a cancelled sweep.
    FreshnessReport ensureFresh(const QStringList& paths, DocumentAnalyzer& analyzer,
                                const std::atomic<bool>* cancel = nullptr);

    std::optional<Error> save();
    std::optional<Error> load();

    // Removes every document and resets both graphs.
    std::optional<Error> teardown();

    std::vector<DocumentInfo> listDocuments() const;
    std::optional<Document> document(const QString& documentId) const;
    std::optional<Chunk> chunk(const QString& chunkId) const;
    std::vector<Chunk> chunksForDocument(const QString& documentId) const;

    int documentCount() const;
    int chunkCount() const;
    std::map<QString, int> typeBreakdown() const;

    int dimensions() const { return m_dimensions; }
    QString modelId() const { return m_modelId; }
    QString storeDir() const { return m_storeDir; }

private:
    struct ChunkRef {
        QString chunkId;
        QString documentId;
    };

    std::optional<Error> loadUnlocked();
    std::optional<Error> saveUnlocked();
    IndexIdentity indexIdentity() const;
    std::unique_ptr<VectorIndex> loadIndex(const char* name, int rows) const;
    bool rebuildDocumentIndex();
    bool rebuildChunkIndex();
    void rebuildLabelMaps();
    void reserveStoredLabels();
    void removeDocumentUnlocked(const QString& documentId);

    std::optional<Error> checkQuery(const std::vector<float>& query) const;
    std::vector<ScoredId> searchDocumentsUnlocked(const std::vector<float>& query, int topK) const;
    std::vector<ScoredId> searchChunksUnlocked(const std::vector<float>& query, int topK,
                                               const std::unordered_set<uint64_t>* allowed) const;

    QString indexPath(const char* name) const;
    QString metaPath(const char* name) const;

    mutable std::shared_mutex m_mutex;

    QString m_storeDir;
    int m_dimensions = 0;
    QString m_modelId;

    std::optional<MetadataStore> m_meta;
    std::unique_ptr<VectorIndex> m_documentIndex;
    std::unique_ptr<VectorIndex> m_chunkIndex;

    std::unordered_map<uint64_t, QString> m_documentByLabel;
    QHash<QString, uint64_t> m_labelByDocument;
    std::unordered_map<uint64_t, ChunkRef> m_chunkByLabel;
    QHash<QString, std::vector<uint64_t>> m_chunkLabelsByDocument;
};

} // namespace dw
