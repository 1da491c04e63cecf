#pragma once

#include "core/shared/document.h"

#include <QString>

#include <cstdint>
#include <map>
#include <optional>
#include <vector>

#include <sqlite3.h>

namespace dw {

// MetadataStore -- SQLite owner of documents, chunks and their vectors.
//
// The HNSW graphs hold only vectors and labels; everything a search result
// needs (ids, text, locators, summaries) lives here, together with the
// vector BLOBs so an index can be rebuilt without re-embedding.
//
// Not internally synchronised: the VectorStore serialises writers and
// allows concurrent readers over one connection (SQLite serialized mode).
class MetadataStore {
public:
    struct DocumentRow {
        Document document;
        uint64_t hnswLabel = 0;
        double indexedAt = 0.0;
    };

    struct ChunkRow {
        Chunk chunk;
        uint64_t hnswLabel = 0;
    };

    // Light row used to rebuild label maps on open.
    struct LabelRow {
        QString id;
        QString documentId;
        uint64_t hnswLabel = 0;
    };

    ~MetadataStore();

    // Move-only (owns sqlite3* handle)
    MetadataStore(MetadataStore&& other) noexcept : m_db(other.m_db) { other.m_db = nullptr; }
    MetadataStore& operator=(MetadataStore&& other) noexcept {
        if (this != &other) {
            if (m_db) sqlite3_close(m_db);
            m_db = other.m_db;
            other.m_db = nullptr;
        }
        return *this;
    }
    MetadataStore(const MetadataStore&) = delete;
    MetadataStore& operator=(const MetadataStore&) = delete;

    // Open or create the database at the given path.
    static std::optional<MetadataStore> open(const QString& dbPath);

    // ── Documents ───────────────────────────────────────────

    // Deletes any previous rows of the document (chunks cascade) and writes
    // the new ones inside one transaction. `chunkLabels` parallels `chunks`.
    bool replaceDocument(const Document& document, uint64_t documentLabel,
                         const std::vector<Chunk>& chunks,
                         const std::vector<uint64_t>& chunkLabels);
    bool deleteDocument(const QString& documentId);
    bool deleteAll();

    std::optional<DocumentRow> getDocument(const QString& documentId, bool withVectors = false) const;
    std::vector<DocumentRow> allDocuments(bool withVectors = false) const;
    std::optional<QString> contentHash(const QString& documentId) const;
    std::optional<QString> sourcePath(const QString& documentId) const;

    // ── Chunks ──────────────────────────────────────────────

    std::optional<ChunkRow> getChunk(const QString& chunkId, bool withVector = false) const;
    std::vector<ChunkRow> chunksForDocument(const QString& documentId, bool withVectors = false) const;
    std::vector<ChunkRow> allChunks(bool withVectors) const;

    std::vector<LabelRow> documentLabels() const;
    std::vector<LabelRow> chunkLabels() const;

    // ── Stats ───────────────────────────────────────────────

    int documentCount() const;
    int chunkCount() const;
    int chunkCount(const QString& documentId) const;
    std::map<QString, int> typeBreakdown() const;

    // ── Store metadata ──────────────────────────────────────

    std::optional<QString> metaValue(const QString& key) const;
    bool setMetaValue(const QString& key, const QString& value);

    // Advanced inside every document write or delete; 0 for a new store.
    uint64_t generation() const;

    // ── Transactions ────────────────────────────────────────

    bool beginTransaction();
    bool commitTransaction();
    bool rollbackTransaction();

private:
    MetadataStore() = default;
    bool init(const QString& dbPath);
    bool execSql(const char* sql) const;
    bool bumpGeneration();
    int countQuery(const char* sql, const QString& bindValue = QString()) const;

    sqlite3* m_db = nullptr;
};

} // namespace dw
