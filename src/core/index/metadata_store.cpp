#include "core/index/metadata_store.h"
#include "core/index/schema.h"
#include "core/shared/logging.h"

#include <QDateTime>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>

#include <cstring>

namespace dw {

namespace {

constexpr const char* kDocumentColumns =
    "document_id, source_path, file_type, content_hash, size_bytes, raw_structure, "
    "summary_text, topics, hnsw_label, indexed_at, summary_vector";

constexpr const char* kChunkColumns =
    "chunk_id, document_id, sequence_index, text, locator, hnsw_label, "
    "prev_chunk_id, next_chunk_id, vector";

// RAII wrapper around a prepared statement.
class Statement {
public:
    Statement(sqlite3* db, const char* sql)
    {
        if (sqlite3_prepare_v2(db, sql, -1, &m_stmt, nullptr) != SQLITE_OK) {
            LOG_ERROR(dwIndex, "prepare failed: %s (%s)", sqlite3_errmsg(db), sql);
            sqlite3_finalize(m_stmt);
            m_stmt = nullptr;
        }
    }
    ~Statement() { sqlite3_finalize(m_stmt); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    bool ok() const { return m_stmt != nullptr; }
    sqlite3_stmt* get() const { return m_stmt; }

    void bindText(int index, const QString& value)
    {
        const QByteArray utf8 = value.toUtf8();
        sqlite3_bind_text(m_stmt, index, utf8.constData(), static_cast<int>(utf8.size()), SQLITE_TRANSIENT);
    }

    void bindOptionalText(int index, const std::optional<QString>& value)
    {
        if (value.has_value()) {
            bindText(index, *value);
        } else {
            sqlite3_bind_null(m_stmt, index);
        }
    }

    void bindVector(int index, const std::vector<float>& vec)
    {
        sqlite3_bind_blob(m_stmt, index, vec.data(),
                          static_cast<int>(vec.size() * sizeof(float)), SQLITE_TRANSIENT);
    }

private:
    sqlite3_stmt* m_stmt = nullptr;
};

QString columnText(sqlite3_stmt* stmt, int column)
{
    const unsigned char* text = sqlite3_column_text(stmt, column);
    if (!text) {
        return QString();
    }
    return QString::fromUtf8(reinterpret_cast<const char*>(text),
                             sqlite3_column_bytes(stmt, column));
}

std::optional<QString> columnOptionalText(sqlite3_stmt* stmt, int column)
{
    if (sqlite3_column_type(stmt, column) == SQLITE_NULL) {
        return std::nullopt;
    }
    return columnText(stmt, column);
}

std::vector<float> columnVector(sqlite3_stmt* stmt, int column)
{
    const void* blob = sqlite3_column_blob(stmt, column);
    const int bytes = sqlite3_column_bytes(stmt, column);
    std::vector<float> vec(static_cast<size_t>(bytes) / sizeof(float));
    if (blob && !vec.empty()) {
        std::memcpy(vec.data(), blob, vec.size() * sizeof(float));
    }
    return vec;
}

QString toJsonText(const QJsonObject& object)
{
    return QString::fromUtf8(QJsonDocument(object).toJson(QJsonDocument::Compact));
}

QString toJsonText(const QStringList& values)
{
    return QString::fromUtf8(QJsonDocument(QJsonArray::fromStringList(values)).toJson(QJsonDocument::Compact));
}

QJsonObject objectFromText(const QString& text)
{
    return QJsonDocument::fromJson(text.toUtf8()).object();
}

QStringList stringListFromText(const QString& text)
{
    QStringList values;
    for (const QJsonValue& value : QJsonDocument::fromJson(text.toUtf8()).array()) {
        values.append(value.toString());
    }
    return values;
}

MetadataStore::DocumentRow readDocumentRow(sqlite3_stmt* stmt, bool withVectors)
{
    MetadataStore::DocumentRow row;
    Document& doc = row.document;
    doc.documentId = columnText(stmt, 0);
    doc.sourcePath = columnText(stmt, 1);
    doc.fileType = fileTypeFromString(columnText(stmt, 2)).value_or(FileType::Text);
    doc.contentHash = columnText(stmt, 3);
    doc.sizeBytes = sqlite3_column_int64(stmt, 4);
    doc.rawStructure = objectFromText(columnText(stmt, 5));
    doc.summaryText = columnText(stmt, 6);
    doc.topics = stringListFromText(columnText(stmt, 7));
    row.hnswLabel = static_cast<uint64_t>(sqlite3_column_int64(stmt, 8));
    row.indexedAt = sqlite3_column_double(stmt, 9);
    if (withVectors) {
        doc.summaryVector = columnVector(stmt, 10);
    }
    return row;
}

MetadataStore::ChunkRow readChunkRow(sqlite3_stmt* stmt, bool withVector)
{
    MetadataStore::ChunkRow row;
    Chunk& chunk = row.chunk;
    chunk.chunkId = columnText(stmt, 0);
    chunk.documentId = columnText(stmt, 1);
    chunk.sequenceIndex = sqlite3_column_int(stmt, 2);
    chunk.text = columnText(stmt, 3);
    chunk.locator = columnText(stmt, 4);
    row.hnswLabel = static_cast<uint64_t>(sqlite3_column_int64(stmt, 5));
    chunk.prevId = columnOptionalText(stmt, 6);
    chunk.nextId = columnOptionalText(stmt, 7);
    if (withVector) {
        chunk.vector = columnVector(stmt, 8);
    }
    return row;
}

} // namespace

MetadataStore::~MetadataStore()
{
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
    }
}

std::optional<MetadataStore> MetadataStore::open(const QString& dbPath)
{
    MetadataStore store;
    if (!store.init(dbPath)) {
        return std::nullopt;
    }
    return store;
}

bool MetadataStore::init(const QString& dbPath)
{
    int rc = sqlite3_open(dbPath.toUtf8().constData(), &m_db);
    if (rc != SQLITE_OK) {
        LOG_ERROR(dwIndex, "Failed to open database: %s", sqlite3_errmsg(m_db));
        return false;
    }

    sqlite3_busy_timeout(m_db, 30000);

    if (!execSql(kConnectionPragmas)) {
        LOG_ERROR(dwIndex, "Failed to set connection pragmas");
        return false;
    }

    int userVersion = 0;
    {
        Statement stmt(m_db, "PRAGMA user_version");
        if (stmt.ok() && sqlite3_step(stmt.get()) == SQLITE_ROW) {
            userVersion = sqlite3_column_int(stmt.get(), 0);
        }
    }

    if (userVersion == 0) {
        if (!execSql(kDatabasePragmas)) {
            LOG_ERROR(dwIndex, "Failed to set database pragmas");
            return false;
        }
        if (!execSql(kSchemaV1)) {
            LOG_ERROR(dwIndex, "Failed to create schema");
            return false;
        }
    } else if (userVersion > kCurrentSchemaVersion) {
        LOG_ERROR(dwIndex, "Database schema version %d is newer than supported %d",
                  userVersion, kCurrentSchemaVersion);
        return false;
    }

    QFile dbFile(dbPath);
    dbFile.setPermissions(QFile::ReadOwner | QFile::WriteOwner);

    LOG_INFO(dwIndex, "Metadata store opened: %s", qUtf8Printable(dbPath));
    return true;
}

bool MetadataStore::execSql(const char* sql) const
{
    char* errMsg = nullptr;
    int rc = sqlite3_exec(m_db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        LOG_ERROR(dwIndex, "SQL error: %s", errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

int MetadataStore::countQuery(const char* sql, const QString& bindValue) const
{
    Statement stmt(m_db, sql);
    if (!stmt.ok()) {
        return 0;
    }
    if (!bindValue.isNull()) {
        stmt.bindText(1, bindValue);
    }
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return 0;
    }
    return sqlite3_column_int(stmt.get(), 0);
}

// ── Documents ───────────────────────────────────────────────

bool MetadataStore::replaceDocument(const Document& document, uint64_t documentLabel,
                                    const std::vector<Chunk>& chunks,
                                    const std::vector<uint64_t>& chunkLabels)
{
    if (chunks.size() != chunkLabels.size()) {
        LOG_ERROR(dwIndex, "replaceDocument: %zu chunks but %zu labels",
                  chunks.size(), chunkLabels.size());
        return false;
    }

    if (!execSql("SAVEPOINT replace_document")) return false;

    auto fail = [this](const char* what) {
        LOG_ERROR(dwIndex, "replaceDocument: %s failed: %s", what, sqlite3_errmsg(m_db));
        execSql("ROLLBACK TO SAVEPOINT replace_document");
        execSql("RELEASE SAVEPOINT replace_document");
        return false;
    };

    // A moved file keeps its path uniqueness; drop any row still owning it.
    {
        Statement stmt(m_db, "DELETE FROM documents WHERE document_id = ?1 OR source_path = ?2");
        if (!stmt.ok()) return fail("document delete prepare");
        stmt.bindText(1, document.documentId);
        stmt.bindText(2, document.sourcePath);
        if (sqlite3_step(stmt.get()) != SQLITE_DONE) return fail("document delete");
    }

    {
        Statement stmt(m_db, R"(
            INSERT INTO documents (document_id, source_path, file_type, content_hash, size_bytes,
                                   raw_structure, summary_text, topics, summary_vector,
                                   hnsw_label, indexed_at)
            VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11)
        )");
        if (!stmt.ok()) return fail("document insert prepare");
        stmt.bindText(1, document.documentId);
        stmt.bindText(2, document.sourcePath);
        stmt.bindText(3, fileTypeToString(document.fileType));
        stmt.bindText(4, document.contentHash);
        sqlite3_bind_int64(stmt.get(), 5, document.sizeBytes);
        stmt.bindText(6, toJsonText(document.rawStructure));
        stmt.bindText(7, document.summaryText);
        stmt.bindText(8, toJsonText(document.topics));
        stmt.bindVector(9, document.summaryVector);
        sqlite3_bind_int64(stmt.get(), 10, static_cast<sqlite3_int64>(documentLabel));
        sqlite3_bind_double(stmt.get(), 11,
                            static_cast<double>(QDateTime::currentSecsSinceEpoch()));
        if (sqlite3_step(stmt.get()) != SQLITE_DONE) return fail("document insert");
    }

    Statement chunkStmt(m_db, R"(
        INSERT INTO chunks (chunk_id, document_id, sequence_index, text, locator, vector,
                            hnsw_label, prev_chunk_id, next_chunk_id)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9)
    )");
    if (!chunkStmt.ok()) return fail("chunk insert prepare");

    for (size_t i = 0; i < chunks.size(); ++i) {
        const Chunk& chunk = chunks[i];
        sqlite3_reset(chunkStmt.get());
        sqlite3_clear_bindings(chunkStmt.get());
        chunkStmt.bindText(1, chunk.chunkId);
        chunkStmt.bindText(2, document.documentId);
        sqlite3_bind_int(chunkStmt.get(), 3, chunk.sequenceIndex);
        chunkStmt.bindText(4, chunk.text);
        chunkStmt.bindText(5, chunk.locator);
        chunkStmt.bindVector(6, chunk.vector);
        sqlite3_bind_int64(chunkStmt.get(), 7, static_cast<sqlite3_int64>(chunkLabels[i]));
        chunkStmt.bindOptionalText(8, chunk.prevId);
        chunkStmt.bindOptionalText(9, chunk.nextId);
        if (sqlite3_step(chunkStmt.get()) != SQLITE_DONE) return fail("chunk insert");
    }

    if (!bumpGeneration()) return fail("generation bump");
    return execSql("RELEASE SAVEPOINT replace_document");
}

bool MetadataStore::deleteDocument(const QString& documentId)
{
    if (!execSql("SAVEPOINT delete_document")) return false;

    auto fail = [this](const char* what) {
        LOG_ERROR(dwIndex, "deleteDocument: %s failed: %s", what, sqlite3_errmsg(m_db));
        execSql("ROLLBACK TO SAVEPOINT delete_document");
        execSql("RELEASE SAVEPOINT delete_document");
        return false;
    };

    {
        Statement stmt(m_db, "DELETE FROM documents WHERE document_id = ?1");
        if (!stmt.ok()) return fail("prepare");
        stmt.bindText(1, documentId);
        if (sqlite3_step(stmt.get()) != SQLITE_DONE) return fail("delete");
    }
    if (sqlite3_changes(m_db) > 0 && !bumpGeneration()) return fail("generation bump");
    return execSql("RELEASE SAVEPOINT delete_document");
}

bool MetadataStore::deleteAll()
{
    if (!execSql("SAVEPOINT delete_all")) return false;
    if (!execSql("DELETE FROM documents") || !bumpGeneration()) {
        LOG_ERROR(dwIndex, "deleteAll: failed to clear documents");
        execSql("ROLLBACK TO SAVEPOINT delete_all");
        execSql("RELEASE SAVEPOINT delete_all");
        return false;
    }
    if (!execSql("RELEASE SAVEPOINT delete_all")) return false;
    LOG_INFO(dwIndex, "deleteAll: all documents cleared");
    return true;
}

std::optional<MetadataStore::DocumentRow> MetadataStore::getDocument(const QString& documentId,
                                                                    bool withVectors) const
{
    const QByteArray sql = QByteArray("SELECT ") + kDocumentColumns
        + " FROM documents WHERE document_id = ?1";
    Statement stmt(m_db, sql.constData());
    if (!stmt.ok()) {
        return std::nullopt;
    }
    stmt.bindText(1, documentId);
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::nullopt;
    }
    DocumentRow row = readDocumentRow(stmt.get(), withVectors);
    for (const ChunkRow& chunk : chunksForDocument(documentId)) {
        row.document.chunkIds.append(chunk.chunk.chunkId);
    }
    return row;
}

std::vector<MetadataStore::DocumentRow> MetadataStore::allDocuments(bool withVectors) const
{
    std::vector<DocumentRow> rows;
    const QByteArray sql = QByteArray("SELECT ") + kDocumentColumns
        + " FROM documents ORDER BY source_path ASC";
    Statement stmt(m_db, sql.constData());
    if (!stmt.ok()) {
        return rows;
    }
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        rows.push_back(readDocumentRow(stmt.get(), withVectors));
    }

    Statement idStmt(m_db, "SELECT document_id, chunk_id FROM chunks ORDER BY document_id, sequence_index");
    if (idStmt.ok()) {
        std::map<QString, QStringList> idsByDocument;
        while (sqlite3_step(idStmt.get()) == SQLITE_ROW) {
            idsByDocument[columnText(idStmt.get(), 0)].append(columnText(idStmt.get(), 1));
        }
        for (DocumentRow& row : rows) {
            auto it = idsByDocument.find(row.document.documentId);
            if (it != idsByDocument.end()) {
                row.document.chunkIds = it->second;
            }
        }
    }
    return rows;
}

std::optional<QString> MetadataStore::contentHash(const QString& documentId) const
{
    Statement stmt(m_db, "SELECT content_hash FROM documents WHERE document_id = ?1");
    if (!stmt.ok()) {
        return std::nullopt;
    }
    stmt.bindText(1, documentId);
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::nullopt;
    }
    return columnText(stmt.get(), 0);
}

std::optional<QString> MetadataStore::sourcePath(const QString& documentId) const
{
    Statement stmt(m_db, "SELECT source_path FROM documents WHERE document_id = ?1");
    if (!stmt.ok()) {
        return std::nullopt;
    }
    stmt.bindText(1, documentId);
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::nullopt;
    }
    return columnText(stmt.get(), 0);
}

// ── Chunks ──────────────────────────────────────────────────

std::optional<MetadataStore::ChunkRow> MetadataStore::getChunk(const QString& chunkId,
                                                              bool withVector) const
{
    const QByteArray sql = QByteArray("SELECT ") + kChunkColumns + " FROM chunks WHERE chunk_id = ?1";
    Statement stmt(m_db, sql.constData());
    if (!stmt.ok()) {
        return std::nullopt;
    }
    stmt.bindText(1, chunkId);
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::nullopt;
    }
    return readChunkRow(stmt.get(), withVector);
}

std::vector<MetadataStore::ChunkRow> MetadataStore::chunksForDocument(const QString& documentId,
                                                                     bool withVectors) const
{
    std::vector<ChunkRow> rows;
    const QByteArray sql = QByteArray("SELECT ") + kChunkColumns
        + " FROM chunks WHERE document_id = ?1 ORDER BY sequence_index ASC";
    Statement stmt(m_db, sql.constData());
    if (!stmt.ok()) {
        return rows;
    }
    stmt.bindText(1, documentId);
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        rows.push_back(readChunkRow(stmt.get(), withVectors));
    }
    return rows;
}

std::vector<MetadataStore::ChunkRow> MetadataStore::allChunks(bool withVectors) const
{
    std::vector<ChunkRow> rows;
    const QByteArray sql = QByteArray("SELECT ") + kChunkColumns
        + " FROM chunks ORDER BY document_id, sequence_index";
    Statement stmt(m_db, sql.constData());
    if (!stmt.ok()) {
        return rows;
    }
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        rows.push_back(readChunkRow(stmt.get(), withVectors));
    }
    return rows;
}

std::vector<MetadataStore::LabelRow> MetadataStore::documentLabels() const
{
    std::vector<LabelRow> rows;
    Statement stmt(m_db, "SELECT document_id, hnsw_label FROM documents");
    if (!stmt.ok()) {
        return rows;
    }
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        const QString id = columnText(stmt.get(), 0);
        rows.push_back(LabelRow{id, id, static_cast<uint64_t>(sqlite3_column_int64(stmt.get(), 1))});
    }
    return rows;
}

std::vector<MetadataStore::LabelRow> MetadataStore::chunkLabels() const
{
    std::vector<LabelRow> rows;
    Statement stmt(m_db, "SELECT chunk_id, document_id, hnsw_label FROM chunks");
    if (!stmt.ok()) {
        return rows;
    }
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        rows.push_back(LabelRow{columnText(stmt.get(), 0), columnText(stmt.get(), 1),
                                static_cast<uint64_t>(sqlite3_column_int64(stmt.get(), 2))});
    }
    return rows;
}

// ── Stats ───────────────────────────────────────────────────

int MetadataStore::documentCount() const
{
    return countQuery("SELECT COUNT(*) FROM documents");
}

int MetadataStore::chunkCount() const
{
    return countQuery("SELECT COUNT(*) FROM chunks");
}

int MetadataStore::chunkCount(const QString& documentId) const
{
    return countQuery("SELECT COUNT(*) FROM chunks WHERE document_id = ?1", documentId);
}

std::map<QString, int> MetadataStore::typeBreakdown() const
{
    std::map<QString, int> breakdown;
    Statement stmt(m_db, "SELECT file_type, COUNT(*) FROM documents GROUP BY file_type");
    if (!stmt.ok()) {
        return breakdown;
    }
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        breakdown[columnText(stmt.get(), 0)] = sqlite3_column_int(stmt.get(), 1);
    }
    return breakdown;
}

// ── Store metadata ──────────────────────────────────────────

std::optional<QString> MetadataStore::metaValue(const QString& key) const
{
    Statement stmt(m_db, "SELECT value FROM store_meta WHERE key = ?1");
    if (!stmt.ok()) {
        return std::nullopt;
    }
    stmt.bindText(1, key);
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::nullopt;
    }
    return columnText(stmt.get(), 0);
}

bool MetadataStore::setMetaValue(const QString& key, const QString& value)
{
    Statement stmt(m_db, R"(
        INSERT INTO store_meta (key, value) VALUES (?1, ?2)
        ON CONFLICT(key) DO UPDATE SET value = excluded.value
    )");
    if (!stmt.ok()) {
        return false;
    }
    stmt.bindText(1, key);
    stmt.bindText(2, value);
    return sqlite3_step(stmt.get()) == SQLITE_DONE;
}

uint64_t MetadataStore::generation() const
{
    return metaValue(QStringLiteral("generation")).value_or(QString()).toULongLong();
}

bool MetadataStore::bumpGeneration()
{
    return execSql(R"(
        INSERT INTO store_meta (key, value) VALUES ('generation', '1')
        ON CONFLICT(key) DO UPDATE SET value = CAST(CAST(value AS INTEGER) + 1 AS TEXT)
    )");
}

// ── Transactions ────────────────────────────────────────────

bool MetadataStore::beginTransaction()
{
    return execSql("BEGIN TRANSACTION");
}

bool MetadataStore::commitTransaction()
{
    return execSql("COMMIT");
}

bool MetadataStore::rollbackTransaction()
{
    return execSql("ROLLBACK");
}

} // namespace dw
