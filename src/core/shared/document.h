#pragma once

#include "core/shared/types.h"

#include <QByteArray>
#include <QJsonObject>
#include <QString>
#include <QStringList>

#include <cstdint>
#include <optional>
#include <vector>

namespace dw {

// Minimal retrievable unit. Chunks refer to their document and neighbours
// by id only; the owning Document holds the ordered id list.
struct Chunk {
    QString chunkId;
    QString documentId;
    int sequenceIndex = 0;
    QString text;
    QString locator;
    std::vector<float> vector;
    std::optional<QString> prevId;
    std::optional<QString> nextId;
};

struct Document {
    QString documentId;
    QString sourcePath;
    FileType fileType = FileType::Text;
    QString contentHash;
    QJsonObject rawStructure;
    QString summaryText;
    std::vector<float> summaryVector;
    QStringList topics;
    QStringList chunkIds;
    int64_t sizeBytes = 0;
};

// Output of one successful analysis: a document and the chunks it owns,
// ordered by sequenceIndex.
struct AnalyzedDocument {
    Document document;
    std::vector<Chunk> chunks;
};

// Stable id derived from the absolute source path.
QString computeDocumentId(const QString& absolutePath);

// SHA-256 of "documentId#sequenceIndex#sha256(text)": stable across
// re-analysis only while the text at that position is unchanged.
QString computeChunkId(const QString& documentId, int sequenceIndex, const QString& text);

// SHA-256 hex digest of the raw file bytes.
QString computeContentHash(const QByteArray& bytes);

// Fills chunkIds, sequenceIndex and prev/next links from vector order.
void linkChunks(Document& document, std::vector<Chunk>& chunks);

} // namespace dw
