#include "core/shared/document.h"

#include <QCryptographicHash>

namespace dw {

namespace {

QString sha256Hex(const QByteArray& data)
{
    return QString::fromLatin1(
        QCryptographicHash::hash(data, QCryptographicHash::Sha256).toHex());
}

} // namespace

QString computeDocumentId(const QString& absolutePath)
{
    return sha256Hex(absolutePath.toUtf8());
}

QString computeChunkId(const QString& documentId, int sequenceIndex, const QString& text)
{
    const QString seed = documentId + QStringLiteral("#") + QString::number(sequenceIndex)
        + QStringLiteral("#") + sha256Hex(text.toUtf8());
    return sha256Hex(seed.toUtf8());
}

QString computeContentHash(const QByteArray& bytes)
{
    return sha256Hex(bytes);
}

void linkChunks(Document& document, std::vector<Chunk>& chunks)
{
    document.chunkIds.clear();
    document.chunkIds.reserve(static_cast<qsizetype>(chunks.size()));

    for (size_t i = 0; i < chunks.size(); ++i) {
        Chunk& chunk = chunks[i];
        chunk.documentId = document.documentId;
        chunk.sequenceIndex = static_cast<int>(i);
        chunk.chunkId = computeChunkId(document.documentId, chunk.sequenceIndex, chunk.text);
        document.chunkIds.append(chunk.chunkId);
    }

    for (size_t i = 0; i < chunks.size(); ++i) {
        chunks[i].prevId = i > 0 ? std::optional<QString>(chunks[i - 1].chunkId) : std::nullopt;
        chunks[i].nextId = i + 1 < chunks.size()
            ? std::optional<QString>(chunks[i + 1].chunkId)
            : std::nullopt;
    }
}

} // namespace dw
