#pragma once

#include "core/shared/search_result.h"

#include <QHash>
#include <QString>
#include <QStringList>

#include <map>
#include <vector>

namespace dw {

// Per-document material shown ahead of that document's chunks.
struct ContextDocument {
    QString documentId;
    QString fileName;
    QString summary;
    QStringList topics;
};

struct AssembledContext {
    QString text;
    QStringList citations;                      // documents with surviving chunks, context order
    std::map<QString, int> perDocumentChunkCounts;
    std::vector<BalancedChunk> included;        // surviving chunks, balanced order
    int droppedChunks = 0;
    bool notesDropped = false;                  // summary and topics left out to fit the last chunk
    bool truncated = false;                     // a single oversized chunk was cut
};

// ContextAssembler -- renders balanced search results into the prompt
// context and enforces the character budget.
//
// Layout: one block per distinct document in order of first appearance,
// holding its summary (first 500 chars) and top 5 topics once, followed by
// its chunks in balanced order, each tagged "[locator]". Over budget, the
// lowest-ranked chunk is dropped and the context re-rendered; a document
// left without chunks disappears with its summary. When a single chunk
// remains and still does not fit, its document's summary and topics go
// first, then its text is cut; a chunk with no room left for any text is
// dropped, so every citation has chunk text in the context.
class ContextAssembler {
public:
    static constexpr int kSummaryChars = 500;
    static constexpr int kSummaryTopics = 5;

    explicit ContextAssembler(int maxChars = 6000);

    AssembledContext assemble(const std::vector<BalancedChunk>& chunks,
                              const QHash<QString, ContextDocument>& documents) const;

    static QString buildPrompt(const QString& context, const QString& question);

    // Deterministic digest used in place of a generated answer: top 3
    // documents with summaries, then the top 5 chunks.
    static QString buildFallbackAnswer(const QString& question,
                                       const std::vector<ContextDocument>& documents,
                                       const std::vector<BalancedChunk>& chunks);

    int maxChars() const { return m_maxChars; }

private:
    QString render(const std::vector<BalancedChunk>& chunks,
                   const QHash<QString, ContextDocument>& documents,
                   bool withNotes = true) const;

    int m_maxChars;
};

} // namespace dw
