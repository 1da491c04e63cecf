#pragma once

#include <QString>
#include <QStringList>

#include <vector>

namespace dw {

struct ChunkCandidate {
    QString chunkId;
    QString documentId;
    double score = 0.0;
};

struct BalancedSelection {
    ChunkCandidate candidate;
    bool fill = false;
};

// Cross-document balancing of chunk candidates.
//
// Each document in `documentOrder` (most relevant first) gets a quota of
// ceil(numChunks / numDocuments). Candidates are taken round-robin in
// document order, best-scoring first within a document, skipping a
// document once its quota is used. If that yields fewer than numChunks,
// the remaining slots are filled from the leftovers in global score order
// regardless of document, so a document may exceed its quota. Candidates
// whose document is not in `documentOrder` are ignored.
//
// Pure and deterministic: score ties are broken by chunk id.
std::vector<BalancedSelection> selectBalanced(const QStringList& documentOrder,
                                              std::vector<ChunkCandidate> candidates,
                                              int numDocuments,
                                              int numChunks);

int perDocumentQuota(int numDocuments, int numChunks);

} // namespace dw
