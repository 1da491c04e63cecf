#include "core/vector/balanced_selector.h"

#include <QHash>

#include <algorithm>
#include <deque>

namespace dw {

int perDocumentQuota(int numDocuments, int numChunks)
{
    if (numDocuments <= 0 || numChunks <= 0) {
        return 0;
    }
    return (numChunks + numDocuments - 1) / numDocuments;
}

std::vector<BalancedSelection> selectBalanced(const QStringList& documentOrder,
                                              std::vector<ChunkCandidate> candidates,
                                              int numDocuments,
                                              int numChunks)
{
    std::vector<BalancedSelection> selected;
    const int quota = perDocumentQuota(numDocuments, numChunks);
    if (quota == 0 || documentOrder.isEmpty()) {
        return selected;
    }

    std::sort(candidates.begin(), candidates.end(),
              [](const ChunkCandidate& a, const ChunkCandidate& b) {
                  if (a.score != b.score) {
                      return a.score > b.score;
                  }
                  return a.chunkId < b.chunkId;
              });

    QHash<QString, int> slotForDocument;
    for (const QString& documentId : documentOrder) {
        if (!slotForDocument.contains(documentId)) {
            slotForDocument.insert(documentId, static_cast<int>(slotForDocument.size()));
        }
    }

    // Per-document queues of indexes into the sorted candidate list.
    std::vector<std::deque<size_t>> queues(static_cast<size_t>(slotForDocument.size()));
    for (size_t i = 0; i < candidates.size(); ++i) {
        auto it = slotForDocument.constFind(candidates[i].documentId);
        if (it != slotForDocument.constEnd()) {
            queues[static_cast<size_t>(it.value())].push_back(i);
        }
    }

    std::vector<bool> taken(candidates.size(), false);
    std::vector<int> takenPerDocument(queues.size(), 0);
    const size_t target = static_cast<size_t>(numChunks);

    bool progressed = true;
    while (selected.size() < target && progressed) {
        progressed = false;
        for (size_t slot = 0; slot < queues.size() && selected.size() < target; ++slot) {
            if (takenPerDocument[slot] >= quota || queues[slot].empty()) {
                continue;
            }
            const size_t index = queues[slot].front();
            queues[slot].pop_front();
            taken[index] = true;
            ++takenPerDocument[slot];
            selected.push_back(BalancedSelection{candidates[index], false});
            progressed = true;
        }
    }

    for (size_t i = 0; i < candidates.size() && selected.size() < target; ++i) {
        if (taken[i] || !slotForDocument.contains(candidates[i].documentId)) {
            continue;
        }
        taken[i] = true;
        selected.push_back(BalancedSelection{candidates[i], true});
    }
    return selected;
}

} // namespace dw
