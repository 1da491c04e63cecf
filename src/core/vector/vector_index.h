#pragma once

#include "core/shared/errors.h"

#include <QString>

#include <algorithm>
#include <cstdint>
#include <memory>
#include <optional>
#include <unordered_set>
#include <vector>

namespace hnswlib {
class InnerProductSpace;

template <typename dist_t>
class HierarchicalNSW;
} // namespace hnswlib

namespace dw {

struct IndexIdentity {
    int dimensions = 0;
    QString modelId;          // empty accepts any stored model on load
};

// VectorIndex -- one HNSW graph over L2-normalised vectors in inner
// product space (distance = 1 - cosine).
//
// Labels are caller-owned 64-bit keys; the metadata store records which
// label belongs to which document or chunk. remove() only tombstones a
// label, and needsRebuild() reports when tombstones pass kRebuildRatio.
// A `<name>.meta.json` sidecar next to the graph file records identity
// and counters so load() can reject a graph built for another model. It
// also carries the metadata store generation the graph was saved at.
//
// Not synchronised: VectorStore serialises writers against readers.
class VectorIndex {
public:
    struct Hit {
        uint64_t label = 0;
        float distance = 0.0f;
    };

    static constexpr int kM = 16;
    static constexpr int kEfConstruction = 200;
    static constexpr int kEfSearch = 64;
    static constexpr int kInitialCapacity = 1024;
    static constexpr double kRebuildRatio = 0.20;
    static constexpr uint64_t kInvalidLabel = UINT64_MAX;

    explicit VectorIndex(IndexIdentity identity);
    ~VectorIndex();

    VectorIndex(const VectorIndex&) = delete;
    VectorIndex& operator=(const VectorIndex&) = delete;

    // Empty graph with room for `capacity` vectors (grows on demand).
    bool create(int capacity = kInitialCapacity);

    std::optional<Error> load(const QString& graphPath, const QString& sidecarPath);
    std::optional<Error> save(const QString& graphPath, const QString& sidecarPath) const;

    // Appends under the next free label; kInvalidLabel on failure.
    uint64_t add(const std::vector<float>& vector);
    // Inserts under a label recorded elsewhere; used by rebuilds.
    bool addWithLabel(const std::vector<float>& vector, uint64_t label);
    bool remove(uint64_t label);

    // Nearest first. `allowed` restricts results to those labels.
    std::vector<Hit> search(const std::vector<float>& query, int k,
                            const std::unordered_set<uint64_t>* allowed = nullptr) const;

    bool isReady() const { return m_graph != nullptr; }
    int size() const;
    int liveSize() const { return std::max(size() - m_tombstones, 0); }
    int tombstones() const { return m_tombstones; }
    bool needsRebuild() const;
    uint64_t nextLabel() const { return m_nextLabel; }
    // add() never hands out a label below `label`.
    void reserveLabelsBelow(uint64_t label) { m_nextLabel = std::max(m_nextLabel, label); }

    uint64_t storeGeneration() const { return m_storeGeneration; }
    void setStoreGeneration(uint64_t generation) { m_storeGeneration = generation; }
    const IndexIdentity& identity() const { return m_identity; }

private:
    bool acceptsVector(const std::vector<float>& vector) const;
    bool growIfNeeded();
    void reset();

    IndexIdentity m_identity;
    std::unique_ptr<hnswlib::InnerProductSpace> m_space;
    std::unique_ptr<hnswlib::HierarchicalNSW<float>> m_graph;
    uint64_t m_nextLabel = 0;
    uint64_t m_storeGeneration = 0;
    int m_tombstones = 0;
};

} // namespace dw
