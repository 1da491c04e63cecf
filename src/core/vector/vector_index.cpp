#include "core/vector/vector_index.h"
#include "core/shared/logging.h"

#include "hnswlib/hnswlib.h"

#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSaveFile>

#include <limits>
#include <queue>

namespace dw {

namespace {

constexpr int kSidecarVersion = 1;

// hnswlib reads past the buffer on truncated graphs; anything smaller than
// its fixed header is rejected before loading.
constexpr qint64 kMinGraphBytes = 96;

class LabelSetFilter : public hnswlib::BaseFilterFunctor {
public:
    explicit LabelSetFilter(const std::unordered_set<uint64_t>& labels)
        : m_labels(labels)
    {
    }

    bool operator()(hnswlib::labeltype label) override
    {
        return m_labels.find(static_cast<uint64_t>(label)) != m_labels.end();
    }

private:
    const std::unordered_set<uint64_t>& m_labels;
};

struct Sidecar {
    int dimensions = 0;
    QString modelId;
    uint64_t elements = 0;
    uint64_t nextLabel = 0;
    uint64_t storeGeneration = 0;
    int tombstones = 0;
};

Result<Sidecar> readSidecar(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return Error{ErrorCode::NotFound, QStringLiteral("Cannot open index sidecar %1").arg(path)};
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        return Error{ErrorCode::CorruptInput,
                     QStringLiteral("Invalid index sidecar %1: %2").arg(path, parseError.errorString())};
    }

    const QJsonObject json = doc.object();
    Sidecar sidecar;
    sidecar.dimensions = json.value(QStringLiteral("dimensions")).toInt(0);
    if (sidecar.dimensions <= 0) {
        return Error{ErrorCode::CorruptInput, QStringLiteral("Index sidecar %1 has no dimensions").arg(path)};
    }
    sidecar.modelId = json.value(QStringLiteral("model_id")).toString();
    sidecar.elements = json.value(QStringLiteral("total_elements")).toVariant().toULongLong();
    sidecar.nextLabel = json.value(QStringLiteral("next_label")).toVariant().toULongLong();
    sidecar.storeGeneration = json.value(QStringLiteral("store_generation")).toVariant().toULongLong();
    sidecar.tombstones = std::max(json.value(QStringLiteral("deleted_elements")).toInt(0), 0);
    return sidecar;
}

} // namespace

VectorIndex::VectorIndex(IndexIdentity identity)
    : m_identity(std::move(identity))
{
}

VectorIndex::~VectorIndex() = default;

void VectorIndex::reset()
{
    m_graph.reset();
    m_space.reset();
    m_nextLabel = 0;
    m_storeGeneration = 0;
    m_tombstones = 0;
}

// ── Lifecycle ───────────────────────────────────────────────

bool VectorIndex::create(int capacity)
{
    if (m_identity.dimensions <= 0) {
        LOG_ERROR(dwIndex, "Cannot create a vector index with %d dimensions", m_identity.dimensions);
        return false;
    }

    reset();
    try {
        m_space = std::make_unique<hnswlib::InnerProductSpace>(m_identity.dimensions);
        m_graph = std::make_unique<hnswlib::HierarchicalNSW<float>>(
            m_space.get(), static_cast<size_t>(std::max(capacity, 1)),
            static_cast<size_t>(kM), static_cast<size_t>(kEfConstruction));
        m_graph->setEf(static_cast<size_t>(kEfSearch));
    } catch (const std::exception& e) {
        LOG_ERROR(dwIndex, "hnswlib refused to create an index: %s", e.what());
        reset();
        return false;
    }
    return true;
}

std::optional<Error> VectorIndex::load(const QString& graphPath, const QString& sidecarPath)
{
    const QFileInfo graphInfo(graphPath);
    if (!graphInfo.isFile()) {
        return Error{ErrorCode::NotFound, QStringLiteral("Index file %1 does not exist").arg(graphPath)};
    }
    if (graphInfo.size() < kMinGraphBytes) {
        return Error{ErrorCode::CorruptInput,
                     QStringLiteral("Index file %1 is truncated (%2 bytes)").arg(graphPath).arg(graphInfo.size())};
    }

    auto sidecar = readSidecar(sidecarPath);
    if (!sidecar) {
        return sidecar.error();
    }
    if (m_identity.dimensions > 0 && sidecar->dimensions != m_identity.dimensions) {
        return Error{ErrorCode::DimensionMismatch,
                     QStringLiteral("Index %1 has %2 dimensions, expected %3")
                         .arg(graphPath)
                         .arg(sidecar->dimensions)
                         .arg(m_identity.dimensions)};
    }
    if (!m_identity.modelId.isEmpty() && sidecar->modelId != m_identity.modelId) {
        return Error{ErrorCode::DimensionMismatch,
                     QStringLiteral("Index %1 was built by model '%2', expected '%3'")
                         .arg(graphPath, sidecar->modelId, m_identity.modelId)};
    }

    const uint64_t capacity = std::max<uint64_t>(
        {static_cast<uint64_t>(kInitialCapacity), sidecar->elements + 1, sidecar->elements * 2});
    if (capacity > static_cast<uint64_t>(std::numeric_limits<size_t>::max())) {
        return Error{ErrorCode::CorruptInput,
                     QStringLiteral("Index sidecar %1 claims %2 elements").arg(sidecarPath).arg(sidecar->elements)};
    }

    reset();
    m_identity.dimensions = sidecar->dimensions;
    m_identity.modelId = sidecar->modelId;
    try {
        m_space = std::make_unique<hnswlib::InnerProductSpace>(m_identity.dimensions);
        m_graph = std::make_unique<hnswlib::HierarchicalNSW<float>>(m_space.get());
        m_graph->loadIndex(graphPath.toStdString(), m_space.get(), static_cast<size_t>(capacity));
        m_graph->setEf(static_cast<size_t>(kEfSearch));
    } catch (const std::exception& e) {
        reset();
        return Error{ErrorCode::CorruptInput,
                     QStringLiteral("hnswlib failed to load %1: %2").arg(graphPath, QString::fromUtf8(e.what()))};
    }

    if (static_cast<uint64_t>(size()) != sidecar->elements) {
        const int loaded = size();
        reset();
        return Error{ErrorCode::CorruptInput,
                     QStringLiteral("Index %1 holds %2 vectors, sidecar says %3")
                         .arg(graphPath)
                         .arg(loaded)
                         .arg(sidecar->elements)};
    }

    m_nextLabel = sidecar->nextLabel;
    m_storeGeneration = sidecar->storeGeneration;
    m_tombstones = sidecar->tombstones;
    LOG_DEBUG(dwIndex, "Loaded %s: %d vectors, %d tombstones",
              qUtf8Printable(graphInfo.fileName()), size(), m_tombstones);
    return std::nullopt;
}

std::optional<Error> VectorIndex::save(const QString& graphPath, const QString& sidecarPath) const
{
    if (!m_graph) {
        return Error{ErrorCode::StorageError, QStringLiteral("Index is not created")};
    }

    try {
        m_graph->saveIndex(graphPath.toStdString());
    } catch (const std::exception& e) {
        return Error{ErrorCode::StorageError,
                     QStringLiteral("hnswlib failed to save %1: %2").arg(graphPath, QString::fromUtf8(e.what()))};
    }

    QJsonObject json;
    json[QStringLiteral("version")] = kSidecarVersion;
    json[QStringLiteral("model_id")] = m_identity.modelId;
    json[QStringLiteral("dimensions")] = m_identity.dimensions;
    json[QStringLiteral("total_elements")] = size();
    json[QStringLiteral("deleted_elements")] = m_tombstones;
    json[QStringLiteral("next_label")] = static_cast<qint64>(m_nextLabel);
    json[QStringLiteral("store_generation")] = static_cast<qint64>(m_storeGeneration);

    QSaveFile file(sidecarPath);
    if (!file.open(QIODevice::WriteOnly)
        || file.write(QJsonDocument(json).toJson(QJsonDocument::Indented)) < 0
        || !file.commit()) {
        return Error{ErrorCode::StorageError,
                     QStringLiteral("Cannot write index sidecar %1: %2").arg(sidecarPath, file.errorString())};
    }
    return std::nullopt;
}

// ── Mutation ────────────────────────────────────────────────

bool VectorIndex::acceptsVector(const std::vector<float>& vector) const
{
    if (!m_graph) {
        LOG_WARN(dwIndex, "Vector index used before create()/load()");
        return false;
    }
    if (static_cast<int>(vector.size()) != m_identity.dimensions) {
        LOG_WARN(dwIndex, "Vector has %zu dimensions, index has %d", vector.size(), m_identity.dimensions);
        return false;
    }
    return true;
}

uint64_t VectorIndex::add(const std::vector<float>& vector)
{
    const uint64_t label = m_nextLabel;
    return addWithLabel(vector, label) ? label : kInvalidLabel;
}

bool VectorIndex::addWithLabel(const std::vector<float>& vector, uint64_t label)
{
    if (!acceptsVector(vector) || !growIfNeeded()) {
        return false;
    }
    try {
        m_graph->addPoint(vector.data(), static_cast<hnswlib::labeltype>(label));
    } catch (const std::exception& e) {
        LOG_ERROR(dwIndex, "addPoint failed for label %llu: %s",
                  static_cast<unsigned long long>(label), e.what());
        return false;
    }
    m_nextLabel = std::max(m_nextLabel, label + 1);
    return true;
}

bool VectorIndex::remove(uint64_t label)
{
    if (!m_graph) {
        return false;
    }
    try {
        m_graph->markDelete(static_cast<hnswlib::labeltype>(label));
    } catch (const std::exception& e) {
        LOG_WARN(dwIndex, "markDelete failed for label %llu: %s",
                 static_cast<unsigned long long>(label), e.what());
        return false;
    }
    ++m_tombstones;
    return true;
}

// Doubles capacity once the graph is 80% full.
bool VectorIndex::growIfNeeded()
{
    const size_t capacity = m_graph->getMaxElements();
    if (m_graph->getCurrentElementCount() < capacity - capacity / 5) {
        return true;
    }
    const size_t grown = std::max<size_t>(capacity * 2, capacity + 1);
    try {
        m_graph->resizeIndex(grown);
    } catch (const std::exception& e) {
        LOG_ERROR(dwIndex, "Index resize to %zu failed: %s", grown, e.what());
        return false;
    }
    LOG_DEBUG(dwIndex, "Index capacity %zu -> %zu", capacity, grown);
    return true;
}

// ── Queries ─────────────────────────────────────────────────

std::vector<VectorIndex::Hit> VectorIndex::search(const std::vector<float>& query, int k,
                                                  const std::unordered_set<uint64_t>* allowed) const
{
    std::vector<Hit> hits;
    if (k <= 0 || !acceptsVector(query)) {
        return hits;
    }

    // hnswlib widens its beam to max(ef, k) on its own.
    std::priority_queue<std::pair<float, hnswlib::labeltype>> queue;
    try {
        if (allowed != nullptr) {
            LabelSetFilter filter(*allowed);
            queue = m_graph->searchKnn(query.data(), static_cast<size_t>(k), &filter);
        } else {
            queue = m_graph->searchKnn(query.data(), static_cast<size_t>(k));
        }
    } catch (const std::exception& e) {
        LOG_ERROR(dwIndex, "searchKnn failed: %s", e.what());
        return hits;
    }

    hits.resize(queue.size());
    for (auto it = hits.rbegin(); it != hits.rend(); ++it) {
        *it = Hit{static_cast<uint64_t>(queue.top().second), queue.top().first};
        queue.pop();
    }
    std::stable_sort(hits.begin(), hits.end(), [](const Hit& a, const Hit& b) {
        return a.distance < b.distance || (a.distance == b.distance && a.label < b.label);
    });
    return hits;
}

int VectorIndex::size() const
{
    return m_graph ? static_cast<int>(m_graph->getCurrentElementCount()) : 0;
}

bool VectorIndex::needsRebuild() const
{
    const int total = size();
    return total > 0 && static_cast<double>(m_tombstones) / total > kRebuildRatio;
}

} // namespace dw
