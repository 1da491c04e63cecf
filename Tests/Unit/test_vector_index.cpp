#include <QtTest/QtTest>
#include "core/vector/vector_index.h"

#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>

#include <memory>
#include <unordered_set>
#include <vector>

class TestVectorIndex : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    // ── Creation ────────────────────────────────────────────────
    void testFreshIndexIsEmpty();
    void testZeroDimensionsCannotCreate();
    void testUseBeforeCreateFails();
    void testWrongSizedVectorsRejected();

    // ── Labels and search ───────────────────────────────────────
    void testNearestNeighbourComesFirst();
    void testEmptyGraphReturnsNoHits();
    void testSearchNeverExceedsK();
    void testAllowedSetFiltersHits();
    void testExplicitLabelMovesNextLabelPastIt();
    void testReservedLabelsAreSkipped();
    void testRemovedLabelDisappearsFromResults();
    void testRemovingTwiceFails();
    void testRebuildThresholdFollowsTombstones();
    void testCapacityGrowsOnDemand();

    // ── Persistence ─────────────────────────────────────────────
    void testRoundTripKeepsCountersAndRanking();
    void testEmptyModelIdAdoptsStoredIdentity();
    void testMissingGraphIsNotFound();
    void testTruncatedGraphIsCorrupt();
    void testDimensionChangeRejected();
    void testModelChangeRejected();
    void testUnparseableSidecarIsCorrupt();
    void testElementCountMismatchIsCorrupt();

private:
    static constexpr int kDims = 32;

    static std::vector<float> axis(int position);
    static dw::IndexIdentity identity(const QString& model = QStringLiteral("axis-model"), int dims = kDims);
    QString graphPath() const { return m_dir->filePath(QStringLiteral("unit.hnsw")); }
    QString sidecarPath() const { return m_dir->filePath(QStringLiteral("unit.meta.json")); }
    bool saveAxes(int count);

    std::unique_ptr<QTemporaryDir> m_dir;
};

void TestVectorIndex::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
}

void TestVectorIndex::cleanup()
{
    m_dir.reset();
}

std::vector<float> TestVectorIndex::axis(int position)
{
    std::vector<float> vector(static_cast<size_t>(kDims), 0.0f);
    vector[static_cast<size_t>(position % kDims)] = 1.0f;
    return vector;
}

dw::IndexIdentity TestVectorIndex::identity(const QString& model, int dims)
{
    dw::IndexIdentity id;
    id.dimensions = dims;
    id.modelId = model;
    return id;
}

bool TestVectorIndex::saveAxes(int count)
{
    dw::VectorIndex index(identity());
    if (!index.create()) {
        return false;
    }
    for (int i = 0; i < count; ++i) {
        if (index.add(axis(i)) == dw::VectorIndex::kInvalidLabel) {
            return false;
        }
    }
    return !index.save(graphPath(), sidecarPath()).has_value();
}

// ── Creation ────────────────────────────────────────────────────

void TestVectorIndex::testFreshIndexIsEmpty()
{
    dw::VectorIndex index(identity());
    QVERIFY(!index.isReady());
    QVERIFY(index.create());
    QVERIFY(index.isReady());
    QCOMPARE(index.size(), 0);
    QCOMPARE(index.liveSize(), 0);
    QCOMPARE(index.nextLabel(), uint64_t(0));
    QVERIFY(!index.needsRebuild());
}

void TestVectorIndex::testZeroDimensionsCannotCreate()
{
    dw::VectorIndex index(identity(QStringLiteral("axis-model"), 0));
    QVERIFY(!index.create());
    QVERIFY(!index.isReady());
}

void TestVectorIndex::testUseBeforeCreateFails()
{
    dw::VectorIndex index(identity());
    QCOMPARE(index.add(axis(0)), dw::VectorIndex::kInvalidLabel);
    QVERIFY(!index.remove(0));
    QVERIFY(index.search(axis(0), 3).empty());

    const std::optional<dw::Error> error = index.save(graphPath(), sidecarPath());
    QVERIFY(error.has_value());
    QCOMPARE(error->code, dw::ErrorCode::StorageError);
    QVERIFY(!QFile::exists(graphPath()));
}

void TestVectorIndex::testWrongSizedVectorsRejected()
{
    dw::VectorIndex index(identity());
    QVERIFY(index.create());

    QCOMPARE(index.add(std::vector<float>(kDims - 1, 0.1f)), dw::VectorIndex::kInvalidLabel);
    QVERIFY(!index.addWithLabel({}, 7));
    QCOMPARE(index.size(), 0);

    QVERIFY(index.add(axis(1)) != dw::VectorIndex::kInvalidLabel);
    QVERIFY(index.search(std::vector<float>(kDims + 1, 0.1f), 1).empty());
}

// ── Labels and search ───────────────────────────────────────────

void TestVectorIndex::testNearestNeighbourComesFirst()
{
    dw::VectorIndex index(identity());
    QVERIFY(index.create());
    for (int i = 0; i < 6; ++i) {
        QCOMPARE(index.add(axis(i)), static_cast<uint64_t>(i));
    }

    // Halfway between axes 2 and 3, tilted towards 3.
    std::vector<float> query(kDims, 0.0f);
    query[2] = 0.6f;
    query[3] = 0.8f;

    const std::vector<dw::VectorIndex::Hit> hits = index.search(query, 3);
    QCOMPARE(hits.size(), size_t(3));
    QCOMPARE(hits[0].label, uint64_t(3));
    QCOMPARE(hits[1].label, uint64_t(2));
    QVERIFY(hits[0].distance <= hits[1].distance);
    QVERIFY(hits[1].distance <= hits[2].distance);
    QVERIFY(qAbs(hits[0].distance - 0.2f) < 1e-4f);
}

void TestVectorIndex::testEmptyGraphReturnsNoHits()
{
    dw::VectorIndex index(identity());
    QVERIFY(index.create());
    QVERIFY(index.search(axis(4), 5).empty());
}

void TestVectorIndex::testSearchNeverExceedsK()
{
    dw::VectorIndex index(identity());
    QVERIFY(index.create());
    for (int i = 0; i < 8; ++i) {
        QVERIFY(index.add(axis(i)) != dw::VectorIndex::kInvalidLabel);
    }

    QCOMPARE(index.search(axis(0), 4).size(), size_t(4));
    QCOMPARE(index.search(axis(0), 50).size(), size_t(8));
    QVERIFY(index.search(axis(0), 0).empty());
    QVERIFY(index.search(axis(0), -2).empty());
}

void TestVectorIndex::testAllowedSetFiltersHits()
{
    dw::VectorIndex index(identity());
    QVERIFY(index.create());
    for (int i = 0; i < 10; ++i) {
        QVERIFY(index.add(axis(i)) != dw::VectorIndex::kInvalidLabel);
    }

    const std::unordered_set<uint64_t> allowed{5, 7};
    const std::vector<dw::VectorIndex::Hit> hits = index.search(axis(0), 10, &allowed);
    QCOMPARE(hits.size(), size_t(2));
    for (const dw::VectorIndex::Hit& hit : hits) {
        QVERIFY(allowed.count(hit.label) == 1);
    }

    const std::unordered_set<uint64_t> nothing;
    QVERIFY(index.search(axis(0), 10, &nothing).empty());
}

void TestVectorIndex::testExplicitLabelMovesNextLabelPastIt()
{
    dw::VectorIndex index(identity());
    QVERIFY(index.create());

    QVERIFY(index.addWithLabel(axis(0), 41));
    QCOMPARE(index.nextLabel(), uint64_t(42));
    QCOMPARE(index.add(axis(1)), uint64_t(42));

    // A lower explicit label leaves the counter alone.
    QVERIFY(index.addWithLabel(axis(2), 3));
    QCOMPARE(index.nextLabel(), uint64_t(43));
    QCOMPARE(index.size(), 3);
}

void TestVectorIndex::testReservedLabelsAreSkipped()
{
    dw::VectorIndex index(identity());
    QVERIFY(index.create());
    QCOMPARE(index.add(axis(0)), uint64_t(0));

    index.reserveLabelsBelow(10);
    QCOMPARE(index.add(axis(1)), uint64_t(10));

    // Never moves the counter backwards.
    index.reserveLabelsBelow(4);
    QCOMPARE(index.add(axis(2)), uint64_t(11));
}

void TestVectorIndex::testRemovedLabelDisappearsFromResults()
{
    dw::VectorIndex index(identity());
    QVERIFY(index.create());
    const uint64_t kept = index.add(axis(0));
    const uint64_t dropped = index.add(axis(1));

    QVERIFY(index.remove(dropped));
    QCOMPARE(index.size(), 2);
    QCOMPARE(index.liveSize(), 1);
    QCOMPARE(index.tombstones(), 1);

    const std::vector<dw::VectorIndex::Hit> hits = index.search(axis(1), 5);
    QCOMPARE(hits.size(), size_t(1));
    QCOMPARE(hits[0].label, kept);
}

void TestVectorIndex::testRemovingTwiceFails()
{
    dw::VectorIndex index(identity());
    QVERIFY(index.create());
    const uint64_t label = index.add(axis(0));

    QVERIFY(index.remove(label));
    QVERIFY(!index.remove(label));
    QVERIFY(!index.remove(999));
    QCOMPARE(index.tombstones(), 1);
}

void TestVectorIndex::testRebuildThresholdFollowsTombstones()
{
    dw::VectorIndex index(identity());
    QVERIFY(index.create());
    for (int i = 0; i < 10; ++i) {
        QVERIFY(index.add(axis(i)) != dw::VectorIndex::kInvalidLabel);
    }

    // 2 of 10 sits exactly on the ratio; only a larger share triggers.
    QVERIFY(index.remove(0));
    QVERIFY(index.remove(1));
    QVERIFY(!index.needsRebuild());
    QVERIFY(index.remove(2));
    QVERIFY(index.needsRebuild());
}

void TestVectorIndex::testCapacityGrowsOnDemand()
{
    dw::VectorIndex index(identity());
    QVERIFY(index.create(2));
    for (int i = 0; i < 40; ++i) {
        QVERIFY(index.add(axis(i)) != dw::VectorIndex::kInvalidLabel);
    }
    QCOMPARE(index.size(), 40);
    QCOMPARE(index.search(axis(9), 1).size(), size_t(1));
}

// ── Persistence ─────────────────────────────────────────────────

void TestVectorIndex::testRoundTripKeepsCountersAndRanking()
{
    {
        dw::VectorIndex index(identity());
        QVERIFY(index.create());
        for (int i = 0; i < 6; ++i) {
            QVERIFY(index.add(axis(i)) != dw::VectorIndex::kInvalidLabel);
        }
        QVERIFY(index.remove(4));
        index.setStoreGeneration(17);
        QVERIFY(!index.save(graphPath(), sidecarPath()).has_value());
    }

    QFile sidecar(sidecarPath());
    QVERIFY(sidecar.open(QIODevice::ReadOnly));
    const QJsonObject json = QJsonDocument::fromJson(sidecar.readAll()).object();
    QCOMPARE(json.value(QStringLiteral("model_id")).toString(), QStringLiteral("axis-model"));
    QCOMPARE(json.value(QStringLiteral("dimensions")).toInt(), kDims);
    QCOMPARE(json.value(QStringLiteral("total_elements")).toInt(), 6);
    QCOMPARE(json.value(QStringLiteral("deleted_elements")).toInt(), 1);
    QCOMPARE(json.value(QStringLiteral("store_generation")).toInt(), 17);

    dw::VectorIndex reopened(identity());
    const std::optional<dw::Error> error = reopened.load(graphPath(), sidecarPath());
    QVERIFY2(!error.has_value(), error ? qPrintable(error->toString()) : "");
    QCOMPARE(reopened.size(), 6);
    QCOMPARE(reopened.liveSize(), 5);
    QCOMPARE(reopened.nextLabel(), uint64_t(6));
    QCOMPARE(reopened.storeGeneration(), uint64_t(17));
    QCOMPARE(reopened.add(axis(7)), uint64_t(6));

    const std::vector<dw::VectorIndex::Hit> hits = reopened.search(axis(3), 1);
    QCOMPARE(hits.size(), size_t(1));
    QCOMPARE(hits[0].label, uint64_t(3));

    for (const dw::VectorIndex::Hit& hit : reopened.search(axis(4), 10)) {
        QVERIFY(hit.label != 4);
    }
}

void TestVectorIndex::testEmptyModelIdAdoptsStoredIdentity()
{
    QVERIFY(saveAxes(3));

    dw::VectorIndex index(identity(QString(), 0));
    QVERIFY(!index.load(graphPath(), sidecarPath()).has_value());
    QCOMPARE(index.identity().modelId, QStringLiteral("axis-model"));
    QCOMPARE(index.identity().dimensions, kDims);
    QCOMPARE(index.size(), 3);
}

void TestVectorIndex::testMissingGraphIsNotFound()
{
    dw::VectorIndex index(identity());
    const std::optional<dw::Error> error = index.load(graphPath(), sidecarPath());
    QVERIFY(error.has_value());
    QCOMPARE(error->code, dw::ErrorCode::NotFound);
    QVERIFY(!index.isReady());
}

void TestVectorIndex::testTruncatedGraphIsCorrupt()
{
    QVERIFY(saveAxes(3));
    QFile graph(graphPath());
    QVERIFY(graph.open(QIODevice::WriteOnly | QIODevice::Truncate));
    graph.write("hnsw?");
    graph.close();

    dw::VectorIndex index(identity());
    const std::optional<dw::Error> error = index.load(graphPath(), sidecarPath());
    QVERIFY(error.has_value());
    QCOMPARE(error->code, dw::ErrorCode::CorruptInput);
    QVERIFY(!index.isReady());
}

void TestVectorIndex::testDimensionChangeRejected()
{
    QVERIFY(saveAxes(3));

    dw::VectorIndex index(identity(QStringLiteral("axis-model"), kDims * 2));
    const std::optional<dw::Error> error = index.load(graphPath(), sidecarPath());
    QVERIFY(error.has_value());
    QCOMPARE(error->code, dw::ErrorCode::DimensionMismatch);
    QVERIFY(!index.isReady());
}

void TestVectorIndex::testModelChangeRejected()
{
    QVERIFY(saveAxes(3));

    dw::VectorIndex index(identity(QStringLiteral("other-model")));
    const std::optional<dw::Error> error = index.load(graphPath(), sidecarPath());
    QVERIFY(error.has_value());
    QCOMPARE(error->code, dw::ErrorCode::DimensionMismatch);
    QVERIFY(error->message.contains(QStringLiteral("other-model")));
}

void TestVectorIndex::testUnparseableSidecarIsCorrupt()
{
    QVERIFY(saveAxes(3));
    QFile sidecar(sidecarPath());
    QVERIFY(sidecar.open(QIODevice::WriteOnly | QIODevice::Truncate));
    sidecar.write("{ \"dimensions\": ");
    sidecar.close();

    dw::VectorIndex index(identity());
    const std::optional<dw::Error> error = index.load(graphPath(), sidecarPath());
    QVERIFY(error.has_value());
    QCOMPARE(error->code, dw::ErrorCode::CorruptInput);
}

void TestVectorIndex::testElementCountMismatchIsCorrupt()
{
    QVERIFY(saveAxes(3));

    QFile sidecar(sidecarPath());
    QVERIFY(sidecar.open(QIODevice::ReadOnly));
    QJsonObject json = QJsonDocument::fromJson(sidecar.readAll()).object();
    sidecar.close();
    json[QStringLiteral("total_elements")] = 5;
    QVERIFY(sidecar.open(QIODevice::WriteOnly | QIODevice::Truncate));
    sidecar.write(QJsonDocument(json).toJson());
    sidecar.close();

    dw::VectorIndex index(identity());
    const std::optional<dw::Error> error = index.load(graphPath(), sidecarPath());
    QVERIFY(error.has_value());
    QCOMPARE(error->code, dw::ErrorCode::CorruptInput);
    QVERIFY(!index.isReady());
}

QTEST_MAIN(TestVectorIndex)
#include "test_vector_index.moc"
