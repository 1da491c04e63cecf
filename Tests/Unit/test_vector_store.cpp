#include <QtTest/QtTest>
#include "core/analysis/document_analyzer.h"
#include "core/vector/vector_store.h"
#include "fake_embedder.h"
#include "fixture_writers.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>

#include <atomic>
#include <cmath>
#include <vector>

class TestVectorStore : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    // ── Lifecycle ───────────────────────────────────────────────
    void testInitRejectsNonPositiveDimensions();
    void testEmptyStoreSearchReportsEmptyIndex();
    void testIncompatibleModelResetsStore();

    // ── Upsert / remove ─────────────────────────────────────────
    void testUpsertInsertThenUnchanged();
    void testUpsertReplacesChangedDocument();
    void testUpsertRejectsWrongDimensions();
    void testRemoveDocument();

    // ── Search ──────────────────────────────────────────────────
    void testSearchDocumentsOrderedByScore();
    void testQueryDimensionMismatch();
    void testSearchChunksRestrictedToDocuments();
    void testHybridSearchBalancesAcrossDocuments();
    void testHybridSearchRejectsNonPositiveArguments();

    // ── Persistence ─────────────────────────────────────────────
    void testSaveAndReloadGiveSameResults();
    void testRebuildsIndicesFromMetadata();
    void testUnsavedReplaceFoundAfterReopen();
    void testTeardown();

    // ── Freshness ───────────────────────────────────────────────
    void testEnsureFreshAddsThenSkipsUnchanged();
    void testEnsureFreshUpdatesAndPrunes();
    void testEnsureFreshRecordsFailures();
    void testEnsureFreshCancelledSkipsPruning();
    void testIsStale();

private:
    static constexpr int kDims = 8;

    static std::vector<float> unit(std::vector<float> values);
    static std::vector<float> axis(int index, float weight = 1.0F, int other = -1, float otherWeight = 0.0F);
    static dw::AnalyzedDocument makeAnalyzed(const QString& path, const std::vector<float>& summaryVector,
                                             const std::vector<std::vector<float>>& chunkVectors,
                                             const QString& revision = QStringLiteral("r1"));
    QString dataPath(const QString& name) const;
    QString storePath() const;

    QTemporaryDir* m_tempDir = nullptr;
    dw::VectorStore* m_store = nullptr;
};

std::vector<float> TestVectorStore::unit(std::vector<float> values)
{
    float norm = 0.0F;
    for (float v : values) {
        norm += v * v;
    }
    norm = std::sqrt(norm);
    for (float& v : values) {
        v /= norm;
    }
    return values;
}

std::vector<float> TestVectorStore::axis(int index, float weight, int other, float otherWeight)
{
    std::vector<float> values(static_cast<size_t>(kDims), 0.0F);
    values[static_cast<size_t>(index)] = weight;
    if (other >= 0) {
        values[static_cast<size_t>(other)] = otherWeight;
    }
    return unit(values);
}

dw::AnalyzedDocument TestVectorStore::makeAnalyzed(const QString& path,
                                                   const std::vector<float>& summaryVector,
                                                   const std::vector<std::vector<float>>& chunkVectors,
                                                   const QString& revision)
{
    dw::AnalyzedDocument analyzed;
    dw::Document& doc = analyzed.document;
    doc.sourcePath = path;
    doc.documentId = dw::computeDocumentId(path);
    doc.fileType = dw::FileType::Text;
    doc.contentHash = dw::computeContentHash((path + revision).toUtf8());
    doc.summaryText = QFileInfo(path).fileName() + QStringLiteral(" summary");
    doc.summaryVector = summaryVector;
    doc.topics = {QFileInfo(path).baseName()};

    for (size_t i = 0; i < chunkVectors.size(); ++i) {
        dw::Chunk chunk;
        chunk.text = QStringLiteral("%1 chunk %2 %3").arg(QFileInfo(path).baseName()).arg(i).arg(revision);
        chunk.locator = QStringLiteral("line %1").arg(i + 1);
        chunk.vector = chunkVectors[i];
        analyzed.chunks.push_back(chunk);
    }
    dw::linkChunks(doc, analyzed.chunks);
    return analyzed;
}

QString TestVectorStore::dataPath(const QString& name) const
{
    return QFileInfo(m_tempDir->filePath(QStringLiteral("data/") + name)).absoluteFilePath();
}

QString TestVectorStore::storePath() const
{
    return m_tempDir->filePath(QStringLiteral("store"));
}

void TestVectorStore::init()
{
    m_tempDir = new QTemporaryDir();
    QVERIFY(m_tempDir->isValid());
    QVERIFY(QDir().mkpath(m_tempDir->filePath(QStringLiteral("data"))));
    m_store = new dw::VectorStore();
    QVERIFY(!m_store->init(storePath(), kDims, QStringLiteral("unit-test-model")).has_value());
}

void TestVectorStore::cleanup()
{
    delete m_store;
    m_store = nullptr;
    delete m_tempDir;
    m_tempDir = nullptr;
}

// ── Lifecycle ───────────────────────────────────────────────────

void TestVectorStore::testInitRejectsNonPositiveDimensions()
{
    dw::VectorStore store;
    const auto error = store.init(storePath(), 0, QStringLiteral("m"));
    QVERIFY(error.has_value());
    QCOMPARE(error->code, dw::ErrorCode::InvalidArgument);
}

void TestVectorStore::testEmptyStoreSearchReportsEmptyIndex()
{
    QVERIFY(m_store->isInitialized());
    QCOMPARE(m_store->documentCount(), 0);

    const auto hybrid = m_store->hybridSearch(axis(0), 2, 5);
    QVERIFY(!hybrid);
    QCOMPARE(hybrid.error().code, dw::ErrorCode::EmptyIndex);

    const auto documents = m_store->searchDocuments(axis(0), 3);
    QVERIFY(!documents);
    QCOMPARE(documents.error().code, dw::ErrorCode::EmptyIndex);
}

void TestVectorStore::testIncompatibleModelResetsStore()
{
    QVERIFY(m_store->upsert(makeAnalyzed(dataPath(QStringLiteral("a.txt")), axis(0), {axis(0)})).ok());
    QVERIFY(!m_store->save().has_value());
    delete m_store;

    m_store = new dw::VectorStore();
    QVERIFY(!m_store->init(storePath(), kDims, QStringLiteral("other-model")).has_value());
    QCOMPARE(m_store->documentCount(), 0);
    QCOMPARE(m_store->chunkCount(), 0);
    QCOMPARE(m_store->modelId(), QStringLiteral("other-model"));
}

// ── Upsert / remove ─────────────────────────────────────────────

void TestVectorStore::testUpsertInsertThenUnchanged()
{
    const dw::AnalyzedDocument analyzed =
        makeAnalyzed(dataPath(QStringLiteral("a.txt")), axis(0), {axis(0), axis(1)});

    auto first = m_store->upsert(analyzed);
    QVERIFY(first.ok());
    QCOMPARE(first.value(), dw::UpsertOutcome::Inserted);

    auto second = m_store->upsert(analyzed);
    QVERIFY(second.ok());
    QCOMPARE(second.value(), dw::UpsertOutcome::Unchanged);

    QCOMPARE(m_store->documentCount(), 1);
    QCOMPARE(m_store->chunkCount(), 2);

    const auto stored = m_store->document(analyzed.document.documentId);
    QVERIFY(stored.has_value());
    QCOMPARE(stored->chunkIds, analyzed.document.chunkIds);
    QCOMPARE(stored->summaryVector, analyzed.document.summaryVector);
}

void TestVectorStore::testUpsertReplacesChangedDocument()
{
    const QString path = dataPath(QStringLiteral("a.txt"));
    QVERIFY(m_store->upsert(makeAnalyzed(path, axis(0), {axis(0), axis(1), axis(2)})).ok());

    const dw::AnalyzedDocument revised =
        makeAnalyzed(path, axis(3), {axis(3)}, QStringLiteral("r2"));
    auto outcome = m_store->upsert(revised);
    QVERIFY(outcome.ok());
    QCOMPARE(outcome.value(), dw::UpsertOutcome::Replaced);

    QCOMPARE(m_store->documentCount(), 1);
    QCOMPARE(m_store->chunkCount(), 1);
    const auto chunks = m_store->chunksForDocument(revised.document.documentId);
    QCOMPARE(static_cast<int>(chunks.size()), 1);
    QCOMPARE(chunks[0].chunkId, revised.chunks[0].chunkId);

    // Old chunk vectors are gone from the graph.
    const auto hits = m_store->searchChunks(axis(1), 5);
    QVERIFY(hits.ok());
    QCOMPARE(static_cast<int>(hits->size()), 1);
    QCOMPARE(hits->front().id, revised.chunks[0].chunkId);
}

void TestVectorStore::testUpsertRejectsWrongDimensions()
{
    dw::AnalyzedDocument badSummary =
        makeAnalyzed(dataPath(QStringLiteral("a.txt")), std::vector<float>(3, 1.0F), {axis(0)});
    auto summaryResult = m_store->upsert(badSummary);
    QVERIFY(!summaryResult);
    QCOMPARE(summaryResult.error().code, dw::ErrorCode::DimensionMismatch);

    dw::AnalyzedDocument badChunk =
        makeAnalyzed(dataPath(QStringLiteral("b.txt")), axis(0), {axis(0), std::vector<float>(3, 1.0F)});
    auto chunkResult = m_store->upsert(badChunk);
    QVERIFY(!chunkResult);
    QCOMPARE(chunkResult.error().code, dw::ErrorCode::DimensionMismatch);

    QCOMPARE(m_store->documentCount(), 0);
}

void TestVectorStore::testRemoveDocument()
{
    const dw::AnalyzedDocument a = makeAnalyzed(dataPath(QStringLiteral("a.txt")), axis(0), {axis(0)});
    const dw::AnalyzedDocument b = makeAnalyzed(dataPath(QStringLiteral("b.txt")), axis(1), {axis(1)});
    QVERIFY(m_store->upsert(a).ok());
    QVERIFY(m_store->upsert(b).ok());

    QVERIFY(!m_store->removeDocument(a.document.documentId).has_value());
    QCOMPARE(m_store->documentCount(), 1);
    QCOMPARE(m_store->chunkCount(), 1);
    QVERIFY(!m_store->document(a.document.documentId).has_value());

    const auto hits = m_store->searchDocuments(axis(0), 5);
    QVERIFY(hits.ok());
    QCOMPARE(static_cast<int>(hits->size()), 1);
    QCOMPARE(hits->front().id, b.document.documentId);

    const auto missing = m_store->removeDocument(a.document.documentId);
    QVERIFY(missing.has_value());
    QCOMPARE(missing->code, dw::ErrorCode::NotFound);
}

// ── Search ──────────────────────────────────────────────────────

void TestVectorStore::testSearchDocumentsOrderedByScore()
{
    const dw::AnalyzedDocument a = makeAnalyzed(dataPath(QStringLiteral("a.txt")), axis(0), {axis(0)});
    const dw::AnalyzedDocument b = makeAnalyzed(dataPath(QStringLiteral("b.txt")), axis(0, 1.0F, 1, 1.0F), {axis(1)});
    const dw::AnalyzedDocument c = makeAnalyzed(dataPath(QStringLiteral("c.txt")), axis(2), {axis(2)});
    QVERIFY(m_store->upsert(a).ok());
    QVERIFY(m_store->upsert(b).ok());
    QVERIFY(m_store->upsert(c).ok());

    const auto hits = m_store->searchDocuments(axis(0), 2);
    QVERIFY(hits.ok());
    QCOMPARE(static_cast<int>(hits->size()), 2);
    QCOMPARE(hits->at(0).id, a.document.documentId);
    QCOMPARE(hits->at(1).id, b.document.documentId);
    QVERIFY(qAbs(hits->at(0).score - 1.0) < 1e-4);
    QVERIFY(hits->at(0).score > hits->at(1).score);
}

void TestVectorStore::testQueryDimensionMismatch()
{
    QVERIFY(m_store->upsert(makeAnalyzed(dataPath(QStringLiteral("a.txt")), axis(0), {axis(0)})).ok());

    const std::vector<float> shortQuery(3, 1.0F);
    auto documents = m_store->searchDocuments(shortQuery, 1);
    QVERIFY(!documents);
    QCOMPARE(documents.error().code, dw::ErrorCode::DimensionMismatch);

    auto hybrid = m_store->hybridSearch(shortQuery, 1, 1);
    QVERIFY(!hybrid);
    QCOMPARE(hybrid.error().code, dw::ErrorCode::DimensionMismatch);
}

void TestVectorStore::testSearchChunksRestrictedToDocuments()
{
    const dw::AnalyzedDocument a = makeAnalyzed(dataPath(QStringLiteral("a.txt")), axis(0), {axis(0), axis(1)});
    const dw::AnalyzedDocument b = makeAnalyzed(dataPath(QStringLiteral("b.txt")), axis(2), {axis(0), axis(2)});
    QVERIFY(m_store->upsert(a).ok());
    QVERIFY(m_store->upsert(b).ok());

    const auto hits = m_store->searchChunks(axis(0), 10, QSet<QString>{b.document.documentId});
    QVERIFY(hits.ok());
    QCOMPARE(static_cast<int>(hits->size()), 2);
    QCOMPARE(hits->front().id, b.chunks[0].chunkId);
    for (const dw::ScoredId& hit : hits.value()) {
        QVERIFY(b.document.chunkIds.contains(hit.id));
    }

    const auto none = m_store->searchChunks(axis(0), 10, QSet<QString>{QStringLiteral("unknown")});
    QVERIFY(none.ok());
    QVERIFY(none->empty());
}

void TestVectorStore::testHybridSearchBalancesAcrossDocuments()
{
    // a: closest summary and every strong chunk. b: weaker on both.
    // c: strongest chunk but an unrelated summary, so it is not selected.
    std::vector<std::vector<float>> aChunks;
    std::vector<std::vector<float>> bChunks;
    for (int i = 0; i < 5; ++i) {
        aChunks.push_back(axis(0, 1.0F, 3, 0.05F * static_cast<float>(i + 1)));
        bChunks.push_back(axis(0, 0.5F, 4, 0.5F + 0.1F * static_cast<float>(i)));
    }
    const dw::AnalyzedDocument a = makeAnalyzed(dataPath(QStringLiteral("a.txt")), axis(0), aChunks);
    const dw::AnalyzedDocument b = makeAnalyzed(dataPath(QStringLiteral("b.txt")), axis(0, 0.8F, 1, 0.6F), bChunks);
    const dw::AnalyzedDocument c = makeAnalyzed(dataPath(QStringLiteral("c.txt")), axis(2), {axis(0)});
    QVERIFY(m_store->upsert(a).ok());
    QVERIFY(m_store->upsert(b).ok());
    QVERIFY(m_store->upsert(c).ok());

    const auto result = m_store->hybridSearch(axis(0), 2, 4);
    QVERIFY(result.ok());
    const std::vector<dw::BalancedChunk>& chunks = result.value();
    QCOMPARE(static_cast<int>(chunks.size()), 4);

    const QStringList expected{a.chunks[0].chunkId, b.chunks[0].chunkId,
                               a.chunks[1].chunkId, b.chunks[1].chunkId};
    for (int i = 0; i < 4; ++i) {
        const dw::BalancedChunk& chunk = chunks[static_cast<size_t>(i)];
        QCOMPARE(chunk.chunkId, expected.at(i));
        QCOMPARE(chunk.rank, i + 1);
        QVERIFY(!chunk.fill);
        QVERIFY(chunk.documentId != c.document.documentId);
        QVERIFY(!chunk.text.isEmpty());
        QVERIFY(!chunk.locator.isEmpty());
    }
    QCOMPARE(chunks[1].sequenceIndex, 0);
    QCOMPARE(chunks[3].sequenceIndex, 1);

    // Same inputs, same output.
    const auto again = m_store->hybridSearch(axis(0), 2, 4);
    QVERIFY(again.ok());
    for (size_t i = 0; i < chunks.size(); ++i) {
        QCOMPARE(again->at(i).chunkId, chunks[i].chunkId);
    }
}

void TestVectorStore::testHybridSearchRejectsNonPositiveArguments()
{
    QVERIFY(m_store->upsert(makeAnalyzed(dataPath(QStringLiteral("a.txt")), axis(0), {axis(0)})).ok());

    auto noDocuments = m_store->hybridSearch(axis(0), 0, 3);
    QVERIFY(!noDocuments);
    QCOMPARE(noDocuments.error().code, dw::ErrorCode::InvalidArgument);

    auto noChunks = m_store->hybridSearch(axis(0), 2, 0);
    QVERIFY(!noChunks);
    QCOMPARE(noChunks.error().code, dw::ErrorCode::InvalidArgument);
}

// ── Persistence ─────────────────────────────────────────────────

void TestVectorStore::testSaveAndReloadGiveSameResults()
{
    for (int i = 0; i < 4; ++i) {
        QVERIFY(m_store->upsert(makeAnalyzed(dataPath(QStringLiteral("doc%1.txt").arg(i)),
                                             axis(i, 1.0F, 7, 0.3F),
                                             {axis(i), axis(i, 1.0F, 6, 0.5F)})).ok());
    }
    const auto before = m_store->hybridSearch(axis(1, 1.0F, 7, 0.2F), 3, 5);
    QVERIFY(before.ok());
    QVERIFY(!m_store->save().has_value());
    delete m_store;

    m_store = new dw::VectorStore();
    QVERIFY(!m_store->init(storePath(), kDims, QStringLiteral("unit-test-model")).has_value());
    QCOMPARE(m_store->documentCount(), 4);
    QCOMPARE(m_store->chunkCount(), 8);

    const auto after = m_store->hybridSearch(axis(1, 1.0F, 7, 0.2F), 3, 5);
    QVERIFY(after.ok());
    QCOMPARE(after->size(), before->size());
    for (size_t i = 0; i < before->size(); ++i) {
        QCOMPARE(after->at(i).chunkId, before->at(i).chunkId);
        QCOMPARE(after->at(i).documentId, before->at(i).documentId);
    }
}

void TestVectorStore::testRebuildsIndicesFromMetadata()
{
    const dw::AnalyzedDocument a = makeAnalyzed(dataPath(QStringLiteral("a.txt")), axis(0), {axis(0)});
    const dw::AnalyzedDocument b = makeAnalyzed(dataPath(QStringLiteral("b.txt")), axis(1), {axis(1)});
    QVERIFY(m_store->upsert(a).ok());
    QVERIFY(m_store->upsert(b).ok());
    QVERIFY(!m_store->save().has_value());
    delete m_store;
    m_store = nullptr;

    // Graph files lost: vectors come back from SQLite.
    const QDir storeDir(storePath());
    for (const QString& name : storeDir.entryList({QStringLiteral("*.hnsw")}, QDir::Files)) {
        QVERIFY(QFile::remove(storeDir.filePath(name)));
    }

    m_store = new dw::VectorStore();
    QVERIFY(!m_store->init(storePath(), kDims, QStringLiteral("unit-test-model")).has_value());
    QCOMPARE(m_store->documentCount(), 2);

    const auto hits = m_store->searchChunks(axis(1), 1);
    QVERIFY(hits.ok());
    QCOMPARE(hits->front().id, b.chunks[0].chunkId);
}

void TestVectorStore::testUnsavedReplaceFoundAfterReopen()
{
    const QString aPath = dataPath(QStringLiteral("a.txt"));
    const dw::AnalyzedDocument a = makeAnalyzed(aPath, axis(0), {axis(0)});
    const dw::AnalyzedDocument b = makeAnalyzed(dataPath(QStringLiteral("b.txt")), axis(1), {axis(1)});
    QVERIFY(m_store->upsert(a).ok());
    QVERIFY(m_store->upsert(b).ok());
    QVERIFY(!m_store->save().has_value());

    // Same chunk count, new content, and the process ends before save().
    const dw::AnalyzedDocument revised = makeAnalyzed(aPath, axis(2), {axis(2)}, QStringLiteral("r2"));
    const auto outcome = m_store->upsert(revised);
    QVERIFY(outcome.ok());
    QCOMPARE(outcome.value(), dw::UpsertOutcome::Replaced);
    delete m_store;

    m_store = new dw::VectorStore();
    QVERIFY(!m_store->init(storePath(), kDims, QStringLiteral("unit-test-model")).has_value());
    QCOMPARE(m_store->documentCount(), 2);

    const auto documents = m_store->searchDocuments(axis(2), 1);
    QVERIFY(documents.ok());
    QCOMPARE(static_cast<int>(documents->size()), 1);
    QCOMPARE(documents->front().id, revised.document.documentId);

    const auto chunks = m_store->searchChunks(axis(2), 1);
    QVERIFY(chunks.ok());
    QCOMPARE(chunks->front().id, revised.chunks[0].chunkId);

    const auto balanced = m_store->hybridSearch(axis(2), 1, 1);
    QVERIFY(balanced.ok());
    QCOMPARE(static_cast<int>(balanced->size()), 1);
    QCOMPARE(balanced->front().chunkId, revised.chunks[0].chunkId);

    // Fresh labels after the reopen do not collide with stored rows.
    const dw::AnalyzedDocument c = makeAnalyzed(dataPath(QStringLiteral("c.txt")), axis(3), {axis(3)});
    QVERIFY(m_store->upsert(c).ok());
    QCOMPARE(m_store->documentCount(), 3);
    QCOMPARE(m_store->searchChunks(axis(3), 1)->front().id, c.chunks[0].chunkId);
    QCOMPARE(m_store->searchChunks(axis(2), 1)->front().id, revised.chunks[0].chunkId);
}

void TestVectorStore::testTeardown()
{
    QVERIFY(m_store->upsert(makeAnalyzed(dataPath(QStringLiteral("a.txt")), axis(0), {axis(0)})).ok());
    QVERIFY(!m_store->teardown().has_value());
    QCOMPARE(m_store->documentCount(), 0);
    QCOMPARE(m_store->chunkCount(), 0);
    QVERIFY(m_store->listDocuments().empty());
}

// ── Freshness ───────────────────────────────────────────────────

void TestVectorStore::testEnsureFreshAddsThenSkipsUnchanged()
{
    dw::test::HashingEmbedder embedder;
    dw::VectorStore store;
    QVERIFY(!store.init(m_tempDir->filePath(QStringLiteral("fresh")), embedder.dimensions(),
                        embedder.modelId()).has_value());
    dw::DocumentAnalyzer analyzer(embedder);

    const QStringList paths{dataPath(QStringLiteral("paris.txt")), dataPath(QStringLiteral("tokyo.txt")),
                            dataPath(QStringLiteral("lima.txt"))};
    QVERIFY(dw::test::writeTextFile(paths[0], QStringLiteral("Paris is the capital of France.")));
    QVERIFY(dw::test::writeTextFile(paths[1], QStringLiteral("Tokyo is the capital of Japan.")));
    QVERIFY(dw::test::writeTextFile(paths[2], QStringLiteral("Lima is the capital of Peru.")));

    const dw::FreshnessReport first = store.ensureFresh(paths, analyzer);
    QCOMPARE(first.added.size(), 3);
    QVERIFY(first.failures.empty());
    QVERIFY(first.changed());
    QCOMPARE(store.documentCount(), 3);

    embedder.resetCounter();
    const dw::FreshnessReport second = store.ensureFresh(paths, analyzer);
    QCOMPARE(second.unchanged.size(), 3);
    QVERIFY(second.added.isEmpty());
    QVERIFY(!second.changed());
    QCOMPARE(embedder.encodedTexts(), 0);

    const std::vector<dw::DocumentInfo> listed = store.listDocuments();
    QCOMPARE(static_cast<int>(listed.size()), 3);
    QCOMPARE(listed[0].fileName, QStringLiteral("lima.txt"));
    QCOMPARE(listed[0].chunkCount, 1);
}

void TestVectorStore::testEnsureFreshUpdatesAndPrunes()
{
    dw::test::HashingEmbedder embedder;
    dw::VectorStore store;
    QVERIFY(!store.init(m_tempDir->filePath(QStringLiteral("fresh")), embedder.dimensions(),
                        embedder.modelId()).has_value());
    dw::DocumentAnalyzer analyzer(embedder);

    const QString a = dataPath(QStringLiteral("a.txt"));
    const QString b = dataPath(QStringLiteral("b.txt"));
    const QString c = dataPath(QStringLiteral("c.txt"));
    QVERIFY(dw::test::writeTextFile(a, QStringLiteral("Apples grow in orchards.")));
    QVERIFY(dw::test::writeTextFile(b, QStringLiteral("Bridges span rivers.")));
    QVERIFY(dw::test::writeTextFile(c, QStringLiteral("Comets orbit the sun.")));
    QCOMPARE(store.ensureFresh({a, b, c}, analyzer).added.size(), 3);

    const auto storedVectors = [&store](const QString& path) {
        std::vector<std::vector<float>> vectors;
        const QString id = dw::computeDocumentId(path);
        vectors.push_back(store.document(id).value_or(dw::Document()).summaryVector);
        for (const dw::Chunk& chunk : store.chunksForDocument(id)) {
            vectors.push_back(chunk.vector);
        }
        return vectors;
    };
    const auto aBefore = storedVectors(a);
    const auto cBefore = storedVectors(c);
    QVERIFY(aBefore.size() > 1);

    QVERIFY(dw::test::writeTextFile(b, QStringLiteral("Bridges span rivers and valleys.")));
    embedder.resetCounter();
    const dw::FreshnessReport updated = store.ensureFresh({a, b, c}, analyzer);
    QCOMPARE(updated.updated, QStringList{b});
    QCOMPARE(updated.unchanged.size(), 2);
    QVERIFY(store.chunksForDocument(dw::computeDocumentId(b)).front().text.contains(QStringLiteral("valleys")));

    // Only b was embedded again; a and c kept their stored vectors.
    const int sweepEncodes = embedder.encodedTexts();
    embedder.resetCounter();
    QVERIFY(analyzer.analyze(b).ok());
    QCOMPARE(sweepEncodes, embedder.encodedTexts());
    QVERIFY(sweepEncodes > 0);
    QVERIFY(storedVectors(a) == aBefore);
    QVERIFY(storedVectors(c) == cBefore);

    // c leaves the collection.
    const dw::FreshnessReport pruned = store.ensureFresh({a, b}, analyzer);
    QCOMPARE(pruned.removed, QStringList{dw::computeDocumentId(c)});
    QCOMPARE(store.documentCount(), 2);
    QVERIFY(!store.document(dw::computeDocumentId(c)).has_value());
}

void TestVectorStore::testEnsureFreshRecordsFailures()
{
    dw::test::HashingEmbedder embedder;
    dw::VectorStore store;
    QVERIFY(!store.init(m_tempDir->filePath(QStringLiteral("fresh")), embedder.dimensions(),
                        embedder.modelId()).has_value());
    dw::DocumentAnalyzer analyzer(embedder);

    const QString good = dataPath(QStringLiteral("good.txt"));
    const QString image = dataPath(QStringLiteral("picture.png"));
    const QString gone = dataPath(QStringLiteral("gone.txt"));
    QVERIFY(dw::test::writeTextFile(good, QStringLiteral("Glaciers carve valleys.")));
    QVERIFY(dw::test::writeFile(image, QByteArray("\x89PNG\r\n\x1a\n", 8)));
    QVERIFY(dw::test::writeTextFile(gone, QStringLiteral("Ghost towns fade.")));
    QCOMPARE(store.ensureFresh({good, gone}, analyzer).added.size(), 2);

    QVERIFY(QFile::remove(gone));
    const dw::FreshnessReport report = store.ensureFresh({good, image, gone}, analyzer);
    QCOMPARE(static_cast<int>(report.failures.size()), 2);
    QCOMPARE(report.failures[0].path, image);
    QCOMPARE(report.failures[0].error.code, dw::ErrorCode::UnsupportedType);
    QCOMPARE(report.failures[1].path, gone);
    QCOMPARE(report.failures[1].error.code, dw::ErrorCode::NotFound);
    QCOMPARE(report.removed, QStringList{dw::computeDocumentId(gone)});
    QCOMPARE(store.documentCount(), 1);
}

void TestVectorStore::testEnsureFreshCancelledSkipsPruning()
{
    dw::test::HashingEmbedder embedder;
    dw::VectorStore store;
    QVERIFY(!store.init(m_tempDir->filePath(QStringLiteral("fresh")), embedder.dimensions(),
                        embedder.modelId()).has_value());
    dw::DocumentAnalyzer analyzer(embedder);

    const QString a = dataPath(QStringLiteral("a.txt"));
    QVERIFY(dw::test::writeTextFile(a, QStringLiteral("Anchors hold ships.")));
    QCOMPARE(store.ensureFresh({a}, analyzer).added.size(), 1);

    // a is missing from the list, but a cancelled sweep prunes nothing.
    std::atomic<bool> cancel{true};
    const QString b = dataPath(QStringLiteral("b.txt"));
    QVERIFY(dw::test::writeTextFile(b, QStringLiteral("Beacons guide sailors.")));
    const dw::FreshnessReport cancelled = store.ensureFresh({b}, analyzer, &cancel);
    QVERIFY(cancelled.cancelled);
    QVERIFY(cancelled.added.isEmpty());
    QVERIFY(cancelled.removed.isEmpty());
    QCOMPARE(store.documentCount(), 1);
    QVERIFY(store.document(dw::computeDocumentId(a)).has_value());
}

void TestVectorStore::testIsStale()
{
    dw::test::HashingEmbedder embedder;
    dw::VectorStore store;
    QVERIFY(!store.init(m_tempDir->filePath(QStringLiteral("fresh")), embedder.dimensions(),
                        embedder.modelId()).has_value());
    dw::DocumentAnalyzer analyzer(embedder);

    const QString a = dataPath(QStringLiteral("a.txt"));
    QVERIFY(dw::test::writeTextFile(a, QStringLiteral("Avalanches follow heavy snow.")));
    QCOMPARE(store.ensureFresh({a}, analyzer).added.size(), 1);

    const QString id = dw::computeDocumentId(a);
    QVERIFY(!store.isStale(id));
    QVERIFY(store.isStale(QStringLiteral("unknown")));

    QVERIFY(dw::test::writeTextFile(a, QStringLiteral("Avalanches follow heavy spring snow.")));
    QVERIFY(store.isStale(id));

    QVERIFY(QFile::remove(a));
    QVERIFY(store.isStale(id));
}

QTEST_MAIN(TestVectorStore)
#include "test_vector_store.moc"
