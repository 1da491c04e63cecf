#include <QtTest/QtTest>
#include "core/embedding/embedding_manager.h"

#include <QFile>
#include <QTemporaryDir>

#include <cmath>

class TestEmbedding : public QObject {
    Q_OBJECT

private slots:
    void testInitializeWithMissingModel();
    void testInitializeWithoutVocab();
    void testEncodeWithoutInit();
    void testEncodeBatchWithoutModel();
    void testConfigReportedBeforeInit();
    void testNormalizeVector();
    void testCircuitBreakerOpensAfterThreshold();
};

void TestEmbedding::testInitializeWithMissingModel()
{
    dw::EmbeddingModelConfig config;
    config.modelDir = QStringLiteral("/nonexistent/models");
    dw::EmbeddingManager manager(config);
    QVERIFY(!manager.initialize());
    QVERIFY(!manager.isAvailable());
}

void TestEmbedding::testInitializeWithoutVocab()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QFile model(dir.filePath(QStringLiteral("model.onnx")));
    QVERIFY(model.open(QIODevice::WriteOnly));
    model.write("not a model");
    model.close();

    dw::EmbeddingModelConfig config;
    config.modelDir = dir.path();
    dw::EmbeddingManager manager(config);
    QVERIFY(!manager.initialize());
    QVERIFY(manager.encode(QStringLiteral("test")).empty());
}

void TestEmbedding::testEncodeWithoutInit()
{
    dw::EmbeddingManager manager(dw::EmbeddingModelConfig{});
    QVERIFY(manager.encode(QStringLiteral("hello")).empty());
}

void TestEmbedding::testEncodeBatchWithoutModel()
{
    dw::EmbeddingManager manager(dw::EmbeddingModelConfig{});
    const std::vector<QString> texts = {
        QStringLiteral("hello"),
        QStringLiteral("world"),
        QStringLiteral("test"),
    };
    QVERIFY(manager.encodeBatch(texts).empty());
}

void TestEmbedding::testConfigReportedBeforeInit()
{
    dw::EmbeddingModelConfig config;
    config.modelId = QStringLiteral("custom-model");
    config.dimensions = 128;
    dw::EmbeddingManager manager(config);
    QCOMPARE(manager.dimensions(), 128);
    QCOMPARE(manager.modelId(), QStringLiteral("custom-model"));
}

void TestEmbedding::testNormalizeVector()
{
    std::vector<float> vector{3.0F, 4.0F};
    dw::normalizeVector(vector);
    QVERIFY(std::abs(vector[0] - 0.6F) < 1e-6F);
    QVERIFY(std::abs(vector[1] - 0.8F) < 1e-6F);

    std::vector<float> zeros{0.0F, 0.0F, 0.0F};
    dw::normalizeVector(zeros);
    QCOMPARE(zeros, std::vector<float>({0.0F, 0.0F, 0.0F}));
}

void TestEmbedding::testCircuitBreakerOpensAfterThreshold()
{
    dw::EmbeddingCircuitBreaker breaker;
    for (int i = 0; i < dw::EmbeddingCircuitBreaker::kOpenThreshold - 1; ++i) {
        breaker.recordFailure();
    }
    QVERIFY(!breaker.isOpen());

    breaker.recordFailure();
    QVERIFY(breaker.isOpen());

    breaker.recordSuccess();
    QVERIFY(!breaker.isOpen());
}

QTEST_MAIN(TestEmbedding)
#include "test_embedding.moc"
