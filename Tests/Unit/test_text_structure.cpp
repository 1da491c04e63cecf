#include <QtTest/QtTest>

#include "core/analysis/text_structure.h"

#include <QJsonArray>

class TestTextStructure : public QObject {
    Q_OBJECT

private slots:
    // ── Heading heuristics ───────────────────────────────────────
    void testIsHeadingLine_data();
    void testIsHeadingLine();
    void testHeadingTitleStripsMarkdown();

    // ── Markers and classification ───────────────────────────────
    void testDetectMarkers();
    void testClassifyContent();
    void testCountParagraphs();

    // ── Plain text ───────────────────────────────────────────────
    void testPlainTextSectionsAndLineLocators();
    void testPlainTextCarriesHeadingIntoLaterChunks();
    void testPlainTextRawStructure();

    // ── PDF pages ────────────────────────────────────────────────
    void testPdfPagesLocatorsAndCarriedHeading();
};

// ── Heading heuristics ───────────────────────────────────────────

void TestTextStructure::testIsHeadingLine_data()
{
    QTest::addColumn<QString>("line");
    QTest::addColumn<bool>("heading");

    QTest::newRow("numbered") << QStringLiteral("2. Methodology") << true;
    QTest::newRow("dotted numbering") << QStringLiteral("3.1 Data Sources") << true;
    QTest::newRow("roman") << QStringLiteral("IV. Results") << true;
    QTest::newRow("markdown") << QStringLiteral("## Getting started with the tool") << true;
    QTest::newRow("upper case") << QStringLiteral("EXECUTIVE SUMMARY") << true;
    QTest::newRow("title case") << QStringLiteral("Results and Discussion") << true;
    QTest::newRow("sentence") << QStringLiteral("This is a complete sentence.") << false;
    QTest::newRow("lower case") << QStringLiteral("results were mixed overall") << false;
    QTest::newRow("too long") << QStringLiteral("One Two Three Four Five Six Seven Eight Nine Ten") << false;
    QTest::newRow("too short") << QStringLiteral("A") << false;
    QTest::newRow("digits only") << QStringLiteral("2024 1999") << false;
    QTest::newRow("numbered lower") << QStringLiteral("1. then we continue") << false;
}

void TestTextStructure::testIsHeadingLine()
{
    QFETCH(QString, line);
    QFETCH(bool, heading);
    QCOMPARE(dw::isHeadingLine(line), heading);
}

void TestTextStructure::testHeadingTitleStripsMarkdown()
{
    QCOMPARE(dw::headingTitle(QStringLiteral("### Install  ")), QStringLiteral("Install"));
    QCOMPARE(dw::headingTitle(QStringLiteral("2. Methodology")), QStringLiteral("2. Methodology"));
}

// ── Markers and classification ───────────────────────────────────

void TestTextStructure::testDetectMarkers()
{
    const dw::ContentMarkers markers =
        dw::detectMarkers(QStringLiteral("See Figure 3 for the trend.\n\nReferences\n[1] Smith"));
    QVERIFY(!markers.hasTables);
    QVERIFY(markers.hasFigures);
    QVERIFY(markers.hasReferences);

    QVERIFY(dw::detectMarkers(QStringLiteral("a | b | c")).hasTables);
}

void TestTextStructure::testClassifyContent()
{
    const QString shortText = QStringLiteral("Only a few words here.");
    QCOMPARE(dw::classifyContent(shortText, dw::detectMarkers(shortText)), QStringLiteral("short_text"));

    QString summary = QStringLiteral("In summary, ");
    for (int i = 0; i < 60; ++i) {
        summary += QStringLiteral("word ");
    }
    QCOMPARE(dw::classifyContent(summary, dw::detectMarkers(summary)), QStringLiteral("summary_section"));

    dw::ContentMarkers tables;
    tables.hasTables = true;
    QCOMPARE(dw::classifyContent(summary, tables), QStringLiteral("table"));
}

void TestTextStructure::testCountParagraphs()
{
    const QString text = QStringLiteral(
        "This paragraph is long enough to count because it exceeds fifty characters.\n\n"
        "Too short.\n\n"
        "Another paragraph that easily passes the fifty character threshold we use.");
    QCOMPARE(dw::countParagraphs(text), 2);
}

// ── Plain text ───────────────────────────────────────────────────

void TestTextStructure::testPlainTextSectionsAndLineLocators()
{
    dw::ChunkerConfig config;
    config.targetSize = 60;
    config.minSize = 20;
    config.maxSize = 120;
    dw::Chunker chunker(config);

    const QString text = QStringLiteral(
        "Overview\nThe system indexes local documents quickly.\n\n"
        "Storage\nVectors live in an HNSW graph on disk.");

    const dw::TypeAnalysis analysis = dw::analyzePlainText(text, chunker);
    QCOMPARE(static_cast<int>(analysis.chunks.size()), 2);
    QCOMPARE(analysis.chunks[0].text, QStringLiteral("Overview\nThe system indexes local documents quickly."));
    QCOMPARE(analysis.chunks[0].locator, QStringLiteral("lines 1-2"));
    QCOMPARE(analysis.chunks[1].text, QStringLiteral("Storage\nVectors live in an HNSW graph on disk."));
    QCOMPARE(analysis.chunks[1].locator, QStringLiteral("lines 4-5"));
    QCOMPARE(analysis.headings, QStringList({"Overview", "Storage"}));
    QCOMPARE(analysis.fullText, text);
}

void TestTextStructure::testPlainTextCarriesHeadingIntoLaterChunks()
{
    dw::ChunkerConfig config;
    config.targetSize = 40;
    config.minSize = 10;
    config.maxSize = 80;
    dw::Chunker chunker(config);

    const QString text = QStringLiteral("Overview\nThe first sentence is here. The second sentence is there.");

    const dw::TypeAnalysis analysis = dw::analyzePlainText(text, chunker);
    QCOMPARE(static_cast<int>(analysis.chunks.size()), 2);
    QCOMPARE(analysis.chunks[0].text, QStringLiteral("Overview\nThe first sentence is here."));
    QCOMPARE(analysis.chunks[1].text,
             QStringLiteral("[Section: Overview]\nThe second sentence is there."));
    QCOMPARE(analysis.chunks[1].locator, QStringLiteral("line 2"));
}

void TestTextStructure::testPlainTextRawStructure()
{
    dw::Chunker chunker;
    const QString text = QStringLiteral("Notes\nSee the table below.\nalpha | beta");

    const dw::TypeAnalysis analysis = dw::analyzePlainText(text, chunker);
    QCOMPARE(analysis.rawStructure.value(QStringLiteral("line_count")).toInt(), 3);
    QCOMPARE(analysis.rawStructure.value(QStringLiteral("word_count")).toInt(), 8);
    QVERIFY(analysis.rawStructure.value(QStringLiteral("has_tables")).toBool());
    QCOMPARE(analysis.rawStructure.value(QStringLiteral("headings")).toArray().size(), 1);
    QVERIFY(analysis.highlights.contains(QStringLiteral("3 lines")));
}

// ── PDF pages ────────────────────────────────────────────────────

void TestTextStructure::testPdfPagesLocatorsAndCarriedHeading()
{
    dw::Chunker chunker;
    const std::vector<dw::PdfPage> pages = {
        {1, QStringLiteral("Introduction\nThe study covers regional sales.")},
        {2, QStringLiteral("More details follow here without a heading.")},
    };

    const dw::TypeAnalysis analysis = dw::analyzePdfPages(pages, chunker);
    QCOMPARE(static_cast<int>(analysis.chunks.size()), 2);
    QCOMPARE(analysis.chunks[0].locator, QStringLiteral("page 1"));
    QCOMPARE(analysis.chunks[1].locator, QStringLiteral("page 2"));
    QCOMPARE(analysis.chunks[1].text,
             QStringLiteral("[Section: Introduction]\nMore details follow here without a heading."));

    QCOMPARE(analysis.rawStructure.value(QStringLiteral("page_count")).toInt(), 2);
    const QJsonArray pageJson = analysis.rawStructure.value(QStringLiteral("pages")).toArray();
    QCOMPARE(pageJson.size(), 2);
    QCOMPARE(pageJson.at(0).toObject().value(QStringLiteral("headings")).toArray().at(0).toString(),
             QStringLiteral("Introduction"));
    QCOMPARE(analysis.headings, QStringList({"Introduction"}));
}

QTEST_MAIN(TestTextStructure)
#include "test_text_structure.moc"
