#include <QtTest/QtTest>

#include "core/extraction/docx_extractor.h"
#include "core/extraction/spreadsheet_extractor.h"
#include "fixture_writers.h"

#include <QFile>
#include <QTemporaryDir>

namespace {

QByteArray readAll(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return QByteArray();
    }
    return file.readAll();
}

} // namespace

class TestOfficeExtraction : public QObject {
    Q_OBJECT

private slots:
    // ── DOCX ─────────────────────────────────────────────────────
    void testHeadingLevelForStyle();
    void testDocxParagraphsAndStyles();
    void testDocxWithoutTextIsCorrupt();
    void testDocxNotAZipIsCorrupt();
    void testDocxReadsGivenBytesNotDisk();

    // ── XLSX ─────────────────────────────────────────────────────
    void testWorkbookSheetsBecomeTables();
    void testEmptySheetsDropped();
    void testSpreadsheetGarbageIsCorrupt();
};

// ── DOCX ─────────────────────────────────────────────────────────

void TestOfficeExtraction::testHeadingLevelForStyle()
{
    QCOMPARE(dw::DocxExtractor::headingLevelForStyle(QStringLiteral("Heading1")), 1);
    QCOMPARE(dw::DocxExtractor::headingLevelForStyle(QStringLiteral("heading 3")), 3);
    QCOMPARE(dw::DocxExtractor::headingLevelForStyle(QStringLiteral("Title")), 1);
    QCOMPARE(dw::DocxExtractor::headingLevelForStyle(QStringLiteral("Normal")), 0);
    QCOMPARE(dw::DocxExtractor::headingLevelForStyle(QString()), 0);
}

void TestOfficeExtraction::testDocxParagraphsAndStyles()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("memo.docx"));
    QVERIFY(dw::test::writeFile(path, dw::test::buildDocx({
        {QStringLiteral("Project Plan"), QStringLiteral("Heading1"), false},
        {QStringLiteral("The plan covers three phases."), QString(), false},
        {QString(), QString(), false},
        {QStringLiteral("Design review"), QString(), true},
        {QStringLiteral("Timeline"), QStringLiteral("Heading2"), false},
    })));

    const auto paragraphs = dw::DocxExtractor::extract(path, readAll(path));
    QVERIFY2(paragraphs.ok(), paragraphs.ok() ? "" : qPrintable(paragraphs.error().toString()));
    QCOMPARE(static_cast<int>(paragraphs->size()), 4);

    QCOMPARE(paragraphs->at(0).text, QStringLiteral("Project Plan"));
    QCOMPARE(paragraphs->at(0).styleId, QStringLiteral("Heading1"));
    QCOMPARE(paragraphs->at(0).headingLevel, 1);

    QCOMPARE(paragraphs->at(1).headingLevel, 0);
    QVERIFY(!paragraphs->at(1).listItem);

    QCOMPARE(paragraphs->at(2).text, QStringLiteral("Design review"));
    QVERIFY(paragraphs->at(2).listItem);

    QCOMPARE(paragraphs->at(3).headingLevel, 2);
}

void TestOfficeExtraction::testDocxWithoutTextIsCorrupt()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("blank.docx"));
    QVERIFY(dw::test::writeFile(path, dw::test::buildDocx({{QString(), QString(), false}})));

    const auto paragraphs = dw::DocxExtractor::extract(path, readAll(path));
    QVERIFY(!paragraphs.ok());
    QCOMPARE(paragraphs.error().code, dw::ErrorCode::CorruptInput);
}

void TestOfficeExtraction::testDocxNotAZipIsCorrupt()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("fake.docx"));
    QVERIFY(dw::test::writeTextFile(path, QStringLiteral("plain text pretending to be a document")));

    const auto paragraphs = dw::DocxExtractor::extract(path, readAll(path));
    QVERIFY(!paragraphs.ok());
    QCOMPARE(paragraphs.error().code, dw::ErrorCode::CorruptInput);
}

void TestOfficeExtraction::testDocxReadsGivenBytesNotDisk()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("notes.docx"));
    const QByteArray hashed = dw::test::buildDocx({{QStringLiteral("Version one"), QString(), false}});
    QVERIFY(dw::test::writeFile(path, hashed));

    // The file moves on after its bytes were read.
    QVERIFY(dw::test::writeFile(path, dw::test::buildDocx({{QStringLiteral("Version two"), QString(), false}})));

    const auto paragraphs = dw::DocxExtractor::extract(path, hashed);
    QVERIFY(paragraphs.ok());
    QCOMPARE(static_cast<int>(paragraphs->size()), 1);
    QCOMPARE(paragraphs->at(0).text, QStringLiteral("Version one"));

    // Nothing on disk is needed at all.
    QVERIFY(QFile::remove(path));
    QVERIFY(dw::DocxExtractor::extract(path, hashed).ok());
}

// ── XLSX ─────────────────────────────────────────────────────────

void TestOfficeExtraction::testWorkbookSheetsBecomeTables()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("budget.xlsx"));
    QVERIFY(dw::test::writeXlsx(path, {
        {QStringLiteral("Costs"), {{"item", "amount"}, {"rent", "1200"}, {"power", "90"}}},
        {QStringLiteral("People"), {{"name", "team"}, {"Ada", "core"}}},
    }));

    const auto tables = dw::SpreadsheetExtractor::extract(path, readAll(path));
    QVERIFY2(tables.ok(), tables.ok() ? "" : qPrintable(tables.error().toString()));
    QCOMPARE(static_cast<int>(tables->size()), 2);

    const dw::TableData& costs = tables->at(0);
    QCOMPARE(costs.name, QStringLiteral("Costs"));
    QCOMPARE(costs.header, QStringList({"item", "amount"}));
    QCOMPARE(static_cast<int>(costs.rows.size()), 2);
    QCOMPARE(costs.rows[0], QStringList({"rent", "1200"}));

    QCOMPARE(tables->at(1).name, QStringLiteral("People"));
    QCOMPARE(tables->at(1).rows[0], QStringList({"Ada", "core"}));
}

void TestOfficeExtraction::testEmptySheetsDropped()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("sparse.xlsx"));
    QVERIFY(dw::test::writeXlsx(path, {
        {QStringLiteral("Empty"), {}},
        {QStringLiteral("Data"), {{"k", "v"}, {"a", "1"}}},
    }));

    const auto tables = dw::SpreadsheetExtractor::extract(path, readAll(path));
    QVERIFY(tables.ok());
    QCOMPARE(static_cast<int>(tables->size()), 1);
    QCOMPARE(tables->at(0).name, QStringLiteral("Data"));
}

void TestOfficeExtraction::testSpreadsheetGarbageIsCorrupt()
{
    const auto tables = dw::SpreadsheetExtractor::extract(QStringLiteral("junk.xlsx"),
                                                          QByteArray("definitely not a zip archive"));
    QVERIFY(!tables.ok());
    QCOMPARE(tables.error().code, dw::ErrorCode::CorruptInput);
}

QTEST_MAIN(TestOfficeExtraction)
#include "test_office_extraction.moc"
