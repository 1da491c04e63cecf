#include "core/analysis/text_structure.h"

#include <QJsonArray>
#include <QRegularExpression>

#include <algorithm>

namespace dw {

namespace {

constexpr int kMaxReportedHeadings = 10;

struct HeadingMark {
    qsizetype offset = 0;
    QString title;
};

std::vector<HeadingMark> findHeadings(const QString& text, int maxWords)
{
    std::vector<HeadingMark> marks;
    qsizetype lineStart = 0;
    while (lineStart <= text.size()) {
        qsizetype lineEnd = text.indexOf(QLatin1Char('\n'), lineStart);
        if (lineEnd < 0) {
            lineEnd = text.size();
        }
        const QString line = text.mid(lineStart, lineEnd - lineStart);
        if (isHeadingLine(line, maxWords)) {
            marks.push_back(HeadingMark{lineStart, headingTitle(line)});
        }
        lineStart = lineEnd + 1;
    }
    return marks;
}

int lineNumberAt(const QString& text, qsizetype offset)
{
    int line = 1;
    const qsizetype end = std::min(offset, text.size());
    for (qsizetype i = 0; i < end; ++i) {
        if (text[i] == QLatin1Char('\n')) {
            ++line;
        }
    }
    return line;
}

qsizetype firstNonSpace(const QString& text, size_t offset)
{
    qsizetype pos = static_cast<qsizetype>(offset);
    while (pos < text.size() && text[pos].isSpace()) {
        ++pos;
    }
    return pos;
}

int wordCount(const QString& text)
{
    static const QRegularExpression whitespace(QStringLiteral("\\s+"));
    return static_cast<int>(text.split(whitespace, Qt::SkipEmptyParts).size());
}

void appendUniqueHeading(QStringList& headings, const QString& title)
{
    if (headings.size() < kMaxReportedHeadings && !headings.contains(title)) {
        headings.append(title);
    }
}

QString withSection(const QString& text, const QString& heading)
{
    if (heading.isEmpty() || text.startsWith(heading)) {
        return text;
    }
    return QStringLiteral("[Section: %1]\n%2").arg(heading, text);
}

QJsonObject markersToJson(const ContentMarkers& markers)
{
    QJsonObject json;
    json[QStringLiteral("has_tables")] = markers.hasTables;
    json[QStringLiteral("has_figures")] = markers.hasFigures;
    json[QStringLiteral("has_references")] = markers.hasReferences;
    return json;
}

QString markerSummary(const ContentMarkers& markers)
{
    QStringList parts;
    if (markers.hasTables) {
        parts.append(QStringLiteral("tables"));
    }
    if (markers.hasFigures) {
        parts.append(QStringLiteral("figures"));
    }
    if (markers.hasReferences) {
        parts.append(QStringLiteral("references"));
    }
    if (parts.isEmpty()) {
        return QString();
    }
    return QStringLiteral("; contains %1").arg(parts.join(QStringLiteral(", ")));
}

} // namespace

bool isHeadingLine(const QString& line, int maxWords)
{
    const QString trimmed = line.trimmed();
    if (trimmed.size() < 3 || trimmed.size() > 120) {
        return false;
    }

    static const QRegularExpression markdownHeading(QStringLiteral("^#{1,6}\\s+\\S"));
    if (markdownHeading.match(trimmed).hasMatch()) {
        return true;
    }

    const QChar last = trimmed.back();
    if (last == QLatin1Char('.') || last == QLatin1Char(',') || last == QLatin1Char(';')) {
        return false;
    }

    static const QRegularExpression whitespace(QStringLiteral("\\s+"));
    const QStringList words = trimmed.split(whitespace, Qt::SkipEmptyParts);
    if (words.isEmpty() || words.size() > maxWords) {
        return false;
    }

    int letters = 0;
    for (const QChar ch : trimmed) {
        if (ch.isLetter()) {
            ++letters;
        }
    }
    if (letters < 2) {
        return false;
    }

    static const QRegularExpression numbered(
        QStringLiteral("^(?:\\d+(?:\\.\\d+)*\\.?|[IVXLC]+\\.)\\s+(\\S.*)$"));
    const QRegularExpressionMatch numberedMatch = numbered.match(trimmed);
    if (numberedMatch.hasMatch()) {
        const QString rest = numberedMatch.captured(1);
        return !rest.isEmpty() && rest.front().isUpper();
    }

    if (trimmed == trimmed.toUpper() && trimmed != trimmed.toLower() && letters >= 3) {
        return true;
    }

    if (!words.front().front().isUpper()) {
        return false;
    }
    for (const QString& word : words) {
        if (word.size() > 3 && word.front().isLetter() && !word.front().isUpper()) {
            return false;
        }
    }
    return true;
}

QString headingTitle(const QString& line)
{
    QString title = line.trimmed();
    while (title.startsWith(QLatin1Char('#'))) {
        title.remove(0, 1);
    }
    return title.trimmed();
}

ContentMarkers detectMarkers(const QString& text)
{
    const QString lower = text.toLower();
    ContentMarkers markers;
    markers.hasTables = lower.contains(QLatin1String("table")) || text.contains(QLatin1Char('|'));
    markers.hasFigures = lower.contains(QLatin1String("figure")) || lower.contains(QLatin1String("fig."))
        || lower.contains(QLatin1String("chart"));
    markers.hasReferences = lower.contains(QLatin1String("references"))
        || lower.contains(QLatin1String("bibliography"));
    return markers;
}

QString classifyContent(const QString& text, const ContentMarkers& markers)
{
    if (markers.hasTables) {
        return QStringLiteral("table");
    }
    if (markers.hasFigures) {
        return QStringLiteral("figure_reference");
    }
    if (wordCount(text) < 50) {
        return QStringLiteral("short_text");
    }
    const QString lower = text.toLower();
    if (lower.contains(QLatin1String("summary")) || lower.contains(QLatin1String("abstract"))
        || lower.contains(QLatin1String("conclusion"))) {
        return QStringLiteral("summary_section");
    }
    return QStringLiteral("body_text");
}

int countParagraphs(const QString& text)
{
    static const QRegularExpression blankLine(QStringLiteral("\\n\\s*\\n"));
    int count = 0;
    for (const QString& block : text.split(blankLine, Qt::SkipEmptyParts)) {
        if (block.trimmed().size() > 50) {
            ++count;
        }
    }
    return count;
}

TypeAnalysis analyzePdfPages(const std::vector<PdfPage>& pages, const Chunker& chunker)
{
    TypeAnalysis analysis;
    QJsonArray pageArray;
    QString carriedHeading;
    ContentMarkers overall;
    int paragraphTotal = 0;

    for (const PdfPage& page : pages) {
        const std::vector<HeadingMark> marks = findHeadings(page.text, 8);
        const ContentMarkers markers = detectMarkers(page.text);
        const int paragraphs = countParagraphs(page.text);

        overall.hasTables = overall.hasTables || markers.hasTables;
        overall.hasFigures = overall.hasFigures || markers.hasFigures;
        overall.hasReferences = overall.hasReferences || markers.hasReferences;
        paragraphTotal += paragraphs;

        QJsonArray pageHeadings;
        for (const HeadingMark& mark : marks) {
            pageHeadings.append(mark.title);
            appendUniqueHeading(analysis.headings, mark.title);
        }

        QJsonObject pageJson = markersToJson(markers);
        pageJson[QStringLiteral("page")] = page.number;
        pageJson[QStringLiteral("headings")] = pageHeadings;
        pageJson[QStringLiteral("content_type")] = classifyContent(page.text, markers);
        pageJson[QStringLiteral("paragraph_count")] = paragraphs;
        pageJson[QStringLiteral("char_count")] = static_cast<int>(page.text.size());
        pageArray.append(pageJson);

        size_t nextMark = 0;
        for (const TextSpan& span : chunker.split(page.text)) {
            const qsizetype start = firstNonSpace(page.text, span.offset);
            while (nextMark < marks.size() && marks[nextMark].offset <= start) {
                carriedHeading = marks[nextMark].title;
                ++nextMark;
            }
            analysis.chunks.push_back(ChunkDraft{
                withSection(span.text, carriedHeading),
                QStringLiteral("page %1").arg(page.number)});
        }
        if (!marks.empty()) {
            carriedHeading = marks.back().title;
        }

        if (!analysis.fullText.isEmpty()) {
            analysis.fullText += QStringLiteral("\n\n");
        }
        analysis.fullText += page.text;
    }

    analysis.rawStructure = markersToJson(overall);
    analysis.rawStructure[QStringLiteral("pages")] = pageArray;
    analysis.rawStructure[QStringLiteral("page_count")] = static_cast<int>(pages.size());
    analysis.rawStructure[QStringLiteral("paragraph_count")] = paragraphTotal;
    analysis.rawStructure[QStringLiteral("headings")] = QJsonArray::fromStringList(analysis.headings);

    analysis.highlights = QStringLiteral("%1 pages, %2 paragraphs%3")
                              .arg(static_cast<int>(pages.size()))
                              .arg(paragraphTotal)
                              .arg(markerSummary(overall));
    return analysis;
}

TypeAnalysis analyzePlainText(const QString& text, const Chunker& chunker)
{
    TypeAnalysis analysis;
    const std::vector<HeadingMark> marks = findHeadings(text, 10);
    for (const HeadingMark& mark : marks) {
        appendUniqueHeading(analysis.headings, mark.title);
    }

    QString currentHeading;
    size_t nextMark = 0;
    for (const TextSpan& span : chunker.split(text)) {
        const qsizetype start = firstNonSpace(text, span.offset);
        while (nextMark < marks.size() && marks[nextMark].offset <= start) {
            currentHeading = marks[nextMark].title;
            ++nextMark;
        }

        const int firstLine = lineNumberAt(text, start);
        const int lastLine = lineNumberAt(text, start + span.text.size() - 1);
        const QString locator = firstLine == lastLine
            ? QStringLiteral("line %1").arg(firstLine)
            : QStringLiteral("lines %1-%2").arg(firstLine).arg(lastLine);
        analysis.chunks.push_back(ChunkDraft{withSection(span.text, currentHeading), locator});
    }

    const ContentMarkers markers = detectMarkers(text);
    const int paragraphs = countParagraphs(text);
    const int lines = lineNumberAt(text, text.size());
    const int words = wordCount(text);

    analysis.rawStructure = markersToJson(markers);
    analysis.rawStructure[QStringLiteral("headings")] = QJsonArray::fromStringList(analysis.headings);
    analysis.rawStructure[QStringLiteral("line_count")] = lines;
    analysis.rawStructure[QStringLiteral("paragraph_count")] = paragraphs;
    analysis.rawStructure[QStringLiteral("word_count")] = words;
    analysis.rawStructure[QStringLiteral("content_type")] = classifyContent(text, markers);

    analysis.highlights = QStringLiteral("%1 lines, %2 paragraphs, %3 words%4")
                              .arg(lines)
                              .arg(paragraphs)
                              .arg(words)
                              .arg(markerSummary(markers));
    analysis.fullText = text;
    return analysis;
}

} // namespace dw
