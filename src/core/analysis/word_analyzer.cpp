#include "core/analysis/word_analyzer.h"
#include "core/analysis/text_structure.h"

#include <QJsonArray>
#include <QJsonObject>
#include <QMap>
#include <QRegularExpression>

#include <algorithm>

namespace dw {

namespace {

struct Section {
    QStringList path;
    std::vector<int> paragraphIndexes;
};

struct HeadingNode {
    QString title;
    int level = 0;
    std::vector<HeadingNode> children;
};

QJsonArray headingNodesToJson(const std::vector<HeadingNode>& nodes)
{
    QJsonArray array;
    for (const HeadingNode& node : nodes) {
        QJsonObject json;
        json[QStringLiteral("title")] = node.title;
        json[QStringLiteral("level")] = node.level;
        if (!node.children.empty()) {
            json[QStringLiteral("children")] = headingNodesToJson(node.children);
        }
        array.append(json);
    }
    return array;
}

// Inserts a heading under the nearest preceding heading of a lower level.
void insertHeading(std::vector<HeadingNode>& roots, const QString& title, int level)
{
    std::vector<HeadingNode>* siblings = &roots;
    while (!siblings->empty() && siblings->back().level < level) {
        siblings = &siblings->back().children;
    }
    siblings->push_back(HeadingNode{title, level, {}});
}

// Styled headings win. A document without heading styles falls back to the
// prose heuristics, treated as a flat level-1 outline.
std::vector<int> resolveHeadingLevels(const std::vector<WordParagraph>& paragraphs)
{
    std::vector<int> levels(paragraphs.size(), 0);
    bool anyStyled = false;
    for (size_t i = 0; i < paragraphs.size(); ++i) {
        levels[i] = paragraphs[i].headingLevel;
        anyStyled = anyStyled || paragraphs[i].headingLevel > 0;
    }
    if (anyStyled) {
        return levels;
    }

    for (size_t i = 0; i < paragraphs.size(); ++i) {
        const WordParagraph& paragraph = paragraphs[i];
        if (!paragraph.listItem && !looksLikeListItem(paragraph.text)
            && isHeadingLine(paragraph.text, 8)) {
            levels[i] = 1;
        }
    }
    return levels;
}

int countWords(const QString& text)
{
    static const QRegularExpression whitespace(QStringLiteral("\\s+"));
    return static_cast<int>(text.split(whitespace, Qt::SkipEmptyParts).size());
}

void appendChunksForBody(TypeAnalysis& analysis,
                         const QString& prefix,
                         const QString& body,
                         const QString& locator,
                         const Chunker& chunker)
{
    const QString whole = prefix.isEmpty() ? body : prefix + QLatin1Char('\n') + body;
    if (static_cast<size_t>(whole.size()) <= chunker.config().maxSize || body.isEmpty()) {
        analysis.chunks.push_back(ChunkDraft{whole, locator});
        return;
    }

    const std::vector<TextSpan> spans = chunker.split(body);
    for (size_t i = 0; i < spans.size(); ++i) {
        const QString text = prefix.isEmpty() ? spans[i].text : prefix + QLatin1Char('\n') + spans[i].text;
        analysis.chunks.push_back(ChunkDraft{
            text,
            QStringLiteral("%1 (part %2/%3)").arg(locator).arg(i + 1).arg(spans.size())});
    }
}

} // namespace

bool looksLikeListItem(const QString& text)
{
    static const QRegularExpression listPattern(
        QStringLiteral("^\\s*(?:[\\x{2022}\\x{25CF}\\x{25E6}\\x{25AA}\\x{2013}\\x{00B7}]"
                       "|[-*+]\\s|\\d{1,3}[.)]\\s|[a-zA-Z][.)]\\s)"));
    return listPattern.match(text).hasMatch();
}

TypeAnalysis analyzeWordParagraphs(const std::vector<WordParagraph>& paragraphs,
                                   const Chunker& chunker,
                                   int paragraphsPerChunk)
{
    TypeAnalysis analysis;
    const std::vector<int> levels = resolveHeadingLevels(paragraphs);

    std::vector<HeadingNode> headingTree;
    QMap<QString, int> styleCounts;
    int listItems = 0;
    int words = 0;
    bool anyHeading = false;

    std::vector<Section> sections;
    std::vector<std::pair<int, QString>> pathStack;   // (level, title)
    sections.push_back(Section{});

    for (size_t i = 0; i < paragraphs.size(); ++i) {
        const WordParagraph& paragraph = paragraphs[i];
        const QString style = paragraph.styleId.isEmpty() ? QStringLiteral("Normal") : paragraph.styleId;
        styleCounts[style] += 1;
        words += countWords(paragraph.text);
        if (paragraph.listItem || looksLikeListItem(paragraph.text)) {
            ++listItems;
        }

        const int level = levels[i];
        if (level > 0) {
            anyHeading = true;
            const QString title = paragraph.text.trimmed();
            insertHeading(headingTree, title, level);
            if (analysis.headings.size() < 10 && !analysis.headings.contains(title)) {
                analysis.headings.append(title);
            }

            while (!pathStack.empty() && pathStack.back().first >= level) {
                pathStack.pop_back();
            }
            pathStack.emplace_back(level, title);

            Section section;
            for (const auto& entry : pathStack) {
                section.path.append(entry.second);
            }
            sections.push_back(std::move(section));
            continue;
        }
        sections.back().paragraphIndexes.push_back(static_cast<int>(i));

        if (!analysis.fullText.isEmpty()) {
            analysis.fullText += QLatin1Char('\n');
        }
        analysis.fullText += paragraph.text;
    }

    if (anyHeading) {
        for (const Section& section : sections) {
            if (section.paragraphIndexes.empty()) {
                continue;
            }
            QStringList bodyLines;
            for (int index : section.paragraphIndexes) {
                bodyLines.append(paragraphs[static_cast<size_t>(index)].text);
            }
            const QString pathText = section.path.join(QStringLiteral(" > "));
            const QString locator = pathText.isEmpty() ? QStringLiteral("preamble") : pathText;
            appendChunksForBody(analysis, pathText, bodyLines.join(QLatin1Char('\n')), locator, chunker);
        }
    } else {
        const int window = std::max(paragraphsPerChunk, 1);
        const int count = static_cast<int>(paragraphs.size());
        for (int start = 0; start < count; start += window) {
            const int end = std::min(start + window, count);
            QStringList lines;
            for (int p = start; p < end; ++p) {
                lines.append(paragraphs[static_cast<size_t>(p)].text);
            }
            const QString locator = start + 1 == end
                ? QStringLiteral("paragraph %1").arg(end)
                : QStringLiteral("paragraphs %1-%2").arg(start + 1).arg(end);
            appendChunksForBody(analysis, QString(), lines.join(QLatin1Char('\n')), locator, chunker);
        }
    }

    QJsonObject styles;
    for (auto it = styleCounts.cbegin(); it != styleCounts.cend(); ++it) {
        styles[it.key()] = it.value();
    }

    analysis.rawStructure[QStringLiteral("headings")] = headingNodesToJson(headingTree);
    analysis.rawStructure[QStringLiteral("paragraph_count")] = static_cast<int>(paragraphs.size());
    analysis.rawStructure[QStringLiteral("list_item_count")] = listItems;
    analysis.rawStructure[QStringLiteral("styles")] = styles;
    analysis.rawStructure[QStringLiteral("word_count")] = words;
    analysis.rawStructure[QStringLiteral("section_count")] = anyHeading
        ? static_cast<int>(std::count_if(sections.begin(), sections.end(),
                                         [](const Section& s) { return !s.path.isEmpty(); }))
        : 0;

    analysis.highlights = QStringLiteral("%1 paragraphs, %2 words, %3 list items, %4 headings")
                              .arg(paragraphs.size())
                              .arg(words)
                              .arg(listItems)
                              .arg(analysis.headings.size());
    return analysis;
}

} // namespace dw
