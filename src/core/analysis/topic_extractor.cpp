#include "core/analysis/topic_extractor.h"

#include <QHash>
#include <QRegularExpression>
#include <QSet>

#include <algorithm>
#include <utility>
#include <vector>

namespace dw {

namespace {

constexpr int kHeadingWeight = 3;

const QSet<QString>& stopWords()
{
    static const QSet<QString> words = {
        QStringLiteral("the"),     QStringLiteral("and"),     QStringLiteral("for"),
        QStringLiteral("are"),     QStringLiteral("but"),     QStringLiteral("not"),
        QStringLiteral("you"),     QStringLiteral("this"),    QStringLiteral("that"),
        QStringLiteral("with"),    QStringLiteral("have"),    QStringLiteral("will"),
        QStringLiteral("from"),    QStringLiteral("they"),    QStringLiteral("been"),
        QStringLiteral("were"),    QStringLiteral("said"),    QStringLiteral("each"),
        QStringLiteral("which"),   QStringLiteral("their"),   QStringLiteral("time"),
        QStringLiteral("would"),   QStringLiteral("there"),   QStringLiteral("could"),
        QStringLiteral("other"),   QStringLiteral("more"),    QStringLiteral("very"),
        QStringLiteral("what"),    QStringLiteral("know"),    QStringLiteral("just"),
        QStringLiteral("first"),   QStringLiteral("into"),    QStringLiteral("over"),
        QStringLiteral("think"),   QStringLiteral("also"),    QStringLiteral("your"),
        QStringLiteral("work"),    QStringLiteral("life"),    QStringLiteral("only"),
        QStringLiteral("can"),     QStringLiteral("should"),  QStringLiteral("after"),
        QStringLiteral("being"),   QStringLiteral("now"),     QStringLiteral("made"),
        QStringLiteral("before"),  QStringLiteral("here"),    QStringLiteral("through"),
        QStringLiteral("when"),    QStringLiteral("where"),   QStringLiteral("how"),
        QStringLiteral("all"),     QStringLiteral("any"),     QStringLiteral("may"),
        QStringLiteral("say"),     QStringLiteral("these"),   QStringLiteral("those"),
        QStringLiteral("about"),   QStringLiteral("while"),   QStringLiteral("because"),
        QStringLiteral("between"), QStringLiteral("within"),  QStringLiteral("without"),
    };
    return words;
}

void countWords(const QString& text, int weight, QHash<QString, int>& counts)
{
    static const QRegularExpression wordPattern(QStringLiteral("\\p{L}{5,}"));
    QRegularExpressionMatchIterator it = wordPattern.globalMatch(text);
    while (it.hasNext()) {
        const QString word = it.next().captured(0).toLower();
        if (!isStopWord(word)) {
            counts[word] += weight;
        }
    }
}

} // namespace

bool isStopWord(const QString& lowerWord)
{
    return stopWords().contains(lowerWord);
}

QStringList extractTopics(const QString& text, const QStringList& headings, int maxTopics)
{
    QHash<QString, int> counts;
    countWords(text, 1, counts);
    for (const QString& heading : headings) {
        countWords(heading, kHeadingWeight, counts);
    }

    std::vector<std::pair<QString, int>> ranked;
    ranked.reserve(static_cast<size_t>(counts.size()));
    for (auto it = counts.cbegin(); it != counts.cend(); ++it) {
        ranked.emplace_back(it.key(), it.value());
    }
    std::sort(ranked.begin(), ranked.end(), [](const auto& a, const auto& b) {
        if (a.second != b.second) {
            return a.second > b.second;
        }
        return a.first < b.first;
    });

    QStringList topics;
    for (const auto& entry : ranked) {
        if (topics.size() >= maxTopics) {
            break;
        }
        topics.append(entry.first);
    }
    return topics;
}

} // namespace dw
