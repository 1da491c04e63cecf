#include "core/extraction/text_cleaner.h"

#include <QRegularExpression>
#include <QStringList>

namespace dw {

QString TextCleaner::clean(const QString& raw)
{
    if (raw.isEmpty()) {
        return raw;
    }

    QString normalized;
    normalized.reserve(raw.size());

    for (qsizetype i = 0; i < raw.size(); ++i) {
        const QChar ch = raw[i];
        const ushort code = ch.unicode();

        if (code == '\r') {
            if (i + 1 < raw.size() && raw[i + 1] == QLatin1Char('\n')) {
                ++i;
            }
            normalized.append(QLatin1Char('\n'));
            continue;
        }
        if ((code < 0x20 && code != 0x09 && code != 0x0A) || code == 0x7F) {
            continue;
        }
        // Non-breaking space behaves like a plain space for chunking.
        normalized.append(code == 0x00A0 ? QChar(QLatin1Char(' ')) : ch);
    }

    QStringList lines = normalized.split(QLatin1Char('\n'));
    static const QRegularExpression horizontalRun(QStringLiteral("[ \\t]+"));
    for (QString& line : lines) {
        line.replace(horizontalRun, QStringLiteral(" "));
        line = line.trimmed();
    }

    QString collapsed;
    collapsed.reserve(normalized.size());
    int blankRun = 0;
    for (const QString& line : lines) {
        if (line.isEmpty()) {
            ++blankRun;
            if (blankRun == 1 && !collapsed.isEmpty()) {
                collapsed.append(QLatin1Char('\n'));
            }
            continue;
        }
        if (!collapsed.isEmpty()) {
            collapsed.append(QLatin1Char('\n'));
        }
        blankRun = 0;
        collapsed.append(line);
    }

    return collapsed.trimmed();
}

QString TextCleaner::cleanPageText(const QString& raw)
{
    QString text = raw;
    text.replace(QChar(0x000C), QLatin1Char('\n'));

    static const QRegularExpression hyphenBreak(QStringLiteral("(\\p{Ll})-\\n(\\p{Ll})"));
    text.replace(hyphenBreak, QStringLiteral("\\1\\2"));
    return clean(text);
}

} // namespace dw
