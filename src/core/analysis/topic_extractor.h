#pragma once

#include <QString>
#include <QStringList>

namespace dw {

// Frequency-ranked keywords. Words of five or more letters are counted
// case-insensitively, stop words excluded; words found in headings count
// three times. Ties are ordered alphabetically so output is stable.
QStringList extractTopics(const QString& text, const QStringList& headings, int maxTopics = 20);

bool isStopWord(const QString& lowerWord);

} // namespace dw
