#pragma once

#include <QString>

namespace dw {

// TextCleaner -- normalizes raw extractor output before structure analysis.
//
// clean():
// 1. Strip ASCII control characters except tab and newline
// 2. Normalize line endings: \r\n and \r to \n
// 3. Collapse runs of 3+ newlines to 2 newlines (paragraph breaks survive)
// 4. Collapse runs of spaces/tabs to a single space
// 5. Trim whitespace at both ends of every line and of the whole text
//
// cleanPageText() additionally rejoins words hyphenated across a line
// break ("infor-\nmation" -> "information") and drops form feeds, which
// PDF text layers emit between columns.
class TextCleaner {
public:
    static QString clean(const QString& raw);
    static QString cleanPageText(const QString& raw);
};

} // namespace dw
