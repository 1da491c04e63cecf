#pragma once

#include <QJsonValue>
#include <QString>
#include <QStringList>

#include <vector>

namespace dw {

struct PdfPage {
    int number = 0;          // 1-based
    QString text;
};

// A header row plus data rows. Rows are padded or trimmed to header width
// by the parsers, so row[i] always lines up with header[i].
struct TableData {
    QString name;            // sheet name; empty for delimited text
    QStringList header;
    std::vector<QStringList> rows;
};

struct WordParagraph {
    QString text;
    QString styleId;         // w:pStyle value, empty when unstyled
    int headingLevel = 0;    // 0 = body text
    bool listItem = false;
};

// Parsed structured-record file. For line-delimited input the root is an
// array holding one element per non-blank line.
struct RecordData {
    QJsonValue root;
    bool lineDelimited = false;
};

} // namespace dw
