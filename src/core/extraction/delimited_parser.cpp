#include "core/extraction/delimited_parser.h"

#include <QFileInfo>

#include <algorithm>

namespace dw {

namespace {

bool isBlankRecord(const QStringList& record)
{
    return std::all_of(record.begin(), record.end(), [](const QString& field) {
        return field.trimmed().isEmpty();
    });
}

} // namespace

QChar DelimitedParser::delimiterForPath(const QString& path)
{
    return QFileInfo(path).suffix().compare(QLatin1String("tsv"), Qt::CaseInsensitive) == 0
        ? QLatin1Char('\t')
        : QLatin1Char(',');
}

Result<TableData> DelimitedParser::parse(const QString& text, QChar delimiter)
{
    std::vector<QStringList> records;
    QStringList record;
    QString field;
    bool inQuotes = false;
    bool fieldWasQuoted = false;

    const auto endField = [&]() {
        record.append(fieldWasQuoted ? field : field.trimmed());
        field.clear();
        fieldWasQuoted = false;
    };
    const auto endRecord = [&]() {
        endField();
        if (!isBlankRecord(record)) {
            records.push_back(record);
        }
        record.clear();
    };

    for (qsizetype i = 0; i < text.size(); ++i) {
        const QChar ch = text[i];

        if (inQuotes) {
            if (ch == QLatin1Char('"')) {
                if (i + 1 < text.size() && text[i + 1] == QLatin1Char('"')) {
                    field.append(QLatin1Char('"'));
                    ++i;
                } else {
                    inQuotes = false;
                }
            } else {
                field.append(ch);
            }
            continue;
        }

        if (ch == QLatin1Char('"') && field.trimmed().isEmpty()) {
            field.clear();
            inQuotes = true;
            fieldWasQuoted = true;
        } else if (ch == delimiter) {
            endField();
        } else if (ch == QLatin1Char('\r')) {
            if (i + 1 < text.size() && text[i + 1] == QLatin1Char('\n')) {
                ++i;
            }
            endRecord();
        } else if (ch == QLatin1Char('\n')) {
            endRecord();
        } else {
            field.append(ch);
        }
    }

    if (inQuotes) {
        return Error{ErrorCode::CorruptInput, QStringLiteral("Unterminated quoted field")};
    }
    if (!field.isEmpty() || !record.isEmpty()) {
        endRecord();
    }

    if (records.empty()) {
        return Error{ErrorCode::CorruptInput, QStringLiteral("No header row found")};
    }

    TableData table;
    table.header = records.front();
    for (qsizetype c = 0; c < table.header.size(); ++c) {
        if (table.header[c].isEmpty()) {
            table.header[c] = QStringLiteral("column_%1").arg(c + 1);
        }
    }

    const qsizetype width = table.header.size();
    table.rows.reserve(records.size() - 1);
    for (size_t r = 1; r < records.size(); ++r) {
        QStringList row = records[r];
        while (row.size() < width) {
            row.append(QString());
        }
        if (row.size() > width) {
            row = row.mid(0, width);
        }
        table.rows.push_back(std::move(row));
    }
    return table;
}

} // namespace dw
