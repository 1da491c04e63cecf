#include "core/analysis/tabular_analyzer.h"

#include <QDate>
#include <QJsonArray>
#include <QRegularExpression>
#include <QSet>

#include <algorithm>

namespace dw {

namespace {

constexpr int kMaxSampleValues = 5;

bool isInteger(const QString& value)
{
    static const QRegularExpression integerPattern(QStringLiteral("^[+-]?\\d+$"));
    return integerPattern.match(value).hasMatch();
}

std::optional<double> parseNumber(const QString& value)
{
    QString normalized = value;
    normalized.remove(QLatin1Char(','));
    bool ok = false;
    const double number = normalized.toDouble(&ok);
    if (!ok) {
        return std::nullopt;
    }
    return number;
}

bool isBoolean(const QString& value)
{
    const QString lower = value.toLower();
    return lower == QLatin1String("true") || lower == QLatin1String("false")
        || lower == QLatin1String("yes") || lower == QLatin1String("no");
}

bool isDate(const QString& value)
{
    return QDate::fromString(value.left(10), Qt::ISODate).isValid();
}

QString formatNumber(double value)
{
    return QString::number(value, 'g', 10);
}

} // namespace

bool ColumnProfile::isNumeric() const
{
    return type == QLatin1String("integer") || type == QLatin1String("number");
}

QJsonObject ColumnProfile::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("name")] = name;
    json[QStringLiteral("type")] = type;
    json[QStringLiteral("non_empty")] = nonEmptyCount;
    if (isNumeric()) {
        json[QStringLiteral("min")] = min.value_or(0.0);
        json[QStringLiteral("max")] = max.value_or(0.0);
        json[QStringLiteral("mean")] = mean.value_or(0.0);
    } else {
        json[QStringLiteral("distinct_count")] = distinctCount;
        json[QStringLiteral("sample_values")] = QJsonArray::fromStringList(sampleValues);
    }
    return json;
}

QString ColumnProfile::describe() const
{
    if (isNumeric() && min && max && mean) {
        return QStringLiteral("%1 (%2, min %3, max %4, mean %5)")
            .arg(name, type, formatNumber(*min), formatNumber(*max), formatNumber(*mean));
    }
    if (type == QLatin1String("empty")) {
        return QStringLiteral("%1 (empty)").arg(name);
    }
    return QStringLiteral("%1 (%2, %3 distinct)").arg(name, type).arg(distinctCount);
}

std::vector<ColumnProfile> profileColumns(const TableData& table)
{
    std::vector<ColumnProfile> profiles;
    profiles.reserve(static_cast<size_t>(table.header.size()));

    for (qsizetype c = 0; c < table.header.size(); ++c) {
        ColumnProfile profile;
        profile.name = table.header[c];

        bool allInteger = true;
        bool allNumber = true;
        bool allBoolean = true;
        bool allDate = true;
        double sum = 0.0;
        QSet<QString> distinct;

        for (const QStringList& row : table.rows) {
            const QString value = c < row.size() ? row[c].trimmed() : QString();
            if (value.isEmpty()) {
                continue;
            }
            ++profile.nonEmptyCount;

            if (!distinct.contains(value)) {
                distinct.insert(value);
                if (profile.sampleValues.size() < kMaxSampleValues) {
                    profile.sampleValues.append(value);
                }
            }

            allInteger = allInteger && isInteger(value);
            allBoolean = allBoolean && isBoolean(value);
            allDate = allDate && isDate(value);

            const std::optional<double> number = parseNumber(value);
            if (!number) {
                allNumber = false;
            } else if (allNumber) {
                sum += *number;
                profile.min = profile.min ? std::min(*profile.min, *number) : *number;
                profile.max = profile.max ? std::max(*profile.max, *number) : *number;
            }
        }

        profile.distinctCount = static_cast<int>(distinct.size());
        if (profile.nonEmptyCount == 0) {
            profile.type = QStringLiteral("empty");
        } else if (allInteger) {
            profile.type = QStringLiteral("integer");
        } else if (allNumber) {
            profile.type = QStringLiteral("number");
        } else if (allBoolean) {
            profile.type = QStringLiteral("boolean");
        } else if (allDate) {
            profile.type = QStringLiteral("date");
        } else {
            profile.type = QStringLiteral("text");
        }

        if (profile.isNumeric()) {
            profile.mean = sum / profile.nonEmptyCount;
        } else {
            profile.min.reset();
            profile.max.reset();
        }
        profiles.push_back(std::move(profile));
    }
    return profiles;
}

QString formatTableRow(const QStringList& values)
{
    return values.join(QStringLiteral(" | "));
}

TypeAnalysis analyzeTables(const std::vector<TableData>& tables, int rowsPerChunk, bool workbook)
{
    TypeAnalysis analysis;
    const int window = std::max(rowsPerChunk, 1);

    QJsonArray tablesJson;
    QStringList highlightLines;
    int totalRows = 0;
    int maxColumns = 0;

    for (const TableData& table : tables) {
        const QString headerLine = formatTableRow(table.header);
        const QString sheetLine = workbook ? QStringLiteral("Sheet: %1\n").arg(table.name) : QString();
        const QString locatorPrefix = workbook ? table.name + QLatin1Char(' ') : QString();
        const int rowCount = static_cast<int>(table.rows.size());

        if (rowCount == 0) {
            analysis.chunks.push_back(ChunkDraft{
                sheetLine + headerLine + QStringLiteral("\n(no data rows)"),
                locatorPrefix + QStringLiteral("header")});
        }

        for (int start = 0; start < rowCount; start += window) {
            const int end = std::min(start + window, rowCount);
            QString text = sheetLine + headerLine;
            for (int r = start; r < end; ++r) {
                text += QLatin1Char('\n');
                text += formatTableRow(table.rows[static_cast<size_t>(r)]);
            }
            analysis.chunks.push_back(ChunkDraft{
                text,
                locatorPrefix + QStringLiteral("rows %1-%2").arg(start + 1).arg(end)});
        }

        const std::vector<ColumnProfile> profiles = profileColumns(table);
        QJsonArray columnsJson;
        QStringList columnDescriptions;
        for (const ColumnProfile& profile : profiles) {
            columnsJson.append(profile.toJson());
            columnDescriptions.append(profile.describe());
        }

        QJsonObject tableJson;
        tableJson[QStringLiteral("name")] = table.name;
        tableJson[QStringLiteral("row_count")] = rowCount;
        tableJson[QStringLiteral("column_count")] = static_cast<int>(table.header.size());
        tableJson[QStringLiteral("columns")] = columnsJson;
        tablesJson.append(tableJson);

        const QString tableLabel = workbook ? QStringLiteral("Sheet %1: ").arg(table.name) : QString();
        highlightLines.append(QStringLiteral("%1%2 rows x %3 columns; columns: %4")
                                  .arg(tableLabel)
                                  .arg(rowCount)
                                  .arg(table.header.size())
                                  .arg(columnDescriptions.join(QStringLiteral(", "))));

        totalRows += rowCount;
        maxColumns = std::max(maxColumns, static_cast<int>(table.header.size()));
        analysis.headings.append(table.header.mid(0, 10));

        analysis.fullText += headerLine + QLatin1Char('\n');
        for (const QStringList& row : table.rows) {
            analysis.fullText += formatTableRow(row) + QLatin1Char('\n');
        }
    }

    analysis.rawStructure[QStringLiteral("tables")] = tablesJson;
    analysis.rawStructure[QStringLiteral("table_count")] = static_cast<int>(tables.size());
    analysis.rawStructure[QStringLiteral("row_count")] = totalRows;
    analysis.rawStructure[QStringLiteral("column_count")] = maxColumns;
    analysis.rawStructure[QStringLiteral("rows_per_chunk")] = window;
    analysis.highlights = highlightLines.join(QLatin1Char('\n'));
    return analysis;
}

} // namespace dw
