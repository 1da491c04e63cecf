#pragma once

#include "core/analysis/analysis_types.h"
#include "core/extraction/extracted_content.h"

#include <QJsonObject>
#include <QString>
#include <QStringList>

#include <optional>
#include <vector>

namespace dw {

struct ColumnProfile {
    QString name;
    QString type;                 // integer, number, boolean, date, text, empty
    int nonEmptyCount = 0;
    int distinctCount = 0;
    std::optional<double> min;
    std::optional<double> max;
    std::optional<double> mean;
    QStringList sampleValues;     // up to 5 distinct values, first-seen order

    bool isNumeric() const;
    QJsonObject toJson() const;
    QString describe() const;
};

std::vector<ColumnProfile> profileColumns(const TableData& table);

// Fixed row-count windows. Every chunk repeats the header line (and the
// sheet name for workbooks) so it can be read on its own; a row is never
// split across chunks. A header-only table yields a single chunk.
TypeAnalysis analyzeTables(const std::vector<TableData>& tables, int rowsPerChunk, bool workbook);

// " | " separated rendering used for both header and data lines.
QString formatTableRow(const QStringList& values);

} // namespace dw
