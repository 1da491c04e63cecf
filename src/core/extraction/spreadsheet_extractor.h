#pragma once

#include "core/extraction/extracted_content.h"
#include "core/shared/errors.h"

#include <QByteArray>
#include <QString>

#include <vector>

namespace dw {

// SpreadsheetExtractor -- reads every worksheet of an xlsx workbook via xlnt.
// Each sheet becomes one table; its header is the first non-empty row.
// Sheets with no non-empty rows are dropped. A workbook that cannot be
// parsed, or that has no non-empty sheet, is CorruptInput.
class SpreadsheetExtractor {
public:
    static Result<std::vector<TableData>> extract(const QString& filePath, const QByteArray& bytes);
};

} // namespace dw
