#include "core/extraction/spreadsheet_extractor.h"
#include "core/shared/logging.h"

#include <xlnt/xlnt.hpp>

#include <algorithm>
#include <cstdint>

namespace dw {

namespace {

QString cellText(const xlnt::cell& cell)
{
    if (!cell.has_value()) {
        return QString();
    }
    return QString::fromStdString(cell.to_string()).trimmed();
}

bool isBlank(const QStringList& row)
{
    return std::all_of(row.begin(), row.end(), [](const QString& v) { return v.isEmpty(); });
}

} // namespace

Result<std::vector<TableData>> SpreadsheetExtractor::extract(const QString& filePath,
                                                              const QByteArray& bytes)
{
    std::vector<TableData> tables;

    try {
        const std::vector<std::uint8_t> data(bytes.begin(), bytes.end());
        xlnt::workbook workbook;
        workbook.load(data);

        for (xlnt::worksheet sheet : workbook) {
            TableData table;
            table.name = QString::fromStdString(sheet.title());

            bool haveHeader = false;
            for (auto row : sheet.rows(false)) {
                QStringList values;
                for (auto cell : row) {
                    values.append(cellText(cell));
                }
                if (isBlank(values)) {
                    continue;
                }
                if (!haveHeader) {
                    table.header = values;
                    haveHeader = true;
                    continue;
                }
                table.rows.push_back(values);
            }

            if (!haveHeader) {
                LOG_DEBUG(dwAnalysis, "Skipping empty sheet '%s' in %s",
                          qUtf8Printable(table.name), qUtf8Printable(filePath));
                continue;
            }

            // Drop trailing header columns that are empty in every row.
            qsizetype width = table.header.size();
            while (width > 0 && table.header[width - 1].isEmpty()
                   && std::all_of(table.rows.begin(), table.rows.end(), [width](const QStringList& r) {
                          return r.size() < width || r[width - 1].isEmpty();
                      })) {
                --width;
            }
            table.header = table.header.mid(0, width);
            for (qsizetype c = 0; c < table.header.size(); ++c) {
                if (table.header[c].isEmpty()) {
                    table.header[c] = QStringLiteral("column_%1").arg(c + 1);
                }
            }
            for (QStringList& row : table.rows) {
                row = row.mid(0, width);
                while (row.size() < width) {
                    row.append(QString());
                }
            }
            tables.push_back(std::move(table));
        }
    } catch (const std::exception& e) {
        LOG_WARN(dwAnalysis, "xlnt failed to read %s: %s", qUtf8Printable(filePath), e.what());
        return Error{ErrorCode::CorruptInput,
                     QStringLiteral("Unreadable spreadsheet: %1").arg(QString::fromUtf8(e.what()))};
    }

    if (tables.empty()) {
        return Error{ErrorCode::CorruptInput, QStringLiteral("Workbook has no non-empty sheets")};
    }
    return tables;
}

} // namespace dw
