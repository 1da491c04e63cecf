#pragma once

#include "core/extraction/extracted_content.h"
#include "core/shared/errors.h"

#include <QChar>
#include <QString>

namespace dw {

// RFC 4180 style parser for comma/tab separated text. Handles quoted fields,
// embedded delimiters and newlines inside quotes, and doubled quotes ("").
// The first non-empty record is the header. Blank records are skipped.
// An unterminated quoted field is CorruptInput.
class DelimitedParser {
public:
    static Result<TableData> parse(const QString& text, QChar delimiter);

    // Tab for .tsv paths, comma otherwise.
    static QChar delimiterForPath(const QString& path);
};

} // namespace dw
