#pragma once

#include "core/extraction/extracted_content.h"
#include "core/shared/errors.h"

#include <QByteArray>
#include <QString>

namespace dw {

// RecordExtractor -- JSON documents and JSON Lines (.jsonl/.ndjson).
// Any parse error, or a top-level scalar, is CorruptInput.
class RecordExtractor {
public:
    static Result<RecordData> extract(const QString& filePath, const QByteArray& bytes);
};

} // namespace dw
