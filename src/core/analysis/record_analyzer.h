#pragma once

#include "core/analysis/analysis_types.h"
#include "core/extraction/extracted_content.h"

#include <QJsonValue>
#include <QString>
#include <QStringList>

namespace dw {

// One "key.path[i]: value" line per leaf, depth-first in document order.
QStringList flattenRecord(const QJsonValue& value, const QString& path = QString());

// Top-level units (object keys or array items) are grouped into chunks
// while the flattened text stays within `budget` characters. A unit over
// budget is split along its children; a single oversized leaf is emitted
// on its own.
TypeAnalysis analyzeRecords(const RecordData& record, int budget);

} // namespace dw
