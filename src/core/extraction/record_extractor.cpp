#include "core/extraction/record_extractor.h"
#include "core/shared/logging.h"

#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>

namespace dw {

namespace {

bool isLineDelimitedPath(const QString& path)
{
    const QString suffix = QFileInfo(path).suffix().toLower();
    return suffix == QLatin1String("jsonl") || suffix == QLatin1String("ndjson");
}

QJsonValue documentRoot(const QJsonDocument& doc)
{
    if (doc.isObject()) {
        return doc.object();
    }
    return doc.array();
}

} // namespace

Result<RecordData> RecordExtractor::extract(const QString& filePath, const QByteArray& bytes)
{
    RecordData data;

    if (isLineDelimitedPath(filePath)) {
        QJsonArray records;
        int lineNumber = 0;
        for (const QByteArray& line : bytes.split('\n')) {
            ++lineNumber;
            const QByteArray trimmed = line.trimmed();
            if (trimmed.isEmpty()) {
                continue;
            }
            QJsonParseError parseError;
            const QJsonDocument doc = QJsonDocument::fromJson(trimmed, &parseError);
            if (parseError.error != QJsonParseError::NoError) {
                return Error{ErrorCode::CorruptInput,
                             QStringLiteral("Invalid JSON on line %1: %2")
                                 .arg(lineNumber)
                                 .arg(parseError.errorString())};
            }
            records.append(documentRoot(doc));
        }
        if (records.isEmpty()) {
            return Error{ErrorCode::CorruptInput, QStringLiteral("No records found")};
        }
        data.root = records;
        data.lineDelimited = true;
        return data;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(bytes, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        LOG_INFO(dwAnalysis, "Invalid JSON in %s at offset %d: %s",
                 qUtf8Printable(filePath), parseError.offset,
                 qUtf8Printable(parseError.errorString()));
        return Error{ErrorCode::CorruptInput,
                     QStringLiteral("Invalid JSON: %1").arg(parseError.errorString())};
    }
    if (!doc.isObject() && !doc.isArray()) {
        return Error{ErrorCode::CorruptInput, QStringLiteral("Top-level JSON value is not a container")};
    }

    data.root = documentRoot(doc);
    return data;
}

} // namespace dw
