#include "core/extraction/text_extractor.h"
#include "core/extraction/text_cleaner.h"
#include "core/shared/logging.h"

#include <QStringConverter>

namespace dw {

QString TextExtractor::decode(const QByteArray& bytes)
{
    if (bytes.isEmpty()) {
        return QString();
    }

    QByteArray payload = bytes;
    if (payload.startsWith("\xEF\xBB\xBF")) {
        payload.remove(0, 3);
    }

    auto toUtf8 = QStringDecoder(QStringDecoder::Utf8, QStringDecoder::Flag::Stateless);
    QString decoded = toUtf8(payload);
    if (toUtf8.hasError()) {
        decoded = QString::fromLatin1(payload);
    }
    return decoded;
}

Result<QString> TextExtractor::extract(const QString& filePath, const QByteArray& bytes)
{
    if (bytes.contains('\0')) {
        LOG_INFO(dwAnalysis, "Binary content in text file: %s", qUtf8Printable(filePath));
        return Error{ErrorCode::CorruptInput, QStringLiteral("File contains binary data")};
    }

    const QString cleaned = TextCleaner::clean(decode(bytes));
    if (cleaned.isEmpty()) {
        return Error{ErrorCode::CorruptInput, QStringLiteral("File has no text content")};
    }

    LOG_DEBUG(dwAnalysis, "Extracted %lld chars from %s",
              static_cast<long long>(cleaned.size()), qUtf8Printable(filePath));
    return cleaned;
}

} // namespace dw
