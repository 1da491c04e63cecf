#include "core/shared/file_reader.h"
#include "core/shared/logging.h"

#include <QFile>
#include <QFileInfo>

namespace dw {

Result<QByteArray> readFileBytes(const QString& path, int64_t maxBytes)
{
    const QFileInfo info(path);
    if (!info.exists() || !info.isFile()) {
        return Error{ErrorCode::NotFound,
                     QStringLiteral("File does not exist or is not a regular file: %1").arg(path)};
    }

    if (!info.isReadable()) {
        return Error{ErrorCode::PermissionDenied, QStringLiteral("File is not readable: %1").arg(path)};
    }

    if (maxBytes > 0 && info.size() > maxBytes) {
        LOG_INFO(dwCore, "Skipping oversized file: %s (%lld bytes)",
                 qUtf8Printable(path), static_cast<long long>(info.size()));
        return Error{ErrorCode::CorruptInput,
                     QStringLiteral("File size %1 bytes exceeds limit of %2 bytes")
                         .arg(info.size())
                         .arg(maxBytes)};
    }

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        if (file.error() == QFileDevice::PermissionsError) {
            return Error{ErrorCode::PermissionDenied,
                         QStringLiteral("Failed to open file: %1").arg(file.errorString())};
        }
        return Error{ErrorCode::NotFound,
                     QStringLiteral("Failed to open file: %1").arg(file.errorString())};
    }

    QByteArray bytes = file.readAll();
    file.close();
    return bytes;
}

} // namespace dw
