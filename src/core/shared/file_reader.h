#pragma once

#include "core/shared/errors.h"

#include <QByteArray>
#include <QString>

#include <cstdint>

namespace dw {

// Reads the raw bytes of a regular file. Fails with NotFound when the path
// is missing or not a regular file, PermissionDenied when it cannot be
// opened, and CorruptInput when it exceeds maxBytes (0 = unlimited).
Result<QByteArray> readFileBytes(const QString& path, int64_t maxBytes = 0);

} // namespace dw
