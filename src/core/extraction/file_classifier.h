#pragma once

#include "core/shared/types.h"

#include <QByteArray>
#include <QString>

#include <optional>

namespace dw {

// Pure classification from path and leading content bytes. The extension
// wins when it is known; otherwise the head of the file is sniffed.
// Returns nullopt for anything that is not one of the supported types.
std::optional<FileType> classifyFileType(const QString& path, const QByteArray& head);

// True when the extension alone identifies a supported type.
bool hasSupportedExtension(const QString& path);

} // namespace dw
