#pragma once

#include "core/shared/errors.h"

#include <QByteArray>
#include <QString>

namespace dw {

// TextExtractor -- decodes plain-text bytes.
//
// UTF-8 is tried first (a BOM is honoured); on invalid sequences the bytes
// are re-read as Latin-1, which always succeeds. Content with NUL bytes is
// treated as binary and rejected as CorruptInput.
class TextExtractor {
public:
    static QString decode(const QByteArray& bytes);
    static Result<QString> extract(const QString& filePath, const QByteArray& bytes);
};

} // namespace dw
