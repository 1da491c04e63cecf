#include "core/shared/errors.h"

namespace dw {

QString errorCodeToString(ErrorCode code)
{
    switch (code) {
    case ErrorCode::UnsupportedType:    return QStringLiteral("UnsupportedType");
    case ErrorCode::CorruptInput:       return QStringLiteral("CorruptInput");
    case ErrorCode::NotFound:           return QStringLiteral("NotFound");
    case ErrorCode::PermissionDenied:   return QStringLiteral("PermissionDenied");
    case ErrorCode::EmbeddingFailed:    return QStringLiteral("EmbeddingFailed");
    case ErrorCode::DimensionMismatch:  return QStringLiteral("DimensionMismatch");
    case ErrorCode::EmptyIndex:         return QStringLiteral("EmptyIndex");
    case ErrorCode::NoDocumentsIndexed: return QStringLiteral("NoDocumentsIndexed");
    case ErrorCode::GenerationError:    return QStringLiteral("GenerationError");
    case ErrorCode::StorageError:       return QStringLiteral("StorageError");
    case ErrorCode::Cancelled:          return QStringLiteral("Cancelled");
    case ErrorCode::InvalidArgument:    return QStringLiteral("InvalidArgument");
    }
    return QStringLiteral("Unknown");
}

QString Error::toString() const
{
    if (message.isEmpty()) {
        return errorCodeToString(code);
    }
    return QStringLiteral("%1: %2").arg(errorCodeToString(code), message);
}

bool isPerFileError(ErrorCode code)
{
    switch (code) {
    case ErrorCode::UnsupportedType:
    case ErrorCode::CorruptInput:
    case ErrorCode::NotFound:
    case ErrorCode::PermissionDenied:
    case ErrorCode::EmbeddingFailed:
        return true;
    default:
        return false;
    }
}

} // namespace dw
