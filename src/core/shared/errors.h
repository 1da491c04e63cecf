#pragma once

#include <QString>

#include <optional>
#include <utility>

namespace dw {

enum class ErrorCode {
    UnsupportedType,
    CorruptInput,
    NotFound,
    PermissionDenied,
    EmbeddingFailed,
    DimensionMismatch,
    EmptyIndex,
    NoDocumentsIndexed,
    GenerationError,
    StorageError,
    Cancelled,
    InvalidArgument,
};

QString errorCodeToString(ErrorCode code);

struct Error {
    ErrorCode code = ErrorCode::StorageError;
    QString message;

    QString toString() const;
};

// Per-file failures are recoverable (the file is skipped and reported);
// everything else aborts the operation that raised it.
bool isPerFileError(ErrorCode code);

// Result<T> -- value-or-error return used across module boundaries.
// Exactly one of value() / error() is meaningful.
template <typename T>
class Result {
public:
    Result(T value)
        : m_value(std::move(value))
    {
    }

    Result(Error error)
        : m_error(std::move(error))
    {
    }

    bool ok() const { return m_value.has_value(); }
    explicit operator bool() const { return ok(); }

    T& value() & { return *m_value; }
    const T& value() const& { return *m_value; }
    T&& value() && { return std::move(*m_value); }

    const T* operator->() const { return &*m_value; }
    T* operator->() { return &*m_value; }

    const Error& error() const { return *m_error; }

private:
    std::optional<T> m_value;
    std::optional<Error> m_error;
};

} // namespace dw
