#pragma once

#include <QString>

#include <optional>

namespace dw {

struct GenerationFailure {
    enum class Kind {
        RateLimit,
        Timeout,
        Service,
    };

    Kind kind = Kind::Service;
    int httpStatus = 0;          // 0 when no HTTP response was received
    QString message;

    bool isRetryable() const { return kind == Kind::RateLimit || kind == Kind::Timeout; }
};

QString generationFailureKindToString(GenerationFailure::Kind kind);

struct GenerationResponse {
    QString text;
    std::optional<GenerationFailure> failure;

    bool ok() const { return !failure.has_value(); }

    static GenerationResponse success(const QString& text) { return GenerationResponse{text, std::nullopt}; }
    static GenerationResponse error(GenerationFailure::Kind kind, int httpStatus, const QString& message)
    {
        return GenerationResponse{QString(), GenerationFailure{kind, httpStatus, message}};
    }
};

// GenerationClient -- external text generation capability. One call, one
// attempt; retry policy lives in GenerationRunner.
class GenerationClient {
public:
    virtual ~GenerationClient() = default;

    virtual GenerationResponse generate(const QString& prompt, int timeoutMs) = 0;
};

} // namespace dw
