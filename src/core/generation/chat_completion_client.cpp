#include "core/generation/chat_completion_client.h"
#include "core/shared/logging.h"
#include "core/shared/settings.h"

#include <cpr/cpr.h>

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QProcessEnvironment>

namespace dw {

namespace {

QString errorMessageFromBody(const std::string& body, long statusCode)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(QByteArray::fromStdString(body), &parseError);
    const QString fallback = QStringLiteral("HTTP %1").arg(statusCode);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        return fallback;
    }
    const QJsonValue error = doc.object().value(QStringLiteral("error"));
    if (!error.isObject()) {
        return fallback;
    }
    return error.toObject().value(QStringLiteral("message")).toString(fallback);
}

} // namespace

QString generationFailureKindToString(GenerationFailure::Kind kind)
{
    switch (kind) {
    case GenerationFailure::Kind::RateLimit: return QStringLiteral("RateLimit");
    case GenerationFailure::Kind::Timeout:   return QStringLiteral("Timeout");
    case GenerationFailure::Kind::Service:   return QStringLiteral("Service");
    }
    return QStringLiteral("Service");
}

ChatCompletionClient::ChatCompletionClient(ChatCompletionConfig config)
    : m_config(std::move(config))
{
}

ChatCompletionConfig ChatCompletionClient::configFromSettings(const Settings& settings)
{
    ChatCompletionConfig config;
    config.endpoint = settings.generationEndpoint;
    config.model = settings.generationModel;
    config.apiKey = QProcessEnvironment::systemEnvironment().value(settings.apiKeyEnv);
    config.temperature = settings.temperature;
    config.maxTokens = settings.maxTokens;
    return config;
}

GenerationResponse ChatCompletionClient::generate(const QString& prompt, int timeoutMs)
{
    using Kind = GenerationFailure::Kind;

    if (m_config.apiKey.isEmpty()) {
        return GenerationResponse::error(Kind::Service, 0,
                                         QStringLiteral("No API key configured for %1").arg(m_config.endpoint));
    }

    QJsonObject userMsg;
    userMsg.insert(QStringLiteral("role"), QStringLiteral("user"));
    userMsg.insert(QStringLiteral("content"), prompt);

    QJsonObject root;
    root.insert(QStringLiteral("model"), m_config.model);
    root.insert(QStringLiteral("temperature"), m_config.temperature);
    root.insert(QStringLiteral("max_tokens"), m_config.maxTokens);
    root.insert(QStringLiteral("messages"), QJsonArray{userMsg});

    const QByteArray jsonBytes = QJsonDocument(root).toJson(QJsonDocument::Compact);

    cpr::Header headers{
        {"Authorization", std::string("Bearer ") + m_config.apiKey.toStdString()},
        {"Content-Type", "application/json"}
    };

    auto response = cpr::Post(
        cpr::Url{m_config.endpoint.toStdString()},
        headers,
        cpr::Body{jsonBytes.toStdString()},
        cpr::ConnectTimeout{m_config.connectTimeoutMs},
        cpr::Timeout{timeoutMs});

    if (response.error) {
        const QString msg = QString::fromStdString(response.error.message);
        if (response.error.code == cpr::ErrorCode::OPERATION_TIMEDOUT) {
            LOG_WARN(dwGeneration, "Generation request timed out: %s", qUtf8Printable(msg));
            return GenerationResponse::error(Kind::Timeout, 0, QStringLiteral("Request timed out: %1").arg(msg));
        }
        LOG_WARN(dwGeneration, "Generation network error: %s", qUtf8Printable(msg));
        return GenerationResponse::error(Kind::Service, 0, QStringLiteral("Network error: %1").arg(msg));
    }

    const int status = static_cast<int>(response.status_code);
    if (status != 200) {
        const QString msg = errorMessageFromBody(response.text, response.status_code);
        LOG_WARN(dwGeneration, "Generation HTTP %d: %s", status, qUtf8Printable(msg));
        if (status == 429) {
            return GenerationResponse::error(Kind::RateLimit, status, msg);
        }
        if (status == 408 || status == 504) {
            return GenerationResponse::error(Kind::Timeout, status, msg);
        }
        return GenerationResponse::error(Kind::Service, status, msg);
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(QByteArray::fromStdString(response.text), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        return GenerationResponse::error(Kind::Service, status,
                                         QStringLiteral("Malformed response: %1").arg(parseError.errorString()));
    }

    // choices[0].message.content
    const QJsonArray choices = doc.object().value(QStringLiteral("choices")).toArray();
    if (choices.isEmpty() || !choices.at(0).isObject()) {
        return GenerationResponse::error(Kind::Service, status, QStringLiteral("Response has no choices"));
    }
    const QJsonObject message = choices.at(0).toObject().value(QStringLiteral("message")).toObject();
    const QString content = message.value(QStringLiteral("content")).toString();
    if (content.trimmed().isEmpty()) {
        return GenerationResponse::error(Kind::Service, status, QStringLiteral("Empty completion"));
    }
    return GenerationResponse::success(content.trimmed());
}

} // namespace dw
