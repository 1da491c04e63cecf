#pragma once

#include "core/generation/generation_client.h"

#include <QString>

namespace dw {

struct Settings;

struct ChatCompletionConfig {
    QString endpoint;
    QString model;
    QString apiKey;
    double temperature = 0.1;
    int maxTokens = 1024;
    int connectTimeoutMs = 10000;
};

// ChatCompletionClient -- OpenAI-compatible /chat/completions over cpr.
//
// 429 maps to RateLimit; a transport timeout, 408 or 504 to Timeout;
// every other failure (network, HTTP, malformed body) to Service.
class ChatCompletionClient : public GenerationClient {
public:
    explicit ChatCompletionClient(ChatCompletionConfig config);

    // Endpoint/model/sampling from settings; the API key is read from the
    // environment variable named by settings.apiKeyEnv.
    static ChatCompletionConfig configFromSettings(const Settings& settings);

    GenerationResponse generate(const QString& prompt, int timeoutMs) override;

    const ChatCompletionConfig& config() const { return m_config; }

private:
    ChatCompletionConfig m_config;
};

} // namespace dw
