#pragma once

#include <QString>
#include <cstdint>

namespace dw {

struct Settings {
    // Storage
    QString storeDir;
    QString dataDir;

    // Embedding model (directory holding model.onnx and vocab.txt)
    QString modelDir;
    QString embeddingModelId = QStringLiteral("all-MiniLM-L6-v2");
    int embeddingDimensions = 384;
    int embeddingMaxTokens = 256;

    // Extraction limits
    int64_t maxFileSize = 104857600;         // 100 MB

    // Chunking
    int chunkTargetSize = 1000;
    int chunkMinSize = 500;
    int chunkMaxSize = 2000;
    int rowsPerChunk = 10;
    int paragraphsPerChunk = 5;
    int recordChunkBudget = 1000;

    // Document summaries
    int maxTopics = 20;
    int summaryMaxChars = 2000;

    // Search
    int maxContextChars = 6000;
    bool refreshBeforeQuery = true;

    // Generation (OpenAI-compatible chat completions)
    QString generationEndpoint = QStringLiteral("https://api.groq.com/openai/v1/chat/completions");
    QString generationModel = QStringLiteral("llama-3.1-8b-instant");
    QString apiKeyEnv = QStringLiteral("GROQ_API_KEY");
    int generationTimeoutMs = 60000;
    int generationMaxAttempts = 3;
    int initialBackoffMs = 1000;
    int maxBackoffMs = 8000;
    double temperature = 0.1;
    int maxTokens = 1024;
};

} // namespace dw
