#pragma once

#include "core/embedding/embedder.h"

#include <QString>

#include <atomic>
#include <cstdint>
#include <memory>
#include <vector>

namespace dw {

class WordPieceTokenizer;

struct EmbeddingCircuitBreaker {
    std::atomic<int> consecutiveFailures{0};
    std::atomic<int64_t> lastFailureTime{0};
    static constexpr int kOpenThreshold = 5;          // Open after 5 consecutive failures
    static constexpr int kHalfOpenDelayMs = 30000;    // Try again after 30s

    bool isOpen() const;
    void recordSuccess();
    void recordFailure();
};

struct EmbeddingModelConfig {
    QString modelDir;                 // holds model.onnx + vocab.txt
    QString modelId = QStringLiteral("all-MiniLM-L6-v2");
    int dimensions = 384;
    int maxSequenceLength = 256;
    int batchSize = 32;
};

// EmbeddingManager -- sentence-transformer inference through ONNX Runtime.
//
// Pools the model output by shape: [batch, dim] is used as-is, and
// [batch, seq, dim] is mean-pooled over the attention mask. Every vector
// is L2-normalised.
class EmbeddingManager : public Embedder {
public:
    explicit EmbeddingManager(const EmbeddingModelConfig& config);
    ~EmbeddingManager() override;

    EmbeddingManager(const EmbeddingManager&) = delete;
    EmbeddingManager& operator=(const EmbeddingManager&) = delete;

    bool initialize();
    bool isAvailable() const;

    int dimensions() const override;
    QString modelId() const override;

    std::vector<float> encode(const QString& text) override;
    std::vector<std::vector<float>> encodeBatch(const std::vector<QString>& texts) override;

    EmbeddingCircuitBreaker& circuitBreaker() { return m_circuitBreaker; }

private:
    std::vector<std::vector<float>> runBatch(const std::vector<QString>& texts);

    class Impl;
    std::unique_ptr<Impl> m_impl;

    EmbeddingModelConfig m_config;
    std::unique_ptr<WordPieceTokenizer> m_tokenizer;
    bool m_available = false;
    EmbeddingCircuitBreaker m_circuitBreaker;
};

// In-place L2 normalisation; zero vectors are left untouched.
void normalizeVector(std::vector<float>& vector);

} // namespace dw
