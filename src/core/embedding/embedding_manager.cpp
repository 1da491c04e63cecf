#include "core/embedding/embedding_manager.h"
#include "core/embedding/tokenizer.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>

#include <onnxruntime_cxx_api.h>

#include <algorithm>
#include <chrono>
#include <cmath>

namespace dw {

namespace {

int64_t steadyNowMs()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}

Ort::Env& ortEnvironment()
{
    static Ort::Env env(ORT_LOGGING_LEVEL_WARNING, "docweave-embedding");
    return env;
}

} // namespace

bool EmbeddingCircuitBreaker::isOpen() const
{
    if (consecutiveFailures.load() < kOpenThreshold) {
        return false;
    }
    // Half-open once the delay has elapsed: allow one attempt through.
    return steadyNowMs() - lastFailureTime.load() < kHalfOpenDelayMs;
}

void EmbeddingCircuitBreaker::recordSuccess()
{
    consecutiveFailures.store(0);
}

void EmbeddingCircuitBreaker::recordFailure()
{
    consecutiveFailures.fetch_add(1);
    lastFailureTime.store(steadyNowMs());
}

void normalizeVector(std::vector<float>& vector)
{
    double sumSquares = 0.0;
    for (const float value : vector) {
        sumSquares += static_cast<double>(value) * static_cast<double>(value);
    }

    const double norm = std::sqrt(sumSquares);
    if (norm <= 0.0) {
        return;
    }

    for (float& value : vector) {
        value = static_cast<float>(static_cast<double>(value) / norm);
    }
}

class EmbeddingManager::Impl {
public:
    Ort::SessionOptions sessionOptions;
    std::unique_ptr<Ort::Session> session;
    std::vector<std::string> inputNames;
    std::string outputName;
};

EmbeddingManager::EmbeddingManager(const EmbeddingModelConfig& config)
    : m_impl(std::make_unique<Impl>())
    , m_config(config)
{
}

EmbeddingManager::~EmbeddingManager() = default;

bool EmbeddingManager::initialize()
{
    const QDir modelDir(m_config.modelDir);
    const QString modelPath = modelDir.filePath(QStringLiteral("model.onnx"));
    const QString vocabPath = modelDir.filePath(QStringLiteral("vocab.txt"));

    if (!QFile::exists(modelPath) || !QFile::exists(vocabPath)) {
        LOG_WARN(dwCore, "EmbeddingManager: model.onnx or vocab.txt missing in %s",
                 qUtf8Printable(m_config.modelDir));
        m_available = false;
        return false;
    }

    if (m_config.dimensions <= 0) {
        LOG_WARN(dwCore, "EmbeddingManager: invalid dimensions %d", m_config.dimensions);
        m_available = false;
        return false;
    }

    m_tokenizer = std::make_unique<WordPieceTokenizer>(vocabPath, m_config.maxSequenceLength);
    if (!m_tokenizer->isLoaded()) {
        LOG_WARN(dwCore, "EmbeddingManager: tokenizer failed to load %s", qUtf8Printable(vocabPath));
        m_available = false;
        return false;
    }

    try {
        m_impl->sessionOptions.SetIntraOpNumThreads(2);
        m_impl->sessionOptions.SetInterOpNumThreads(1);
        m_impl->sessionOptions.SetExecutionMode(ExecutionMode::ORT_SEQUENTIAL);
        m_impl->sessionOptions.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);

        const std::string pathUtf8 = modelPath.toStdString();
        m_impl->session = std::make_unique<Ort::Session>(ortEnvironment(), pathUtf8.c_str(),
                                                         m_impl->sessionOptions);

        Ort::AllocatorWithDefaultOptions allocator;
        m_impl->inputNames.clear();
        for (size_t i = 0; i < m_impl->session->GetInputCount(); ++i) {
            Ort::AllocatedStringPtr name = m_impl->session->GetInputNameAllocated(i, allocator);
            m_impl->inputNames.emplace_back(name.get());
        }

        if (m_impl->session->GetOutputCount() == 0) {
            LOG_WARN(dwCore, "EmbeddingManager: model has no outputs");
            m_available = false;
            return false;
        }
        Ort::AllocatedStringPtr outputName = m_impl->session->GetOutputNameAllocated(0, allocator);
        m_impl->outputName = outputName.get();
    } catch (const Ort::Exception& ex) {
        LOG_WARN(dwCore, "EmbeddingManager: session creation failed: %s", ex.what());
        m_impl->session.reset();
        m_available = false;
        return false;
    }

    LOG_INFO(dwCore, "EmbeddingManager ready: model=%s dims=%d",
             qUtf8Printable(m_config.modelId), m_config.dimensions);
    m_available = true;
    return true;
}

bool EmbeddingManager::isAvailable() const
{
    return m_available;
}

int EmbeddingManager::dimensions() const
{
    return m_config.dimensions;
}

QString EmbeddingManager::modelId() const
{
    return m_config.modelId;
}

std::vector<float> EmbeddingManager::encode(const QString& text)
{
    std::vector<std::vector<float>> result = encodeBatch({text});
    if (result.size() != 1) {
        return {};
    }
    return std::move(result.front());
}

std::vector<std::vector<float>> EmbeddingManager::encodeBatch(const std::vector<QString>& texts)
{
    if (!m_available || texts.empty()) {
        return {};
    }

    std::vector<std::vector<float>> embeddings;
    embeddings.reserve(texts.size());

    const size_t batchSize = static_cast<size_t>(std::max(m_config.batchSize, 1));
    for (size_t start = 0; start < texts.size(); start += batchSize) {
        const size_t end = std::min(texts.size(), start + batchSize);
        const std::vector<QString> slice(texts.begin() + static_cast<std::ptrdiff_t>(start),
                                         texts.begin() + static_cast<std::ptrdiff_t>(end));
        std::vector<std::vector<float>> part = runBatch(slice);
        if (part.size() != slice.size()) {
            return {};
        }
        for (std::vector<float>& embedding : part) {
            embeddings.push_back(std::move(embedding));
        }
    }
    return embeddings;
}

std::vector<std::vector<float>> EmbeddingManager::runBatch(const std::vector<QString>& texts)
{
    if (m_circuitBreaker.isOpen()) {
        LOG_WARN(dwCore, "EmbeddingManager circuit breaker is open, skipping inference");
        return {};
    }

    const BatchTokenizerOutput tokenized = m_tokenizer->tokenizeBatch(texts);
    if (tokenized.batchSize <= 0 || tokenized.seqLength <= 0) {
        return {};
    }

    const int64_t inputShape[2] = {
        static_cast<int64_t>(tokenized.batchSize),
        static_cast<int64_t>(tokenized.seqLength),
    };

    try {
        Ort::MemoryInfo memoryInfo = Ort::MemoryInfo::CreateCpu(OrtAllocatorType::OrtArenaAllocator,
                                                                 OrtMemTypeDefault);

        std::vector<Ort::Value> inputs;
        std::vector<const char*> inputNames;
        for (const std::string& name : m_impl->inputNames) {
            const std::vector<int64_t>* source = nullptr;
            if (name == "input_ids") {
                source = &tokenized.inputIds;
            } else if (name == "attention_mask") {
                source = &tokenized.attentionMask;
            } else if (name == "token_type_ids") {
                source = &tokenized.tokenTypeIds;
            } else {
                LOG_WARN(dwCore, "EmbeddingManager: unexpected model input %s", name.c_str());
                m_circuitBreaker.recordFailure();
                return {};
            }
            inputs.push_back(Ort::Value::CreateTensor<int64_t>(
                memoryInfo,
                const_cast<int64_t*>(source->data()),
                source->size(),
                inputShape,
                2));
            inputNames.push_back(name.c_str());
        }

        const char* outputNames[1] = {m_impl->outputName.c_str()};
        std::vector<Ort::Value> outputs = m_impl->session->Run(
            Ort::RunOptions{nullptr},
            inputNames.data(),
            inputs.data(),
            inputs.size(),
            outputNames,
            1);

        if (outputs.empty() || !outputs[0].IsTensor()) {
            LOG_WARN(dwCore, "EmbeddingManager inference failed: missing tensor output");
            m_circuitBreaker.recordFailure();
            return {};
        }

        const std::vector<int64_t> shape = outputs[0].GetTensorTypeAndShapeInfo().GetShape();
        const float* data = outputs[0].GetTensorData<float>();
        const int64_t dims = m_config.dimensions;
        const int64_t batch = tokenized.batchSize;

        std::vector<std::vector<float>> embeddings;
        embeddings.reserve(static_cast<size_t>(batch));

        if (shape.size() == 2 && shape[0] == batch && shape[1] == dims) {
            for (int64_t i = 0; i < batch; ++i) {
                const float* row = data + i * dims;
                std::vector<float> embedding(row, row + dims);
                normalizeVector(embedding);
                embeddings.push_back(std::move(embedding));
            }
        } else if (shape.size() == 3 && shape[0] == batch && shape[2] == dims && shape[1] >= 1) {
            const int64_t seqLen = shape[1];
            for (int64_t i = 0; i < batch; ++i) {
                std::vector<float> embedding(static_cast<size_t>(dims), 0.0f);
                double tokens = 0.0;
                for (int64_t t = 0; t < seqLen; ++t) {
                    if (tokenized.attentionMask[static_cast<size_t>(i * seqLen + t)] == 0) {
                        continue;
                    }
                    const float* token = data + (i * seqLen + t) * dims;
                    for (int64_t j = 0; j < dims; ++j) {
                        embedding[static_cast<size_t>(j)] += token[j];
                    }
                    tokens += 1.0;
                }
                if (tokens > 0.0) {
                    for (float& value : embedding) {
                        value = static_cast<float>(value / tokens);
                    }
                }
                normalizeVector(embedding);
                embeddings.push_back(std::move(embedding));
            }
        } else {
            LOG_WARN(dwCore, "EmbeddingManager inference failed: unsupported output shape");
            m_circuitBreaker.recordFailure();
            return {};
        }

        m_circuitBreaker.recordSuccess();
        return embeddings;
    } catch (const Ort::Exception& ex) {
        LOG_WARN(dwCore, "EmbeddingManager inference failed: %s", ex.what());
        m_circuitBreaker.recordFailure();
        return {};
    }
}

} // namespace dw
