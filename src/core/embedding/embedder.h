#pragma once

#include <QString>

#include <vector>

namespace dw {

// Embedder -- text to fixed-length vector. Implementations must return
// L2-normalised vectors of exactly dimensions() floats, and must be pure
// with respect to the input text. An empty return signals failure.
class Embedder {
public:
    virtual ~Embedder() = default;

    virtual int dimensions() const = 0;
    virtual QString modelId() const = 0;

    virtual std::vector<float> encode(const QString& text) = 0;
    virtual std::vector<std::vector<float>> encodeBatch(const std::vector<QString>& texts) = 0;
};

} // namespace dw
