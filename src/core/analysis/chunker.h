#pragma once

#include <QString>
#include <cstddef>
#include <vector>

namespace dw {

// Character budgets per span. A span ends at the last boundary before
// targetSize, preferably past minSize, and never exceeds maxSize. A tail
// shorter than minSize joins the span before it when both fit in maxSize.
struct ChunkerConfig {
    size_t targetSize = 1000;
    size_t minSize = 500;
    size_t maxSize = 2000;
};

struct TextSpan {
    QString text;
    size_t offset = 0;
};

// Chunker -- splits prose into sized spans for embedding.
//
// Boundaries are tried in order: blank line, end of sentence, newline,
// space. With none in reach the span is cut hard at maxSize.
//
// Spans do not overlap; neighbouring context is reached through the
// chunk prev/next links. Returned spans are trimmed and never empty.
class Chunker {
public:
    using Config = ChunkerConfig;

    explicit Chunker(const Config& config = {});

    std::vector<TextSpan> split(const QString& content) const;

    const Config& config() const { return m_config; }

private:
    // Start of the next span, looked for backwards from `limit`.
    size_t boundaryBefore(const QString& content, size_t spanStart, size_t limit) const;

    Config m_config;
};

} // namespace dw
