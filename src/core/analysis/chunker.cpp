#include "core/analysis/chunker.h"

#include <algorithm>

namespace dw {

namespace {

enum class Boundary {
    Paragraph,
    Sentence,
    Line,
    Word,
};

constexpr Boundary kBoundaryOrder[] = {
    Boundary::Paragraph,
    Boundary::Sentence,
    Boundary::Line,
    Boundary::Word,
};

bool isSentenceEnd(QChar ch)
{
    return ch == QLatin1Char('.') || ch == QLatin1Char('!') || ch == QLatin1Char('?');
}

// True when a span may end right before `pos`.
bool endsAt(const QString& text, qsizetype pos, Boundary kind)
{
    const QChar before = text[pos - 1];
    switch (kind) {
    case Boundary::Paragraph:
        return pos >= 2 && before == QLatin1Char('\n') && text[pos - 2] == QLatin1Char('\n');
    case Boundary::Sentence:
        return pos < text.size() && isSentenceEnd(before)
            && (text[pos] == QLatin1Char(' ') || text[pos] == QLatin1Char('\n'));
    case Boundary::Line:
        return before == QLatin1Char('\n');
    case Boundary::Word:
        return before == QLatin1Char(' ');
    }
    return false;
}

} // namespace

Chunker::Chunker(const Config& config)
    : m_config(config)
{
    m_config.maxSize = std::max<size_t>(m_config.maxSize, 1);
    if (m_config.targetSize == 0 || m_config.targetSize > m_config.maxSize) {
        m_config.targetSize = m_config.maxSize;
    }
    m_config.minSize = std::min(m_config.minSize, m_config.targetSize);
}

std::vector<TextSpan> Chunker::split(const QString& content) const
{
    std::vector<TextSpan> spans;
    const auto length = static_cast<size_t>(content.size());

    for (size_t start = 0; start < length;) {
        const size_t left = length - start;
        size_t end = left <= m_config.targetSize
            ? length
            : boundaryBefore(content, start, start + m_config.targetSize);
        end = std::min(end, start + m_config.maxSize);

        if (end < length && length - end < m_config.minSize && left <= m_config.maxSize) {
            end = length;
        }

        QString text = content.mid(static_cast<qsizetype>(start), static_cast<qsizetype>(end - start))
                           .trimmed();
        if (!text.isEmpty()) {
            spans.push_back(TextSpan{std::move(text), start});
        }
        start = end;
    }
    return spans;
}

size_t Chunker::boundaryBefore(const QString& content, size_t spanStart, size_t limit) const
{
    size_t floor = spanStart + m_config.minSize;
    if (floor >= limit) {
        floor = spanStart;
    }

    for (const Boundary kind : kBoundaryOrder) {
        for (size_t pos = limit; pos > floor; --pos) {
            if (endsAt(content, static_cast<qsizetype>(pos), kind)) {
                return pos;
            }
        }
    }
    return limit;
}

} // namespace dw
