#include "core/search/context_assembler.h"
#include "core/shared/logging.h"

#include <algorithm>

namespace dw {

namespace {

constexpr int kFallbackDocuments = 3;
constexpr int kFallbackSummaryChars = 300;
constexpr int kFallbackChunks = 5;
constexpr int kFallbackChunkChars = 200;

const QString kEllipsis = QStringLiteral("...");

QStringList documentOrder(const std::vector<BalancedChunk>& chunks)
{
    QStringList order;
    for (const BalancedChunk& chunk : chunks) {
        if (!order.contains(chunk.documentId)) {
            order.append(chunk.documentId);
        }
    }
    return order;
}

QString locatorTag(const BalancedChunk& chunk)
{
    if (chunk.locator.isEmpty()) {
        return QStringLiteral("[chunk %1]").arg(chunk.sequenceIndex + 1);
    }
    return QStringLiteral("[%1]").arg(chunk.locator);
}

} // namespace

ContextAssembler::ContextAssembler(int maxChars)
    : m_maxChars(std::max(maxChars, 1))
{
}

QString ContextAssembler::render(const std::vector<BalancedChunk>& chunks,
                                 const QHash<QString, ContextDocument>& documents,
                                 bool withNotes) const
{
    QStringList blocks;
    for (const QString& documentId : documentOrder(chunks)) {
        const ContextDocument document = documents.value(documentId);
        const QString name = document.fileName.isEmpty() ? documentId : document.fileName;

        QStringList lines;
        lines.append(QStringLiteral("=== DOCUMENT: %1 ===").arg(name));
        if (withNotes && !document.summary.isEmpty()) {
            lines.append(QStringLiteral("Summary: %1").arg(document.summary.left(kSummaryChars)));
        }
        if (withNotes && !document.topics.isEmpty()) {
            lines.append(QStringLiteral("Key Topics: %1")
                             .arg(document.topics.mid(0, kSummaryTopics).join(QStringLiteral(", "))));
        }
        for (const BalancedChunk& chunk : chunks) {
            if (chunk.documentId == documentId) {
                lines.append(QString());
                lines.append(QStringLiteral("%1 %2").arg(locatorTag(chunk), chunk.text));
            }
        }
        blocks.append(lines.join(QLatin1Char('\n')));
    }
    return blocks.join(QStringLiteral("\n\n"));
}

AssembledContext ContextAssembler::assemble(const std::vector<BalancedChunk>& chunks,
                                            const QHash<QString, ContextDocument>& documents) const
{
    AssembledContext result;

    std::vector<BalancedChunk> surviving = chunks;
    std::stable_sort(surviving.begin(), surviving.end(),
                     [](const BalancedChunk& a, const BalancedChunk& b) { return a.rank < b.rank; });

    QString text = render(surviving, documents);
    while (text.size() > m_maxChars && surviving.size() > 1) {
        surviving.pop_back();
        ++result.droppedChunks;
        text = render(surviving, documents);
    }

    if (text.size() > m_maxChars && surviving.size() == 1) {
        const QString bare = render(surviving, documents, false);
        result.notesDropped = bare.size() < text.size();
        text = bare;
    }

    if (text.size() > m_maxChars && surviving.size() == 1) {
        BalancedChunk& only = surviving.front();
        const qsizetype overflow = text.size() - m_maxChars;
        const qsizetype keep = only.text.size() - overflow - kEllipsis.size();
        if (keep > 0) {
            only.text = only.text.left(keep) + kEllipsis;
            result.truncated = true;
            text = render(surviving, documents, false);
        } else {
            // Not even the header and locator of this chunk fit.
            surviving.clear();
            ++result.droppedChunks;
            text.clear();
        }
    }

    if (result.droppedChunks > 0 || result.notesDropped || result.truncated) {
        LOG_INFO(dwSearch, "Context budget %d: dropped %d chunk(s)%s%s", m_maxChars,
                 result.droppedChunks, result.notesDropped ? ", left out summary" : "",
                 result.truncated ? ", truncated last chunk" : "");
    }

    result.text = text;
    result.citations = documentOrder(surviving);
    for (const BalancedChunk& chunk : surviving) {
        result.perDocumentChunkCounts[chunk.documentId] += 1;
    }
    result.included = std::move(surviving);
    return result;
}

QString ContextAssembler::buildPrompt(const QString& context, const QString& question)
{
    return QStringLiteral(
               "You are an expert document analyst. Answer the user's question using the provided "
               "comprehensive context from multiple documents.\n"
               "\n"
               "CONTEXT INFORMATION:\n"
               "%1\n"
               "\n"
               "USER QUESTION: %2\n"
               "\n"
               "INSTRUCTIONS:\n"
               "1. Provide a comprehensive answer based on ALL relevant information from the context\n"
               "2. If the question requires analysis across multiple documents, synthesize information "
               "from all sources\n"
               "3. Include specific details, examples, and explanations when available\n"
               "4. If information is incomplete, clearly state what aspects need more information\n"
               "5. Cite specific documents or locations when referencing information\n"
               "6. Structure your response clearly with main points and supporting details\n"
               "\n"
               "ANSWER:")
        .arg(context, question);
}

QString ContextAssembler::buildFallbackAnswer(const QString& question,
                                              const std::vector<ContextDocument>& documents,
                                              const std::vector<BalancedChunk>& chunks)
{
    QStringList parts;
    parts.append(QStringLiteral("Based on the analysis of the documents, here's what I found regarding: '%1'\n")
                     .arg(question));

    if (!documents.empty()) {
        parts.append(QStringLiteral("RELEVANT DOCUMENTS:"));
        const size_t count = std::min(documents.size(), static_cast<size_t>(kFallbackDocuments));
        for (size_t i = 0; i < count; ++i) {
            parts.append(QStringLiteral("%1. %2: %3...")
                             .arg(i + 1)
                             .arg(documents[i].fileName, documents[i].summary.left(kFallbackSummaryChars)));
        }
    }

    if (!chunks.empty()) {
        parts.append(QStringLiteral("\nRELEVANT CONTENT:"));
        const size_t count = std::min(chunks.size(), static_cast<size_t>(kFallbackChunks));
        for (size_t i = 0; i < count; ++i) {
            parts.append(QStringLiteral("%1. %2 %3...")
                             .arg(i + 1)
                             .arg(locatorTag(chunks[i]), chunks[i].text.left(kFallbackChunkChars)));
        }
    }

    return parts.join(QStringLiteral("\n\n"));
}

} // namespace dw
