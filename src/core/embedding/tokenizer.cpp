#include "core/embedding/tokenizer.h"

#include <QDebug>
#include <QFile>
#include <QRegularExpression>
#include <QStringConverter>
#include <QTextStream>

#include <algorithm>
#include <utility>

namespace dw {

namespace {

bool isPunctuation(QChar ch)
{
    const ushort code = ch.unicode();
    if ((code >= 33 && code <= 47) || (code >= 58 && code <= 64)
        || (code >= 91 && code <= 96) || (code >= 123 && code <= 126)) {
        return true;
    }
    return ch.isPunct();
}

} // namespace

WordPieceTokenizer::WordPieceTokenizer(const QString& vocabPath, int maxSequenceLength)
    : m_maxSequenceLength(std::max(maxSequenceLength, 8))
{
    QFile file(vocabPath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qWarning() << "WordPieceTokenizer failed to open vocab:" << vocabPath;
        return;
    }

    QTextStream in(&file);
    in.setEncoding(QStringConverter::Utf8);

    int index = 0;
    while (!in.atEnd()) {
        const QString token = in.readLine().trimmed();
        if (!token.isEmpty()) {
            m_vocab.emplace(token.toStdString(), index);
        }
        ++index;
    }

    if (m_vocab.empty()) {
        qWarning() << "WordPieceTokenizer loaded empty vocab from" << vocabPath;
        return;
    }

    m_padId = specialId("[PAD]", 0);
    m_unkId = specialId("[UNK]", 100);
    m_clsId = specialId("[CLS]", 101);
    m_sepId = specialId("[SEP]", 102);
    m_loaded = true;
}

bool WordPieceTokenizer::isLoaded() const
{
    return m_loaded;
}

int WordPieceTokenizer::vocabSize() const
{
    return static_cast<int>(m_vocab.size());
}

int64_t WordPieceTokenizer::specialId(const char* token, int64_t fallback) const
{
    const auto it = m_vocab.find(token);
    return it != m_vocab.end() ? static_cast<int64_t>(it->second) : fallback;
}

QString WordPieceTokenizer::normalize(const QString& text) const
{
    const QString decomposed = text.toLower().normalized(QString::NormalizationForm_D);

    QString stripped;
    stripped.reserve(decomposed.size());
    for (const QChar ch : decomposed) {
        const QChar::Category category = ch.category();
        if (category == QChar::Mark_NonSpacing
            || category == QChar::Mark_SpacingCombining
            || category == QChar::Mark_Enclosing) {
            continue;
        }
        if (ch.unicode() < 0x20 && ch != QLatin1Char('\t') && ch != QLatin1Char('\n')) {
            continue;
        }
        stripped.append(ch);
    }

    static const QRegularExpression whitespaceRegex(QStringLiteral("\\s+"));
    stripped.replace(whitespaceRegex, QStringLiteral(" "));
    return stripped.trimmed();
}

QStringList WordPieceTokenizer::splitWords(const QString& normalizedText) const
{
    // Whitespace split, then every punctuation character becomes its own word.
    QStringList words;
    QString current;
    for (const QChar ch : normalizedText) {
        if (ch == QLatin1Char(' ')) {
            if (!current.isEmpty()) {
                words.append(current);
                current.clear();
            }
        } else if (isPunctuation(ch)) {
            if (!current.isEmpty()) {
                words.append(current);
                current.clear();
            }
            words.append(QString(ch));
        } else {
            current.append(ch);
        }
    }
    if (!current.isEmpty()) {
        words.append(current);
    }
    return words;
}

void WordPieceTokenizer::appendWordPieces(const QString& word, std::vector<int64_t>* output) const
{
    const int maxContent = m_maxSequenceLength - 2;
    if (!output || word.isEmpty() || static_cast<int>(output->size()) >= maxContent) {
        return;
    }

    // Overlong words map straight to [UNK], as in the reference BERT tokenizer.
    if (word.size() > 100) {
        output->push_back(m_unkId);
        return;
    }

    std::vector<int64_t> pieces;
    int start = 0;
    while (start < word.size()) {
        int end = word.size();
        int matchedId = -1;

        while (end > start) {
            QString piece = word.mid(start, end - start);
            if (start > 0) {
                piece.prepend(QStringLiteral("##"));
            }
            const auto it = m_vocab.find(piece.toStdString());
            if (it != m_vocab.end()) {
                matchedId = it->second;
                break;
            }
            --end;
        }

        if (matchedId < 0) {
            pieces.assign(1, m_unkId);
            break;
        }
        pieces.push_back(static_cast<int64_t>(matchedId));
        start = end;
    }

    for (const int64_t id : pieces) {
        if (static_cast<int>(output->size()) >= maxContent) {
            break;
        }
        output->push_back(id);
    }
}

std::vector<int64_t> WordPieceTokenizer::tokenizeContent(const QString& normalizedText) const
{
    std::vector<int64_t> content;
    if (!m_loaded || normalizedText.isEmpty()) {
        return content;
    }

    const int maxContent = m_maxSequenceLength - 2;
    for (const QString& word : splitWords(normalizedText)) {
        if (static_cast<int>(content.size()) >= maxContent) {
            break;
        }
        appendWordPieces(word, &content);
    }
    return content;
}

TokenizerOutput WordPieceTokenizer::tokenize(const QString& text) const
{
    TokenizerOutput output;
    if (!m_loaded) {
        return output;
    }

    const std::vector<int64_t> content = tokenizeContent(normalize(text));

    output.inputIds.reserve(content.size() + 2);
    output.inputIds.push_back(m_clsId);
    output.inputIds.insert(output.inputIds.end(), content.begin(), content.end());
    output.inputIds.push_back(m_sepId);

    output.seqLength = static_cast<int>(output.inputIds.size());
    output.attentionMask.assign(output.inputIds.size(), 1);
    output.tokenTypeIds.assign(output.inputIds.size(), 0);
    return output;
}

BatchTokenizerOutput WordPieceTokenizer::tokenizeBatch(const std::vector<QString>& texts) const
{
    BatchTokenizerOutput batch;
    if (!m_loaded || texts.empty()) {
        return batch;
    }

    std::vector<TokenizerOutput> rows;
    rows.reserve(texts.size());
    int maxLength = 0;
    for (const QString& text : texts) {
        TokenizerOutput row = tokenize(text);
        maxLength = std::max(maxLength, row.seqLength);
        rows.push_back(std::move(row));
    }

    batch.batchSize = static_cast<int>(texts.size());
    batch.seqLength = maxLength;
    const size_t total = static_cast<size_t>(batch.batchSize) * static_cast<size_t>(maxLength);
    batch.inputIds.reserve(total);
    batch.attentionMask.reserve(total);
    batch.tokenTypeIds.reserve(total);

    for (TokenizerOutput& row : rows) {
        row.inputIds.resize(static_cast<size_t>(maxLength), m_padId);
        row.attentionMask.resize(static_cast<size_t>(maxLength), 0);
        row.tokenTypeIds.resize(static_cast<size_t>(maxLength), 0);

        batch.inputIds.insert(batch.inputIds.end(), row.inputIds.begin(), row.inputIds.end());
        batch.attentionMask.insert(batch.attentionMask.end(), row.attentionMask.begin(), row.attentionMask.end());
        batch.tokenTypeIds.insert(batch.tokenTypeIds.end(), row.tokenTypeIds.begin(), row.tokenTypeIds.end());
    }

    return batch;
}

} // namespace dw
