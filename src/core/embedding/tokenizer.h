#pragma once

#include <QString>
#include <QStringList>

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace dw {

struct TokenizerOutput {
    std::vector<int64_t> inputIds;
    std::vector<int64_t> attentionMask;
    std::vector<int64_t> tokenTypeIds;
    int seqLength = 0;
};

struct BatchTokenizerOutput {
    std::vector<int64_t> inputIds;
    std::vector<int64_t> attentionMask;
    std::vector<int64_t> tokenTypeIds;
    int batchSize = 0;
    int seqLength = 0;
};

// BERT-style uncased WordPiece tokenizer. Special token ids are resolved
// from the vocabulary; sequences are truncated to maxSequenceLength
// including [CLS] and [SEP].
class WordPieceTokenizer {
public:
    explicit WordPieceTokenizer(const QString& vocabPath, int maxSequenceLength = 256);

    bool isLoaded() const;
    int vocabSize() const;

    TokenizerOutput tokenize(const QString& text) const;
    BatchTokenizerOutput tokenizeBatch(const std::vector<QString>& texts) const;

private:
    QString normalize(const QString& text) const;
    QStringList splitWords(const QString& normalizedText) const;
    std::vector<int64_t> tokenizeContent(const QString& normalizedText) const;
    void appendWordPieces(const QString& word, std::vector<int64_t>* output) const;
    int64_t specialId(const char* token, int64_t fallback) const;

    std::unordered_map<std::string, int> m_vocab;
    int m_maxSequenceLength = 256;
    int64_t m_padId = 0;
    int64_t m_unkId = 100;
    int64_t m_clsId = 101;
    int64_t m_sepId = 102;
    bool m_loaded = false;
};

} // namespace dw
