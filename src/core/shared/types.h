#pragma once

#include <QString>
#include <optional>

namespace dw {

// Analysis strategy is selected per file type; see classifyFileType().
enum class FileType {
    Pdf,
    Text,
    Tabular,
    Spreadsheet,
    Word,
    StructuredRecord,
};

QString fileTypeToString(FileType type);
std::optional<FileType> fileTypeFromString(const QString& str);

// Retrieval breadth for one question.
enum class AnalysisDepth {
    Quick,
    Standard,
    Deep,
};

struct DepthParameters {
    int numDocuments = 0;
    int numChunks = 0;
};

QString analysisDepthToString(AnalysisDepth depth);
std::optional<AnalysisDepth> parseAnalysisDepth(const QString& str);
DepthParameters depthParameters(AnalysisDepth depth);

} // namespace dw
