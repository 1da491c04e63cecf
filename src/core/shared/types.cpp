#include "core/shared/types.h"

namespace dw {

QString fileTypeToString(FileType type)
{
    switch (type) {
    case FileType::Pdf:              return QStringLiteral("pdf");
    case FileType::Text:             return QStringLiteral("text");
    case FileType::Tabular:          return QStringLiteral("tabular");
    case FileType::Spreadsheet:      return QStringLiteral("spreadsheet");
    case FileType::Word:             return QStringLiteral("word");
    case FileType::StructuredRecord: return QStringLiteral("structured-record");
    }
    return QStringLiteral("text");
}

std::optional<FileType> fileTypeFromString(const QString& str)
{
    if (str == QLatin1String("pdf"))               return FileType::Pdf;
    if (str == QLatin1String("text"))              return FileType::Text;
    if (str == QLatin1String("tabular"))           return FileType::Tabular;
    if (str == QLatin1String("spreadsheet"))       return FileType::Spreadsheet;
    if (str == QLatin1String("word"))              return FileType::Word;
    if (str == QLatin1String("structured-record")) return FileType::StructuredRecord;
    return std::nullopt;
}

QString analysisDepthToString(AnalysisDepth depth)
{
    switch (depth) {
    case AnalysisDepth::Quick:    return QStringLiteral("quick");
    case AnalysisDepth::Standard: return QStringLiteral("standard");
    case AnalysisDepth::Deep:     return QStringLiteral("deep");
    }
    return QStringLiteral("deep");
}

std::optional<AnalysisDepth> parseAnalysisDepth(const QString& str)
{
    const QString normalized = str.trimmed().toLower();
    if (normalized == QLatin1String("quick"))    return AnalysisDepth::Quick;
    if (normalized == QLatin1String("standard")) return AnalysisDepth::Standard;
    if (normalized == QLatin1String("deep"))     return AnalysisDepth::Deep;
    return std::nullopt;
}

DepthParameters depthParameters(AnalysisDepth depth)
{
    switch (depth) {
    case AnalysisDepth::Quick:    return {2, 5};
    case AnalysisDepth::Standard: return {3, 8};
    case AnalysisDepth::Deep:     return {5, 15};
    }
    return {5, 15};
}

} // namespace dw
