#include "core/extraction/file_classifier.h"

#include <QFileInfo>
#include <QHash>

namespace dw {

namespace {

const QHash<QString, FileType>& extensionTable()
{
    static const QHash<QString, FileType> table = {
        {QStringLiteral("pdf"), FileType::Pdf},

        {QStringLiteral("txt"), FileType::Text},
        {QStringLiteral("text"), FileType::Text},
        {QStringLiteral("md"), FileType::Text},
        {QStringLiteral("markdown"), FileType::Text},
        {QStringLiteral("rst"), FileType::Text},
        {QStringLiteral("log"), FileType::Text},

        {QStringLiteral("csv"), FileType::Tabular},
        {QStringLiteral("tsv"), FileType::Tabular},

        {QStringLiteral("xlsx"), FileType::Spreadsheet},
        {QStringLiteral("xlsm"), FileType::Spreadsheet},

        {QStringLiteral("docx"), FileType::Word},

        {QStringLiteral("json"), FileType::StructuredRecord},
        {QStringLiteral("jsonl"), FileType::StructuredRecord},
        {QStringLiteral("ndjson"), FileType::StructuredRecord},
    };
    return table;
}

bool looksLikeText(const QByteArray& head)
{
    if (head.isEmpty()) {
        return false;
    }

    int controlBytes = 0;
    for (const char c : head) {
        const auto byte = static_cast<unsigned char>(c);
        if (byte == 0) {
            return false;
        }
        if (byte < 0x20 && byte != '\n' && byte != '\r' && byte != '\t' && byte != '\f') {
            ++controlBytes;
        }
    }
    return controlBytes * 50 <= head.size();
}

} // namespace

bool hasSupportedExtension(const QString& path)
{
    return extensionTable().contains(QFileInfo(path).suffix().toLower());
}

std::optional<FileType> classifyFileType(const QString& path, const QByteArray& head)
{
    const QString extension = QFileInfo(path).suffix().toLower();
    const auto it = extensionTable().constFind(extension);
    if (it != extensionTable().constEnd()) {
        return it.value();
    }

    if (head.startsWith("%PDF-")) {
        return FileType::Pdf;
    }

    const QByteArray trimmed = head.trimmed();
    if (trimmed.startsWith('{') || trimmed.startsWith('[')) {
        return FileType::StructuredRecord;
    }

    // Zip containers (docx/xlsx) need their extension; sniffing the archive
    // directory is not attempted.
    if (looksLikeText(head)) {
        return FileType::Text;
    }
    return std::nullopt;
}

} // namespace dw
