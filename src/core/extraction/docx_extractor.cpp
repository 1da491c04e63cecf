#include "core/extraction/docx_extractor.h"
#include "core/shared/logging.h"

#include <duckx/duckx.hpp>

#include <QDir>
#include <QRegularExpression>
#include <QTemporaryFile>

#include <string>

namespace dw {

int DocxExtractor::headingLevelForStyle(const QString& styleId)
{
    const QString normalized = styleId.toLower().remove(QLatin1Char(' '));
    if (normalized == QLatin1String("title")) {
        return 1;
    }
    static const QRegularExpression headingStyle(QStringLiteral("^heading([1-9])$"));
    const QRegularExpressionMatch match = headingStyle.match(normalized);
    if (match.hasMatch()) {
        return match.captured(1).toInt();
    }
    return 0;
}

Result<std::vector<WordParagraph>> DocxExtractor::extract(const QString& filePath, const QByteArray& bytes)
{
    QTemporaryFile spill(QDir::tempPath() + QStringLiteral("/docweave-XXXXXX.docx"));
    if (!spill.open() || spill.write(bytes) != bytes.size() || !spill.flush()) {
        LOG_WARN(dwAnalysis, "Cannot stage %s for duckx: %s",
                 qUtf8Printable(filePath), qUtf8Printable(spill.errorString()));
        return Error{ErrorCode::StorageError, QStringLiteral("Cannot stage DOCX for reading")};
    }

    duckx::Document doc(QFile::encodeName(spill.fileName()).toStdString());
    doc.open();
    if (!doc.is_open()) {
        LOG_WARN(dwAnalysis, "duckx failed to open: %s", qUtf8Printable(filePath));
        return Error{ErrorCode::CorruptInput, QStringLiteral("Failed to open DOCX document")};
    }

    std::vector<WordParagraph> paragraphs;

    for (duckx::Paragraph& paragraph = doc.paragraphs(); paragraph.has_next(); paragraph.next()) {
        WordParagraph entry;
        bool propertiesRead = false;

        for (duckx::Run& run = paragraph.runs(); run.has_next(); run.next()) {
            const pugi::xml_node node = run.get_node();

            if (!propertiesRead) {
                const pugi::xml_node properties = node.parent().child("w:pPr");
                entry.styleId = QString::fromUtf8(
                    properties.child("w:pStyle").attribute("w:val").value());
                entry.listItem = static_cast<bool>(properties.child("w:numPr"));
                propertiesRead = true;
            }

            for (pugi::xml_node child = node.first_child(); child; child = child.next_sibling()) {
                const std::string name = child.name();
                if (name == "w:t") {
                    entry.text += QString::fromUtf8(child.text().get());
                } else if (name == "w:br") {
                    entry.text += QLatin1Char('\n');
                } else if (name == "w:tab") {
                    entry.text += QLatin1Char('\t');
                }
            }
        }

        entry.text = entry.text.trimmed();
        if (entry.text.isEmpty()) {
            continue;
        }
        entry.headingLevel = headingLevelForStyle(entry.styleId);
        if (entry.styleId.contains(QLatin1String("List"), Qt::CaseInsensitive)) {
            entry.listItem = true;
        }
        paragraphs.push_back(std::move(entry));
    }

    if (paragraphs.empty()) {
        return Error{ErrorCode::CorruptInput, QStringLiteral("DOCX has no text paragraphs")};
    }

    LOG_DEBUG(dwAnalysis, "Extracted %d paragraphs from %s",
              static_cast<int>(paragraphs.size()), qUtf8Printable(filePath));
    return paragraphs;
}

} // namespace dw
