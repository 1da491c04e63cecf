#pragma once

#include "core/extraction/extracted_content.h"
#include "core/shared/errors.h"

#include <QByteArray>
#include <QString>

#include <vector>

namespace dw {

// DocxExtractor -- walks the body paragraphs of a .docx through duckx.
//
// Text comes from w:t runs, with w:br mapped to newline and w:tab to tab.
// The paragraph's w:pPr supplies the style id (Heading1..9 and Title give a
// heading level) and numbering (w:numPr marks a list item). Empty
// paragraphs are dropped.
//
// duckx only opens archives by path, so `bytes` is spilled to a private
// temporary file first; the file at `filePath` is never re-read.
class DocxExtractor {
public:
    static Result<std::vector<WordParagraph>> extract(const QString& filePath, const QByteArray& bytes);

    // "Heading2" -> 2, "Title" -> 1, anything else -> 0.
    static int headingLevelForStyle(const QString& styleId);
};

} // namespace dw
