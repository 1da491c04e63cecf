#pragma once

#include "core/extraction/extracted_content.h"
#include "core/shared/errors.h"

#include <QByteArray>
#include <QString>

#include <vector>

namespace dw {

// PdfExtractor -- per-page text through Poppler.
//
// Limits:
//   - 1000-page cap per document
//   - 10 MB extracted text cap
//   - Encrypted PDFs are rejected as CorruptInput
// A PDF with no text layer on any page is also CorruptInput.
class PdfExtractor {
public:
    static constexpr int kMaxPages = 1000;
    static constexpr qsizetype kMaxExtractedChars = 10 * 1024 * 1024;

    static Result<std::vector<PdfPage>> extract(const QString& filePath, const QByteArray& bytes);
};

} // namespace dw
