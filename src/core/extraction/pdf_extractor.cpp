#include "core/extraction/pdf_extractor.h"
#include "core/extraction/text_cleaner.h"
#include "core/shared/logging.h"

#include <QElapsedTimer>

#include <poppler/qt6/poppler-qt6.h>

#include <algorithm>
#include <memory>

namespace dw {

Result<std::vector<PdfPage>> PdfExtractor::extract(const QString& filePath, const QByteArray& bytes)
{
    QElapsedTimer timer;
    timer.start();

    std::unique_ptr<Poppler::Document> doc = Poppler::Document::loadFromData(bytes);
    if (!doc) {
        LOG_WARN(dwAnalysis, "Poppler failed to load: %s", qUtf8Printable(filePath));
        return Error{ErrorCode::CorruptInput, QStringLiteral("Failed to load PDF document")};
    }

    if (doc->isLocked()) {
        LOG_INFO(dwAnalysis, "Skipping encrypted PDF: %s", qUtf8Printable(filePath));
        return Error{ErrorCode::CorruptInput, QStringLiteral("PDF is encrypted or password-protected")};
    }

    const int pageCount = doc->numPages();
    const int pagesToProcess = std::min(pageCount, kMaxPages);
    if (pageCount > kMaxPages) {
        LOG_INFO(dwAnalysis, "PDF has %d pages, capping at %d: %s",
                 pageCount, kMaxPages, qUtf8Printable(filePath));
    }

    std::vector<PdfPage> pages;
    pages.reserve(static_cast<size_t>(std::max(pagesToProcess, 0)));
    qsizetype totalChars = 0;
    bool anyText = false;

    for (int i = 0; i < pagesToProcess; ++i) {
        std::unique_ptr<Poppler::Page> page = doc->page(i);
        if (!page) {
            LOG_DEBUG(dwAnalysis, "Null page %d in %s", i, qUtf8Printable(filePath));
            continue;
        }

        PdfPage entry;
        entry.number = i + 1;
        entry.text = TextCleaner::cleanPageText(page->text(QRectF()));
        anyText = anyText || !entry.text.isEmpty();
        totalChars += entry.text.size();
        pages.push_back(std::move(entry));

        if (totalChars > kMaxExtractedChars) {
            LOG_INFO(dwAnalysis, "Extracted text exceeded %lld chars at page %d: %s",
                     static_cast<long long>(kMaxExtractedChars), i + 1, qUtf8Printable(filePath));
            break;
        }
    }

    if (!anyText) {
        return Error{ErrorCode::CorruptInput, QStringLiteral("PDF has no extractable text layer")};
    }

    LOG_DEBUG(dwAnalysis, "Extracted %d pages from PDF %s in %lld ms",
              static_cast<int>(pages.size()), qUtf8Printable(filePath),
              static_cast<long long>(timer.elapsed()));
    return pages;
}

} // namespace dw
