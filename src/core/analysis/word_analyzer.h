#pragma once

#include "core/analysis/analysis_types.h"
#include "core/extraction/extracted_content.h"

#include <QString>

#include <vector>

namespace dw {

// Bullet glyphs, "1." / "a)" enumerations and "- " / "* " prefixes.
bool looksLikeListItem(const QString& text);

// Heading-bounded sections for word documents. Section text is prefixed
// with the heading path ("Intro > Scope"); a section longer than the
// chunker's maxSize is split again with the path repeated on every piece.
// Without any headings the paragraphs are grouped in fixed windows.
TypeAnalysis analyzeWordParagraphs(const std::vector<WordParagraph>& paragraphs,
                                   const Chunker& chunker,
                                   int paragraphsPerChunk);

} // namespace dw
