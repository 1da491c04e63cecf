#pragma once

#include "core/analysis/analysis_types.h"
#include "core/extraction/extracted_content.h"

#include <QString>
#include <QStringList>

#include <vector>

namespace dw {

struct ContentMarkers {
    bool hasTables = false;
    bool hasFigures = false;
    bool hasReferences = false;
};

// Heading heuristics for prose. A line qualifies when it has at most
// maxWords words, contains letters, does not end in sentence punctuation,
// and is either numbered ("2.", "3.1", "IV."), a markdown heading, fully
// upper case, or title case.
bool isHeadingLine(const QString& line, int maxWords = 8);

// Strips markdown '#' and numbering decorations kept for display.
QString headingTitle(const QString& line);

ContentMarkers detectMarkers(const QString& text);

// "table", "figure_reference", "summary_section", "short_text" or "body_text".
QString classifyContent(const QString& text, const ContentMarkers& markers);

// Blank-line separated blocks longer than 50 characters.
int countParagraphs(const QString& text);

// pdf: one page-aware pass, chunk locators are "page N".
TypeAnalysis analyzePdfPages(const std::vector<PdfPage>& pages, const Chunker& chunker);

// Plain text: chunk locators are "lines a-b".
TypeAnalysis analyzePlainText(const QString& text, const Chunker& chunker);

} // namespace dw
