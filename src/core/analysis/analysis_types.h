#pragma once

#include "core/analysis/chunker.h"

#include <QJsonObject>
#include <QString>
#include <QStringList>

#include <cstdint>
#include <vector>

namespace dw {

// Chunk text plus its human-readable position, before ids and vectors
// are assigned.
struct ChunkDraft {
    QString text;
    QString locator;
};

// Output of one per-type handler.
struct TypeAnalysis {
    std::vector<ChunkDraft> chunks;
    QJsonObject rawStructure;
    QStringList headings;
    QString highlights;      // stats line(s) for the document summary
    QString fullText;        // body text used for topic extraction
};

struct AnalyzerOptions {
    ChunkerConfig chunker;
    int rowsPerChunk = 10;
    int paragraphsPerChunk = 5;
    int recordChunkBudget = 1000;
    int maxTopics = 20;
    int summaryMaxChars = 2000;
    int summaryChunkCount = 3;
    int64_t maxFileSize = 104857600;
};

} // namespace dw
