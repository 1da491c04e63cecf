#include "core/analysis/document_analyzer.h"
#include "core/embedding/embedding_manager.h"
#include "core/generation/chat_completion_client.h"
#include "core/search/search_engine.h"
#include "core/shared/settings_manager.h"
#include "core/vector/vector_store.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QJsonDocument>
#include <QTextStream>

#include <cstdio>

namespace {

QTextStream& out()
{
    static QTextStream stream(stdout);
    return stream;
}

QTextStream& err()
{
    static QTextStream stream(stderr);
    return stream;
}

void printJson(const QJsonObject& json)
{
    out() << QString::fromUtf8(QJsonDocument(json).toJson(QJsonDocument::Indented));
    out().flush();
}

void printAnswer(const dw::AnswerResult& result)
{
    if (result.ok()) {
        out() << result.answer << "\n\n";
    } else {
        err() << "Error: " << result.error->toString() << "\n";
        err().flush();
        if (!result.fallbackAnswer.isEmpty()) {
            out() << result.fallbackAnswer << "\n\n";
        }
    }

    if (!result.citations.isEmpty()) {
        out() << "Sources:\n";
        for (const QString& documentId : result.citations) {
            const auto count = result.perDocumentChunkCounts.find(documentId);
            out() << "  " << documentId << " ("
                  << (count != result.perDocumentChunkCounts.end() ? count->second : 0)
                  << " chunks)\n";
        }
    }
    out() << QStringLiteral("Timing: index %1 ms, search %2 ms, generation %3 ms\n")
                 .arg(result.timing.indexMs)
                 .arg(result.timing.searchMs)
                 .arg(result.timing.generationMs);
    out().flush();
}

void printDocuments(const std::vector<dw::DocumentInfo>& documents)
{
    if (documents.empty()) {
        out() << "No documents indexed.\n";
    }
    for (const dw::DocumentInfo& info : documents) {
        out() << QStringLiteral("%1  %2  %3 chunks  %4\n")
                     .arg(info.documentId.left(12), dw::fileTypeToString(info.fileType))
                     .arg(info.chunkCount)
                     .arg(info.sourcePath);
    }
    out().flush();
}

} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("docweave"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Question answering over a local document collection"));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("index | ask | list | summary | stats"));
    parser.addPositionalArgument(QStringLiteral("args"), QStringLiteral("Command arguments"), QStringLiteral("[args...]"));

    const QCommandLineOption settingsOption(QStringLiteral("settings"),
                                            QStringLiteral("Settings file"), QStringLiteral("path"));
    const QCommandLineOption storeOption(QStringLiteral("store"),
                                         QStringLiteral("Index directory"), QStringLiteral("dir"));
    const QCommandLineOption dataOption(QStringLiteral("data"),
                                        QStringLiteral("Document directory"), QStringLiteral("dir"));
    const QCommandLineOption modelOption(QStringLiteral("model"),
                                         QStringLiteral("Embedding model directory"), QStringLiteral("dir"));
    const QCommandLineOption depthOption(QStringLiteral("depth"),
                                         QStringLiteral("quick | standard | deep"),
                                         QStringLiteral("depth"), QStringLiteral("deep"));
    const QCommandLineOption jsonOption(QStringLiteral("json"), QStringLiteral("Print JSON"));
    parser.addOptions({settingsOption, storeOption, dataOption, modelOption, depthOption, jsonOption});
    parser.process(app);

    const QStringList positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        parser.showHelp(1);
    }
    const QString command = positional.front();
    const QStringList args = positional.mid(1);

    // Settings: file (if any), then command-line overrides
    dw::Settings settings;
    const QString settingsPath = parser.isSet(settingsOption) ? parser.value(settingsOption)
                                                              : dw::SettingsManager::settingsFilePath();
    if (const std::optional<dw::Settings> loaded = dw::SettingsManager::load(settingsPath)) {
        settings = *loaded;
    } else if (parser.isSet(settingsOption)) {
        err() << "Cannot read settings file " << settingsPath << "\n";
        return 1;
    }
    if (parser.isSet(storeOption)) {
        settings.storeDir = parser.value(storeOption);
    }
    if (settings.storeDir.isEmpty()) {
        settings.storeDir = dw::SettingsManager::defaultStoreDir();
    }
    if (parser.isSet(dataOption)) {
        settings.dataDir = parser.value(dataOption);
    }
    if (parser.isSet(modelOption)) {
        settings.modelDir = parser.value(modelOption);
    }
    if (command == QLatin1String("index") && !args.isEmpty()) {
        settings.dataDir = args.front();
    }

    dw::EmbeddingModelConfig modelConfig;
    modelConfig.modelDir = settings.modelDir;
    modelConfig.modelId = settings.embeddingModelId;
    modelConfig.dimensions = settings.embeddingDimensions;
    modelConfig.maxSequenceLength = settings.embeddingMaxTokens;
    dw::EmbeddingManager embedder(modelConfig);
    const bool needsEmbedder = command == QLatin1String("index") || command == QLatin1String("ask");
    if (needsEmbedder && !embedder.initialize()) {
        err() << "Embedding model unavailable in " << settings.modelDir << "\n";
        return 1;
    }

    dw::VectorStore store;
    if (auto error = store.init(settings.storeDir, settings.embeddingDimensions, settings.embeddingModelId)) {
        err() << "Cannot open index: " << error->toString() << "\n";
        return 1;
    }

    dw::DocumentAnalyzer analyzer(embedder, dw::DocumentAnalyzer::optionsFromSettings(settings));
    dw::ChatCompletionClient generator(dw::ChatCompletionClient::configFromSettings(settings));
    dw::SearchEngine engine(store, analyzer, generator, dw::SearchEngine::optionsFromSettings(settings));
    if (!settings.dataDir.isEmpty()) {
        engine.setCollection(dw::SearchEngine::scanDataDirectory(settings.dataDir));
    }

    if (command == QLatin1String("index")) {
        if (settings.dataDir.isEmpty()) {
            err() << "index: no document directory given\n";
            return 1;
        }
        const dw::FreshnessReport report = engine.refresh();
        out() << QStringLiteral("Indexed: %1 added, %2 updated, %3 unchanged, %4 removed, %5 failed (%6 ms)\n")
                     .arg(report.added.size())
                     .arg(report.updated.size())
                     .arg(report.unchanged.size())
                     .arg(report.removed.size())
                     .arg(report.failures.size())
                     .arg(report.durationMs);
        for (const dw::AnalysisFailure& failure : report.failures) {
            out() << "  " << QFileInfo(failure.path).fileName() << ": " << failure.error.toString() << "\n";
        }
        out().flush();
        return 0;
    }

    if (command == QLatin1String("ask")) {
        if (args.isEmpty()) {
            err() << "ask: no question given\n";
            return 1;
        }
        const std::optional<dw::AnalysisDepth> depth = dw::parseAnalysisDepth(parser.value(depthOption));
        if (!depth) {
            err() << "Unknown depth '" << parser.value(depthOption) << "'\n";
            return 1;
        }
        const dw::AnswerResult result = engine.comprehensiveSearch(args.join(QLatin1Char(' ')), *depth);
        if (parser.isSet(jsonOption)) {
            printJson(dw::answerResultToJson(result));
        } else {
            printAnswer(result);
        }
        return result.ok() ? 0 : 2;
    }

    if (command == QLatin1String("list")) {
        printDocuments(engine.listDocuments());
        return 0;
    }

    if (command == QLatin1String("summary")) {
        if (args.isEmpty()) {
            err() << "summary: no document given\n";
            return 1;
        }
        const dw::Result<dw::DocumentSummary> summary = engine.documentSummary(args.front());
        if (!summary) {
            err() << summary.error().toString() << "\n";
            return 1;
        }
        out() << summary->sourcePath << " (" << dw::fileTypeToString(summary->fileType) << ")\n\n"
              << summary->summaryText << "\n\n"
              << "Topics: " << summary->topics.join(QStringLiteral(", ")) << "\n";
        out().flush();
        return 0;
    }

    if (command == QLatin1String("stats")) {
        printJson(dw::collectionAnalysisToJson(engine.analyzeCollection()));
        return 0;
    }

    err() << "Unknown command '" << command << "'\n";
    return 1;
}
