#include "core/shared/settings_manager.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QStandardPaths>

namespace dw {

namespace {

void readInt(const QJsonObject& json, const char* key, int& target)
{
    const QString name = QString::fromLatin1(key);
    if (json.contains(name)) {
        target = json.value(name).toInt(target);
    }
}

void readString(const QJsonObject& json, const char* key, QString& target)
{
    target = json.value(QString::fromLatin1(key)).toString(target);
}

} // namespace

std::optional<Settings> SettingsManager::load()
{
    return load(settingsFilePath());
}

std::optional<Settings> SettingsManager::load(const QString& filePath)
{
    QFile file(filePath);
    if (!file.exists()) {
        return std::nullopt;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(dwCore, "Failed to open settings file for read: %s", qUtf8Printable(filePath));
        return std::nullopt;
    }

    const QByteArray rawJson = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(rawJson, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(dwCore,
                 "Failed to parse settings JSON (%s): %s",
                 qUtf8Printable(filePath),
                 qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    return fromJson(doc.object());
}

bool SettingsManager::save(const Settings& settings)
{
    return save(settings, settingsFilePath());
}

bool SettingsManager::save(const Settings& settings, const QString& filePath)
{
    const QString parentDir = QFileInfo(filePath).absolutePath();
    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(dwCore, "Failed to create settings directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(dwCore, "Failed to open settings file for write: %s", qUtf8Printable(filePath));
        return false;
    }

    const qint64 bytesWritten = file.write(QJsonDocument(toJson(settings)).toJson(QJsonDocument::Indented));
    file.close();

    if (bytesWritten < 0) {
        LOG_ERROR(dwCore, "Failed to write settings file: %s", qUtf8Printable(filePath));
        return false;
    }
    return true;
}

QString SettingsManager::settingsFilePath()
{
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return basePath + QStringLiteral("/docweave/settings.json");
}

QString SettingsManager::defaultStoreDir()
{
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return basePath + QStringLiteral("/docweave/store");
}

QJsonObject SettingsManager::toJson(const Settings& settings)
{
    QJsonObject json;
    json.insert(QStringLiteral("storeDir"), settings.storeDir);
    json.insert(QStringLiteral("dataDir"), settings.dataDir);
    json.insert(QStringLiteral("modelDir"), settings.modelDir);
    json.insert(QStringLiteral("embeddingModelId"), settings.embeddingModelId);
    json.insert(QStringLiteral("embeddingDimensions"), settings.embeddingDimensions);
    json.insert(QStringLiteral("embeddingMaxTokens"), settings.embeddingMaxTokens);
    json.insert(QStringLiteral("maxFileSize"), static_cast<qint64>(settings.maxFileSize));
    json.insert(QStringLiteral("chunkTargetSize"), settings.chunkTargetSize);
    json.insert(QStringLiteral("chunkMinSize"), settings.chunkMinSize);
    json.insert(QStringLiteral("chunkMaxSize"), settings.chunkMaxSize);
    json.insert(QStringLiteral("rowsPerChunk"), settings.rowsPerChunk);
    json.insert(QStringLiteral("paragraphsPerChunk"), settings.paragraphsPerChunk);
    json.insert(QStringLiteral("recordChunkBudget"), settings.recordChunkBudget);
    json.insert(QStringLiteral("maxTopics"), settings.maxTopics);
    json.insert(QStringLiteral("summaryMaxChars"), settings.summaryMaxChars);
    json.insert(QStringLiteral("maxContextChars"), settings.maxContextChars);
    json.insert(QStringLiteral("refreshBeforeQuery"), settings.refreshBeforeQuery);

    QJsonObject generation;
    generation.insert(QStringLiteral("endpoint"), settings.generationEndpoint);
    generation.insert(QStringLiteral("model"), settings.generationModel);
    generation.insert(QStringLiteral("apiKeyEnv"), settings.apiKeyEnv);
    generation.insert(QStringLiteral("timeoutMs"), settings.generationTimeoutMs);
    generation.insert(QStringLiteral("maxAttempts"), settings.generationMaxAttempts);
    generation.insert(QStringLiteral("initialBackoffMs"), settings.initialBackoffMs);
    generation.insert(QStringLiteral("maxBackoffMs"), settings.maxBackoffMs);
    generation.insert(QStringLiteral("temperature"), settings.temperature);
    generation.insert(QStringLiteral("maxTokens"), settings.maxTokens);
    json.insert(QStringLiteral("generation"), generation);
    return json;
}

Settings SettingsManager::fromJson(const QJsonObject& json)
{
    Settings settings;

    readString(json, "storeDir", settings.storeDir);
    readString(json, "dataDir", settings.dataDir);
    readString(json, "modelDir", settings.modelDir);
    readString(json, "embeddingModelId", settings.embeddingModelId);
    readInt(json, "embeddingDimensions", settings.embeddingDimensions);
    readInt(json, "embeddingMaxTokens", settings.embeddingMaxTokens);

    if (json.contains(QStringLiteral("maxFileSize"))) {
        settings.maxFileSize = static_cast<int64_t>(
            json.value(QStringLiteral("maxFileSize")).toVariant().toLongLong());
    }

    readInt(json, "chunkTargetSize", settings.chunkTargetSize);
    readInt(json, "chunkMinSize", settings.chunkMinSize);
    readInt(json, "chunkMaxSize", settings.chunkMaxSize);
    readInt(json, "rowsPerChunk", settings.rowsPerChunk);
    readInt(json, "paragraphsPerChunk", settings.paragraphsPerChunk);
    readInt(json, "recordChunkBudget", settings.recordChunkBudget);
    readInt(json, "maxTopics", settings.maxTopics);
    readInt(json, "summaryMaxChars", settings.summaryMaxChars);
    readInt(json, "maxContextChars", settings.maxContextChars);
    settings.refreshBeforeQuery = json.value(QStringLiteral("refreshBeforeQuery"))
                                      .toBool(settings.refreshBeforeQuery);

    const QJsonObject generation = json.value(QStringLiteral("generation")).toObject();
    readString(generation, "endpoint", settings.generationEndpoint);
    readString(generation, "model", settings.generationModel);
    readString(generation, "apiKeyEnv", settings.apiKeyEnv);
    readInt(generation, "timeoutMs", settings.generationTimeoutMs);
    readInt(generation, "maxAttempts", settings.generationMaxAttempts);
    readInt(generation, "initialBackoffMs", settings.initialBackoffMs);
    readInt(generation, "maxBackoffMs", settings.maxBackoffMs);
    settings.temperature = generation.value(QStringLiteral("temperature")).toDouble(settings.temperature);
    readInt(generation, "maxTokens", settings.maxTokens);

    return settings;
}

} // namespace dw
