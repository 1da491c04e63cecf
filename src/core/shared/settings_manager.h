#pragma once

#include "core/shared/settings.h"

#include <QJsonObject>
#include <QString>

#include <optional>

namespace dw {

// SettingsManager -- JSON save/load for docweave settings.
//
// The default location is:
//   $XDG_DATA_HOME/docweave/settings.json
// Keys missing from the file keep their defaults.
class SettingsManager {
public:
    // Load settings from the default path. Returns nullopt if the file
    // doesn't exist or cannot be parsed.
    static std::optional<Settings> load();
    static std::optional<Settings> load(const QString& filePath);

    // Save settings, creating the parent directory if needed.
    static bool save(const Settings& settings);
    static bool save(const Settings& settings, const QString& filePath);

    static QString settingsFilePath();
    static QString defaultStoreDir();

    static QJsonObject toJson(const Settings& settings);
    static Settings fromJson(const QJsonObject& json);
};

} // namespace dw
