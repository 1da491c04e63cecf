#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(dwCore)
Q_DECLARE_LOGGING_CATEGORY(dwAnalysis)
Q_DECLARE_LOGGING_CATEGORY(dwIndex)
Q_DECLARE_LOGGING_CATEGORY(dwSearch)
Q_DECLARE_LOGGING_CATEGORY(dwGeneration)

#define LOG_DEBUG(cat, ...) qCDebug(cat, __VA_ARGS__)
#define LOG_INFO(cat, ...)  qCInfo(cat, __VA_ARGS__)
#define LOG_WARN(cat, ...)  qCWarning(cat, __VA_ARGS__)
#define LOG_ERROR(cat, ...) qCCritical(cat, __VA_ARGS__)
