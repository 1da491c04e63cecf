#include "core/analysis/record_analyzer.h"

#include <QJsonArray>
#include <QJsonObject>
#include <QRegularExpression>
#include <QSet>

#include <algorithm>
#include <cmath>
#include <vector>

namespace dw {

namespace {

constexpr int kMaxKeyPaths = 50;

struct RecordUnit {
    QString path;
    QJsonValue value;
};

QString childPath(const QString& parent, const QString& key)
{
    return parent.isEmpty() ? key : parent + QLatin1Char('.') + key;
}

QString indexPath(const QString& parent, int index)
{
    return QStringLiteral("%1[%2]").arg(parent).arg(index);
}

QString scalarText(const QJsonValue& value)
{
    switch (value.type()) {
    case QJsonValue::String:
        return value.toString();
    case QJsonValue::Bool:
        return value.toBool() ? QStringLiteral("true") : QStringLiteral("false");
    case QJsonValue::Double: {
        const double number = value.toDouble();
        if (std::floor(number) == number && std::fabs(number) < 1e15) {
            return QString::number(static_cast<qint64>(number));
        }
        return QString::number(number, 'g', 15);
    }
    case QJsonValue::Null:
        return QStringLiteral("null");
    case QJsonValue::Object:
        return QStringLiteral("{}");
    case QJsonValue::Array:
        return QStringLiteral("[]");
    case QJsonValue::Undefined:
        break;
    }
    return QString();
}

QString kindOf(const QJsonValue& value)
{
    switch (value.type()) {
    case QJsonValue::String: return QStringLiteral("string");
    case QJsonValue::Bool:   return QStringLiteral("boolean");
    case QJsonValue::Double: return QStringLiteral("number");
    case QJsonValue::Object: return QStringLiteral("object");
    case QJsonValue::Array:  return QStringLiteral("array");
    case QJsonValue::Null:
    case QJsonValue::Undefined:
        break;
    }
    return QStringLiteral("null");
}

bool hasChildren(const QJsonValue& value)
{
    return (value.isObject() && !value.toObject().isEmpty())
        || (value.isArray() && !value.toArray().isEmpty());
}

std::vector<RecordUnit> childUnits(const QString& path, const QJsonValue& value)
{
    std::vector<RecordUnit> units;
    if (value.isObject()) {
        const QJsonObject object = value.toObject();
        for (auto it = object.constBegin(); it != object.constEnd(); ++it) {
            units.push_back(RecordUnit{childPath(path, it.key()), it.value()});
        }
    } else if (value.isArray()) {
        const QJsonArray array = value.toArray();
        for (int i = 0; i < array.size(); ++i) {
            units.push_back(RecordUnit{indexPath(path, i), array.at(i)});
        }
    }
    return units;
}

int nestingDepth(const QJsonValue& value)
{
    int deepest = 0;
    if (value.isObject()) {
        const QJsonObject object = value.toObject();
        for (auto it = object.constBegin(); it != object.constEnd(); ++it) {
            deepest = std::max(deepest, nestingDepth(it.value()));
        }
        return deepest + 1;
    }
    if (value.isArray()) {
        for (const QJsonValue& item : value.toArray()) {
            deepest = std::max(deepest, nestingDepth(item));
        }
        return deepest + 1;
    }
    return 0;
}

void collectKeyPaths(const QJsonValue& value, const QString& path,
                     QSet<QString>& seen, QJsonArray& out)
{
    if (out.size() >= kMaxKeyPaths) {
        return;
    }
    if (!path.isEmpty()) {
        static const QRegularExpression index(QStringLiteral("\\[\\d+\\]"));
        QString general = path;
        general.replace(index, QStringLiteral("[*]"));
        if (!seen.contains(general)) {
            seen.insert(general);
            QJsonObject entry;
            entry[QStringLiteral("path")] = general;
            entry[QStringLiteral("kind")] = kindOf(value);
            out.append(entry);
        }
    }
    for (const RecordUnit& unit : childUnits(path, value)) {
        collectKeyPaths(unit.value, unit.path, seen, out);
    }
}

class RecordChunkBuilder {
public:
    RecordChunkBuilder(TypeAnalysis& analysis, int budget)
        : m_analysis(analysis)
        , m_budget(std::max(budget, 1))
    {
    }

    void addUnits(const std::vector<RecordUnit>& units)
    {
        for (const RecordUnit& unit : units) {
            const QStringList lines = flattenRecord(unit.value, unit.path);
            const QString text = lines.join(QLatin1Char('\n'));

            if (text.size() > m_budget) {
                flush();
                if (hasChildren(unit.value)) {
                    addUnits(childUnits(unit.path, unit.value));
                    flush();
                } else {
                    m_analysis.chunks.push_back(ChunkDraft{text, unit.path});
                }
                continue;
            }

            const qsizetype grown = m_text.isEmpty() ? text.size() : m_text.size() + 1 + text.size();
            if (grown > m_budget) {
                flush();
            }
            if (!m_text.isEmpty()) {
                m_text += QLatin1Char('\n');
            }
            m_text += text;
            if (m_firstPath.isEmpty()) {
                m_firstPath = unit.path;
            }
            m_lastPath = unit.path;
        }
    }

    void flush()
    {
        if (m_text.isEmpty()) {
            return;
        }
        const QString locator = m_firstPath == m_lastPath
            ? m_firstPath
            : QStringLiteral("%1 .. %2").arg(m_firstPath, m_lastPath);
        m_analysis.chunks.push_back(ChunkDraft{m_text, locator});
        m_text.clear();
        m_firstPath.clear();
        m_lastPath.clear();
    }

private:
    TypeAnalysis& m_analysis;
    int m_budget;
    QString m_text;
    QString m_firstPath;
    QString m_lastPath;
};

} // namespace

QStringList flattenRecord(const QJsonValue& value, const QString& path)
{
    QStringList lines;
    if (hasChildren(value)) {
        for (const RecordUnit& unit : childUnits(path, value)) {
            lines.append(flattenRecord(unit.value, unit.path));
        }
        return lines;
    }
    const QString label = path.isEmpty() ? QStringLiteral("value") : path;
    lines.append(QStringLiteral("%1: %2").arg(label, scalarText(value)));
    return lines;
}

TypeAnalysis analyzeRecords(const RecordData& record, int budget)
{
    TypeAnalysis analysis;

    RecordChunkBuilder builder(analysis, budget);
    builder.addUnits(childUnits(QString(), record.root));
    builder.flush();
    if (analysis.chunks.empty()) {
        // Empty container at the top level.
        analysis.chunks.push_back(ChunkDraft{flattenRecord(record.root).join(QLatin1Char('\n')),
                                             QStringLiteral("root")});
    }

    QSet<QString> seenPaths;
    QJsonArray keyPaths;
    collectKeyPaths(record.root, QString(), seenPaths, keyPaths);

    const int depth = nestingDepth(record.root);
    QString structureType;
    QString countLine;
    if (record.lineDelimited) {
        structureType = QStringLiteral("json-lines");
        const int items = static_cast<int>(record.root.toArray().size());
        analysis.rawStructure[QStringLiteral("item_count")] = items;
        countLine = QStringLiteral("%1 records").arg(items);
    } else if (record.root.isArray()) {
        structureType = QStringLiteral("array");
        const int items = static_cast<int>(record.root.toArray().size());
        analysis.rawStructure[QStringLiteral("item_count")] = items;
        countLine = QStringLiteral("array of %1 items").arg(items);
    } else {
        structureType = QStringLiteral("object");
        const QStringList keys = record.root.toObject().keys();
        analysis.rawStructure[QStringLiteral("key_count")] = static_cast<int>(keys.size());
        analysis.rawStructure[QStringLiteral("top_level_keys")] = QJsonArray::fromStringList(keys.mid(0, 20));
        countLine = QStringLiteral("object with %1 keys").arg(keys.size());
        for (const QString& key : keys) {
            if (analysis.headings.size() >= 10) {
                break;
            }
            analysis.headings.append(key);
        }
    }

    analysis.rawStructure[QStringLiteral("structure_type")] = structureType;
    analysis.rawStructure[QStringLiteral("nested_levels")] = depth;
    analysis.rawStructure[QStringLiteral("key_paths")] = keyPaths;

    analysis.highlights = QStringLiteral("%1, %2 nesting levels, %3 distinct key paths")
                              .arg(countLine)
                              .arg(depth)
                              .arg(keyPaths.size());

    analysis.fullText = flattenRecord(record.root).join(QLatin1Char('\n'));
    return analysis;
}

} // namespace dw
