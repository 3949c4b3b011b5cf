// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "session/ConfigStore.hpp"

#include <QtCore/QJsonArray>
#include <QtCore/QJsonValue>
#include <QtCore/QSet>

#include <algorithm>
#include <utility>

namespace Session {

namespace {

using namespace Qt::StringLiterals;

const QString kDocumentName = u"app"_s;
const QString kApplicationName = u"MarkdownReader"_s;

const QString kSchemaVersionKey = u"schemaVersion"_s;
const QString kWindowKey = u"window"_s;
const QString kThemeKey = u"theme"_s;
const QString kFontKey = u"font"_s;
const QString kRecentFilesKey = u"recentFiles"_s;
const QString kRecentFoldersKey = u"recentFolders"_s;
const QString kMarkersKey = u"markers"_s;
const QString kExpandedKey = u"expandedDirectories"_s;
const QString kScrollKey = u"scrollPositions"_s;
const QString kLastFileKey = u"lastFile"_s;
const QString kLastFolderKey = u"lastFolder"_s;

const QString kXKey = u"x"_s;
const QString kYKey = u"y"_s;
const QString kWidthKey = u"width"_s;
const QString kHeightKey = u"height"_s;
const QString kMaximizedKey = u"maximized"_s;
const QString kSplitterKey = u"splitterPosition"_s;

const QString kBodySizeKey = u"bodySize"_s;
const QString kCodeSizeKey = u"codeSize"_s;
const QString kCodeFamilyKey = u"codeFamily"_s;
const QString kCodeWeightKey = u"codeWeight"_s;
const QString kInlineCodeColorKey = u"inlineCodeColor"_s;
const QString kBlockCodeColorKey = u"blockCodeColor"_s;

int intOr(const QJsonObject& obj, const QString& key, int fallback)
{
    const QJsonValue v = obj.value(key);
    return v.isDouble() ? v.toInt(fallback) : fallback;
}

int positiveIntOr(const QJsonObject& obj, const QString& key, int fallback)
{
    const int v = intOr(obj, key, fallback);
    return v > 0 ? v : fallback;
}

QString stringOr(const QJsonObject& obj, const QString& key, const QString& fallback)
{
    const QJsonValue v = obj.value(key);
    return v.isString() ? v.toString() : fallback;
}

QJsonValue colorToJson(const QColor& color)
{
    if (!color.isValid())
        return QJsonValue(QJsonValue::Null);
    return color.alpha() == 255 ? color.name(QColor::HexRgb) : color.name(QColor::HexArgb);
}

QColor colorFromJson(const QJsonValue& value)
{
    if (!value.isString())
        return {};
    const QColor color = QColor::fromString(value.toString());
    return color.isValid() ? color : QColor{};
}

QStringList recentList(const QJsonValue& value, int cap)
{
    QStringList out;
    if (!value.isArray())
        return out;

    QSet<QString> seen;
    const QJsonArray arr = value.toArray();
    for (const QJsonValue& v : arr) {
        if (out.size() >= cap)
            break;
        if (!v.isString())
            continue;
        const QString path = v.toString();
        if (path.isEmpty() || seen.contains(path))
            continue;
        seen.insert(path);
        out.push_back(path);
    }
    return out;
}

QStringList capped(const QStringList& list, int cap)
{
    QStringList out;
    QSet<QString> seen;
    for (const QString& path : list) {
        if (out.size() >= cap)
            break;
        if (path.isEmpty() || seen.contains(path))
            continue;
        seen.insert(path);
        out.push_back(path);
    }
    return out;
}

QStringList sortedKeys(const QStringList& keys)
{
    QStringList out = keys;
    std::sort(out.begin(), out.end());
    return out;
}

WindowGeometry windowFromJson(const QJsonValue& value)
{
    WindowGeometry w;
    if (!value.isObject())
        return w;

    const QJsonObject obj = value.toObject();
    w.x = intOr(obj, kXKey, w.x);
    w.y = intOr(obj, kYKey, w.y);
    w.width = positiveIntOr(obj, kWidthKey, w.width);
    w.height = positiveIntOr(obj, kHeightKey, w.height);
    if (const QJsonValue m = obj.value(kMaximizedKey); m.isBool())
        w.maximized = m.toBool();
    w.splitterPosition = std::max(0, intOr(obj, kSplitterKey, w.splitterPosition));
    return w;
}

FontSettings fontFromJson(const QJsonValue& value, const RecordLimits& limits)
{
    FontSettings f;
    if (!value.isObject())
        return f;

    const QJsonObject obj = value.toObject();
    f.bodySize = intOr(obj, kBodySizeKey, f.bodySize);
    f.codeSize = intOr(obj, kCodeSizeKey, f.codeSize);
    f.codeFamily = stringOr(obj, kCodeFamilyKey, f.codeFamily);
    if (const auto weight = codeWeightFromToken(stringOr(obj, kCodeWeightKey, {})))
        f.codeWeight = *weight;
    f.inlineCodeColor = colorFromJson(obj.value(kInlineCodeColorKey));
    f.blockCodeColor = colorFromJson(obj.value(kBlockCodeColorKey));
    return f.sanitized(limits);
}

} // namespace

ConfigStore::ConfigStore(Utils::DocumentStore store, RecordLimits limits)
    : m_store(std::move(store))
    , m_limits(limits)
{}

Utils::DocumentStore ConfigStore::makeDocumentStore(const QString& configRoot)
{
    Utils::DocumentStoreConfig cfg;
    cfg.applicationName = kApplicationName;
    cfg.configRootOverride = configRoot;
    return Utils::DocumentStore(std::move(cfg));
}

QString ConfigStore::filePath() const
{
    return m_store.documentPath(kDocumentName);
}

ConfigurationRecord ConfigStore::load() const
{
    const Utils::DocumentLoadResult loaded = m_store.load(kDocumentName);

    switch (loaded.status) {
    case Utils::DocumentLoadResult::Status::NotFound:
        qCInfo(sessionlog) << "No configuration at" << filePath() << "; using defaults.";
        return ConfigurationRecord::defaults();
    case Utils::DocumentLoadResult::Status::Corrupt:
        qCWarning(sessionlog).noquote() << "Unreadable configuration" << filePath() << ":" << loaded.error
                                        << "Using defaults.";
        return ConfigurationRecord::defaults();
    case Utils::DocumentLoadResult::Status::Ok:
        break;
    }

    const QJsonValue version = loaded.object.value(kSchemaVersionKey);
    if (!version.isUndefined() && (!version.isDouble() || version.toDouble() > kSchemaVersion)) {
        qCWarning(sessionlog) << "Configuration schema version" << version.toVariant()
                              << "is not supported (expected" << kSchemaVersion << "); using defaults.";
        return ConfigurationRecord::defaults();
    }

    return fromJson(loaded.object, m_limits);
}

Utils::Result ConfigStore::save(const ConfigurationRecord& record) const
{
    Utils::Result result = m_store.save(kDocumentName, toJson(sanitized(record, m_limits)));
    if (!result)
        qCWarning(sessionlog).noquote() << "Failed to save configuration to" << filePath() << ":" << result.message();
    return result;
}

ConfigurationRecord ConfigStore::sanitized(const ConfigurationRecord& record, const RecordLimits& limits)
{
    ConfigurationRecord out = record;
    const int cap = std::max(0, limits.maxRecentEntries);
    out.recentFiles = capped(record.recentFiles, cap);
    out.recentFolders = capped(record.recentFolders, cap);
    out.font = record.font.sanitized(limits);
    for (auto it = out.markers.begin(); it != out.markers.end();) {
        if (it.key().isEmpty() || it.value() == MarkerColor::None)
            it = out.markers.erase(it);
        else
            ++it;
    }
    for (auto it = out.scrollPositions.begin(); it != out.scrollPositions.end();) {
        if (it.key().isEmpty() || it.value() <= 0)
            it = out.scrollPositions.erase(it);
        else
            ++it;
    }
    out.expandedDirectories.remove(QString());
    return out;
}

QJsonObject ConfigStore::toJson(const ConfigurationRecord& record)
{
    QJsonObject root;
    root.insert(kSchemaVersionKey, kSchemaVersion);

    QJsonObject window;
    window.insert(kXKey, record.window.x);
    window.insert(kYKey, record.window.y);
    window.insert(kWidthKey, record.window.width);
    window.insert(kHeightKey, record.window.height);
    window.insert(kMaximizedKey, record.window.maximized);
    window.insert(kSplitterKey, record.window.splitterPosition);
    root.insert(kWindowKey, window);

    root.insert(kThemeKey, themeToken(record.theme));

    QJsonObject font;
    font.insert(kBodySizeKey, record.font.bodySize);
    font.insert(kCodeSizeKey, record.font.codeSize);
    font.insert(kCodeFamilyKey, record.font.codeFamily);
    font.insert(kCodeWeightKey, codeWeightToken(record.font.codeWeight));
    font.insert(kInlineCodeColorKey, colorToJson(record.font.inlineCodeColor));
    font.insert(kBlockCodeColorKey, colorToJson(record.font.blockCodeColor));
    root.insert(kFontKey, font);

    root.insert(kRecentFilesKey, QJsonArray::fromStringList(record.recentFiles));
    root.insert(kRecentFoldersKey, QJsonArray::fromStringList(record.recentFolders));

    QJsonObject markers;
    for (auto it = record.markers.cbegin(); it != record.markers.cend(); ++it) {
        if (it.value() != MarkerColor::None)
            markers.insert(it.key(), markerToken(it.value()));
    }
    root.insert(kMarkersKey, markers);

    // Sorted so that an unchanged record produces an unchanged file.
    root.insert(kExpandedKey, QJsonArray::fromStringList(sortedKeys(record.expandedDirectories.values())));

    QJsonObject scroll;
    for (auto it = record.scrollPositions.cbegin(); it != record.scrollPositions.cend(); ++it)
        scroll.insert(it.key(), it.value());
    root.insert(kScrollKey, scroll);

    root.insert(kLastFileKey, record.lastFile);
    root.insert(kLastFolderKey, record.lastFolder);
    return root;
}

ConfigurationRecord ConfigStore::fromJson(const QJsonObject& object, const RecordLimits& limits)
{
    ConfigurationRecord record;
    const int cap = std::max(0, limits.maxRecentEntries);

    record.window = windowFromJson(object.value(kWindowKey));

    if (const auto theme = themeFromToken(stringOr(object, kThemeKey, {})))
        record.theme = *theme;

    record.font = fontFromJson(object.value(kFontKey), limits);
    record.recentFiles = recentList(object.value(kRecentFilesKey), cap);
    record.recentFolders = recentList(object.value(kRecentFoldersKey), cap);

    if (const QJsonValue v = object.value(kMarkersKey); v.isObject()) {
        const QJsonObject markers = v.toObject();
        for (auto it = markers.constBegin(); it != markers.constEnd(); ++it) {
            if (it.key().isEmpty() || !it.value().isString())
                continue;
            const auto color = markerFromToken(it.value().toString());
            if (color && *color != MarkerColor::None)
                record.markers.insert(it.key(), *color);
        }
    }

    if (const QJsonValue v = object.value(kExpandedKey); v.isArray()) {
        const QJsonArray dirs = v.toArray();
        for (const QJsonValue& dir : dirs) {
            if (dir.isString() && !dir.toString().isEmpty())
                record.expandedDirectories.insert(dir.toString());
        }
    }

    if (const QJsonValue v = object.value(kScrollKey); v.isObject()) {
        const QJsonObject scroll = v.toObject();
        for (auto it = scroll.constBegin(); it != scroll.constEnd(); ++it) {
            if (it.key().isEmpty() || !it.value().isDouble())
                continue;
            const int offset = it.value().toInt();
            if (offset > 0)
                record.scrollPositions.insert(it.key(), offset);
        }
    }

    record.lastFile = stringOr(object, kLastFileKey, {});
    record.lastFolder = stringOr(object, kLastFolderKey, {});
    return record;
}

} // namespace Session
