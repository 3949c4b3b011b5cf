// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "session/SessionState.hpp"

#include <utils/PathUtils.hpp>

#include <algorithm>
#include <utility>

namespace Session {

namespace {

QString keyFor(const QString& path)
{
    return path.trimmed().isEmpty() ? QString() : Utils::PathUtils::absoluteKey(path);
}

QSet<QString> keysFor(const QSet<QString>& paths)
{
    QSet<QString> out;
    out.reserve(paths.size());
    for (const QString& p : paths) {
        const QString key = keyFor(p);
        if (!key.isEmpty())
            out.insert(key);
    }
    return out;
}

bool inScope(const QString& key, const QString& scope)
{
    return scope.isEmpty() || Utils::PathUtils::isSameOrDescendant(key, scope);
}

bool beneathAny(const QString& key, const QSet<QString>& dirs)
{
    for (const QString& dir : dirs) {
        if (Utils::PathUtils::isSameOrDescendant(key, dir))
            return true;
    }
    return false;
}

template <typename Map>
Map rebasedMap(const Map& in, const QString& from, const QString& to, bool* touched)
{
    Map out;
    out.reserve(in.size());
    for (auto it = in.cbegin(); it != in.cend(); ++it) {
        if (Utils::PathUtils::isSameOrDescendant(it.key(), from)) {
            out.insert(Utils::PathUtils::rebase(it.key(), from, to), it.value());
            *touched = true;
        } else {
            out.insert(it.key(), it.value());
        }
    }
    return out;
}

QStringList rebasedList(const QStringList& in, const QString& from, const QString& to, bool* touched)
{
    QStringList out;
    for (const QString& p : in) {
        QString next = p;
        if (Utils::PathUtils::isSameOrDescendant(p, from)) {
            next = Utils::PathUtils::rebase(p, from, to);
            *touched = true;
        }
        if (!out.contains(next))
            out.push_back(next);
    }
    return out;
}

} // namespace

SessionState::SessionState(ConfigStore store, QObject* parent)
    : QObject(parent)
    , m_store(std::move(store))
    , m_record(m_store.load())
    , m_flushInvoker(kDefaultFlushDelayMs, this)
{
    m_flushInvoker.setAction([this]() {
        const Utils::Result r = flush();
        if (!r)
            qCDebug(sessionlog) << "Deferred save failed; the next change retries.";
    });
}

SessionState::~SessionState() = default;

void SessionState::touch()
{
    emit changed();
    m_flushInvoker.trigger();
}

bool SessionState::pushRecent(QStringList& list, const QString& key)
{
    if (key.isEmpty())
        return false;
    if (!list.isEmpty() && list.front() == key)
        return false;

    list.removeAll(key);
    list.prepend(key);

    const int cap = std::max(0, limits().maxRecentEntries);
    while (list.size() > cap)
        list.removeLast();
    return true;
}

void SessionState::recordRecentFile(const QString& path)
{
    if (!pushRecent(m_record.recentFiles, keyFor(path)))
        return;
    emit recentFilesChanged();
    touch();
}

void SessionState::recordRecentFolder(const QString& path)
{
    if (!pushRecent(m_record.recentFolders, keyFor(path)))
        return;
    emit recentFoldersChanged();
    touch();
}

void SessionState::setMarker(const QString& path, MarkerColor color)
{
    const QString key = keyFor(path);
    if (key.isEmpty())
        return;

    if (color == MarkerColor::None) {
        if (!m_record.markers.remove(key))
            return;
    } else {
        const auto it = m_record.markers.constFind(key);
        if (it != m_record.markers.cend() && it.value() == color)
            return;
        m_record.markers.insert(key, color);
    }

    emit markerChanged(key, color);
    touch();
}

void SessionState::clearMarker(const QString& path)
{
    setMarker(path, MarkerColor::None);
}

MarkerColor SessionState::marker(const QString& path) const
{
    return m_record.markers.value(keyFor(path), MarkerColor::None);
}

void SessionState::setExpanded(const QString& path, bool expanded)
{
    const QString key = keyFor(path);
    if (key.isEmpty())
        return;

    if (expanded) {
        if (m_record.expandedDirectories.contains(key))
            return;
        m_record.expandedDirectories.insert(key);
    } else if (!m_record.expandedDirectories.remove(key)) {
        return;
    }
    touch();
}

bool SessionState::isExpanded(const QString& path) const
{
    return m_record.expandedDirectories.contains(keyFor(path));
}

void SessionState::setScrollPosition(const QString& path, int offset)
{
    const QString key = keyFor(path);
    if (key.isEmpty())
        return;

    offset = std::max(0, offset);
    if (offset == 0) {
        if (!m_record.scrollPositions.remove(key))
            return;
    } else {
        if (m_record.scrollPositions.value(key, 0) == offset)
            return;
        m_record.scrollPositions.insert(key, offset);
    }
    touch();
}

int SessionState::scrollPosition(const QString& path) const
{
    return m_record.scrollPositions.value(keyFor(path), 0);
}

void SessionState::setWindowGeometry(const WindowGeometry& geometry)
{
    WindowGeometry next = geometry;
    next.splitterPosition = std::max(0, next.splitterPosition);
    if (next.width <= 0)
        next.width = m_record.window.width;
    if (next.height <= 0)
        next.height = m_record.window.height;
    if (next == m_record.window)
        return;
    m_record.window = next;
    touch();
}

void SessionState::setSplitterPosition(int position)
{
    position = std::max(0, position);
    if (position == m_record.window.splitterPosition)
        return;
    m_record.window.splitterPosition = position;
    touch();
}

void SessionState::setTheme(ThemePreference theme)
{
    if (theme == m_record.theme)
        return;
    m_record.theme = theme;
    emit themeChanged(theme);
    touch();
}

void SessionState::setFontSettings(const FontSettings& font)
{
    const FontSettings next = font.sanitized(limits());
    if (next == m_record.font)
        return;
    m_record.font = next;
    emit fontSettingsChanged();
    touch();
}

void SessionState::setLastFile(const QString& path)
{
    const QString key = keyFor(path);
    if (key == m_record.lastFile)
        return;
    m_record.lastFile = key;
    touch();
}

void SessionState::setLastFolder(const QString& path)
{
    const QString key = keyFor(path);
    if (key == m_record.lastFolder)
        return;
    m_record.lastFolder = key;
    touch();
}

void SessionState::movePath(const QString& from, const QString& to)
{
    const QString fromKey = keyFor(from);
    const QString toKey = keyFor(to);
    if (fromKey.isEmpty() || toKey.isEmpty() || fromKey == toKey)
        return;

    bool touched = false;

    QList<QString> movedMarkers;
    for (auto it = m_record.markers.cbegin(); it != m_record.markers.cend(); ++it) {
        if (Utils::PathUtils::isSameOrDescendant(it.key(), fromKey))
            movedMarkers.push_back(it.key());
    }
    m_record.markers = rebasedMap(m_record.markers, fromKey, toKey, &touched);
    m_record.scrollPositions = rebasedMap(m_record.scrollPositions, fromKey, toKey, &touched);

    QSet<QString> expanded;
    for (const QString& dir : std::as_const(m_record.expandedDirectories)) {
        if (Utils::PathUtils::isSameOrDescendant(dir, fromKey)) {
            expanded.insert(Utils::PathUtils::rebase(dir, fromKey, toKey));
            touched = true;
        } else {
            expanded.insert(dir);
        }
    }
    m_record.expandedDirectories = std::move(expanded);

    bool filesTouched = false;
    bool foldersTouched = false;
    m_record.recentFiles = rebasedList(m_record.recentFiles, fromKey, toKey, &filesTouched);
    m_record.recentFolders = rebasedList(m_record.recentFolders, fromKey, toKey, &foldersTouched);

    for (QString* last : {&m_record.lastFile, &m_record.lastFolder}) {
        if (!last->isEmpty() && Utils::PathUtils::isSameOrDescendant(*last, fromKey)) {
            *last = Utils::PathUtils::rebase(*last, fromKey, toKey);
            touched = true;
        }
    }

    if (!touched && !filesTouched && !foldersTouched)
        return;

    for (const QString& oldKey : std::as_const(movedMarkers)) {
        const QString newKey = Utils::PathUtils::rebase(oldKey, fromKey, toKey);
        emit markerChanged(oldKey, MarkerColor::None);
        emit markerChanged(newKey, m_record.markers.value(newKey, MarkerColor::None));
    }
    if (filesTouched)
        emit recentFilesChanged();
    if (foldersTouched)
        emit recentFoldersChanged();
    touch();
}

void SessionState::forgetPath(const QString& path)
{
    const QString key = keyFor(path);
    if (key.isEmpty())
        return;

    const auto under = [&key](const QString& p) { return Utils::PathUtils::isSameOrDescendant(p, key); };

    bool touched = prune(key, {}, {}) > 0;

    const qsizetype files = m_record.recentFiles.removeIf(under);
    const qsizetype folders = m_record.recentFolders.removeIf(under);

    if (!m_record.lastFile.isEmpty() && under(m_record.lastFile)) {
        m_record.lastFile.clear();
        touched = true;
    }
    if (!m_record.lastFolder.isEmpty() && under(m_record.lastFolder)) {
        m_record.lastFolder.clear();
        touched = true;
    }

    if (!touched && files == 0 && folders == 0)
        return;

    if (files > 0)
        emit recentFilesChanged();
    if (folders > 0)
        emit recentFoldersChanged();
    touch();
}

int SessionState::reconcile(const QSet<QString>& livePaths)
{
    return reconcile(QString(), livePaths);
}

int SessionState::reconcile(const QString& scannedRoot,
                            const QSet<QString>& livePaths,
                            const QSet<QString>& unwalked)
{
    const QString scope = keyFor(scannedRoot);
    if (!scannedRoot.trimmed().isEmpty() && scope.isEmpty())
        return 0;

    const int removed = prune(scope, keysFor(livePaths), keysFor(unwalked));
    if (removed > 0) {
        qCDebug(sessionlog) << "Reconciliation pruned" << removed << "stale entries"
                            << (scope.isEmpty() ? QString() : QStringLiteral("under %1").arg(scope));
        touch();
    }
    return removed;
}

// Removes in-scope entries not present in live and not beneath an unwalked
// directory. Emits markerChanged for each dropped marker but leaves touch()
// to the caller.
int SessionState::prune(const QString& scope, const QSet<QString>& live, const QSet<QString>& unwalked)
{
    int removed = 0;
    const auto stale = [&](const QString& key) {
        return inScope(key, scope) && !live.contains(key) && !beneathAny(key, unwalked);
    };

    QStringList droppedMarkers;
    for (auto it = m_record.markers.begin(); it != m_record.markers.end();) {
        if (stale(it.key())) {
            droppedMarkers.push_back(it.key());
            it = m_record.markers.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    for (auto it = m_record.scrollPositions.begin(); it != m_record.scrollPositions.end();) {
        if (stale(it.key())) {
            it = m_record.scrollPositions.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    for (auto it = m_record.expandedDirectories.begin(); it != m_record.expandedDirectories.end();) {
        if (stale(*it)) {
            it = m_record.expandedDirectories.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    for (const QString& key : std::as_const(droppedMarkers))
        emit markerChanged(key, MarkerColor::None);

    return removed;
}

Utils::Result SessionState::flush()
{
    m_flushInvoker.cancel();
    const Utils::Result result = m_store.save(m_record);
    emit flushed(result.ok);
    return result;
}

void SessionState::setFlushDelay(int ms)
{
    m_flushInvoker.setDelayMs(std::max(0, ms));
}

int SessionState::flushDelay() const
{
    return m_flushInvoker.delayMs();
}

bool SessionState::hasPendingFlush() const
{
    return m_flushInvoker.isPending();
}

} // namespace Session
