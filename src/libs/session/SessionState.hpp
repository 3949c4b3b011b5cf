// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "session/ConfigStore.hpp"
#include "session/ConfigurationRecord.hpp"
#include "session/SessionGlobal.hpp"

#include <utils/Result.hpp>
#include <utils/async/DebouncedInvoker.hpp>

#include <QtCore/QObject>
#include <QtCore/QSet>
#include <QtCore/QString>

namespace Session {

// Owns the live configuration record. Every change re-arms a debounced
// save; flush() writes synchronously and is called once at shutdown.
// Paths are normalized to absolute keys on the way in.
class SESSION_EXPORT SessionState final : public QObject
{
    Q_OBJECT

public:
    static constexpr int kDefaultFlushDelayMs = 500;

    explicit SessionState(ConfigStore store, QObject* parent = nullptr);
    ~SessionState() override;

    const ConfigurationRecord& record() const { return m_record; }
    const RecordLimits& limits() const { return m_store.limits(); }
    const ConfigStore& store() const { return m_store; }

    void recordRecentFile(const QString& path);
    void recordRecentFolder(const QString& path);
    const QStringList& recentFiles() const { return m_record.recentFiles; }
    const QStringList& recentFolders() const { return m_record.recentFolders; }

    void setMarker(const QString& path, MarkerColor color);
    void clearMarker(const QString& path);
    MarkerColor marker(const QString& path) const;

    void setExpanded(const QString& path, bool expanded);
    bool isExpanded(const QString& path) const;

    void setScrollPosition(const QString& path, int offset);
    int scrollPosition(const QString& path) const;

    void setWindowGeometry(const WindowGeometry& geometry);
    void setSplitterPosition(int position);
    void setTheme(ThemePreference theme);
    void setFontSettings(const FontSettings& font);
    void setLastFile(const QString& path);
    void setLastFolder(const QString& path);

    // Re-keys everything recorded for from (and beneath it) onto to.
    void movePath(const QString& from, const QString& to);
    // Drops everything recorded for path and beneath it.
    void forgetPath(const QString& path);

    // Prunes marker, scroll and expanded entries absent from livePaths.
    // Returns the number of entries removed.
    int reconcile(const QSet<QString>& livePaths);
    // Same, restricted to entries at or beneath scannedRoot. Entries beneath
    // a path in unwalked are kept: those directories were listed but their
    // contents were never enumerated.
    int reconcile(const QString& scannedRoot,
                  const QSet<QString>& livePaths,
                  const QSet<QString>& unwalked = {});

    Utils::Result flush();

    void setFlushDelay(int ms);
    int flushDelay() const;
    bool hasPendingFlush() const;

signals:
    void changed();
    void markerChanged(const QString& path, Session::MarkerColor color);
    void recentFilesChanged();
    void recentFoldersChanged();
    void themeChanged(Session::ThemePreference theme);
    void fontSettingsChanged();
    void flushed(bool ok);

private:
    void touch();
    bool pushRecent(QStringList& list, const QString& key);
    int prune(const QString& scope, const QSet<QString>& livePaths, const QSet<QString>& unwalked);

    ConfigStore m_store;
    ConfigurationRecord m_record;
    Utils::Async::DebouncedInvoker m_flushInvoker;
};

} // namespace Session
