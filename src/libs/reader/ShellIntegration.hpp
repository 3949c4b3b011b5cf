// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "reader/ReaderGlobal.hpp"
#include "reader/Theme.hpp"

#include <utils/Result.hpp>

#include <QtCore/QElapsedTimer>
#include <QtCore/QObject>
#include <QtCore/QString>

#include <optional>

namespace Reader {

// The few OS-shell services the reader relies on. The window talks to
// this interface so tests can stand in a fake.
class READER_EXPORT ShellIntegration : public QObject
{
    Q_OBJECT

public:
    using QObject::QObject;
    ~ShellIntegration() override = default;

    // Null hides the indicator; values are clamped to [0, 1].
    virtual void setTaskbarProgress(std::optional<qreal> fraction) = 0;
    virtual std::optional<qreal> taskbarProgress() const = 0;

    virtual ResolvedTheme systemTheme() = 0;

    virtual Utils::Result revealInFileExplorer(const QString& path) = 0;

signals:
    void progressChanged(std::optional<qreal> fraction);
    void systemThemeChanged(Reader::ResolvedTheme theme);
};

class READER_EXPORT QtShellIntegration : public ShellIntegration
{
    Q_OBJECT

public:
    explicit QtShellIntegration(QObject* parent = nullptr);

    void setTaskbarProgress(std::optional<qreal> fraction) override;
    std::optional<qreal> taskbarProgress() const override;

    // Reads are cached briefly; a colour scheme change drops the cache.
    ResolvedTheme systemTheme() override;
    void invalidateSystemTheme();

    Utils::Result revealInFileExplorer(const QString& path) override;

protected:
    virtual ResolvedTheme readSystemTheme() const;

private:
    std::optional<qreal> m_progress;
    std::optional<ResolvedTheme> m_cachedTheme;
    QElapsedTimer m_themeAge;
};

} // namespace Reader
