// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "reader/ShellIntegration.hpp"

#include "reader/ReaderConstants.hpp"

#include <utils/PathUtils.hpp>

#include <QtCore/QDir>
#include <QtCore/QFileInfo>
#include <QtCore/QProcess>
#include <QtCore/QUrl>
#include <QtGui/QDesktopServices>
#include <QtGui/QGuiApplication>
#include <QtGui/QStyleHints>

#include <algorithm>

namespace Reader {

QtShellIntegration::QtShellIntegration(QObject* parent)
    : ShellIntegration(parent)
{
    if (auto* app = qobject_cast<QGuiApplication*>(QCoreApplication::instance())) {
        connect(app->styleHints(), &QStyleHints::colorSchemeChanged, this, [this] {
            invalidateSystemTheme();
            emit systemThemeChanged(systemTheme());
        });
    }
}

void QtShellIntegration::setTaskbarProgress(std::optional<qreal> fraction)
{
    if (fraction)
        fraction = std::clamp<qreal>(*fraction, 0.0, 1.0);
    if (fraction == m_progress)
        return;

    m_progress = fraction;
    emit progressChanged(m_progress);
}

std::optional<qreal> QtShellIntegration::taskbarProgress() const
{
    return m_progress;
}

ResolvedTheme QtShellIntegration::systemTheme()
{
    if (m_cachedTheme && m_themeAge.isValid()
        && m_themeAge.elapsed() < Constants::SYSTEM_THEME_CACHE_MS)
        return *m_cachedTheme;

    m_cachedTheme = readSystemTheme();
    m_themeAge.start();
    return *m_cachedTheme;
}

void QtShellIntegration::invalidateSystemTheme()
{
    m_cachedTheme.reset();
    m_themeAge.invalidate();
}

ResolvedTheme QtShellIntegration::readSystemTheme() const
{
    auto* app = qobject_cast<QGuiApplication*>(QCoreApplication::instance());
    if (!app)
        return ResolvedTheme::Light;
    return app->styleHints()->colorScheme() == Qt::ColorScheme::Dark ? ResolvedTheme::Dark
                                                                     : ResolvedTheme::Light;
}

Utils::Result QtShellIntegration::revealInFileExplorer(const QString& path)
{
    const QString abs = Utils::PathUtils::absoluteKey(path);
    if (abs.isEmpty() || !QFileInfo::exists(abs)) {
        const QString msg = QStringLiteral("Path does not exist: %1").arg(path);
        qCWarning(readerlog).noquote() << msg;
        return Utils::Result::failure(msg);
    }

#if defined(Q_OS_MAC)
    const QStringList args = { QStringLiteral("-R"), abs };
    if (QProcess::execute(QStringLiteral("open"), args) != 0) {
        const QString msg = QStringLiteral("Failed to reveal in Finder: %1").arg(abs);
        qCWarning(readerlog).noquote() << msg;
        return Utils::Result::failure(msg);
    }
#elif defined(Q_OS_WIN)
    const QStringList args = { QStringLiteral("/select,"), QDir::toNativeSeparators(abs) };
    if (!QProcess::startDetached(QStringLiteral("explorer"), args)) {
        const QString msg = QStringLiteral("Failed to reveal in Explorer: %1").arg(abs);
        qCWarning(readerlog).noquote() << msg;
        return Utils::Result::failure(msg);
    }
#else
    const QFileInfo fi(abs);
    const QString dirPath = fi.isDir() ? abs : fi.absolutePath();
    if (!QDesktopServices::openUrl(QUrl::fromLocalFile(dirPath))) {
        const QString msg = QStringLiteral("Failed to reveal in file manager: %1").arg(abs);
        qCWarning(readerlog).noquote() << msg;
        return Utils::Result::failure(msg);
    }
#endif

    return Utils::Result::success();
}

} // namespace Reader
