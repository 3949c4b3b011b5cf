// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "reader/MarkdownRenderer.hpp"
#include "reader/PreviewStyle.hpp"
#include "reader/ReaderGlobal.hpp"

#include <utils/async/DebouncedInvoker.hpp>

#include <QtWidgets/QMainWindow>

#include <optional>

class QActionGroup;
class QLabel;
class QMenu;
class QProgressBar;
class QSplitter;

namespace Session {
class SessionState;
}

namespace FileTree {
class FileTreeDataSource;
class FileTreePanel;
}

namespace Reader {

class MarkdownPreview;
class ShellIntegration;

// Tree on the left, preview on the right. Window state is written to
// the session as it changes; the session itself is flushed on close.
class READER_EXPORT MainWindow final : public QMainWindow
{
    Q_OBJECT

public:
    MainWindow(Session::SessionState& session, ShellIntegration& shell, QWidget* parent = nullptr);
    ~MainWindow() override;

    MarkdownRenderer& renderer() { return m_renderer; }
    FileTree::FileTreeDataSource* dataSource() const { return m_dataSource; }
    FileTree::FileTreePanel* treePanel() const { return m_treePanel; }
    MarkdownPreview* preview() const { return m_preview; }
    const PreviewStyle& previewStyle() const { return m_style; }

    QString currentFile() const { return m_currentFile; }

    // Opens and renders a file, re-rooting the tree when the file lies
    // outside it. Warns and returns false for a missing file.
    bool openFile(const QString& path);
    bool openFolder(const QString& path);

    // Reopens the last folder and file; missing ones are skipped quietly.
    void restoreSession();

    void showInvalidPathWarning(const QString& path);

public slots:
    void applyTheme();
    void reloadCurrentFile();

protected:
    void closeEvent(QCloseEvent* event) override;
    bool event(QEvent* event) override;

private slots:
    void chooseFile();
    void chooseFolder();
    void showSettings();
    void showAbout();
    void rebuildRecentFiles();
    void rebuildRecentFolders();
    void handleSplitterMoved(int pos, int index);
    void handleProgressChanged(std::optional<qreal> fraction);
    void handleReveal(const QString& path);

private:
    void createMenus();
    void createStatusBar();
    void restoreWindowState();
    void saveWindowState();
    bool renderFile(const QString& path);
    void setCurrentFile(const QString& path);
    void syncThemeActions();

    Session::SessionState& m_session;
    ShellIntegration& m_shell;
    MarkdownRenderer m_renderer;
    PreviewStyle m_style;

    FileTree::FileTreeDataSource* m_dataSource = nullptr;
    FileTree::FileTreePanel* m_treePanel = nullptr;
    MarkdownPreview* m_preview = nullptr;
    QSplitter* m_splitter = nullptr;

    QMenu* m_recentFilesMenu = nullptr;
    QMenu* m_recentFoldersMenu = nullptr;
    QActionGroup* m_themeGroup = nullptr;

    QLabel* m_statusLabel = nullptr;
    QProgressBar* m_progress = nullptr;

    Utils::Async::DebouncedInvoker m_stateSaveInvoker;
    QString m_currentFile;
    bool m_shuttingDown = false;
};

} // namespace Reader
