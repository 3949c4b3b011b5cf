// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "reader/MainWindow.hpp"

#include "reader/MarkdownPreview.hpp"
#include "reader/ReaderConstants.hpp"
#include "reader/SettingsDialog.hpp"
#include "reader/ShellIntegration.hpp"
#include "reader/Theme.hpp"

#include <filetree/FileOperations.hpp>
#include <filetree/FileTreeDataSource.hpp>
#include <filetree/FileTreePanel.hpp>
#include <session/SessionState.hpp>
#include <utils/PathUtils.hpp>

#include <QtCore/QCoreApplication>
#include <QtCore/QDir>
#include <QtCore/QEvent>
#include <QtCore/QFileInfo>
#include <QtCore/QTimer>
#include <QtCore/QUrl>
#include <QtGui/QAction>
#include <QtGui/QActionGroup>
#include <QtGui/QCloseEvent>
#include <QtGui/QGuiApplication>
#include <QtGui/QKeySequence>
#include <QtGui/QScreen>
#include <QtGui/QTextDocument>
#include <QtWidgets/QApplication>
#include <QtWidgets/QFileDialog>
#include <QtWidgets/QLabel>
#include <QtWidgets/QMenu>
#include <QtWidgets/QMenuBar>
#include <QtWidgets/QMessageBox>
#include <QtWidgets/QProgressBar>
#include <QtWidgets/QSplitter>
#include <QtWidgets/QStatusBar>

namespace Reader {

namespace {

constexpr int kProgressSteps = 1000;
constexpr int kProgressHideDelayMs = 300;

} // namespace

MainWindow::MainWindow(Session::SessionState& session, ShellIntegration& shell, QWidget* parent)
    : QMainWindow(parent)
    , m_session(session)
    , m_shell(shell)
    , m_stateSaveInvoker(Constants::WINDOW_STATE_SAVE_DELAY_MS)
{
    setObjectName(Constants::MAIN_WINDOW_OBJECT_NAME);
    setWindowTitle(QGuiApplication::applicationDisplayName());

    m_dataSource = new FileTree::FileTreeDataSource(m_session, this);

    m_splitter = new QSplitter(Qt::Horizontal, this);
    m_splitter->setChildrenCollapsible(false);

    m_treePanel = new FileTree::FileTreePanel(m_session, m_dataSource, m_splitter);
    m_preview = new MarkdownPreview(m_splitter);
    m_splitter->addWidget(m_treePanel);
    m_splitter->addWidget(m_preview);
    m_splitter->setStretchFactor(0, 0);
    m_splitter->setStretchFactor(1, 1);
    setCentralWidget(m_splitter);

    createMenus();
    createStatusBar();

    connect(m_splitter, &QSplitter::splitterMoved, this, &MainWindow::handleSplitterMoved);
    connect(m_treePanel, &FileTree::FileTreePanel::fileActivated, this,
            [this](const QString& path) { openFile(path); });
    connect(m_treePanel, &FileTree::FileTreePanel::revealRequested, this, &MainWindow::handleReveal);
    connect(m_treePanel->operations(), &FileTree::FileOperations::operationCompleted, this,
            [this](FileTree::FileOperations::Operation op, const QString& path, const QString& newPath) {
                if (m_currentFile.isEmpty() || !Utils::PathUtils::isSameOrDescendant(m_currentFile, path))
                    return;
                if (op == FileTree::FileOperations::Operation::Rename)
                    setCurrentFile(Utils::PathUtils::rebase(m_currentFile, path, newPath));
                else if (op == FileTree::FileOperations::Operation::Delete) {
                    setCurrentFile({});
                    m_preview->showMessage(tr("The open file was deleted."));
                }
            });

    connect(m_preview, &MarkdownPreview::scrollOffsetChanged, this, [this](int offset) {
        if (!m_currentFile.isEmpty())
            m_session.setScrollPosition(m_currentFile, offset);
    });

    connect(&m_session, &Session::SessionState::themeChanged, this, &MainWindow::applyTheme);
    connect(&m_session, &Session::SessionState::fontSettingsChanged, this, &MainWindow::applyTheme);
    connect(&m_session, &Session::SessionState::recentFilesChanged, this, &MainWindow::rebuildRecentFiles);
    connect(&m_session, &Session::SessionState::recentFoldersChanged, this, &MainWindow::rebuildRecentFolders);
    connect(&m_shell, &ShellIntegration::systemThemeChanged, this, [this] {
        if (m_session.record().theme == Session::ThemePreference::Auto)
            applyTheme();
    });
    connect(&m_shell, &ShellIntegration::progressChanged, this, &MainWindow::handleProgressChanged);

    m_stateSaveInvoker.setAction([this] { saveWindowState(); });

    restoreWindowState();
    rebuildRecentFiles();
    rebuildRecentFolders();
    applyTheme();

    m_preview->showMessage(tr("Open a Markdown file or folder to start reading."));
}

MainWindow::~MainWindow()
{
    m_shuttingDown = true;
    m_stateSaveInvoker.cancel();
}

void MainWindow::createMenus()
{
    QMenu* fileMenu = menuBar()->addMenu(tr("&File"));
    QAction* openFile = fileMenu->addAction(tr("Open File..."), this, &MainWindow::chooseFile);
    openFile->setShortcut(QKeySequence::Open);
    QAction* openFolder = fileMenu->addAction(tr("Open Folder..."), this, &MainWindow::chooseFolder);
    openFolder->setShortcut(QKeySequence(Qt::CTRL | Qt::Key_K));
    fileMenu->addSeparator();
    m_recentFilesMenu = fileMenu->addMenu(tr("Recent Files"));
    m_recentFoldersMenu = fileMenu->addMenu(tr("Recent Folders"));
    fileMenu->addSeparator();
    QAction* quit = fileMenu->addAction(tr("Exit"), this, &QWidget::close);
    quit->setShortcut(QKeySequence::Quit);

    QMenu* viewMenu = menuBar()->addMenu(tr("&View"));
    QAction* refresh = viewMenu->addAction(tr("Refresh"), this, [this] {
        m_dataSource->refresh();
        reloadCurrentFile();
    });
    refresh->setShortcut(QKeySequence::Refresh);

    QMenu* themeMenu = viewMenu->addMenu(tr("Theme"));
    m_themeGroup = new QActionGroup(this);
    m_themeGroup->setExclusive(true);
    for (const auto pref : {Session::ThemePreference::Light, Session::ThemePreference::Dark,
                            Session::ThemePreference::Auto}) {
        QAction* action = themeMenu->addAction(themeDisplayName(pref));
        action->setCheckable(true);
        action->setData(QVariant::fromValue(pref));
        m_themeGroup->addAction(action);
        connect(action, &QAction::triggered, this, [this, pref] { m_session.setTheme(pref); });
    }

    QMenu* settingsMenu = menuBar()->addMenu(tr("&Settings"));
    QAction* settings = settingsMenu->addAction(tr("Settings..."), this, &MainWindow::showSettings);
    settings->setShortcut(QKeySequence(Qt::CTRL | Qt::Key_Comma));

    QMenu* helpMenu = menuBar()->addMenu(tr("&Help"));
    helpMenu->addAction(tr("About"), this, &MainWindow::showAbout);
}

void MainWindow::createStatusBar()
{
    m_statusLabel = new QLabel(this);
    statusBar()->addWidget(m_statusLabel, 1);

    m_progress = new QProgressBar(this);
    m_progress->setRange(0, kProgressSteps);
    m_progress->setTextVisible(false);
    m_progress->setMaximumWidth(160);
    m_progress->setVisible(false);
    statusBar()->addPermanentWidget(m_progress);
}

void MainWindow::restoreWindowState()
{
    const Session::WindowGeometry& geom = m_session.record().window;
    QRect rect(geom.x, geom.y, geom.width, geom.height);

    // A monitor that is gone would leave the window unreachable.
    if (!QGuiApplication::screenAt(rect.center())) {
        if (QScreen* primary = QGuiApplication::primaryScreen()) {
            rect.moveCenter(primary->availableGeometry().center());
        }
    }
    setGeometry(rect);

    if (geom.maximized)
        setWindowState(windowState() | Qt::WindowMaximized);

    const int treeWidth = geom.splitterPosition > 0 ? geom.splitterPosition : 300;
    m_splitter->setSizes({treeWidth, qMax(1, rect.width() - treeWidth)});
}

void MainWindow::saveWindowState()
{
    if (windowState().testFlag(Qt::WindowMinimized))
        return;

    Session::WindowGeometry geom = m_session.record().window;
    geom.maximized = isMaximized();
    if (!geom.maximized && !isFullScreen()) {
        const QRect rect = geometry();
        geom.x = rect.x();
        geom.y = rect.y();
        geom.width = rect.width();
        geom.height = rect.height();
    }
    const QList<int> sizes = m_splitter->sizes();
    if (!sizes.isEmpty() && sizes.front() > 0)
        geom.splitterPosition = sizes.front();

    m_session.setWindowGeometry(geom);
}

bool MainWindow::event(QEvent* event)
{
    if (!m_shuttingDown) {
        switch (event->type()) {
        case QEvent::Resize:
        case QEvent::Move:
        case QEvent::WindowStateChange:
            m_stateSaveInvoker.trigger();
            break;
        default:
            break;
        }
    }
    return QMainWindow::event(event);
}

void MainWindow::closeEvent(QCloseEvent* event)
{
    m_stateSaveInvoker.cancel();
    saveWindowState();
    if (!m_currentFile.isEmpty())
        m_session.setScrollPosition(m_currentFile, m_preview->scrollOffset());

    const Utils::Result flushed = m_session.flush();
    if (!flushed)
        qCWarning(readerlog).noquote() << "Session was not saved on close:" << flushed.message();

    m_shuttingDown = true;
    event->accept();
}

void MainWindow::handleSplitterMoved(int pos, int)
{
    const int total = m_splitter->width();
    const int maxTree = total / Constants::TREE_MAX_WIDTH_DIVISOR;
    if (maxTree > 0 && pos > maxTree) {
        m_splitter->setSizes({maxTree, total - maxTree});
        pos = maxTree;
    }
    m_session.setSplitterPosition(pos);
}

void MainWindow::applyTheme()
{
    const ResolvedTheme resolved = resolveTheme(m_session.record().theme, m_shell.systemTheme());
    if (qobject_cast<QApplication*>(QCoreApplication::instance()))
        QApplication::setPalette(windowPalette(resolved));

    m_style = PreviewStyle::make(resolved, m_session.record().font);
    m_preview->applyStyle(m_style);
    syncThemeActions();
    reloadCurrentFile();
}

void MainWindow::syncThemeActions()
{
    const Session::ThemePreference current = m_session.record().theme;
    for (QAction* action : m_themeGroup->actions()) {
        if (action->data().value<Session::ThemePreference>() == current)
            action->setChecked(true);
    }
}

void MainWindow::reloadCurrentFile()
{
    if (m_currentFile.isEmpty())
        return;
    m_session.setScrollPosition(m_currentFile, m_preview->scrollOffset());
    renderFile(m_currentFile);
}

void MainWindow::setCurrentFile(const QString& path)
{
    m_currentFile = path;
    if (path.isEmpty()) {
        setWindowTitle(QGuiApplication::applicationDisplayName());
        return;
    }
    setWindowTitle(QStringLiteral("%1 - %2").arg(QFileInfo(path).fileName(),
                                                  QGuiApplication::applicationDisplayName()));
}

bool MainWindow::renderFile(const QString& path)
{
    const QFileInfo fi(path);
    m_statusLabel->setText(tr("Loading: %1").arg(fi.fileName()));
    m_shell.setTaskbarProgress(0.0);

    QString text;
    const Utils::Result read = MarkdownRenderer::readFile(path, &text);
    if (!read) {
        qCWarning(readerlog).noquote() << read.message();
        m_preview->showMessage(read.message());
        m_statusLabel->setText(tr("Failed to load: %1").arg(fi.fileName()));
        m_shell.setTaskbarProgress(std::nullopt);
        return false;
    }

    m_shell.setTaskbarProgress(0.5);
    const QString dir = fi.absolutePath();
    std::unique_ptr<QTextDocument> doc =
        m_renderer.renderDocument(text, m_style, QUrl::fromLocalFile(dir + u'/'));

    setCurrentFile(path);
    m_preview->showDocument(std::move(doc), dir, m_session.scrollPosition(path));

    m_shell.setTaskbarProgress(1.0);
    QTimer::singleShot(kProgressHideDelayMs, this, [this] { m_shell.setTaskbarProgress(std::nullopt); });
    m_statusLabel->setText(tr("Loaded: %1").arg(fi.fileName()));
    return true;
}

bool MainWindow::openFile(const QString& path)
{
    const QString abs = Utils::PathUtils::absoluteKey(path);
    if (abs.isEmpty() || !QFileInfo(abs).isFile()) {
        QMessageBox::warning(this, tr("Open File"), tr("File does not exist:\n%1").arg(path));
        return false;
    }

    if (!m_currentFile.isEmpty() && m_currentFile != abs)
        m_session.setScrollPosition(m_currentFile, m_preview->scrollOffset());

    m_session.recordRecentFile(abs);
    m_session.setLastFile(abs);

    const QString root = m_dataSource->rootPath();
    if (root.isEmpty() || !Utils::PathUtils::isSameOrDescendant(abs, root))
        openFolder(QFileInfo(abs).absolutePath());

    m_treePanel->selectPath(abs);
    return renderFile(abs);
}

bool MainWindow::openFolder(const QString& path)
{
    const QString abs = Utils::PathUtils::absoluteKey(path);
    if (abs.isEmpty() || !QFileInfo(abs).isDir()) {
        QMessageBox::warning(this, tr("Open Folder"), tr("Folder does not exist:\n%1").arg(path));
        return false;
    }

    m_dataSource->setRootPath(abs);
    m_session.recordRecentFolder(abs);
    m_session.setLastFolder(abs);
    m_statusLabel->setText(tr("Opened folder: %1").arg(QDir::toNativeSeparators(abs)));
    return true;
}

void MainWindow::restoreSession()
{
    const Session::ConfigurationRecord& record = m_session.record();
    if (!record.lastFolder.isEmpty() && QFileInfo(record.lastFolder).isDir())
        m_dataSource->setRootPath(record.lastFolder);

    if (!record.lastFile.isEmpty() && QFileInfo(record.lastFile).isFile())
        openFile(record.lastFile);
}

void MainWindow::showInvalidPathWarning(const QString& path)
{
    qCWarning(readerlog).noquote() << "Startup path is not a readable file:" << path;
    QMessageBox::warning(this, QGuiApplication::applicationDisplayName(),
                         tr("Cannot open \"%1\".\nThe file does not exist or is not readable.").arg(path));
}

void MainWindow::chooseFile()
{
    const QString start = m_dataSource->rootPath();
    const QString path = QFileDialog::getOpenFileName(this, tr("Open File"), start,
                                                      tr("Markdown files (*.md *.markdown);;All files (*)"));
    if (!path.isEmpty())
        openFile(path);
}

void MainWindow::chooseFolder()
{
    const QString path = QFileDialog::getExistingDirectory(this, tr("Open Folder"), m_dataSource->rootPath());
    if (!path.isEmpty())
        openFolder(path);
}

void MainWindow::showSettings()
{
    SettingsDialog dialog(m_session.record().theme, m_session.record().font, m_session.limits(), this);
    if (dialog.exec() != QDialog::Accepted)
        return;

    m_session.setTheme(dialog.theme());
    m_session.setFontSettings(dialog.fontSettings());
}

void MainWindow::showAbout()
{
    QMessageBox::about(this, tr("About %1").arg(QGuiApplication::applicationDisplayName()),
                       tr("%1 %2\nA Markdown file viewer.")
                           .arg(QGuiApplication::applicationDisplayName(),
                                QCoreApplication::applicationVersion()));
}

void MainWindow::rebuildRecentFiles()
{
    m_recentFilesMenu->clear();
    for (const QString& path : m_session.recentFiles()) {
        QAction* action = m_recentFilesMenu->addAction(QFileInfo(path).fileName());
        action->setToolTip(QDir::toNativeSeparators(path));
        action->setStatusTip(QDir::toNativeSeparators(path));
        connect(action, &QAction::triggered, this, [this, path] { openFile(path); });
    }
    m_recentFilesMenu->setEnabled(!m_recentFilesMenu->isEmpty());
}

void MainWindow::rebuildRecentFolders()
{
    m_recentFoldersMenu->clear();
    for (const QString& path : m_session.recentFolders()) {
        QAction* action = m_recentFoldersMenu->addAction(QDir::toNativeSeparators(path));
        connect(action, &QAction::triggered, this, [this, path] { openFolder(path); });
    }
    m_recentFoldersMenu->setEnabled(!m_recentFoldersMenu->isEmpty());
}

void MainWindow::handleProgressChanged(std::optional<qreal> fraction)
{
    if (!fraction) {
        m_progress->setVisible(false);
        return;
    }
    m_progress->setValue(qRound(*fraction * kProgressSteps));
    m_progress->setVisible(true);
}

void MainWindow::handleReveal(const QString& path)
{
    const Utils::Result revealed = m_shell.revealInFileExplorer(path);
    if (!revealed)
        QMessageBox::warning(this, tr("Reveal in File Manager"), revealed.message());
}

} // namespace Reader
