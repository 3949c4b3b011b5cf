#include "filetree/FileTreeActions.hpp"

#include <QtCore/QVector>

namespace FileTree {

namespace {

struct ActionEntry {
    FileTreeActions::Action action;
    QString id;
    QString text;
    int group = 0;
};

QString revealLabel()
{
#if defined(Q_OS_MAC)
    return QStringLiteral("Reveal in Finder");
#elif defined(Q_OS_WIN)
    return QStringLiteral("Show in Explorer");
#else
    return QStringLiteral("Show in File Manager");
#endif
}

const QVector<ActionEntry>& actionEntries()
{
    using A = FileTreeActions::Action;
    static const QVector<ActionEntry> entries = {
        { A::MarkGreen, QStringLiteral("mark-green"), QStringLiteral("Mark Green"), 0 },
        { A::MarkRed, QStringLiteral("mark-red"), QStringLiteral("Mark Red"), 0 },
        { A::ClearMark, QStringLiteral("clear-mark"), QStringLiteral("Clear Mark"), 0 },
        { A::Reveal, QStringLiteral("reveal"), revealLabel(), 1 },
        { A::NewFolder, QStringLiteral("new-folder"), QStringLiteral("New Folder..."), 2 },
        { A::NewMarkdownFile, QStringLiteral("new-markdown-file"), QStringLiteral("New Markdown File..."), 2 },
        { A::Rename, QStringLiteral("rename"), QStringLiteral("Rename..."), 3 },
        { A::Delete, QStringLiteral("delete"), QStringLiteral("Delete"), 3 }
    };
    return entries;
}

const ActionEntry* entryFor(FileTreeActions::Action action)
{
    for (const auto& entry : actionEntries()) {
        if (entry.action == action)
            return &entry;
    }
    return nullptr;
}

} // namespace

QString FileTreeActions::id(Action action)
{
    const ActionEntry* entry = entryFor(action);
    return entry ? entry->id : QString();
}

std::optional<FileTreeActions::Action> FileTreeActions::fromId(QStringView id)
{
    if (id.isEmpty())
        return std::nullopt;

    for (const auto& entry : actionEntries()) {
        if (entry.id == id)
            return entry.action;
    }
    return std::nullopt;
}

QString FileTreeActions::text(Action action)
{
    const ActionEntry* entry = entryFor(action);
    return entry ? entry->text : QString();
}

int FileTreeActions::group(Action action)
{
    const ActionEntry* entry = entryFor(action);
    return entry ? entry->group : -1;
}

QList<FileTreeActions::Action> FileTreeActions::available(bool isDirectory, Session::MarkerColor marker)
{
    if (isDirectory) {
        return { Action::Reveal, Action::NewFolder, Action::NewMarkdownFile,
                 Action::Rename, Action::Delete };
    }

    QList<Action> actions;
    if (marker != Session::MarkerColor::Green)
        actions.push_back(Action::MarkGreen);
    if (marker != Session::MarkerColor::Red)
        actions.push_back(Action::MarkRed);
    if (marker != Session::MarkerColor::None)
        actions.push_back(Action::ClearMark);
    actions.append({ Action::Reveal, Action::Rename, Action::Delete });
    return actions;
}

QList<FileTreeActions::Action> FileTreeActions::availableForRoot()
{
    return { Action::Reveal, Action::NewFolder, Action::NewMarkdownFile };
}

} // namespace FileTree
