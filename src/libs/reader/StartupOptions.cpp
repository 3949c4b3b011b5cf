// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "reader/StartupOptions.hpp"

#include <utils/PathUtils.hpp>

#include <QtCore/QCommandLineParser>
#include <QtCore/QCoreApplication>
#include <QtCore/QFileInfo>

namespace Reader {

StartupOptions StartupOptions::parse(const QStringList& arguments)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(QCoreApplication::translate("Reader", "Markdown file viewer."));
    const QCommandLineOption help = parser.addHelpOption();
    const QCommandLineOption version = parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("file"),
                                 QCoreApplication::translate("Reader", "Markdown file to open."),
                                 QStringLiteral("[file]"));

    StartupOptions out;
    if (!parser.parse(arguments)) {
        out.action = Action::Error;
        out.message = parser.errorText();
        return out;
    }

    if (parser.isSet(help)) {
        out.action = Action::ShowHelp;
        out.message = parser.helpText();
        return out;
    }
    if (parser.isSet(version)) {
        out.action = Action::ShowVersion;
        out.message = QStringLiteral("%1 %2").arg(QCoreApplication::applicationName(),
                                                  QCoreApplication::applicationVersion());
        return out;
    }

    const QStringList positional = parser.positionalArguments();
    if (positional.isEmpty())
        return out;
    if (positional.size() > 1)
        qCWarning(readerlog) << "Ignoring extra arguments:" << positional.mid(1);

    out.requestedPath = positional.front();
    const QString abs = Utils::PathUtils::absoluteKey(out.requestedPath);
    const QFileInfo fi(abs);
    if (!abs.isEmpty() && fi.isFile() && fi.isReadable())
        out.filePath = abs;
    return out;
}

} // namespace Reader
