// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "reader/StartupOptions.hpp"

#include <QtCore/QCoreApplication>
#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QTemporaryDir>

using Reader::StartupOptions;

namespace {

const QString kProgram = QStringLiteral("mdreader");

} // namespace

TEST(StartupOptionsTests, NoArgumentsRunsWithoutFile)
{
    const StartupOptions opts = StartupOptions::parse({kProgram});
    EXPECT_EQ(opts.action, StartupOptions::Action::Run);
    EXPECT_TRUE(opts.requestedPath.isEmpty());
    EXPECT_TRUE(opts.filePath.isEmpty());
    EXPECT_FALSE(opts.hasInvalidPath());
}

TEST(StartupOptionsTests, ExistingFileResolvesToAbsolutePath)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString root = QDir(dir.path()).canonicalPath();
    QFile f(root + QStringLiteral("/notes.md"));
    ASSERT_TRUE(f.open(QIODevice::WriteOnly));
    f.close();

    const StartupOptions opts = StartupOptions::parse({kProgram, root + QStringLiteral("/./notes.md")});
    EXPECT_EQ(opts.action, StartupOptions::Action::Run);
    EXPECT_EQ(opts.filePath, root + QStringLiteral("/notes.md"));
    EXPECT_FALSE(opts.hasInvalidPath());
}

TEST(StartupOptionsTests, MissingOrDirectoryPathIsInvalid)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    const StartupOptions missing = StartupOptions::parse({kProgram, dir.filePath(QStringLiteral("gone.md"))});
    EXPECT_EQ(missing.action, StartupOptions::Action::Run);
    EXPECT_TRUE(missing.hasInvalidPath());
    EXPECT_EQ(missing.requestedPath, dir.filePath(QStringLiteral("gone.md")));

    const StartupOptions folder = StartupOptions::parse({kProgram, dir.path()});
    EXPECT_TRUE(folder.hasInvalidPath());
}

TEST(StartupOptionsTests, HelpAndVersion)
{
    QCoreApplication::setApplicationName(QStringLiteral("MarkdownReader"));
    QCoreApplication::setApplicationVersion(QStringLiteral("9.9"));

    const StartupOptions help = StartupOptions::parse({kProgram, QStringLiteral("--help")});
    EXPECT_EQ(help.action, StartupOptions::Action::ShowHelp);
    EXPECT_TRUE(help.message.contains(QStringLiteral("[file]")));

    const StartupOptions version = StartupOptions::parse({kProgram, QStringLiteral("--version")});
    EXPECT_EQ(version.action, StartupOptions::Action::ShowVersion);
    EXPECT_TRUE(version.message.contains(QStringLiteral("9.9")));
}

TEST(StartupOptionsTests, UnknownOptionIsAnError)
{
    const StartupOptions opts = StartupOptions::parse({kProgram, QStringLiteral("--bogus")});
    EXPECT_EQ(opts.action, StartupOptions::Action::Error);
    EXPECT_FALSE(opts.message.isEmpty());
}
