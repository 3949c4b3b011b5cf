// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "session/SessionState.hpp"

#include <QtCore/QCoreApplication>
#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QTemporaryDir>
#include <QtTest/QSignalSpy>
#include <QtTest/QTest>

#include <memory>

using Session::ConfigStore;
using Session::ConfigurationRecord;
using Session::FontSettings;
using Session::MarkerColor;
using Session::RecordLimits;
using Session::SessionState;
using Session::ThemePreference;

namespace {

QCoreApplication* ensureApp()
{
    static int argc = 1;
    static char arg0[] = "session-tests";
    static char* argv[] = {arg0, nullptr};
    static std::unique_ptr<QCoreApplication> app;
    if (!QCoreApplication::instance())
        app = std::make_unique<QCoreApplication>(argc, argv);
    return QCoreApplication::instance();
}

ConfigStore storeIn(const QTemporaryDir& dir, RecordLimits limits = {})
{
    return ConfigStore(ConfigStore::makeDocumentStore(dir.path()), limits);
}

} // namespace

TEST(SessionStateTests, StartsFromDefaultsWhenNothingIsStored)
{
    ensureApp();
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    SessionState session(storeIn(dir));
    EXPECT_EQ(session.record(), ConfigurationRecord::defaults());
    EXPECT_FALSE(session.hasPendingFlush());
}

TEST(SessionStateTests, RecentFilesMoveToFrontWithinCap)
{
    ensureApp();
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    RecordLimits limits;
    limits.maxRecentEntries = 3;
    SessionState session(storeIn(dir, limits));

    for (const char* p : {"/x", "/y", "/z", "/x"})
        session.recordRecentFile(QString::fromLatin1(p));

    const QStringList expected{QStringLiteral("/x"), QStringLiteral("/z"), QStringLiteral("/y")};
    EXPECT_EQ(session.recentFiles(), expected);
}

TEST(SessionStateTests, RecentListNeverExceedsCap)
{
    ensureApp();
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    SessionState session(storeIn(dir));
    for (int i = 0; i < 40; ++i) {
        session.recordRecentFolder(QStringLiteral("/folder/%1").arg(i % 13));
        ASSERT_LE(session.recentFolders().size(), session.limits().maxRecentEntries);
        EXPECT_EQ(session.recentFolders().front(), QStringLiteral("/folder/%1").arg(i % 13));
        QStringList copy = session.recentFolders();
        EXPECT_EQ(copy.removeDuplicates(), 0);
    }
}

TEST(SessionStateTests, EmptyRecentPathIsIgnored)
{
    ensureApp();
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    SessionState session(storeIn(dir));
    QSignalSpy spy(&session, &SessionState::changed);
    session.recordRecentFile(QString());
    session.recordRecentFile(QStringLiteral("   "));
    EXPECT_TRUE(session.recentFiles().isEmpty());
    EXPECT_EQ(spy.count(), 0);
}

TEST(SessionStateTests, SettingNoneMarkerRemovesKey)
{
    ensureApp();
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    SessionState session(storeIn(dir));
    const QString path = QStringLiteral("/a/readme.md");

    session.setMarker(path, MarkerColor::Green);
    EXPECT_EQ(session.marker(path), MarkerColor::Green);

    session.setMarker(path, MarkerColor::None);
    EXPECT_FALSE(session.record().markers.contains(path));
    EXPECT_EQ(session.marker(path), MarkerColor::None);
}

TEST(SessionStateTests, MarkerSignalsOnlyOnChange)
{
    ensureApp();
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    SessionState session(storeIn(dir));
    QSignalSpy markerSpy(&session, &SessionState::markerChanged);
    QSignalSpy changedSpy(&session, &SessionState::changed);

    session.setMarker(QStringLiteral("/a.md"), MarkerColor::Red);
    session.setMarker(QStringLiteral("/a.md"), MarkerColor::Red);
    session.clearMarker(QStringLiteral("/b.md"));

    EXPECT_EQ(markerSpy.count(), 1);
    EXPECT_EQ(changedSpy.count(), 1);
    EXPECT_EQ(markerSpy.at(0).at(0).toString(), QStringLiteral("/a.md"));
}

TEST(SessionStateTests, PathsAreNormalizedToAbsoluteKeys)
{
    ensureApp();
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    SessionState session(storeIn(dir));
    session.setMarker(QStringLiteral("/docs/sub/../a.md"), MarkerColor::Green);
    EXPECT_EQ(session.marker(QStringLiteral("/docs/a.md")), MarkerColor::Green);
    EXPECT_TRUE(session.record().markers.contains(QStringLiteral("/docs/a.md")));

    session.setExpanded(QStringLiteral("/docs/"), true);
    EXPECT_TRUE(session.isExpanded(QStringLiteral("/docs")));
}

TEST(SessionStateTests, ScrollOffsetsClampAndZeroRemoves)
{
    ensureApp();
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    SessionState session(storeIn(dir));
    const QString path = QStringLiteral("/n/a.md");

    session.setScrollPosition(path, 250);
    EXPECT_EQ(session.scrollPosition(path), 250);

    session.setScrollPosition(path, -40);
    EXPECT_EQ(session.scrollPosition(path), 0);
    EXPECT_FALSE(session.record().scrollPositions.contains(path));
}

TEST(SessionStateTests, FontSettingsAreClampedOnWrite)
{
    ensureApp();
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    SessionState session(storeIn(dir));
    QSignalSpy spy(&session, &SessionState::fontSettingsChanged);

    FontSettings font;
    font.bodySize = 3;
    font.codeSize = 1000;
    font.codeFamily = QStringLiteral("  ");
    session.setFontSettings(font);

    EXPECT_EQ(session.record().font.bodySize, 8);
    EXPECT_EQ(session.record().font.codeSize, 72);
    EXPECT_EQ(session.record().font.codeFamily, FontSettings::defaultCodeFamily());
    EXPECT_EQ(spy.count(), 1);
}

TEST(SessionStateTests, ThemeChangeEmitsOnce)
{
    ensureApp();
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    SessionState session(storeIn(dir));
    QSignalSpy spy(&session, &SessionState::themeChanged);
    session.setTheme(ThemePreference::Dark);
    session.setTheme(ThemePreference::Dark);
    EXPECT_EQ(spy.count(), 1);
    EXPECT_EQ(session.record().theme, ThemePreference::Dark);
}

TEST(SessionStateTests, ReconcileRemovesExactlyAbsentEntries)
{
    ensureApp();
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    SessionState session(storeIn(dir));
    session.setMarker(QStringLiteral("/a/readme.md"), MarkerColor::Green);
    session.setMarker(QStringLiteral("/a/gone.md"), MarkerColor::Red);
    session.setScrollPosition(QStringLiteral("/a/readme.md"), 10);
    session.setScrollPosition(QStringLiteral("/a/gone.md"), 20);
    session.setExpanded(QStringLiteral("/a"), true);
    session.setExpanded(QStringLiteral("/a/old"), true);
    session.recordRecentFile(QStringLiteral("/a/gone.md"));

    const QSet<QString> live{QStringLiteral("/a"), QStringLiteral("/a/readme.md")};
    EXPECT_EQ(session.reconcile(live), 3);

    EXPECT_EQ(session.marker(QStringLiteral("/a/readme.md")), MarkerColor::Green);
    EXPECT_EQ(session.marker(QStringLiteral("/a/gone.md")), MarkerColor::None);
    EXPECT_EQ(session.scrollPosition(QStringLiteral("/a/readme.md")), 10);
    EXPECT_EQ(session.scrollPosition(QStringLiteral("/a/gone.md")), 0);
    EXPECT_TRUE(session.isExpanded(QStringLiteral("/a")));
    EXPECT_FALSE(session.isExpanded(QStringLiteral("/a/old")));
    EXPECT_EQ(session.recentFiles(), QStringList{QStringLiteral("/a/gone.md")});
}

TEST(SessionStateTests, ScopedReconcileLeavesOtherTreesAlone)
{
    ensureApp();
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    SessionState session(storeIn(dir));
    session.setMarker(QStringLiteral("/work/a.md"), MarkerColor::Green);
    session.setMarker(QStringLiteral("/work/b.md"), MarkerColor::Green);
    session.setMarker(QStringLiteral("/home/notes.md"), MarkerColor::Red);

    const QSet<QString> live{QStringLiteral("/work"), QStringLiteral("/work/a.md")};
    EXPECT_EQ(session.reconcile(QStringLiteral("/work"), live), 1);

    EXPECT_EQ(session.marker(QStringLiteral("/work/a.md")), MarkerColor::Green);
    EXPECT_EQ(session.marker(QStringLiteral("/work/b.md")), MarkerColor::None);
    EXPECT_EQ(session.marker(QStringLiteral("/home/notes.md")), MarkerColor::Red);
}

TEST(SessionStateTests, ScopedReconcileKeepsEntriesBeneathUnwalkedFolders)
{
    ensureApp();
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    SessionState session(storeIn(dir));
    session.setScrollPosition(QStringLiteral("/work/link/x.md"), 40);
    session.setExpanded(QStringLiteral("/work/link/sub"), true);
    session.setMarker(QStringLiteral("/work/gone.md"), MarkerColor::Red);

    const QSet<QString> live{QStringLiteral("/work"), QStringLiteral("/work/link")};
    const QSet<QString> unwalked{QStringLiteral("/work/link")};
    EXPECT_EQ(session.reconcile(QStringLiteral("/work"), live, unwalked), 1);

    EXPECT_EQ(session.scrollPosition(QStringLiteral("/work/link/x.md")), 40);
    EXPECT_TRUE(session.isExpanded(QStringLiteral("/work/link/sub")));
    EXPECT_EQ(session.marker(QStringLiteral("/work/gone.md")), MarkerColor::None);
}

TEST(SessionStateTests, ReconcileWithNothingStaleIsSilent)
{
    ensureApp();
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    SessionState session(storeIn(dir));
    session.setMarker(QStringLiteral("/a.md"), MarkerColor::Green);
    ASSERT_TRUE(session.flush());

    QSignalSpy spy(&session, &SessionState::changed);
    EXPECT_EQ(session.reconcile({QStringLiteral("/a.md")}), 0);
    EXPECT_EQ(spy.count(), 0);
    EXPECT_FALSE(session.hasPendingFlush());
}

TEST(SessionStateTests, MovePathRekeysDescendants)
{
    ensureApp();
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    SessionState session(storeIn(dir));
    session.setMarker(QStringLiteral("/docs/old/a.md"), MarkerColor::Green);
    session.setMarker(QStringLiteral("/docs/older.md"), MarkerColor::Red);
    session.setScrollPosition(QStringLiteral("/docs/old/a.md"), 99);
    session.setExpanded(QStringLiteral("/docs/old"), true);
    session.recordRecentFile(QStringLiteral("/docs/old/a.md"));
    session.setLastFile(QStringLiteral("/docs/old/a.md"));

    session.movePath(QStringLiteral("/docs/old"), QStringLiteral("/docs/new"));

    EXPECT_EQ(session.marker(QStringLiteral("/docs/new/a.md")), MarkerColor::Green);
    EXPECT_EQ(session.marker(QStringLiteral("/docs/old/a.md")), MarkerColor::None);
    EXPECT_EQ(session.marker(QStringLiteral("/docs/older.md")), MarkerColor::Red);
    EXPECT_EQ(session.scrollPosition(QStringLiteral("/docs/new/a.md")), 99);
    EXPECT_TRUE(session.isExpanded(QStringLiteral("/docs/new")));
    EXPECT_FALSE(session.isExpanded(QStringLiteral("/docs/old")));
    EXPECT_EQ(session.recentFiles(), QStringList{QStringLiteral("/docs/new/a.md")});
    EXPECT_EQ(session.record().lastFile, QStringLiteral("/docs/new/a.md"));
}

TEST(SessionStateTests, ForgetPathDropsDescendants)
{
    ensureApp();
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    SessionState session(storeIn(dir));
    session.setMarker(QStringLiteral("/docs/tmp/a.md"), MarkerColor::Green);
    session.setMarker(QStringLiteral("/docs/keep.md"), MarkerColor::Green);
    session.setExpanded(QStringLiteral("/docs/tmp"), true);
    session.recordRecentFile(QStringLiteral("/docs/keep.md"));
    session.recordRecentFile(QStringLiteral("/docs/tmp/a.md"));
    session.setLastFile(QStringLiteral("/docs/tmp/a.md"));

    session.forgetPath(QStringLiteral("/docs/tmp"));

    EXPECT_EQ(session.marker(QStringLiteral("/docs/tmp/a.md")), MarkerColor::None);
    EXPECT_EQ(session.marker(QStringLiteral("/docs/keep.md")), MarkerColor::Green);
    EXPECT_FALSE(session.isExpanded(QStringLiteral("/docs/tmp")));
    EXPECT_EQ(session.recentFiles(), QStringList{QStringLiteral("/docs/keep.md")});
    EXPECT_TRUE(session.record().lastFile.isEmpty());
}

TEST(SessionStateTests, DebounceCoalescesBurstIntoOneSave)
{
    ensureApp();
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    SessionState session(storeIn(dir));
    session.setFlushDelay(50);
    QSignalSpy spy(&session, &SessionState::flushed);

    for (int i = 0; i < 10; ++i)
        session.setScrollPosition(QStringLiteral("/a.md"), 10 + i);
    EXPECT_TRUE(session.hasPendingFlush());

    ASSERT_TRUE(spy.wait(2000));
    QCoreApplication::processEvents();
    QTest::qWait(150);

    EXPECT_EQ(spy.count(), 1);
    EXPECT_TRUE(spy.at(0).at(0).toBool());
    EXPECT_FALSE(session.hasPendingFlush());
    EXPECT_EQ(session.store().load().scrollPositions.value(QStringLiteral("/a.md")), 19);
}

TEST(SessionStateTests, FlushCancelsPendingSaveAndWritesEverything)
{
    ensureApp();
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    SessionState session(storeIn(dir));
    session.setFlushDelay(10000);
    session.setTheme(ThemePreference::Light);
    session.recordRecentFolder(QStringLiteral("/notes"));
    ASSERT_TRUE(session.hasPendingFlush());

    ASSERT_TRUE(session.flush());
    EXPECT_FALSE(session.hasPendingFlush());

    const ConfigurationRecord onDisk = session.store().load();
    EXPECT_EQ(onDisk, session.record());
}

TEST(SessionStateTests, SubsetWritePreservesOtherFields)
{
    ensureApp();
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    {
        SessionState first(storeIn(dir));
        first.setMarker(QStringLiteral("/a.md"), MarkerColor::Red);
        first.setTheme(ThemePreference::Dark);
        ASSERT_TRUE(first.flush());
    }

    SessionState second(storeIn(dir));
    Session::WindowGeometry geometry = second.record().window;
    geometry.width = 640;
    second.setWindowGeometry(geometry);
    ASSERT_TRUE(second.flush());

    const ConfigurationRecord onDisk = second.store().load();
    EXPECT_EQ(onDisk.window.width, 640);
    EXPECT_EQ(onDisk.theme, ThemePreference::Dark);
    EXPECT_EQ(onDisk.markers.value(QStringLiteral("/a.md")), MarkerColor::Red);
}

TEST(SessionStateTests, FailedFlushKeepsInMemoryState)
{
    ensureApp();
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    const QString blocker = QDir(dir.path()).filePath(QStringLiteral("blocker"));
    QFile f(blocker);
    ASSERT_TRUE(f.open(QIODevice::WriteOnly));
    f.close();

    SessionState session(ConfigStore(ConfigStore::makeDocumentStore(blocker), {}));
    session.setTheme(ThemePreference::Light);

    QSignalSpy spy(&session, &SessionState::flushed);
    EXPECT_FALSE(session.flush());
    ASSERT_EQ(spy.count(), 1);
    EXPECT_FALSE(spy.at(0).at(0).toBool());
    EXPECT_EQ(session.record().theme, ThemePreference::Light);
}
