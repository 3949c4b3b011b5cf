// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "session/ConfigStore.hpp"

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QJsonArray>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonObject>
#include <QtCore/QTemporaryDir>

using Session::CodeFontWeight;
using Session::ConfigStore;
using Session::ConfigurationRecord;
using Session::MarkerColor;
using Session::RecordLimits;
using Session::ThemePreference;

namespace {

ConfigStore makeStore(const QTemporaryDir& dir, RecordLimits limits = {})
{
    return ConfigStore(ConfigStore::makeDocumentStore(dir.path()), limits);
}

void writeRaw(const ConfigStore& store, const QByteArray& bytes)
{
    QDir().mkpath(QFileInfo(store.filePath()).absolutePath());
    QFile f(store.filePath());
    ASSERT_TRUE(f.open(QIODevice::WriteOnly | QIODevice::Truncate));
    f.write(bytes);
}

void writeJson(const ConfigStore& store, const QJsonObject& obj)
{
    writeRaw(store, QJsonDocument(obj).toJson(QJsonDocument::Compact));
}

ConfigurationRecord sampleRecord()
{
    ConfigurationRecord r;
    r.window = {10, 20, 900, 700, true, 250};
    r.recentFiles = {QStringLiteral("/docs/b.md"), QStringLiteral("/docs/a.md")};
    r.recentFolders = {QStringLiteral("/docs")};
    r.markers.insert(QStringLiteral("/docs/a.md"), MarkerColor::Green);
    r.markers.insert(QStringLiteral("/docs/b.md"), MarkerColor::Red);
    r.expandedDirectories = {QStringLiteral("/docs"), QStringLiteral("/docs/sub")};
    r.scrollPositions.insert(QStringLiteral("/docs/a.md"), 420);
    r.theme = ThemePreference::Dark;
    r.font.bodySize = 18;
    r.font.codeSize = 12;
    r.font.codeFamily = QStringLiteral("JetBrains Mono");
    r.font.codeWeight = CodeFontWeight::Bold;
    r.font.inlineCodeColor = QColor(0x12, 0x34, 0x56);
    r.font.blockCodeColor = QColor(0xaa, 0xbb, 0xcc, 0x80);
    r.lastFile = QStringLiteral("/docs/a.md");
    r.lastFolder = QStringLiteral("/docs");
    return r;
}

} // namespace

TEST(ConfigStoreTests, MissingFileYieldsDefaults)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    const ConfigStore store = makeStore(dir);
    EXPECT_FALSE(QFileInfo::exists(store.filePath()));
    EXPECT_EQ(store.load(), ConfigurationRecord::defaults());
}

TEST(ConfigStoreTests, FileLivesUnderApplicationDirectory)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    const ConfigStore store = makeStore(dir);
    EXPECT_EQ(store.filePath(), QDir(dir.path()).filePath(QStringLiteral("MarkdownReader/app.json")));
}

TEST(ConfigStoreTests, DefaultsMatchDocumentedValues)
{
    const ConfigurationRecord r = ConfigurationRecord::defaults();
    EXPECT_EQ(r.window.x, 100);
    EXPECT_EQ(r.window.y, 100);
    EXPECT_EQ(r.window.width, 1200);
    EXPECT_EQ(r.window.height, 800);
    EXPECT_EQ(r.window.splitterPosition, 300);
    EXPECT_FALSE(r.window.maximized);
    EXPECT_EQ(r.theme, ThemePreference::Auto);
    EXPECT_EQ(r.font.bodySize, 16);
    EXPECT_EQ(r.font.codeSize, 14);
    EXPECT_EQ(r.font.codeWeight, CodeFontWeight::Normal);
    EXPECT_FALSE(r.font.inlineCodeColor.isValid());
    EXPECT_FALSE(r.font.blockCodeColor.isValid());
    EXPECT_TRUE(r.recentFiles.isEmpty());
    EXPECT_TRUE(r.markers.isEmpty());
}

TEST(ConfigStoreTests, SaveThenLoadReturnsEqualRecord)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    const ConfigStore store = makeStore(dir);
    const ConfigurationRecord record = sampleRecord();

    const Utils::Result saved = store.save(record);
    ASSERT_TRUE(saved) << saved.message().toStdString();
    EXPECT_EQ(store.load(), record);
}

TEST(ConfigStoreTests, CorruptFileYieldsDefaults)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    const ConfigStore store = makeStore(dir);
    writeRaw(store, "{ \"theme\": \"dark\", ");
    EXPECT_EQ(store.load(), ConfigurationRecord::defaults());

    writeRaw(store, "[1, 2, 3]");
    EXPECT_EQ(store.load(), ConfigurationRecord::defaults());
}

TEST(ConfigStoreTests, NewerSchemaVersionYieldsDefaults)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    const ConfigStore store = makeStore(dir);
    QJsonObject obj = ConfigStore::toJson(sampleRecord());
    obj.insert(QStringLiteral("schemaVersion"), ConfigStore::kSchemaVersion + 1);
    writeJson(store, obj);

    EXPECT_EQ(store.load(), ConfigurationRecord::defaults());
}

TEST(ConfigStoreTests, FractionalNewerSchemaVersionYieldsDefaults)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    const ConfigStore store = makeStore(dir);
    QJsonObject obj = ConfigStore::toJson(sampleRecord());
    obj.insert(QStringLiteral("schemaVersion"), ConfigStore::kSchemaVersion + 0.5);
    writeJson(store, obj);

    EXPECT_EQ(store.load(), ConfigurationRecord::defaults());
}

TEST(ConfigStoreTests, MissingSchemaVersionIsAccepted)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    const ConfigStore store = makeStore(dir);
    writeJson(store, QJsonObject{{QStringLiteral("theme"), QStringLiteral("light")}});

    EXPECT_EQ(store.load().theme, ThemePreference::Light);
}

TEST(ConfigStoreTests, WronglyTypedFieldsFallBackIndividually)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    const ConfigStore store = makeStore(dir);
    QJsonObject obj;
    obj.insert(QStringLiteral("schemaVersion"), 1);
    obj.insert(QStringLiteral("theme"), 42);
    obj.insert(QStringLiteral("recentFiles"), QStringLiteral("not-a-list"));
    obj.insert(QStringLiteral("window"), QJsonObject{{QStringLiteral("x"), QStringLiteral("left")},
                                                     {QStringLiteral("width"), 640}});
    obj.insert(QStringLiteral("lastFolder"), QStringLiteral("/notes"));
    obj.insert(QStringLiteral("markers"), QJsonObject{{QStringLiteral("/notes/a.md"), QStringLiteral("purple")},
                                                      {QStringLiteral("/notes/b.md"), QStringLiteral("red")}});
    writeJson(store, obj);

    const ConfigurationRecord r = store.load();
    EXPECT_EQ(r.theme, ThemePreference::Auto);
    EXPECT_TRUE(r.recentFiles.isEmpty());
    EXPECT_EQ(r.window.x, 100);
    EXPECT_EQ(r.window.width, 640);
    EXPECT_EQ(r.lastFolder, QStringLiteral("/notes"));
    EXPECT_EQ(r.markers.size(), 1);
    EXPECT_EQ(r.markers.value(QStringLiteral("/notes/b.md")), MarkerColor::Red);
}

TEST(ConfigStoreTests, UnknownKeysAreIgnored)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    const ConfigStore store = makeStore(dir);
    QJsonObject obj = ConfigStore::toJson(sampleRecord());
    obj.insert(QStringLiteral("pluginState"), QJsonObject{{QStringLiteral("enabled"), true}});
    obj.insert(QStringLiteral("zoom"), 1.5);
    writeJson(store, obj);

    EXPECT_EQ(store.load(), sampleRecord());
}

TEST(ConfigStoreTests, FontSizesAreClampedOnLoad)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    const ConfigStore store = makeStore(dir);
    writeJson(store, QJsonObject{{QStringLiteral("font"),
                                  QJsonObject{{QStringLiteral("bodySize"), 500},
                                              {QStringLiteral("codeSize"), 2}}}});

    const ConfigurationRecord r = store.load();
    EXPECT_EQ(r.font.bodySize, 72);
    EXPECT_EQ(r.font.codeSize, 8);
}

TEST(ConfigStoreTests, FontSizesAreClampedOnSave)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    RecordLimits limits;
    limits.minFontSize = 10;
    limits.maxFontSize = 20;
    const ConfigStore store = makeStore(dir, limits);

    ConfigurationRecord r;
    r.font.bodySize = 40;
    r.font.codeSize = 4;
    ASSERT_TRUE(store.save(r));

    QFile f(store.filePath());
    ASSERT_TRUE(f.open(QIODevice::ReadOnly));
    const QJsonObject font = QJsonDocument::fromJson(f.readAll()).object().value(QStringLiteral("font")).toObject();
    EXPECT_EQ(font.value(QStringLiteral("bodySize")).toInt(), 20);
    EXPECT_EQ(font.value(QStringLiteral("codeSize")).toInt(), 10);
}

TEST(ConfigStoreTests, RecentListsAreCappedAndDeduplicatedOnLoad)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    RecordLimits limits;
    limits.maxRecentEntries = 3;
    const ConfigStore store = makeStore(dir, limits);

    const QJsonArray files{QStringLiteral("/a.md"), QStringLiteral("/b.md"), QStringLiteral("/a.md"),
                           QStringLiteral("/c.md"), QStringLiteral("/d.md")};
    writeJson(store, QJsonObject{{QStringLiteral("recentFiles"), files}});

    const QStringList expected{QStringLiteral("/a.md"), QStringLiteral("/b.md"), QStringLiteral("/c.md")};
    EXPECT_EQ(store.load().recentFiles, expected);
}

TEST(ConfigStoreTests, NoneMarkersAndZeroOffsetsAreNotPersisted)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    const ConfigStore store = makeStore(dir);
    ConfigurationRecord r;
    r.markers.insert(QStringLiteral("/a.md"), MarkerColor::None);
    r.scrollPositions.insert(QStringLiteral("/a.md"), 0);
    ASSERT_TRUE(store.save(r));

    const ConfigurationRecord loaded = store.load();
    EXPECT_TRUE(loaded.markers.isEmpty());
    EXPECT_TRUE(loaded.scrollPositions.isEmpty());
}

TEST(ConfigStoreTests, SaveReportsFailureWhenDirectoryCannotBeCreated)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    const QString blocker = QDir(dir.path()).filePath(QStringLiteral("blocker"));
    QFile f(blocker);
    ASSERT_TRUE(f.open(QIODevice::WriteOnly));
    f.close();

    const ConfigStore store(ConfigStore::makeDocumentStore(blocker), {});
    const Utils::Result r = store.save(sampleRecord());
    EXPECT_FALSE(r);
    EXPECT_FALSE(r.errors.isEmpty());
    EXPECT_EQ(store.load(), ConfigurationRecord::defaults());
}

TEST(ConfigStoreTests, SaveReplacesPreviousContents)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    const ConfigStore store = makeStore(dir);
    ASSERT_TRUE(store.save(sampleRecord()));

    ConfigurationRecord next = sampleRecord();
    next.theme = ThemePreference::Light;
    next.recentFiles.clear();
    ASSERT_TRUE(store.save(next));

    EXPECT_EQ(store.load(), next);
    EXPECT_EQ(QDir(QFileInfo(store.filePath()).absolutePath()).entryList(QDir::Files),
              QStringList{QStringLiteral("app.json")});
}

TEST(ConfigStoreTests, TokensRoundTripAndRejectGarbage)
{
    EXPECT_EQ(Session::markerFromToken(Session::markerToken(MarkerColor::Green)), MarkerColor::Green);
    EXPECT_EQ(Session::themeFromToken(u"DARK"), ThemePreference::Dark);
    EXPECT_EQ(Session::codeWeightFromToken(u"bold"), CodeFontWeight::Bold);
    EXPECT_FALSE(Session::markerFromToken(u"blue").has_value());
    EXPECT_FALSE(Session::themeFromToken(u"").has_value());
}
