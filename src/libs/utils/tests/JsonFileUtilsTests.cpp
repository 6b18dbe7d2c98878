// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "utils/filesystem/JsonFileUtils.hpp"

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QJsonArray>
#include <QtCore/QTemporaryDir>

namespace JsonFileUtils = Utils::JsonFileUtils;

TEST(JsonFileUtilsTests, WriteThenReadObject)
{
    QTemporaryDir temp;
    ASSERT_TRUE(temp.isValid());

    const QString path = QDir(temp.path()).filePath(QStringLiteral("enum.json"));
    const QJsonObject written{{QStringLiteral("name"), QStringLiteral("Colors")},
                              {QStringLiteral("variants"), QJsonArray{}}};

    const Utils::Result writeResult = JsonFileUtils::writeObjectAtomic(path, written);
    ASSERT_TRUE(writeResult.ok) << writeResult.errorString().toStdString();

    QJsonObject read;
    const Utils::Result readResult = JsonFileUtils::readObject(path, read);
    ASSERT_TRUE(readResult.ok) << readResult.errorString().toStdString();
    EXPECT_EQ(read, written);
}

TEST(JsonFileUtilsTests, ReadReportsMissingAndMalformedFiles)
{
    QTemporaryDir temp;
    ASSERT_TRUE(temp.isValid());

    QJsonObject out{{QStringLiteral("stale"), true}};
    const Utils::Result missing = JsonFileUtils::readObject(QDir(temp.path()).filePath("nope.json"), out);
    EXPECT_FALSE(missing.ok);
    EXPECT_TRUE(out.isEmpty());

    const QString brokenPath = QDir(temp.path()).filePath(QStringLiteral("broken.json"));
    QFile broken(brokenPath);
    ASSERT_TRUE(broken.open(QIODevice::WriteOnly));
    broken.write("{ \"name\": ");
    broken.close();

    const Utils::Result malformed = JsonFileUtils::readObject(brokenPath, out);
    EXPECT_FALSE(malformed.ok);
    EXPECT_FALSE(malformed.errors.isEmpty());

    const QString arrayPath = QDir(temp.path()).filePath(QStringLiteral("array.json"));
    QFile array(arrayPath);
    ASSERT_TRUE(array.open(QIODevice::WriteOnly));
    array.write("[1, 2, 3]");
    array.close();

    EXPECT_FALSE(JsonFileUtils::readObject(arrayPath, out).ok);
    EXPECT_FALSE(JsonFileUtils::readObject(temp.path(), out).ok);
}

TEST(JsonFileUtilsTests, WriteFailsWhenParentDirectoryIsMissing)
{
    QTemporaryDir temp;
    ASSERT_TRUE(temp.isValid());

    const QString path = QDir(temp.path()).filePath(QStringLiteral("missing/enum.json"));
    const Utils::Result result = JsonFileUtils::writeObjectAtomic(path, QJsonObject{});
    EXPECT_FALSE(result.ok);
    EXPECT_FALSE(QFileInfo::exists(path));
}

TEST(JsonFileUtilsTests, EnsureDirectoryCreatesAndRejectsFiles)
{
    QTemporaryDir temp;
    ASSERT_TRUE(temp.isValid());

    const QString nested = QDir(temp.path()).filePath(QStringLiteral("a/b/Colors.enum"));
    ASSERT_TRUE(JsonFileUtils::ensureDirectory(nested).ok);
    EXPECT_TRUE(QFileInfo(nested).isDir());
    EXPECT_TRUE(JsonFileUtils::ensureDirectory(nested).ok);

    const QString filePath = QDir(temp.path()).filePath(QStringLiteral("plain.json"));
    QFile file(filePath);
    ASSERT_TRUE(file.open(QIODevice::WriteOnly));
    file.close();
    EXPECT_FALSE(JsonFileUtils::ensureDirectory(filePath).ok);
}
