// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "editorapi/EditorTypes.hpp"
#include "editorapi/PluginError.hpp"

#include <QtCore/QHash>

using EditorApi::EditorId;
using EditorApi::FileTypeId;
using EditorApi::PluginError;
using EditorApi::PluginResult;

TEST(EditorTypesTests, IdsCompareByValueAndHash)
{
    const EditorId a(QStringLiteral("enum-editor"));
    const EditorId b(QStringLiteral("enum-editor"));
    const EditorId c(QStringLiteral("struct-editor"));

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_LT(a, c);
    EXPECT_TRUE(a.isValid());
    EXPECT_FALSE(EditorId().isValid());
    EXPECT_FALSE(EditorId(QStringLiteral("  ")).isValid());

    QHash<FileTypeId, int> byType;
    byType.insert(FileTypeId(QStringLiteral("enum")), 1);
    EXPECT_TRUE(byType.contains(FileTypeId(QStringLiteral("enum"))));
    EXPECT_FALSE(byType.contains(FileTypeId(QStringLiteral("struct"))));
}

TEST(PluginErrorTests, EditorNotFoundCarriesRequestedId)
{
    const PluginError err = PluginError::editorNotFound(EditorId(QStringLiteral("bogus-editor")));
    EXPECT_EQ(err.kind, PluginError::Kind::EditorNotFound);
    EXPECT_EQ(err.editorId.toString(), QStringLiteral("bogus-editor"));
    EXPECT_TRUE(err.toString().contains(QStringLiteral("bogus-editor")));
    EXPECT_TRUE(err.toString().startsWith(QStringLiteral("EditorNotFound")));
}

TEST(PluginErrorTests, FromResultKeepsEveryMessage)
{
    Utils::Result io = Utils::Result::failure(QStringLiteral("first"));
    io.addError(QStringLiteral("second"));

    const PluginError err = PluginError::fromResult(PluginError::Kind::SaveFailed, io);
    EXPECT_EQ(err.kind, PluginError::Kind::SaveFailed);
    EXPECT_EQ(err.message, QStringLiteral("first; second"));
}

TEST(PluginErrorTests, ResultReportsKindOnlyOnFailure)
{
    const PluginResult ok = PluginResult::success();
    EXPECT_TRUE(static_cast<bool>(ok));
    EXPECT_EQ(ok.errorKind(), PluginError::Kind::None);
    EXPECT_TRUE(ok.error.toString().isEmpty());

    const PluginResult failed = PluginResult::failure(
        PluginError::fromResult(PluginError::Kind::ReloadFailed, Utils::Result::failure(QStringLiteral("gone"))));
    EXPECT_FALSE(static_cast<bool>(failed));
    EXPECT_EQ(failed.errorKind(), PluginError::Kind::ReloadFailed);
    EXPECT_EQ(failed.error.toString(), QStringLiteral("ReloadFailed: gone"));
}
