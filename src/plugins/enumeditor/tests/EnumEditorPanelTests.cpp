// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "enumeditor/document/EnumDocument.hpp"
#include "enumeditor/panels/EnumEditorPanel.hpp"

#include <utils/filesystem/JsonFileUtils.hpp>

#include <QtCore/QDir>
#include <QtCore/QJsonArray>
#include <QtCore/QTemporaryDir>
#include <QtTest/QSignalSpy>
#include <QtTest/QTest>
#include <QtWidgets/QApplication>
#include <QtWidgets/QLineEdit>
#include <QtWidgets/QListWidget>
#include <QtWidgets/QToolButton>

using EnumEditor::EnumEditorPanel;

namespace {

QApplication* ensureApp()
{
    static QApplication* app = []() {
        static int argc = 1;
        static char arg0[] = "enumeditor-panel-tests";
        static char* argv[] = { arg0, nullptr };
        return new QApplication(argc, argv);
    }();
    return app;
}

class EnumEditorPanelTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ensureApp();
        ASSERT_TRUE(m_temp.isValid());

        const QString path = QDir(m_temp.path()).filePath(QStringLiteral("enum.json"));
        const QJsonObject content{
            {QStringLiteral("name"), QStringLiteral("Colors")},
            {QStringLiteral("variants"),
             QJsonArray{QJsonObject{{QStringLiteral("name"), QStringLiteral("Red")}, {QStringLiteral("value"), 1}},
                        QJsonObject{{QStringLiteral("name"), QStringLiteral("Green")}}}}};
        ASSERT_TRUE(Utils::JsonFileUtils::writeObjectAtomic(path, content).ok);

        const Utils::Result built = EnumEditorPanel::create(path, m_panel);
        ASSERT_TRUE(built.ok) << built.errorString().toStdString();

        m_nameEdit = m_panel->findChild<QLineEdit*>(QStringLiteral("EnumNameEdit"));
        m_variantList = m_panel->findChild<QListWidget*>(QStringLiteral("EnumVariantList"));
        m_addButton = m_panel->findChild<QToolButton*>(QStringLiteral("EnumAddVariantButton"));
        m_removeButton = m_panel->findChild<QToolButton*>(QStringLiteral("EnumRemoveVariantButton"));
        ASSERT_NE(m_nameEdit, nullptr);
        ASSERT_NE(m_variantList, nullptr);
        ASSERT_NE(m_addButton, nullptr);
        ASSERT_NE(m_removeButton, nullptr);
    }

    QStringList storedNames() const
    {
        QStringList names;
        for (const EnumEditor::EnumVariant& variant : m_panel->document()->definition().variants)
            names << variant.name;
        return names;
    }

    QStringList listedNames() const
    {
        QStringList names;
        for (int i = 0; i < m_variantList->count(); ++i)
            names << m_variantList->item(i)->text();
        return names;
    }

    QTemporaryDir m_temp;
    QSharedPointer<EnumEditorPanel> m_panel;
    QLineEdit* m_nameEdit = nullptr;
    QListWidget* m_variantList = nullptr;
    QToolButton* m_addButton = nullptr;
    QToolButton* m_removeButton = nullptr;
};

} // namespace

TEST_F(EnumEditorPanelTest, ShowsLoadedDefinition)
{
    EXPECT_EQ(m_nameEdit->text(), QStringLiteral("Colors"));
    EXPECT_EQ(listedNames(), (QStringList{QStringLiteral("Red"), QStringLiteral("Green")}));
    EXPECT_TRUE(m_removeButton->isEnabled());
    EXPECT_TRUE(m_panel->previewText().startsWith(QStringLiteral("enum class Colors {")));
    EXPECT_FALSE(m_panel->isDirty());
}

TEST_F(EnumEditorPanelTest, AddAndRemoveButtonsEditVariants)
{
    QSignalSpy dirtySpy(m_panel.data(), &EnumEditorPanel::dirtyStateChanged);

    m_addButton->click();
    EXPECT_EQ(storedNames(),
              (QStringList{QStringLiteral("Red"), QStringLiteral("Green"), QStringLiteral("Variant")}));
    EXPECT_EQ(listedNames(), storedNames());
    EXPECT_EQ(m_variantList->currentRow(), 2);
    EXPECT_TRUE(m_panel->previewText().contains(QStringLiteral("    Variant,")));
    EXPECT_TRUE(m_panel->isDirty());
    EXPECT_TRUE(m_panel->windowTitle().endsWith(u'*'));

    m_addButton->click();
    EXPECT_EQ(storedNames().last(), QStringLiteral("Variant1"));

    m_variantList->setCurrentRow(0);
    m_removeButton->click();
    EXPECT_EQ(storedNames(),
              (QStringList{QStringLiteral("Green"), QStringLiteral("Variant"), QStringLiteral("Variant1")}));
    EXPECT_EQ(listedNames(), storedNames());
    EXPECT_FALSE(m_panel->previewText().contains(QStringLiteral("Red")));

    ASSERT_EQ(dirtySpy.count(), 1);
    EXPECT_TRUE(dirtySpy.front().at(0).toBool());
}

TEST_F(EnumEditorPanelTest, RemovingEverythingDisablesRemove)
{
    m_variantList->setCurrentRow(-1);
    m_removeButton->click();
    EXPECT_EQ(storedNames().size(), 2);

    m_variantList->setCurrentRow(1);
    m_removeButton->click();
    m_variantList->setCurrentRow(0);
    m_removeButton->click();

    EXPECT_TRUE(storedNames().isEmpty());
    EXPECT_EQ(m_variantList->count(), 0);
    EXPECT_FALSE(m_removeButton->isEnabled());
    EXPECT_EQ(m_panel->previewText(), QStringLiteral("enum class Colors {};\n"));
}

TEST_F(EnumEditorPanelTest, EditingItemTextRenamesVariant)
{
    m_variantList->item(0)->setText(QStringLiteral("Crimson"));

    EXPECT_EQ(storedNames(), (QStringList{QStringLiteral("Crimson"), QStringLiteral("Green")}));
    EXPECT_EQ(m_panel->document()->definition().variants.at(0).value, 1);
    EXPECT_TRUE(m_panel->previewText().contains(QStringLiteral("Crimson = 1,")));
    EXPECT_TRUE(m_panel->isDirty());

    m_variantList->item(0)->setText(QStringLiteral("Red"));
    EXPECT_FALSE(m_panel->isDirty());
}

TEST_F(EnumEditorPanelTest, EmptyRenameIsReverted)
{
    m_variantList->item(1)->setText(QStringLiteral("   "));

    EXPECT_EQ(m_variantList->item(1)->text(), QStringLiteral("Green"));
    EXPECT_EQ(storedNames(), (QStringList{QStringLiteral("Red"), QStringLiteral("Green")}));
    EXPECT_FALSE(m_panel->isDirty());
}

TEST_F(EnumEditorPanelTest, PaddedRenameShowsStoredName)
{
    m_variantList->item(0)->setText(QStringLiteral(" Red "));
    EXPECT_EQ(m_variantList->item(0)->text(), QStringLiteral("Red"));
    EXPECT_FALSE(m_panel->isDirty());

    m_variantList->item(0)->setText(QStringLiteral("  Scarlet "));
    EXPECT_EQ(m_variantList->item(0)->text(), QStringLiteral("Scarlet"));
    EXPECT_EQ(storedNames().front(), QStringLiteral("Scarlet"));
}

TEST_F(EnumEditorPanelTest, TypingNameUpdatesDocumentAndPreview)
{
    m_nameEdit->clear();
    QTest::keyClicks(m_nameEdit, QStringLiteral("Palette"));

    EXPECT_EQ(m_panel->document()->definition().name, QStringLiteral("Palette"));
    EXPECT_TRUE(m_panel->previewText().startsWith(QStringLiteral("enum class Palette {")));
    EXPECT_TRUE(m_panel->isDirty());

    const Utils::Result saved = m_panel->save();
    ASSERT_TRUE(saved.ok) << saved.errorString().toStdString();
    EXPECT_FALSE(m_panel->isDirty());
    EXPECT_EQ(m_panel->windowTitle(), QStringLiteral("Palette"));
}
