// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "enumeditor/EnumEditorGlobal.hpp"

#include <utils/Result.hpp>

#include <QtCore/QSharedPointer>
#include <QtWidgets/QWidget>

QT_BEGIN_NAMESPACE
class QLineEdit;
class QListWidget;
class QListWidgetItem;
class QPlainTextEdit;
class QToolButton;
QT_END_NAMESPACE

namespace EnumEditor {

class EnumDocument;

// Editable entity for one enum definition: properties, variant list and a
// code preview over a single EnumDocument.
class ENUMEDITOR_EXPORT EnumEditorPanel final : public QWidget
{
    Q_OBJECT

public:
    // Loads filePath and builds the panel. outPanel stays null on failure.
    // The returned pointer deletes the panel with deleteLater().
    static Utils::Result create(const QString& filePath, QSharedPointer<EnumEditorPanel>& outPanel);

    ~EnumEditorPanel() override;

    const QString& filePath() const;
    EnumDocument* document() const noexcept { return m_document; }

    bool isDirty() const;
    Utils::Result save();
    Utils::Result reload();

    QString previewText() const;

signals:
    void dirtyStateChanged(bool dirty);

private:
    explicit EnumEditorPanel(EnumDocument* document, QWidget* parent = nullptr);

    QWidget* buildPropertiesPanel();
    QWidget* buildVariantsPanel();
    QWidget* buildCodePreviewPanel();

    void refreshFromDocument();
    void refreshVariantList();
    void refreshCodePreview();
    void refreshTitle();

    void handleNameEdited(const QString& text);
    void handleDescriptionEdited();
    void handleVariantItemChanged(QListWidgetItem* item);
    void addVariant();
    void removeSelectedVariant();

    EnumDocument* m_document = nullptr; // owned (QObject child)

    QLineEdit* m_nameEdit = nullptr;
    QPlainTextEdit* m_descriptionEdit = nullptr;
    QListWidget* m_variantList = nullptr;
    QToolButton* m_addVariantButton = nullptr;
    QToolButton* m_removeVariantButton = nullptr;
    QPlainTextEdit* m_codePreview = nullptr;

    bool m_syncingUi = false;
};

} // namespace EnumEditor
