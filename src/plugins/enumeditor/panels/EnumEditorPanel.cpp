// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "enumeditor/panels/EnumEditorPanel.hpp"

#include "enumeditor/document/EnumDocument.hpp"
#include "enumeditor/panels/EnumCodePreview.hpp"

#include <QtGui/QFontDatabase>
#include <QtWidgets/QFormLayout>
#include <QtWidgets/QGroupBox>
#include <QtWidgets/QHBoxLayout>
#include <QtWidgets/QLabel>
#include <QtWidgets/QLineEdit>
#include <QtWidgets/QListWidget>
#include <QtWidgets/QPlainTextEdit>
#include <QtWidgets/QSplitter>
#include <QtWidgets/QToolButton>
#include <QtWidgets/QVBoxLayout>

#include <memory>
#include <utility>

namespace EnumEditor {

namespace {

constexpr int kPanelMargin = 6;

} // namespace

Utils::Result EnumEditorPanel::create(const QString& filePath, QSharedPointer<EnumEditorPanel>& outPanel)
{
    outPanel.reset();

    auto document = std::make_unique<EnumDocument>(filePath);
    const Utils::Result loaded = document->load();
    if (!loaded)
        return loaded;

    outPanel = QSharedPointer<EnumEditorPanel>(new EnumEditorPanel(document.release()), &QObject::deleteLater);
    return Utils::Result::success();
}

EnumEditorPanel::EnumEditorPanel(EnumDocument* document, QWidget* parent)
    : QWidget(parent)
    , m_document(document)
{
    m_document->setParent(this);

    setObjectName(QStringLiteral("EnumEditorPanel"));
    setAttribute(Qt::WA_StyledBackground, true);

    auto* rootLayout = new QVBoxLayout(this);
    rootLayout->setContentsMargins(0, 0, 0, 0);
    rootLayout->setSpacing(0);

    auto* splitter = new QSplitter(Qt::Horizontal, this);
    splitter->setObjectName(QStringLiteral("EnumEditorSplitter"));
    splitter->setChildrenCollapsible(false);
    splitter->addWidget(buildPropertiesPanel());
    splitter->addWidget(buildVariantsPanel());
    splitter->addWidget(buildCodePreviewPanel());
    splitter->setStretchFactor(0, 1);
    splitter->setStretchFactor(1, 1);
    splitter->setStretchFactor(2, 2);
    rootLayout->addWidget(splitter);

    connect(m_document, &EnumDocument::definitionChanged, this, &EnumEditorPanel::refreshFromDocument);
    connect(m_document, &EnumDocument::dirtyStateChanged, this, [this](bool dirty) {
        refreshTitle();
        emit dirtyStateChanged(dirty);
    });

    refreshFromDocument();
}

EnumEditorPanel::~EnumEditorPanel() = default;

const QString& EnumEditorPanel::filePath() const
{
    return m_document->filePath();
}

bool EnumEditorPanel::isDirty() const
{
    return m_document->isDirty();
}

Utils::Result EnumEditorPanel::save()
{
    return m_document->save();
}

Utils::Result EnumEditorPanel::reload()
{
    return m_document->load();
}

QString EnumEditorPanel::previewText() const
{
    return m_codePreview ? m_codePreview->toPlainText() : QString();
}

QWidget* EnumEditorPanel::buildPropertiesPanel()
{
    auto* box = new QGroupBox(QStringLiteral("Properties"), this);
    box->setObjectName(QStringLiteral("EnumPropertiesPanel"));

    auto* layout = new QFormLayout(box);
    layout->setContentsMargins(kPanelMargin, kPanelMargin, kPanelMargin, kPanelMargin);

    m_nameEdit = new QLineEdit(box);
    m_nameEdit->setObjectName(QStringLiteral("EnumNameEdit"));
    m_nameEdit->setPlaceholderText(QStringLiteral("EnumName"));
    connect(m_nameEdit, &QLineEdit::textEdited, this, &EnumEditorPanel::handleNameEdited);

    m_descriptionEdit = new QPlainTextEdit(box);
    m_descriptionEdit->setObjectName(QStringLiteral("EnumDescriptionEdit"));
    m_descriptionEdit->setPlaceholderText(QStringLiteral("Description"));
    connect(m_descriptionEdit, &QPlainTextEdit::textChanged, this, &EnumEditorPanel::handleDescriptionEdited);

    layout->addRow(QStringLiteral("Name"), m_nameEdit);
    layout->addRow(QStringLiteral("Description"), m_descriptionEdit);
    return box;
}

QWidget* EnumEditorPanel::buildVariantsPanel()
{
    auto* box = new QGroupBox(QStringLiteral("Variants"), this);
    box->setObjectName(QStringLiteral("EnumVariantsPanel"));

    auto* layout = new QVBoxLayout(box);
    layout->setContentsMargins(kPanelMargin, kPanelMargin, kPanelMargin, kPanelMargin);

    m_variantList = new QListWidget(box);
    m_variantList->setObjectName(QStringLiteral("EnumVariantList"));
    m_variantList->setSelectionMode(QAbstractItemView::SingleSelection);
    m_variantList->setEditTriggers(QAbstractItemView::DoubleClicked | QAbstractItemView::EditKeyPressed);
    connect(m_variantList, &QListWidget::itemChanged, this, &EnumEditorPanel::handleVariantItemChanged);

    auto* buttons = new QHBoxLayout();
    buttons->setContentsMargins(0, 0, 0, 0);

    m_addVariantButton = new QToolButton(box);
    m_addVariantButton->setObjectName(QStringLiteral("EnumAddVariantButton"));
    m_addVariantButton->setText(QStringLiteral("Add"));
    connect(m_addVariantButton, &QToolButton::clicked, this, &EnumEditorPanel::addVariant);

    m_removeVariantButton = new QToolButton(box);
    m_removeVariantButton->setObjectName(QStringLiteral("EnumRemoveVariantButton"));
    m_removeVariantButton->setText(QStringLiteral("Remove"));
    connect(m_removeVariantButton, &QToolButton::clicked, this, &EnumEditorPanel::removeSelectedVariant);

    buttons->addWidget(m_addVariantButton);
    buttons->addWidget(m_removeVariantButton);
    buttons->addStretch(1);

    layout->addWidget(m_variantList, 1);
    layout->addLayout(buttons);
    return box;
}

QWidget* EnumEditorPanel::buildCodePreviewPanel()
{
    auto* box = new QGroupBox(QStringLiteral("Code Preview"), this);
    box->setObjectName(QStringLiteral("EnumCodePreviewPanel"));

    auto* layout = new QVBoxLayout(box);
    layout->setContentsMargins(kPanelMargin, kPanelMargin, kPanelMargin, kPanelMargin);

    m_codePreview = new QPlainTextEdit(box);
    m_codePreview->setObjectName(QStringLiteral("EnumCodePreview"));
    m_codePreview->setReadOnly(true);
    m_codePreview->setLineWrapMode(QPlainTextEdit::NoWrap);
    m_codePreview->setFont(QFontDatabase::systemFont(QFontDatabase::FixedFont));

    layout->addWidget(m_codePreview);
    return box;
}

void EnumEditorPanel::refreshFromDocument()
{
    const EnumDefinition& def = m_document->definition();

    m_syncingUi = true;
    if (m_nameEdit->text() != def.name)
        m_nameEdit->setText(def.name);
    if (m_descriptionEdit->toPlainText() != def.description)
        m_descriptionEdit->setPlainText(def.description);
    refreshVariantList();
    m_syncingUi = false;

    refreshCodePreview();
    refreshTitle();
}

void EnumEditorPanel::refreshVariantList()
{
    const QVector<EnumVariant>& variants = m_document->definition().variants;

    // Items are reused in place; an item may be the one currently emitting
    // itemChanged.
    while (m_variantList->count() > variants.size())
        delete m_variantList->takeItem(m_variantList->count() - 1);
    while (m_variantList->count() < variants.size()) {
        auto* item = new QListWidgetItem(m_variantList);
        item->setFlags(item->flags() | Qt::ItemIsEditable);
    }

    for (int i = 0; i < variants.size(); ++i) {
        QListWidgetItem* item = m_variantList->item(i);
        const EnumVariant& variant = variants.at(i);
        if (item->text() != variant.name)
            item->setText(variant.name);
        item->setToolTip(variant.description);
    }

    m_removeVariantButton->setEnabled(!variants.isEmpty());
}

void EnumEditorPanel::refreshCodePreview()
{
    m_codePreview->setPlainText(CodePreview::generate(m_document->definition()));
}

void EnumEditorPanel::refreshTitle()
{
    const QString name = m_document->definition().name;
    setWindowTitle(m_document->isDirty() ? name + u'*' : name);
}

void EnumEditorPanel::handleNameEdited(const QString& text)
{
    if (m_syncingUi)
        return;
    m_document->setName(text);
}

void EnumEditorPanel::handleDescriptionEdited()
{
    if (m_syncingUi)
        return;
    m_document->setDescription(m_descriptionEdit->toPlainText());
}

void EnumEditorPanel::handleVariantItemChanged(QListWidgetItem* item)
{
    if (m_syncingUi || !item)
        return;

    const int row = m_variantList->row(item);
    const QVector<EnumVariant>& variants = m_document->definition().variants;
    if (row < 0 || row >= variants.size())
        return;

    EnumVariant updated = variants.at(row);
    updated.name = item->text().trimmed();
    if (!m_document->updateVariant(row, std::move(updated)))
        qCDebug(enumeditorlog) << "EnumEditorPanel: rejected empty variant name at row" << row;

    // The list always shows the stored (trimmed) name.
    const QString& stored = m_document->definition().variants.at(row).name;
    if (item->text() != stored) {
        m_syncingUi = true;
        item->setText(stored);
        m_syncingUi = false;
    }
}

void EnumEditorPanel::addVariant()
{
    EnumVariant variant;
    variant.name = m_document->uniqueVariantName(QStringLiteral("Variant"));
    if (m_document->addVariant(std::move(variant)))
        m_variantList->setCurrentRow(m_variantList->count() - 1);
}

void EnumEditorPanel::removeSelectedVariant()
{
    const int row = m_variantList->currentRow();
    if (row < 0)
        return;
    m_document->removeVariant(row);
}

} // namespace EnumEditor
