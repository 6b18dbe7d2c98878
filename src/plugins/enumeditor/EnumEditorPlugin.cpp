// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "enumeditor/EnumEditorPlugin.hpp"

#include "enumeditor/Constants.hpp"
#include "enumeditor/EnumEditorInstance.hpp"
#include "enumeditor/document/EnumDefinition.hpp"
#include "enumeditor/panels/EnumEditorPanel.hpp"
#include "enumeditor/registry/EditorInstanceRegistry.hpp"

#include <editorapi/DocumentStorage.hpp>

#include <QtCore/QStringList>

#include <utility>

Q_LOGGING_CATEGORY(enumeditorlog, "pulsar.enumeditor")

namespace EnumEditor {

namespace {

EditorApi::EditorId enumEditorId()
{
    return EditorApi::EditorId(QString::fromLatin1(Constants::kEditorId));
}

EditorApi::FileTypeId enumFileTypeId()
{
    return EditorApi::FileTypeId(QString::fromLatin1(Constants::kFileTypeId));
}

} // namespace

EnumEditorPlugin::EnumEditorPlugin(QObject* parent)
    : EnumEditorPlugin(std::make_shared<EditorInstanceRegistry>(), parent)
{
}

EnumEditorPlugin::EnumEditorPlugin(std::shared_ptr<EditorInstanceRegistry> registry, QObject* parent)
    : EditorApi::IEditorPlugin(parent)
    , m_registry(std::move(registry))
{
    Q_ASSERT(m_registry);
}

EnumEditorPlugin::~EnumEditorPlugin()
{
    onUnload();
}

EditorApi::PluginMetadata EnumEditorPlugin::metadata() const
{
    EditorApi::PluginMetadata meta;
    meta.id = EditorApi::PluginId(QString::fromLatin1(Constants::kPluginId));
    meta.name = QString::fromLatin1(Constants::kPluginName);
    meta.version = QString::fromLatin1(Constants::kPluginVersion);
    meta.author = QString::fromLatin1(Constants::kPluginAuthor);
    meta.description = QString::fromLatin1(Constants::kPluginDescription);
    return meta;
}

EditorApi::FileTypeDefinition EnumEditorPlugin::enumFileType()
{
    EditorApi::FileTypeDefinition def;
    def.id = enumFileTypeId();
    def.extension = QString::fromLatin1(Constants::kFileExtension);
    def.displayName = QString::fromLatin1(Constants::kFileTypeDisplayName);
    def.iconResource = QString::fromLatin1(Constants::kIconResource);
    def.color = QColor::fromRgb(Constants::kFileTypeColor);
    def.structure = EditorApi::FileStructure::folderBased(QString::fromLatin1(Constants::kMarkerFile));
    def.defaultContent = EnumDefinition::defaultContent();
    def.categories = QStringList{QString::fromLatin1(Constants::kFileTypeCategory)};
    return def;
}

QVector<EditorApi::FileTypeDefinition> EnumEditorPlugin::fileTypes() const
{
    return {enumFileType()};
}

QVector<EditorApi::EditorMetadata> EnumEditorPlugin::editors() const
{
    EditorApi::EditorMetadata editor;
    editor.id = enumEditorId();
    editor.displayName = QString::fromLatin1(Constants::kEditorDisplayName);
    editor.supportedFileTypes = {enumFileTypeId()};
    return {editor};
}

EditorApi::PluginResult EnumEditorPlugin::createEditor(const EditorApi::EditorId& editorId,
                                                       const QString& filePath,
                                                       EditorApi::EditorHandles& outHandles)
{
    outHandles = {};

    if (editorId != enumEditorId()) {
        qCWarning(enumeditorlog) << "EnumEditorPlugin: unknown editor requested:" << editorId.toString();
        return EditorApi::PluginResult::failure(EditorApi::PluginError::editorNotFound(editorId));
    }

    const QString resolvedPath =
        EditorApi::DocumentStorage::resolveDocumentPath(enumFileType().structure, filePath);

    // Built outside the registry lock; it does file I/O.
    QSharedPointer<EnumEditorPanel> panel;
    const Utils::Result built = EnumEditorPanel::create(resolvedPath, panel);
    if (!built) {
        qCWarning(enumeditorlog).noquote()
            << QStringLiteral("EnumEditorPlugin: failed to open '%1': %2").arg(resolvedPath, built.errorString());
        return EditorApi::PluginResult::failure(
            EditorApi::PluginError::fromResult(EditorApi::PluginError::Kind::ConstructionFailed, built));
    }

    InstanceRecord record;
    record.panel = panel;
    record.instance = std::make_unique<EnumEditorInstance>(panel, resolvedPath);
    const InstanceId id = m_registry->insert(std::move(record));

    outHandles.panel = panel;
    outHandles.instance = std::make_unique<EnumEditorInstance>(panel, resolvedPath);
    outHandles.instanceId = id;

    qCInfo(enumeditorlog) << "EnumEditorPlugin: created enum editor instance" << id << "for" << resolvedPath;
    emit editorCreated(id, resolvedPath);
    return EditorApi::PluginResult::success();
}

bool EnumEditorPlugin::releaseEditor(EditorApi::InstanceId instanceId)
{
    if (!m_registry->remove(instanceId))
        return false;

    qCInfo(enumeditorlog) << "EnumEditorPlugin: released enum editor instance" << instanceId;
    emit editorReleased(instanceId);
    return true;
}

void EnumEditorPlugin::onLoad()
{
    qCInfo(enumeditorlog) << "EnumEditorPlugin: loaded";
}

qsizetype EnumEditorPlugin::onUnload()
{
    const qsizetype count = m_registry->clear();
    qCInfo(enumeditorlog) << "EnumEditorPlugin: unloaded, cleaned up" << count << "editors";
    return count;
}

} // namespace EnumEditor
