// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "enumeditor/EnumEditorGlobal.hpp"

#include <editorapi/IEditorPlugin.hpp>

#include <memory>

namespace EnumEditor {

class EditorInstanceRegistry;

class ENUMEDITOR_EXPORT EnumEditorPlugin final : public EditorApi::IEditorPlugin
{
    Q_OBJECT
    Q_PLUGIN_METADATA(IID "com.pulsar.EditorPlugin" FILE "EnumEditor.json")

public:
    explicit EnumEditorPlugin(QObject* parent = nullptr);
    EnumEditorPlugin(std::shared_ptr<EditorInstanceRegistry> registry, QObject* parent = nullptr);
    ~EnumEditorPlugin() override;

    EditorApi::PluginMetadata metadata() const override;
    QVector<EditorApi::FileTypeDefinition> fileTypes() const override;
    QVector<EditorApi::EditorMetadata> editors() const override;

    EditorApi::PluginResult createEditor(const EditorApi::EditorId& editorId,
                                         const QString& filePath,
                                         EditorApi::EditorHandles& outHandles) override;

    bool releaseEditor(EditorApi::InstanceId instanceId) override;

    void onLoad() override;
    qsizetype onUnload() override;

    const std::shared_ptr<EditorInstanceRegistry>& registry() const noexcept { return m_registry; }

    static EditorApi::FileTypeDefinition enumFileType();

private:
    std::shared_ptr<EditorInstanceRegistry> m_registry;
};

} // namespace EnumEditor
