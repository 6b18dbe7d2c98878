// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "enumeditor/EnumEditorInstance.hpp"

#include "enumeditor/panels/EnumEditorPanel.hpp"

#include <utility>

namespace EnumEditor {

EnumEditorInstance::EnumEditorInstance(QSharedPointer<EnumEditorPanel> panel, QString filePath)
    : m_filePath(std::move(filePath))
    , m_panel(std::move(panel))
{
    Q_ASSERT(m_panel);
}

EnumEditorInstance::~EnumEditorInstance() = default;

const QString& EnumEditorInstance::filePath() const
{
    return m_filePath;
}

EditorApi::PluginResult EnumEditorInstance::save()
{
    const Utils::Result result = m_panel->save();
    if (!result) {
        qCWarning(enumeditorlog).noquote()
            << QStringLiteral("EnumEditor: save failed for '%1': %2").arg(m_filePath, result.errorString());
        return EditorApi::PluginResult::failure(
            EditorApi::PluginError::fromResult(EditorApi::PluginError::Kind::SaveFailed, result));
    }

    qCInfo(enumeditorlog) << "EnumEditor: saved" << m_filePath;
    return EditorApi::PluginResult::success();
}

EditorApi::PluginResult EnumEditorInstance::reload()
{
    const Utils::Result result = m_panel->reload();
    if (!result) {
        qCWarning(enumeditorlog).noquote()
            << QStringLiteral("EnumEditor: reload failed for '%1': %2").arg(m_filePath, result.errorString());
        return EditorApi::PluginResult::failure(
            EditorApi::PluginError::fromResult(EditorApi::PluginError::Kind::ReloadFailed, result));
    }

    qCInfo(enumeditorlog) << "EnumEditor: reloaded" << m_filePath;
    return EditorApi::PluginResult::success();
}

bool EnumEditorInstance::isDirty() const
{
    return m_panel->isDirty();
}

QObject* EnumEditorInstance::entity() const
{
    return m_panel.data();
}

} // namespace EnumEditor
