// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "enumeditor/EnumEditorGlobal.hpp"

#include <editorapi/IEditorInstance.hpp>

#include <QtCore/QSharedPointer>
#include <QtCore/QString>

namespace EnumEditor {

class EnumEditorPanel;

// Host-facing adapter over one EnumEditorPanel.
class ENUMEDITOR_EXPORT EnumEditorInstance final : public EditorApi::IEditorInstance
{
public:
    EnumEditorInstance(QSharedPointer<EnumEditorPanel> panel, QString filePath);
    EnumEditorInstance(const EnumEditorInstance&) = delete;
    EnumEditorInstance& operator=(const EnumEditorInstance&) = delete;
    ~EnumEditorInstance() override;

    const QString& filePath() const override;

    EditorApi::PluginResult save() override;
    EditorApi::PluginResult reload() override;
    bool isDirty() const override;

    QObject* entity() const override;

    EnumEditorPanel* panel() const noexcept { return m_panel.data(); }

private:
    const QString m_filePath;
    QSharedPointer<EnumEditorPanel> m_panel;
};

} // namespace EnumEditor
