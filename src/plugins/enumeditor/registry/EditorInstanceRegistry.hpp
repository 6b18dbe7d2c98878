// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "enumeditor/EnumEditorGlobal.hpp"

#include <editorapi/IEditorInstance.hpp>
#include <editorapi/IEditorPlugin.hpp>

#include <QtCore/QList>
#include <QtCore/QMutex>

#include <memory>
#include <unordered_map>

namespace EnumEditor {

using InstanceId = EditorApi::InstanceId;

struct ENUMEDITOR_EXPORT InstanceRecord final {
    EditorApi::PanelHandle panel;
    std::unique_ptr<EditorApi::IEditorInstance> instance;
};

// Owns every open editor of the plugin, keyed by a never-reused id.
//
// Ids come from a counter that starts at 0 and only grows. Counter and map
// sit behind one mutex, which is only held for a single map operation; record
// destruction always happens after the lock is released.
class ENUMEDITOR_EXPORT EditorInstanceRegistry final
{
public:
    EditorInstanceRegistry() = default;
    ~EditorInstanceRegistry();

    EditorInstanceRegistry(const EditorInstanceRegistry&) = delete;
    EditorInstanceRegistry& operator=(const EditorInstanceRegistry&) = delete;

    InstanceId allocateId();

    // id must come from allocateId() and must not be registered yet; a
    // duplicate is a programming error and aborts.
    void registerInstance(InstanceId id, InstanceRecord record);

    // allocateId() + registerInstance() under a single lock.
    InstanceId insert(InstanceRecord record);

    bool remove(InstanceId id);

    // Drops every record and returns how many were dropped.
    qsizetype clear();

    qsizetype size() const;
    bool contains(InstanceId id) const;
    QList<InstanceId> ids() const;
    EditorApi::PanelHandle panel(InstanceId id) const;
    InstanceId nextId() const;

private:
    void registerLocked(InstanceId id, InstanceRecord record);

    mutable QMutex m_mutex;
    std::unordered_map<InstanceId, InstanceRecord> m_records;
    InstanceId m_nextId = 0;
};

} // namespace EnumEditor
