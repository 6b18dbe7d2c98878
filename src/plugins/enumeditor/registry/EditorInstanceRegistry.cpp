// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "enumeditor/registry/EditorInstanceRegistry.hpp"

#include <QtCore/QMutexLocker>

#include <algorithm>
#include <utility>

namespace EnumEditor {

EditorInstanceRegistry::~EditorInstanceRegistry()
{
    clear();
}

InstanceId EditorInstanceRegistry::allocateId()
{
    QMutexLocker locker(&m_mutex);
    return m_nextId++;
}

void EditorInstanceRegistry::registerInstance(InstanceId id, InstanceRecord record)
{
    QMutexLocker locker(&m_mutex);
    registerLocked(id, std::move(record));
}

InstanceId EditorInstanceRegistry::insert(InstanceRecord record)
{
    QMutexLocker locker(&m_mutex);
    const InstanceId id = m_nextId++;
    registerLocked(id, std::move(record));
    return id;
}

bool EditorInstanceRegistry::remove(InstanceId id)
{
    InstanceRecord removed;
    {
        QMutexLocker locker(&m_mutex);
        auto it = m_records.find(id);
        if (it == m_records.end())
            return false;
        removed = std::move(it->second);
        m_records.erase(it);
    }
    return true;
}

qsizetype EditorInstanceRegistry::clear()
{
    std::unordered_map<InstanceId, InstanceRecord> drained;
    {
        QMutexLocker locker(&m_mutex);
        drained.swap(m_records);
    }
    return static_cast<qsizetype>(drained.size());
}

qsizetype EditorInstanceRegistry::size() const
{
    QMutexLocker locker(&m_mutex);
    return static_cast<qsizetype>(m_records.size());
}

bool EditorInstanceRegistry::contains(InstanceId id) const
{
    QMutexLocker locker(&m_mutex);
    return m_records.find(id) != m_records.end();
}

QList<InstanceId> EditorInstanceRegistry::ids() const
{
    QList<InstanceId> out;
    {
        QMutexLocker locker(&m_mutex);
        out.reserve(static_cast<qsizetype>(m_records.size()));
        for (const auto& entry : m_records)
            out.push_back(entry.first);
    }
    std::sort(out.begin(), out.end());
    return out;
}

EditorApi::PanelHandle EditorInstanceRegistry::panel(InstanceId id) const
{
    QMutexLocker locker(&m_mutex);
    const auto it = m_records.find(id);
    if (it == m_records.end())
        return {};
    return it->second.panel;
}

InstanceId EditorInstanceRegistry::nextId() const
{
    QMutexLocker locker(&m_mutex);
    return m_nextId;
}

void EditorInstanceRegistry::registerLocked(InstanceId id, InstanceRecord record)
{
    if (!m_records.try_emplace(id, std::move(record)).second)
        qFatal("EditorInstanceRegistry: instance id %llu registered twice", static_cast<unsigned long long>(id));

    // Keep the counter ahead of every registered id so allocateId() can never
    // hand one out again.
    if (id >= m_nextId)
        m_nextId = id + 1;
}

} // namespace EnumEditor
