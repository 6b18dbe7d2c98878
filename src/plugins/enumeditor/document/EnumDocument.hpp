// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "enumeditor/EnumEditorGlobal.hpp"
#include "enumeditor/document/EnumDefinition.hpp"

#include <utils/Result.hpp>

#include <QtCore/QObject>
#include <QtCore/QString>

namespace EnumEditor {

// One enum definition bound to its marker file. Tracks the last persisted
// definition next to the edited one; the document is dirty while they differ.
class ENUMEDITOR_EXPORT EnumDocument final : public QObject
{
    Q_OBJECT

public:
    explicit EnumDocument(QString filePath, QObject* parent = nullptr);

    const QString& filePath() const noexcept { return m_filePath; }
    const EnumDefinition& definition() const noexcept { return m_current; }
    bool isDirty() const noexcept { return m_dirty; }

    // Reads the file. On failure the in-memory state is left untouched.
    Utils::Result load();
    Utils::Result save();

    void setDefinition(EnumDefinition definition);
    void setName(const QString& name);
    void setDescription(const QString& description);

    bool addVariant(EnumVariant variant);
    bool updateVariant(int index, EnumVariant variant);
    bool removeVariant(int index);
    bool moveVariant(int from, int to);

    QString uniqueVariantName(const QString& base) const;

signals:
    void definitionChanged();
    void dirtyStateChanged(bool dirty);
    void saved();
    void reloaded();

private:
    void applyEdit(EnumDefinition next);
    void updateDirtyState();

    QString m_filePath;
    EnumDefinition m_persisted;
    EnumDefinition m_current;
    bool m_dirty = false;
};

} // namespace EnumEditor
