// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "enumeditor/document/EnumDocument.hpp"

#include <utils/filesystem/JsonFileUtils.hpp>

#include <utility>

namespace EnumEditor {

EnumDocument::EnumDocument(QString filePath, QObject* parent)
    : QObject(parent)
    , m_filePath(std::move(filePath))
{
}

Utils::Result EnumDocument::load()
{
    QJsonObject json;
    const Utils::Result readResult = Utils::JsonFileUtils::readObject(m_filePath, json);
    if (!readResult)
        return readResult;

    EnumDefinition loaded;
    const Utils::Result parseResult = EnumDefinition::fromJson(json, loaded);
    if (!parseResult) {
        Utils::Result failure = Utils::Result::failure(
            QStringLiteral("Malformed enum definition: %1").arg(m_filePath));
        for (const QString& error : parseResult.errors)
            failure.addError(error);
        return failure;
    }

    const bool changed = (loaded != m_current);
    m_persisted = loaded;
    m_current = std::move(loaded);
    updateDirtyState();

    if (changed)
        emit definitionChanged();
    emit reloaded();
    return Utils::Result::success();
}

Utils::Result EnumDocument::save()
{
    const Utils::Result writeResult = Utils::JsonFileUtils::writeObjectAtomic(m_filePath, m_current.toJson());
    if (!writeResult)
        return writeResult;

    m_persisted = m_current;
    updateDirtyState();
    emit saved();
    return Utils::Result::success();
}

void EnumDocument::setDefinition(EnumDefinition definition)
{
    applyEdit(std::move(definition));
}

void EnumDocument::setName(const QString& name)
{
    EnumDefinition next = m_current;
    next.name = name;
    applyEdit(std::move(next));
}

void EnumDocument::setDescription(const QString& description)
{
    EnumDefinition next = m_current;
    next.description = description;
    applyEdit(std::move(next));
}

bool EnumDocument::addVariant(EnumVariant variant)
{
    if (variant.name.trimmed().isEmpty())
        return false;

    EnumDefinition next = m_current;
    next.variants.push_back(std::move(variant));
    applyEdit(std::move(next));
    return true;
}

bool EnumDocument::updateVariant(int index, EnumVariant variant)
{
    if (index < 0 || index >= m_current.variants.size())
        return false;
    if (variant.name.trimmed().isEmpty())
        return false;

    EnumDefinition next = m_current;
    next.variants[index] = std::move(variant);
    applyEdit(std::move(next));
    return true;
}

bool EnumDocument::removeVariant(int index)
{
    if (index < 0 || index >= m_current.variants.size())
        return false;

    EnumDefinition next = m_current;
    next.variants.removeAt(index);
    applyEdit(std::move(next));
    return true;
}

bool EnumDocument::moveVariant(int from, int to)
{
    const int count = m_current.variants.size();
    if (from < 0 || from >= count || to < 0 || to >= count)
        return false;
    if (from == to)
        return true;

    EnumDefinition next = m_current;
    next.variants.move(from, to);
    applyEdit(std::move(next));
    return true;
}

QString EnumDocument::uniqueVariantName(const QString& base) const
{
    const QString stem = base.trimmed().isEmpty() ? QStringLiteral("Variant") : base.trimmed();
    if (m_current.indexOfVariant(stem) < 0)
        return stem;

    for (int i = 1;; ++i) {
        const QString candidate = QStringLiteral("%1%2").arg(stem).arg(i);
        if (m_current.indexOfVariant(candidate) < 0)
            return candidate;
    }
}

void EnumDocument::applyEdit(EnumDefinition next)
{
    if (next == m_current)
        return;

    m_current = std::move(next);
    updateDirtyState();
    emit definitionChanged();
}

void EnumDocument::updateDirtyState()
{
    const bool dirty = (m_current != m_persisted);
    if (dirty == m_dirty)
        return;

    m_dirty = dirty;
    emit dirtyStateChanged(dirty);
}

} // namespace EnumEditor
