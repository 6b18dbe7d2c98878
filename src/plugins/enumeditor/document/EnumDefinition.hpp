// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "enumeditor/EnumEditorGlobal.hpp"

#include <utils/Result.hpp>

#include <QtCore/QJsonObject>
#include <QtCore/QString>
#include <QtCore/QVector>

#include <optional>

namespace EnumEditor {

struct ENUMEDITOR_EXPORT EnumVariant final {
    QString name;
    std::optional<qint64> value;
    QString description;

    friend bool operator==(const EnumVariant&, const EnumVariant&) = default;
};

struct ENUMEDITOR_EXPORT EnumDefinition final {
    QString name;
    QString description;
    QVector<EnumVariant> variants;

    friend bool operator==(const EnumDefinition&, const EnumDefinition&) = default;

    int indexOfVariant(const QString& variantName) const;

    QJsonObject toJson() const;

    // Structural parse only: the root must carry a string "name" and, when
    // present, a "variants" array of objects with string names.
    static Utils::Result fromJson(const QJsonObject& json, EnumDefinition& out);

    static QJsonObject defaultContent();
};

} // namespace EnumEditor
