// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "enumeditor/document/EnumDefinition.hpp"

#include "enumeditor/Constants.hpp"

#include <QtCore/QJsonArray>
#include <QtCore/QJsonValue>

#include <utility>

namespace EnumEditor {

namespace {

using namespace Qt::StringLiterals;

const QString kNameKey = u"name"_s;
const QString kDescriptionKey = u"description"_s;
const QString kVariantsKey = u"variants"_s;
const QString kValueKey = u"value"_s;

Utils::Result parseVariant(const QJsonValue& value, int index, EnumVariant& out)
{
    if (!value.isObject())
        return Utils::Result::failure(QStringLiteral("Variant %1 is not an object.").arg(index));

    const QJsonObject obj = value.toObject();
    const QJsonValue name = obj.value(kNameKey);
    if (!name.isString())
        return Utils::Result::failure(QStringLiteral("Variant %1 has no string 'name'.").arg(index));

    out = {};
    out.name = name.toString();

    const QJsonValue explicitValue = obj.value(kValueKey);
    if (!explicitValue.isUndefined() && !explicitValue.isNull()) {
        if (!explicitValue.isDouble())
            return Utils::Result::failure(QStringLiteral("Variant '%1' has a non-numeric 'value'.").arg(out.name));
        const qint64 integral = explicitValue.toInteger();
        if (static_cast<double>(integral) != explicitValue.toDouble())
            return Utils::Result::failure(QStringLiteral("Variant '%1' has a non-integer 'value'.").arg(out.name));
        out.value = integral;
    }

    out.description = obj.value(kDescriptionKey).toString();
    return Utils::Result::success();
}

} // namespace

int EnumDefinition::indexOfVariant(const QString& variantName) const
{
    for (int i = 0; i < variants.size(); ++i) {
        if (variants.at(i).name == variantName)
            return i;
    }
    return -1;
}

QJsonObject EnumDefinition::toJson() const
{
    QJsonArray variantArray;
    for (const EnumVariant& variant : variants) {
        QJsonObject v;
        v.insert(kNameKey, variant.name);
        if (variant.value.has_value())
            v.insert(kValueKey, *variant.value);
        if (!variant.description.isEmpty())
            v.insert(kDescriptionKey, variant.description);
        variantArray.push_back(v);
    }

    QJsonObject root;
    root.insert(kNameKey, name);
    if (!description.isEmpty())
        root.insert(kDescriptionKey, description);
    root.insert(kVariantsKey, variantArray);
    return root;
}

Utils::Result EnumDefinition::fromJson(const QJsonObject& json, EnumDefinition& out)
{
    const QJsonValue name = json.value(kNameKey);
    if (!name.isString())
        return Utils::Result::failure(QStringLiteral("Enum definition has no string 'name'."));

    EnumDefinition parsed;
    parsed.name = name.toString();
    parsed.description = json.value(kDescriptionKey).toString();

    const QJsonValue variantsValue = json.value(kVariantsKey);
    if (!variantsValue.isUndefined() && !variantsValue.isArray())
        return Utils::Result::failure(QStringLiteral("Enum definition 'variants' is not an array."));

    const QJsonArray variantArray = variantsValue.toArray();
    parsed.variants.reserve(variantArray.size());
    for (int i = 0; i < variantArray.size(); ++i) {
        EnumVariant variant;
        const Utils::Result parsedVariant = parseVariant(variantArray.at(i), i, variant);
        if (!parsedVariant)
            return parsedVariant;
        parsed.variants.push_back(std::move(variant));
    }

    out = std::move(parsed);
    return Utils::Result::success();
}

QJsonObject EnumDefinition::defaultContent()
{
    return QJsonObject{{kNameKey, QString::fromLatin1(Constants::kDefaultEnumName)},
                       {kVariantsKey, QJsonArray{}}};
}

} // namespace EnumEditor
