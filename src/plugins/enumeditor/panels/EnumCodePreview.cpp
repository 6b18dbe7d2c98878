// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "enumeditor/panels/EnumCodePreview.hpp"

#include "enumeditor/Constants.hpp"

#include <QtCore/QStringList>

namespace EnumEditor::CodePreview {

namespace {

const QString kIndent = QStringLiteral("    ");

void appendDocComment(QStringList& lines, const QString& text, const QString& indent)
{
    if (text.trimmed().isEmpty())
        return;

    const QStringList parts = text.split(u'\n');
    for (const QString& part : parts)
        lines << QStringLiteral("%1/// %2").arg(indent, part.trimmed());
}

} // namespace

QString sanitizeIdentifier(const QString& name, const QString& fallback)
{
    QString out;
    out.reserve(name.size() + 1);

    for (const QChar c : name.trimmed()) {
        if (c.isLetterOrNumber() || c == u'_')
            out.append(c);
        else
            out.append(u'_');
    }

    if (out.isEmpty())
        return fallback;
    if (out.front().isDigit())
        out.prepend(u'_');
    return out;
}

QString generate(const EnumDefinition& definition)
{
    QStringList lines;
    appendDocComment(lines, definition.description, QString());

    const QString enumName = sanitizeIdentifier(definition.name, QString::fromLatin1(Constants::kDefaultEnumName));
    if (definition.variants.isEmpty()) {
        lines << QStringLiteral("enum class %1 {};").arg(enumName);
        return lines.join(u'\n') + u'\n';
    }

    lines << QStringLiteral("enum class %1 {").arg(enumName);
    for (const EnumVariant& variant : definition.variants) {
        appendDocComment(lines, variant.description, kIndent);
        const QString variantName = sanitizeIdentifier(variant.name, QStringLiteral("Unnamed"));
        if (variant.value.has_value())
            lines << QStringLiteral("%1%2 = %3,").arg(kIndent, variantName).arg(*variant.value);
        else
            lines << QStringLiteral("%1%2,").arg(kIndent, variantName);
    }
    lines << QStringLiteral("};");
    return lines.join(u'\n') + u'\n';
}

} // namespace EnumEditor::CodePreview
