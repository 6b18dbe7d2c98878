// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "enumeditor/EnumEditorGlobal.hpp"
#include "enumeditor/document/EnumDefinition.hpp"

#include <QtCore/QString>

namespace EnumEditor::CodePreview {

// Identifier-safe form of a user supplied name: invalid characters become
// '_', and a leading digit gets a '_' prefix.
ENUMEDITOR_EXPORT QString sanitizeIdentifier(const QString& name, const QString& fallback);

// C++ `enum class` rendering used by the code preview panel.
ENUMEDITOR_EXPORT QString generate(const EnumDefinition& definition);

} // namespace EnumEditor::CodePreview
