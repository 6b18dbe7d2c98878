// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QtGlobal>

namespace EnumEditor::Constants {

constexpr inline char kPluginId[] = "com.pulsar.enum-editor";
constexpr inline char kPluginName[] = "Enum Editor";
constexpr inline char kPluginVersion[] = "0.1.0";
constexpr inline char kPluginAuthor[] = "Pulsar Team";
constexpr inline char kPluginDescription[] = "Professional multi-panel editor for creating enum definitions";

constexpr inline char kEditorId[] = "enum-editor";
constexpr inline char kEditorDisplayName[] = "Enum Editor";

constexpr inline char kFileTypeId[] = "enum";
constexpr inline char kFileExtension[] = "enum";
constexpr inline char kFileTypeDisplayName[] = "Enum Definition";
constexpr inline char kMarkerFile[] = "enum.json";
constexpr inline char kFileTypeCategory[] = "Types";
constexpr inline char kIconResource[] = ":/ui/icons/svg/list_icon.svg";
constexpr inline quint32 kFileTypeColor = 0x673AB7;

constexpr inline char kDefaultEnumName[] = "NewEnum";

} // namespace EnumEditor::Constants
