// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "editorapi/PluginError.hpp"

#include <utility>

namespace EditorApi {

PluginError PluginError::editorNotFound(EditorId editorId)
{
    PluginError e;
    e.kind = Kind::EditorNotFound;
    e.message = QStringLiteral("Editor not found: '%1'").arg(editorId.toString());
    e.editorId = std::move(editorId);
    return e;
}

PluginError PluginError::fromResult(Kind kind, const Utils::Result& result)
{
    PluginError e;
    e.kind = kind;
    e.message = result.errorString();
    return e;
}

QString PluginError::toString() const
{
    if (kind == Kind::None)
        return {};
    if (message.isEmpty())
        return kindName(kind);
    return QStringLiteral("%1: %2").arg(kindName(kind), message);
}

QString kindName(PluginError::Kind kind)
{
    switch (kind) {
    case PluginError::Kind::None:
        return QStringLiteral("None");
    case PluginError::Kind::EditorNotFound:
        return QStringLiteral("EditorNotFound");
    case PluginError::Kind::ConstructionFailed:
        return QStringLiteral("ConstructionFailed");
    case PluginError::Kind::SaveFailed:
        return QStringLiteral("SaveFailed");
    case PluginError::Kind::ReloadFailed:
        return QStringLiteral("ReloadFailed");
    }
    return QStringLiteral("Unknown");
}

} // namespace EditorApi
