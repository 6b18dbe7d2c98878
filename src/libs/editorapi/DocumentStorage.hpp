// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "editorapi/EditorApiGlobal.hpp"
#include "editorapi/EditorTypes.hpp"

#include <utils/Result.hpp>

#include <QtCore/QString>

namespace EditorApi::DocumentStorage {

// Maps a path the host picked to the file an editor should read. A directory
// resolves to its marker file when the structure has one; any other path is
// returned unchanged.
EDITORAPI_EXPORT QString resolveDocumentPath(const FileStructure& structure, const QString& path);

// Path of the marker file for a folder-based document, empty for single-file
// structures.
EDITORAPI_EXPORT QString markerPath(const FileStructure& structure, const QString& documentPath);

// Writes a fresh document of the given type at path using its default
// content. Refuses to overwrite existing content.
EDITORAPI_EXPORT Utils::Result createDocument(const FileTypeDefinition& definition, const QString& path);

} // namespace EditorApi::DocumentStorage
