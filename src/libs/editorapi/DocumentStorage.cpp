// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "editorapi/DocumentStorage.hpp"

#include <utils/PathUtils.hpp>
#include <utils/filesystem/JsonFileUtils.hpp>

#include <QtCore/QDir>
#include <QtCore/QFileInfo>

namespace EditorApi::DocumentStorage {

QString resolveDocumentPath(const FileStructure& structure, const QString& path)
{
    if (!structure.isFolderBased() || structure.markerFile.isEmpty())
        return path;

    const QFileInfo info(path);
    if (!info.isDir())
        return path;

    return QDir(path).filePath(structure.markerFile);
}

QString markerPath(const FileStructure& structure, const QString& documentPath)
{
    if (!structure.isFolderBased() || structure.markerFile.isEmpty())
        return {};
    return Utils::PathUtils::joinPath(documentPath, structure.markerFile);
}

Utils::Result createDocument(const FileTypeDefinition& definition, const QString& path)
{
    const QString target = Utils::PathUtils::normalizePath(path);
    if (target.isEmpty())
        return Utils::Result::failure(QStringLiteral("Document path is empty."));

    const QFileInfo info(target);

    if (!definition.structure.isFolderBased()) {
        if (info.exists())
            return Utils::Result::failure(QStringLiteral("Document already exists: %1").arg(target));
        return Utils::JsonFileUtils::writeObjectAtomic(target, definition.defaultContent);
    }

    if (definition.structure.markerFile.isEmpty()) {
        return Utils::Result::failure(
            QStringLiteral("File type '%1' has no marker file.").arg(definition.id.toString()));
    }

    if (info.exists()) {
        if (!info.isDir())
            return Utils::Result::failure(QStringLiteral("Document path exists and is not a directory: %1").arg(target));
        if (!QDir(target).isEmpty(QDir::NoDotAndDotDot | QDir::AllEntries | QDir::Hidden))
            return Utils::Result::failure(QStringLiteral("Document directory is not empty: %1").arg(target));
    }

    const Utils::Result ensure = Utils::JsonFileUtils::ensureDirectory(target);
    if (!ensure)
        return ensure;

    const QString marker = markerPath(definition.structure, target);
    const Utils::Result written = Utils::JsonFileUtils::writeObjectAtomic(marker, definition.defaultContent);
    if (!written)
        return written;

    qCDebug(editorapilog) << "DocumentStorage: created" << definition.id.toString() << "document at" << target;
    return Utils::Result::success();
}

} // namespace EditorApi::DocumentStorage
