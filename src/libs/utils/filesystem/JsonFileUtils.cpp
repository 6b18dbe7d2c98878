// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "utils/filesystem/JsonFileUtils.hpp"

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QJsonParseError>
#include <QtCore/QSaveFile>

namespace Utils::JsonFileUtils {

Result writeObjectAtomic(const QString& path, const QJsonObject& object, QJsonDocument::JsonFormat format)
{
    const QString cleanedPath = path.trimmed();
    if (cleanedPath.isEmpty())
        return Result::failure(QStringLiteral("JSON output path is empty."));

    QSaveFile file(cleanedPath);
    if (!file.open(QIODevice::WriteOnly)) {
        return Result::failure(QStringLiteral("Failed to open file for writing: %1 (%2)")
                                   .arg(cleanedPath, file.errorString()));
    }

    const QJsonDocument doc(object);
    if (file.write(doc.toJson(format)) < 0) {
        const QString error = file.errorString();
        file.cancelWriting();
        return Result::failure(QStringLiteral("Failed to write JSON file: %1 (%2)").arg(cleanedPath, error));
    }

    if (!file.commit()) {
        return Result::failure(QStringLiteral("Failed to commit JSON file: %1 (%2)")
                                   .arg(cleanedPath, file.errorString()));
    }
    return Result::success();
}

Result readObject(const QString& path, QJsonObject& outObject)
{
    outObject = {};

    const QString cleanedPath = path.trimmed();
    if (cleanedPath.isEmpty())
        return Result::failure(QStringLiteral("JSON input path is empty."));

    const QFileInfo info(cleanedPath);
    if (!info.exists())
        return Result::failure(QStringLiteral("JSON file does not exist: %1").arg(cleanedPath));
    if (!info.isFile())
        return Result::failure(QStringLiteral("JSON path is not a file: %1").arg(cleanedPath));

    QFile file(cleanedPath);
    if (!file.open(QIODevice::ReadOnly)) {
        return Result::failure(QStringLiteral("Failed to open JSON file: %1 (%2)")
                                   .arg(cleanedPath, file.errorString()));
    }

    const QByteArray bytes = file.readAll();
    QJsonParseError parseError{};
    const QJsonDocument doc = QJsonDocument::fromJson(bytes, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        return Result::failure(QStringLiteral("Failed to parse JSON file: %1 (%2)")
                                   .arg(cleanedPath, parseError.errorString()));
    }

    if (!doc.isObject())
        return Result::failure(QStringLiteral("JSON document is not an object: %1").arg(cleanedPath));

    outObject = doc.object();
    return Result::success();
}

Result ensureDirectory(const QString& path)
{
    const QString cleanedPath = path.trimmed();
    if (cleanedPath.isEmpty())
        return Result::failure(QStringLiteral("Directory path is empty."));

    const QFileInfo info(cleanedPath);
    if (info.exists()) {
        if (info.isDir())
            return Result::success();
        return Result::failure(QStringLiteral("Path exists and is not a directory: %1").arg(cleanedPath));
    }

    if (!QDir().mkpath(cleanedPath)) {
        qCWarning(utilslog) << "JsonFileUtils: mkpath failed for" << cleanedPath;
        return Result::failure(QStringLiteral("Failed to create directory: %1").arg(cleanedPath));
    }
    return Result::success();
}

} // namespace Utils::JsonFileUtils
