// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "utils/PathUtils.hpp"

#include <QtCore/QDir>

namespace Utils::PathUtils {

QString normalizePath(QStringView path)
{
    QString s = QDir::fromNativeSeparators(path.toString()).trimmed();
    QString cleaned = QDir::cleanPath(s);
    if (cleaned == ".")
        cleaned.clear();
    return cleaned;
}

QString joinPath(QStringView base, QStringView child)
{
    const QString cleanedBase = normalizePath(base);
    const QString cleanedChild = normalizePath(child);
    if (cleanedBase.isEmpty())
        return cleanedChild;
    if (cleanedChild.isEmpty())
        return cleanedBase;
    return QDir::cleanPath(QDir(cleanedBase).filePath(cleanedChild));
}

} // namespace Utils::PathUtils
