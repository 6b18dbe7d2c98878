// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "utils/Result.hpp"
#include "utils/UtilsGlobal.hpp"

#include <QtCore/QJsonDocument>
#include <QtCore/QJsonObject>
#include <QtCore/QString>

namespace Utils::JsonFileUtils {

// Writes through QSaveFile so readers never observe a half-written document.
UTILS_EXPORT Result writeObjectAtomic(const QString& path,
                                      const QJsonObject& object,
                                      QJsonDocument::JsonFormat format = QJsonDocument::Indented);

// outObject is cleared on failure.
UTILS_EXPORT Result readObject(const QString& path, QJsonObject& outObject);

UTILS_EXPORT Result ensureDirectory(const QString& path);

} // namespace Utils::JsonFileUtils
