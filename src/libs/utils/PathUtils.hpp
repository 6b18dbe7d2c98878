// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "utils/UtilsGlobal.hpp"

#include <QtCore/QString>
#include <QtCore/QStringView>

namespace Utils::PathUtils {

UTILS_EXPORT QString normalizePath(QStringView path);
UTILS_EXPORT QString joinPath(QStringView base, QStringView child);

} // namespace Utils::PathUtils
