// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QLoggingCategory>
#include <QtCore/QtGlobal>

#if defined(ENUMEDITOR_BUILD_SHARED) && (ENUMEDITOR_BUILD_SHARED == 1)
#	if defined(ENUMEDITOR_LIBRARY)
#		define ENUMEDITOR_EXPORT Q_DECL_EXPORT
#	else
#		define ENUMEDITOR_EXPORT Q_DECL_IMPORT
#	endif
#else
#	define ENUMEDITOR_EXPORT
#endif

Q_DECLARE_EXPORTED_LOGGING_CATEGORY(enumeditorlog, ENUMEDITOR_EXPORT)
