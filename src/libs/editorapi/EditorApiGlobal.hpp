// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QLoggingCategory>
#include <QtCore/QtGlobal>

#if defined(EDITORAPI_BUILD_SHARED) && (EDITORAPI_BUILD_SHARED == 1)
#	if defined(EDITORAPI_LIBRARY)
#		define EDITORAPI_EXPORT Q_DECL_EXPORT
#	else
#		define EDITORAPI_EXPORT Q_DECL_IMPORT
#	endif
#else
#	define EDITORAPI_EXPORT
#endif

Q_DECLARE_EXPORTED_LOGGING_CATEGORY(editorapilog, EDITORAPI_EXPORT)
