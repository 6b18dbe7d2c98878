// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "editorapi/EditorApiGlobal.hpp"
#include "editorapi/EditorTypes.hpp"

#include <utils/Result.hpp>

#include <QtCore/QString>

#include <utility>

namespace EditorApi {

struct EDITORAPI_EXPORT PluginError final {
	enum class Kind : unsigned char {
		None,
		EditorNotFound,
		ConstructionFailed,
		SaveFailed,
		ReloadFailed
	};

	Kind kind = Kind::None;
	EditorId editorId;
	QString message;

	static PluginError editorNotFound(EditorId editorId);

	// Folds a low-level failure into a typed error, keeping every message.
	static PluginError fromResult(Kind kind, const Utils::Result& result);

	QString toString() const;
};

EDITORAPI_EXPORT QString kindName(PluginError::Kind kind);

// Outcome of a host-facing call. Mirrors Utils::Result but carries exactly one
// typed error so the host can branch on the failure class.
struct EDITORAPI_EXPORT PluginResult final {
	bool ok = true;
	PluginError error;

	static PluginResult success() { return PluginResult{}; }

	static PluginResult failure(PluginError err)
	{
		PluginResult r;
		r.ok = false;
		r.error = std::move(err);
		return r;
	}

	PluginError::Kind errorKind() const noexcept { return ok ? PluginError::Kind::None : error.kind; }

	explicit operator bool() const { return ok; }
};

} // namespace EditorApi
