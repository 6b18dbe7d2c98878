// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "editorapi/EditorApiGlobal.hpp"
#include "editorapi/PluginError.hpp"

#include <QtCore/QObject>
#include <QtCore/QString>

namespace EditorApi {

// Uniform handle the host keeps for one open document. The host never sees
// the document-specific entity type unless it asks for it through entityAs().
class EDITORAPI_EXPORT IEditorInstance
{
public:
	virtual ~IEditorInstance() = default;

	// Resolved on-disk location backing the instance. Fixed for its lifetime.
	virtual const QString& filePath() const = 0;

	virtual PluginResult save() = 0;
	virtual PluginResult reload() = 0;
	virtual bool isDirty() const = 0;

	// The live entity behind this instance, type-erased.
	virtual QObject* entity() const = 0;

	// Attempted downcast to the concrete entity type. Null on mismatch.
	template <class T>
	T* entityAs() const
	{
		return qobject_cast<T*>(entity());
	}

protected:
	IEditorInstance() = default;
	IEditorInstance(const IEditorInstance&) = default;
	IEditorInstance& operator=(const IEditorInstance&) = default;
};

} // namespace EditorApi
