// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "editorapi/EditorApiGlobal.hpp"
#include "editorapi/EditorTypes.hpp"
#include "editorapi/IEditorInstance.hpp"
#include "editorapi/PluginError.hpp"

#include <QtCore/QObject>
#include <QtCore/QSharedPointer>
#include <QtCore/QString>
#include <QtCore/QVector>

#include <memory>

QT_BEGIN_NAMESPACE
class QWidget;
QT_END_NAMESPACE

namespace EditorApi {

using InstanceId = quint64;

// Shared display handle. The host and the plugin each keep one; the panel
// lives until both have let go.
using PanelHandle = QSharedPointer<QWidget>;

struct EDITORAPI_EXPORT EditorHandles final {
	PanelHandle panel;
	std::unique_ptr<IEditorInstance> instance;
	InstanceId instanceId = 0;

	bool isValid() const noexcept { return panel && instance; }
};

// Base class for editor plugins. Concrete plugins are exported with
// Q_PLUGIN_METADATA(IID "com.pulsar.EditorPlugin" ...) and recovered by the
// host through qobject_cast<IEditorPlugin*>(QPluginLoader::instance()).
class EDITORAPI_EXPORT IEditorPlugin : public QObject
{
	Q_OBJECT

public:
	explicit IEditorPlugin(QObject* parent = nullptr) : QObject(parent) {}
	~IEditorPlugin() override = default;

	virtual PluginMetadata metadata() const = 0;
	virtual QVector<FileTypeDefinition> fileTypes() const = 0;
	virtual QVector<EditorMetadata> editors() const = 0;

	// Resolves filePath, builds the entity and registers it. On failure
	// outHandles is left empty and nothing is registered.
	virtual PluginResult createEditor(const EditorId& editorId,
									  const QString& filePath,
									  EditorHandles& outHandles) = 0;

	// Drops the plugin's bookkeeping for one editor. Returns false for an
	// unknown id.
	virtual bool releaseEditor(InstanceId instanceId) = 0;

	virtual void onLoad() {}

	// Best-effort teardown; returns the number of editors released.
	virtual qsizetype onUnload() = 0;

signals:
	void editorCreated(quint64 instanceId, const QString& filePath);
	void editorReleased(quint64 instanceId);
};

} // namespace EditorApi
