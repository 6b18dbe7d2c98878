// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "editorapi/EditorApiGlobal.hpp"

#include <QtCore/QHashFunctions>
#include <QtCore/QJsonObject>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QVector>
#include <QtGui/QColor>

#include <compare>
#include <utility>

namespace EditorApi {

// Value-compared string token. The tag keeps editor ids and file type ids
// from being mixed up at call sites.
template <typename Tag>
class NamedId final
{
public:
	NamedId() = default;
	explicit NamedId(QString value) : m_value(std::move(value)) {}

	const QString& toString() const noexcept { return m_value; }
	bool isValid() const noexcept { return !m_value.trimmed().isEmpty(); }

	explicit operator bool() const noexcept { return isValid(); }

	friend bool operator==(const NamedId&, const NamedId&) noexcept = default;
	friend std::strong_ordering operator<=>(const NamedId& a, const NamedId& b) noexcept {
		const int c = QString::compare(a.m_value, b.m_value, Qt::CaseSensitive);
		if (c < 0) return std::strong_ordering::less;
		if (c > 0) return std::strong_ordering::greater;
		return std::strong_ordering::equal;
	}

	friend size_t qHash(const NamedId& id, size_t seed = 0) noexcept { return qHash(id.m_value, seed); }

private:
	QString m_value;
};

struct EditorIdTag {};
struct FileTypeIdTag {};
struct PluginIdTag {};

using EditorId = NamedId<EditorIdTag>;
using FileTypeId = NamedId<FileTypeIdTag>;
using PluginId = NamedId<PluginIdTag>;

// How a document is laid out on disk. Folder-based documents appear as a
// single entry to the user; their content lives in the marker file.
struct EDITORAPI_EXPORT FileStructure final {
	enum class Kind : unsigned char {
		SingleFile,
		FolderBased
	};

	Kind kind = Kind::SingleFile;
	QString markerFile;

	static FileStructure singleFile() { return {}; }
	static FileStructure folderBased(QString marker)
	{
		FileStructure s;
		s.kind = Kind::FolderBased;
		s.markerFile = std::move(marker);
		return s;
	}

	bool isFolderBased() const noexcept { return kind == Kind::FolderBased; }
};

struct EDITORAPI_EXPORT FileTypeDefinition final {
	FileTypeId id;
	QString extension;
	QString displayName;
	QString iconResource;
	QColor color;
	FileStructure structure;
	QJsonObject defaultContent;
	QStringList categories;
};

struct EDITORAPI_EXPORT EditorMetadata final {
	EditorId id;
	QString displayName;
	QVector<FileTypeId> supportedFileTypes;

	bool supports(const FileTypeId& fileType) const { return supportedFileTypes.contains(fileType); }
};

struct EDITORAPI_EXPORT PluginMetadata final {
	PluginId id;
	QString name;
	QString version;
	QString author;
	QString description;
};

} // namespace EditorApi
