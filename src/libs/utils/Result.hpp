// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <utility>

#include <QtCore/QString>
#include <QtCore/QStringList>

namespace Utils {

// Outcome of a low-level operation (file I/O, JSON parsing). Higher layers
// lift failures into their own typed errors.
struct Result {
	bool ok = true;
	QStringList errors;

	static Result success() { return Result{}; }

	static Result failure(const QString& msg)
	{
		Result r;
		r.ok = false;
		r.errors.push_back(msg);
		return r;
	}

	static Result failure(QStringList msgs)
	{
		Result r;
		r.ok = false;
		r.errors = std::move(msgs);
		return r;
	}

	void addError(const QString& msg)
	{
		ok = false;
		errors.push_back(msg);
	}

	QString errorString(const QString& separator = QStringLiteral("; ")) const
	{
		return errors.join(separator);
	}

	explicit operator bool() const { return ok; }
};

} // namespace Utils
