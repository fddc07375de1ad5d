// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QMetaType>
#include <QtCore/QString>
#include <QtCore/QStringList>

#include <utility>

namespace Utils {

struct Result {
	enum class Kind : unsigned char {
		Ok,
		Failed,
		Unsupported
	};

	bool ok = true;
	Kind kind = Kind::Ok;
	QStringList errors;

	static Result success() { return Result{}; }

	static Result failure(const QString& msg)
	{
		Result r;
		r.ok = false;
		r.kind = Kind::Failed;
		r.errors.push_back(msg);
		return r;
	}

	static Result failure(QStringList msgs)
	{
		Result r;
		r.ok = false;
		r.kind = Kind::Failed;
		r.errors = std::move(msgs);
		return r;
	}

	// The operation is not available for the target, as opposed to having been attempted and failed.
	static Result unsupported(const QString& msg)
	{
		Result r = failure(msg);
		r.kind = Kind::Unsupported;
		return r;
	}

	void addError(const QString& msg)
	{
		ok = false;
		if (kind == Kind::Ok)
			kind = Kind::Failed;
		errors.push_back(msg);
	}

	void merge(const Result& other)
	{
		if (other.ok)
			return;
		ok = false;
		if (kind == Kind::Ok)
			kind = other.kind;
		errors.append(other.errors);
	}

	bool isUnsupported() const { return kind == Kind::Unsupported; }

	QString message() const { return errors.join(QLatin1Char('\n')); }

	explicit operator bool() const { return ok; }
};

} // namespace Utils

Q_DECLARE_METATYPE(Utils::Result)
