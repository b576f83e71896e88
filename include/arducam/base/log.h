/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2018, Google Inc.
 * Copyright (C) 2025, Arducam
 *
 * Category based diagnostics on stderr
 */

#pragma once

#include <sstream>
#include <string>

#include <arducam/base/class.h>

namespace arducam {

enum LogSeverity {
	LogInvalid = -1,
	LogDebug = 0,
	LogInfo,
	LogWarning,
	LogError,
	LogFatal,
};

class LogCategory
{
public:
	static LogCategory *create(const char *name);

	const std::string &name() const { return name_; }
	LogSeverity severity() const { return severity_; }
	void setSeverity(LogSeverity severity) { severity_ = severity; }

	bool enabled(LogSeverity severity) const
	{
		return severity >= severity_;
	}

private:
	explicit LogCategory(const char *name);

	const std::string name_;
	LogSeverity severity_;
};

#define LOG_DECLARE_CATEGORY(name)					\
const LogCategory &_LOG_CATEGORY(name)();

#define LOG_DEFINE_CATEGORY(name)					\
LOG_DECLARE_CATEGORY(name)						\
const LogCategory &_LOG_CATEGORY(name)()				\
{									\
	static const LogCategory *category = LogCategory::create(#name);	\
	return *category;						\
}

class LogMessage
{
public:
	LogMessage(const LogCategory &category, LogSeverity severity,
		   const char *fileName, unsigned int line,
		   const std::string &prefix = std::string());
	~LogMessage();

	std::ostream &stream() { return msgStream_; }

private:
	ARDUCAM_DISABLE_COPY_AND_MOVE(LogMessage)

	const LogCategory &category_;
	LogSeverity severity_;
	const char *fileName_;
	unsigned int line_;
	std::string prefix_;
	std::ostringstream msgStream_;
};

class Loggable
{
public:
	virtual ~Loggable();

protected:
	virtual std::string logPrefix() const = 0;

	LogMessage _log(const LogCategory &category, LogSeverity severity,
			const char *fileName = __builtin_FILE(),
			unsigned int line = __builtin_LINE()) const;
};

LogMessage _log(const LogCategory &category, LogSeverity severity,
		const char *fileName = __builtin_FILE(),
		unsigned int line = __builtin_LINE());

#define _LOG_CATEGORY(name) logCategory##name

#define LOG(category, severity)						\
	_log(_LOG_CATEGORY(category)(), Log##severity).stream()

} /* namespace arducam */
