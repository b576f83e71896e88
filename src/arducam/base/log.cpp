/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2018, Google Inc.
 * Copyright (C) 2025, Arducam
 *
 * Category based diagnostics on stderr
 */

#include <arducam/base/log.h>

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdlib.h>
#include <time.h>
#include <unistd.h>
#include <utility>
#include <vector>

#include <arducam/base/utils.h>

/**
 * \file base/log.h
 * \brief Category based diagnostics
 *
 * Diagnostics are grouped in categories named after the area of the tools
 * that emits them (Transport, Decoder, DeviceMapping, ...). Each category
 * has its own threshold, messages below it are dropped. The default
 * threshold is LogWarning so that the command line tools stay quiet unless
 * something goes wrong.
 *
 * Thresholds are set through the ARDUCAM_LOG_LEVELS environment variable, a
 * comma-separated list of 'category:level' rules. A category pattern ending
 * with '*' matches every category starting with the text before it, and a
 * rule without a category applies to all of them. When several rules match
 * a category the last one wins. Levels are given by name (DEBUG, INFO, WARN,
 * ERROR, FATAL) or by their numerical value from 0 to 4.
 *
 * Messages are written to stderr, one line each:
 *
 * \verbatim
   [12.345678] [1234] WARN Transport i2c_device.cpp:142 i2c-10: Bus busy
   \endverbatim
 */

namespace arducam {

namespace {

const char *severityName(LogSeverity severity)
{
	switch (severity) {
	case LogDebug:
		return "DEBUG";
	case LogInfo:
		return "INFO";
	case LogWarning:
		return "WARN";
	case LogError:
		return "ERROR";
	case LogFatal:
		return "FATAL";
	default:
		return "UNKWN";
	}
}

LogSeverity parseSeverity(const std::string &level)
{
	if (level.size() == 1 && level[0] >= '0' && level[0] <= '4')
		return static_cast<LogSeverity>(level[0] - '0');

	for (int severity = LogDebug; severity <= LogFatal; ++severity) {
		if (level == severityName(static_cast<LogSeverity>(severity)))
			return static_cast<LogSeverity>(severity);
	}

	return LogInvalid;
}

class Logger
{
public:
	static Logger *instance();

	void registerCategory(LogCategory *category);
	void write(const std::string &line);

private:
	Logger();

	void parseLevels(const std::string &levels);
	LogSeverity thresholdFor(const std::string &name) const;

	std::mutex lock_;
	std::vector<std::unique_ptr<LogCategory>> categories_;
	std::vector<std::pair<std::string, LogSeverity>> rules_;
};

Logger::Logger()
{
	const char *levels = utils::secure_getenv("ARDUCAM_LOG_LEVELS");
	if (levels)
		parseLevels(levels);
}

Logger *Logger::instance()
{
	static Logger logger;
	return &logger;
}

/*
 * Split the ARDUCAM_LOG_LEVELS value into rules. Malformed rules are
 * reported on stderr and skipped, the remaining ones still apply.
 */
void Logger::parseLevels(const std::string &levels)
{
	for (const std::string &rule : utils::split(levels, ",")) {
		if (rule.empty())
			continue;

		std::string pattern;
		std::string level;

		size_t colon = rule.rfind(':');
		if (colon == std::string::npos) {
			pattern = "*";
			level = rule;
		} else {
			pattern = rule.substr(0, colon);
			level = rule.substr(colon + 1);
		}

		LogSeverity severity = parseSeverity(level);
		if (pattern.empty() || severity == LogInvalid) {
			std::cerr << "Ignoring invalid log level rule '" << rule
				  << "'" << std::endl;
			continue;
		}

		rules_.emplace_back(pattern, severity);
	}
}

LogSeverity Logger::thresholdFor(const std::string &name) const
{
	LogSeverity severity = LogWarning;

	for (const auto &[pattern, level] : rules_) {
		bool match;

		if (pattern.back() == '*')
			match = name.compare(0, pattern.size() - 1, pattern,
					     0, pattern.size() - 1) == 0;
		else
			match = name == pattern;

		if (match)
			severity = level;
	}

	return severity;
}

void Logger::registerCategory(LogCategory *category)
{
	category->setSeverity(thresholdFor(category->name()));

	std::lock_guard<std::mutex> locker(lock_);
	categories_.emplace_back(category);
}

void Logger::write(const std::string &line)
{
	std::lock_guard<std::mutex> locker(lock_);
	std::cerr << line << std::flush;
}

} /* namespace */

/**
 * \enum LogSeverity
 * \brief Severity of a log message
 * \var LogDebug
 * \brief Debug message, hidden unless enabled through ARDUCAM_LOG_LEVELS
 * \var LogInfo
 * \brief Informational message
 * \var LogWarning
 * \brief Unexpected condition that the tools recover from
 * \var LogError
 * \brief Operation failure
 * \var LogFatal
 * \brief Unrecoverable condition, the process aborts after the message
 */

/**
 * \class LogCategory
 * \brief A named group of log messages with its own threshold
 *
 * Categories are created on first use through LOG_DEFINE_CATEGORY() and live
 * until the process exits.
 */

/**
 * \brief Create a log category registered with the logger
 * \param[in] name The category name
 * \return The new category, its threshold resolved from ARDUCAM_LOG_LEVELS
 */
LogCategory *LogCategory::create(const char *name)
{
	LogCategory *category = new LogCategory(name);
	Logger::instance()->registerCategory(category);
	return category;
}

LogCategory::LogCategory(const char *name)
	: name_(name), severity_(LogWarning)
{
}

/**
 * \class LogMessage
 * \brief A single log line, written out on destruction
 *
 * The message text is accumulated through stream() and only formatted when
 * the category threshold lets it through. A LogFatal message aborts the
 * process once written.
 */

LogMessage::LogMessage(const LogCategory &category, LogSeverity severity,
		       const char *fileName, unsigned int line,
		       const std::string &prefix)
	: category_(category), severity_(severity), fileName_(fileName),
	  line_(line), prefix_(prefix)
{
}

LogMessage::~LogMessage()
{
	if (category_.enabled(severity_)) {
		struct timespec ts;
		clock_gettime(CLOCK_MONOTONIC, &ts);

		std::ostringstream line;
		line << "[" << ts.tv_sec << "."
		     << std::setw(6) << std::setfill('0') << ts.tv_nsec / 1000
		     << "] [" << getpid() << "] "
		     << severityName(severity_) << " " << category_.name() << " "
		     << utils::basename(fileName_) << ":" << line_ << " ";
		if (!prefix_.empty())
			line << prefix_ << ": ";
		line << msgStream_.str();

		std::string text = line.str();
		if (text.back() != '\n')
			text += '\n';

		Logger::instance()->write(text);
	}

	if (severity_ == LogFatal)
		std::abort();
}

/**
 * \class Loggable
 * \brief Base class for objects whose log messages carry an identifying prefix
 *
 * Inside a Loggable member function, LOG() resolves to Loggable::_log() and
 * prepends logPrefix() to the message text.
 */

Loggable::~Loggable()
{
}

/**
 * \fn Loggable::logPrefix()
 * \brief Retrieve the string to prefix to log messages
 * \return The prefix
 */

LogMessage Loggable::_log(const LogCategory &category, LogSeverity severity,
			  const char *fileName, unsigned int line) const
{
	return LogMessage(category, severity, fileName, line, logPrefix());
}

LogMessage _log(const LogCategory &category, LogSeverity severity,
		const char *fileName, unsigned int line)
{
	return LogMessage(category, severity, fileName, line);
}

/**
 * \def LOG_DEFINE_CATEGORY(name)
 * \brief Define a log category, created on first use
 *
 * \def LOG_DECLARE_CATEGORY(name)
 * \brief Declare a log category defined in another compilation unit
 *
 * \def LOG(category, severity)
 * \brief Log a message in \a category with the given \a severity
 *
 * The macro expands to an output stream, the message is written when the
 * statement ends.
 */

} /* namespace arducam */
