/* SPDX-License-Identifier: GPL-2.0-or-later */
/*
 * Copyright (C) 2018, Google Inc.
 * Copyright (C) 2025, Arducam
 *
 * Log level selection and output format test
 */

#include <fcntl.h>
#include <fstream>
#include <iostream>
#include <regex>
#include <stdio.h>
#include <stdlib.h>
#include <string>
#include <unistd.h>
#include <vector>

#include <arducam/base/log.h>
#include <arducam/base/unique_fd.h>

#include "test.h"

using namespace std;
using namespace arducam;

LOG_DEFINE_CATEGORY(TestWildOne)
LOG_DEFINE_CATEGORY(TestLast)
LOG_DEFINE_CATEGORY(TestNumeric)
LOG_DEFINE_CATEGORY(TestDefault)
LOG_DEFINE_CATEGORY(TestBad)

namespace {

class Bus : public Loggable
{
public:
	void report()
	{
		LOG(TestLast, Error) << "Transfer failed";
	}

protected:
	std::string logPrefix() const override
	{
		return "i2c-10";
	}
};

} /* namespace */

class LogLevelsTest : public Test
{
protected:
	int init()
	{
		int ret = createTemporaryDirectory();
		if (ret)
			return ret;

		/* Categories pick their level up when first used. */
		setenv("ARDUCAM_LOG_LEVELS",
		       "TestWild*:DEBUG,TestLast:ERROR,TestLast:INFO,"
		       "TestBad:LOUD,TestNumeric:3", 1);

		return TestPass;
	}

	void emit()
	{
		LOG(TestWildOne, Debug) << "wild debug";
		LOG(TestLast, Info) << "last info";
		LOG(TestLast, Debug) << "last debug";
		LOG(TestNumeric, Warning) << "numeric warning";
		LOG(TestNumeric, Error) << "numeric error";
		LOG(TestDefault, Info) << "default info";
		LOG(TestDefault, Warning) << "default warning";
		LOG(TestBad, Info) << "bad info";

		Bus bus;
		bus.report();
	}

	int capture(std::vector<std::string> *lines)
	{
		std::string path = temporaryDirectory() + "/stderr.log";

		UniqueFD fd(open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644));
		if (!fd.isValid()) {
			cerr << "Failed to create " << path << endl;
			return TestFail;
		}

		cerr.flush();
		UniqueFD saved(dup(STDERR_FILENO));
		dup2(fd.get(), STDERR_FILENO);

		emit();

		cerr.flush();
		dup2(saved.get(), STDERR_FILENO);

		std::ifstream file(path);
		std::string line;
		while (std::getline(file, line))
			lines->push_back(line);

		return TestPass;
	}

	int run()
	{
		std::vector<std::string> lines;
		if (capture(&lines) != TestPass)
			return TestFail;

		const std::vector<std::string> expected = {
			"Ignoring invalid log level rule 'TestBad:LOUD'",
			"DEBUG TestWildOne log_levels.cpp:71 wild debug",
			"INFO TestLast log_levels.cpp:72 last info",
			"ERROR TestNumeric log_levels.cpp:75 numeric error",
			"WARN TestDefault log_levels.cpp:77 default warning",
			"ERROR TestLast log_levels.cpp:40 i2c-10: Transfer failed",
		};

		if (lines.size() != expected.size()) {
			cerr << "Expected " << expected.size() << " lines, got "
			     << lines.size() << endl;
			for (const std::string &line : lines)
				cerr << "  " << line << endl;
			return TestFail;
		}

		if (lines[0] != expected[0]) {
			cerr << "Unexpected diagnostic '" << lines[0] << "'" << endl;
			return TestFail;
		}

		const std::regex header(R"(^\[[0-9]+\.[0-9]{6}\] \[[0-9]+\] (.*)$)");

		for (size_t i = 1; i < lines.size(); ++i) {
			std::smatch match;
			if (!std::regex_match(lines[i], match, header) ||
			    match[1] != expected[i]) {
				cerr << "Line '" << lines[i] << "' doesn't match '"
				     << expected[i] << "'" << endl;
				return TestFail;
			}
		}

		return TestPass;
	}
};

TEST_REGISTER(LogLevelsTest)
