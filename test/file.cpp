/* SPDX-License-Identifier: GPL-2.0-or-later */
/*
 * Copyright (C) 2020, Google Inc.
 * Copyright (C) 2025, Arducam
 *
 * File access tests
 */

#include <errno.h>
#include <iostream>
#include <string>
#include <vector>

#include <arducam/base/file.h>

#include "test.h"

using namespace std;
using namespace arducam;

class FileTest : public Test
{
protected:
	int init()
	{
		return createTemporaryDirectory();
	}

	int testExists()
	{
		if (!File::exists("/dev/null") || File::exists("/dev/null/invalid")) {
			cerr << "File::exists() failed on regular paths" << endl;
			return TestFail;
		}

		if (File::exists(temporaryDirectory())) {
			cerr << "Directory reported as a file" << endl;
			return TestFail;
		}

		return TestPass;
	}

	int testErrors()
	{
		File missing(temporaryDirectory() + "/missing.yaml");

		if (missing.open(File::OpenModeFlag::ReadOnly) ||
		    missing.error() != -ENOENT || missing.isOpen()) {
			cerr << "Opening a missing file didn't report ENOENT" << endl;
			return TestFail;
		}

		uint8_t byte;
		if (missing.read(&byte, 1) != -EBADF) {
			cerr << "Read from a closed file didn't fail" << endl;
			return TestFail;
		}

		File directory(temporaryDirectory());
		if (directory.open(File::OpenModeFlag::WriteOnly) ||
		    directory.error() != -EISDIR) {
			cerr << "Opening a directory for writing didn't fail" << endl;
			return TestFail;
		}

		return TestPass;
	}

	int testReadWrite()
	{
		const string path = temporaryDirectory() + "/map.yaml";
		const string first = "schema_version: 1\ndevices: []\n";
		const string second = "schema_version: 1\n";

		/* Writing creates the file, Truncate drops the old content. */
		for (const string &content : { first, second }) {
			File file(path);
			if (!file.open(File::OpenModeFlag::WriteOnly |
				       File::OpenModeFlag::Truncate)) {
				cerr << "Failed to open " << path << " for writing" << endl;
				return TestFail;
			}

			ssize_t ret = file.write(reinterpret_cast<const uint8_t *>(content.data()),
						 content.size());
			if (ret != static_cast<ssize_t>(content.size())) {
				cerr << "Short write: " << ret << endl;
				return TestFail;
			}

			if (file.open(File::OpenModeFlag::ReadOnly) ||
			    file.error() != -EBUSY) {
				cerr << "Reopening an open file didn't fail" << endl;
				return TestFail;
			}
		}

		File file(path);
		if (!file.open(File::OpenModeFlag::ReadOnly)) {
			cerr << "Failed to open " << path << " for reading" << endl;
			return TestFail;
		}

		uint8_t head[6];
		if (file.read(head, sizeof(head)) != 6 ||
		    string(head, head + 6) != "schema") {
			cerr << "Partial read returned wrong data" << endl;
			return TestFail;
		}

		std::vector<uint8_t> rest;
		ssize_t ret = file.readAll(&rest);
		if (ret != static_cast<ssize_t>(second.size() - 6) ||
		    string(rest.begin(), rest.end()) != second.substr(6)) {
			cerr << "readAll() returned wrong data" << endl;
			return TestFail;
		}

		/* At end of file. */
		if (file.read(head, sizeof(head)) != 0) {
			cerr << "Read past the end returned data" << endl;
			return TestFail;
		}

		file.close();
		if (file.isOpen() || file.fd() != -1) {
			cerr << "File still open after close()" << endl;
			return TestFail;
		}

		return TestPass;
	}

	int run()
	{
		if (testExists() != TestPass ||
		    testErrors() != TestPass ||
		    testReadWrite() != TestPass)
			return TestFail;

		return TestPass;
	}
};

TEST_REGISTER(FileTest)
