/* SPDX-License-Identifier: GPL-2.0-or-later */
/*
 * Copyright (C) 2018, Google Inc.
 * Copyright (C) 2025, Arducam
 *
 * Test harness
 */

#include <errno.h>
#include <filesystem>
#include <iostream>
#include <stdlib.h>
#include <string.h>

#include "test.h"

Test::~Test()
{
	if (!tmpDir_.empty()) {
		std::error_code ec;
		std::filesystem::remove_all(tmpDir_, ec);
	}
}

int Test::execute()
{
	int ret;

	/* Keep the output of the tests independent of the user environment. */
	unsetenv("ARDUCAM_MAPPING_TABLE");

	ret = init();
	if (ret)
		return ret;

	ret = run();

	cleanup();

	return ret;
}

/*
 * Create a directory private to the test, removed with all its content when
 * the test is destroyed.
 */
int Test::createTemporaryDirectory()
{
	if (!tmpDir_.empty())
		return 0;

	std::error_code ec;
	std::filesystem::path base = std::filesystem::temp_directory_path(ec);
	if (ec)
		base = "/tmp";

	std::string pattern = (base / "arducam-test-XXXXXX").string();

	if (!mkdtemp(pattern.data())) {
		int ret = -errno;
		std::cerr << "Failed to create temporary directory: "
			  << strerror(-ret) << std::endl;
		return ret;
	}

	tmpDir_ = pattern;

	return 0;
}
