/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2020, Google Inc.
 * Copyright (C) 2025, Arducam
 *
 * Class declaration helpers
 */

#pragma once

/* Delete the copy constructor and copy assignment operator of klass. */
#define ARDUCAM_DISABLE_COPY(klass)			\
	klass(const klass &) = delete;			\
	klass &operator=(const klass &) = delete;

/* Also delete the move constructor and move assignment operator. */
#define ARDUCAM_DISABLE_COPY_AND_MOVE(klass)		\
	ARDUCAM_DISABLE_COPY(klass)			\
	klass(klass &&) = delete;			\
	klass &operator=(klass &&) = delete;
