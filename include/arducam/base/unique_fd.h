/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2021, Google Inc.
 * Copyright (C) 2025, Arducam
 *
 * Owned file descriptor
 */

#pragma once

#include <arducam/base/class.h>

namespace arducam {

class UniqueFD final
{
public:
	explicit UniqueFD(int fd = -1)
		: fd_(fd)
	{
	}

	UniqueFD(UniqueFD &&other)
		: fd_(other.fd_)
	{
		other.fd_ = -1;
	}

	UniqueFD &operator=(UniqueFD &&other)
	{
		if (this != &other) {
			reset(other.fd_);
			other.fd_ = -1;
		}
		return *this;
	}

	~UniqueFD() { reset(); }

	void reset(int fd = -1);

	int get() const { return fd_; }
	bool isValid() const { return fd_ >= 0; }

private:
	ARDUCAM_DISABLE_COPY(UniqueFD)

	int fd_;
};

} /* namespace arducam */
