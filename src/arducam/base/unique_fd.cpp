/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2021, Google Inc.
 * Copyright (C) 2025, Arducam
 *
 * Owned file descriptor
 */

#include <arducam/base/unique_fd.h>

#include <unistd.h>

/**
 * \file base/unique_fd.h
 * \brief Owned file descriptor
 */

namespace arducam {

/**
 * \class UniqueFD
 * \brief A file descriptor closed when its owner goes away
 *
 * Ownership moves with the object. Descriptors of I2C adapters, media
 * devices and files are held this way so that error paths don't leak them.
 */

/**
 * \brief Close the owned file descriptor and take ownership of \a fd
 * \param[in] fd The file descriptor, -1 to only close
 *
 * Resetting to the descriptor already owned keeps it open.
 */
void UniqueFD::reset(int fd)
{
	if (fd == fd_)
		return;

	if (fd_ >= 0)
		close(fd_);

	fd_ = fd;
}

} /* namespace arducam */
