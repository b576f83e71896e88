/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2020, Google Inc.
 * Copyright (C) 2025, Arducam
 *
 * Configuration and mapping table file access
 */

#include <arducam/base/file.h>

#include <errno.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

/**
 * \file base/file.h
 * \brief Whole-file access for configuration and mapping tables
 */

namespace arducam {

namespace {

/*
 * Call \a op until \a size bytes are transferred, end of file is reached or
 * an error other than EINTR occurs.
 */
template<typename Op>
ssize_t transferAll(size_t size, Op op)
{
	size_t done = 0;

	while (done < size) {
		ssize_t ret = op(done);
		if (ret < 0 && errno == EINTR)
			continue;
		if (ret < 0)
			return done ? static_cast<ssize_t>(done) : -errno;
		if (ret == 0)
			break;

		done += ret;
	}

	return done;
}

} /* namespace */

/**
 * \class File
 * \brief A file accessed through a file descriptor
 *
 * Errors from open() are reported as negative errno values through error(),
 * read() and write() return them directly.
 */

File::File(const std::string &name)
	: name_(name), error_(0)
{
}

File::~File() = default;

/**
 * \brief Open the file
 * \param[in] mode ReadOnly or WriteOnly, optionally combined with Truncate
 *
 * Files opened for writing are created with mode 0666, subject to the umask.
 *
 * \return True on success, false otherwise
 */
bool File::open(OpenModeFlag mode)
{
	if (isOpen()) {
		error_ = -EBUSY;
		return false;
	}

	int flags = O_CLOEXEC;
	if (mode & OpenModeFlag::WriteOnly)
		flags |= (mode & OpenModeFlag::ReadOnly ? O_RDWR : O_WRONLY) | O_CREAT;
	else
		flags |= O_RDONLY;
	if (mode & OpenModeFlag::Truncate)
		flags |= O_TRUNC;

	fd_ = UniqueFD(::open(name_.c_str(), flags, 0666));
	error_ = fd_.isValid() ? 0 : -errno;

	return fd_.isValid();
}

/**
 * \brief Read up to \a size bytes into \a data
 * \return The number of bytes read, 0 at end of file, or a negative error code
 */
ssize_t File::read(uint8_t *data, size_t size)
{
	if (!isOpen())
		return -EBADF;

	return transferAll(size, [&](size_t done) {
		return ::read(fd_.get(), data + done, size - done);
	});
}

/**
 * \brief Write \a size bytes from \a data
 * \return The number of bytes written, or a negative error code
 */
ssize_t File::write(const uint8_t *data, size_t size)
{
	if (!isOpen())
		return -EBADF;

	return transferAll(size, [&](size_t done) {
		return ::write(fd_.get(), data + done, size - done);
	});
}

/**
 * \brief Append the rest of the file to \a data
 * \return The number of bytes read, or a negative error code
 */
ssize_t File::readAll(std::vector<uint8_t> *data)
{
	ssize_t total = 0;
	uint8_t chunk[4096];

	ssize_t ret;
	while ((ret = read(chunk, sizeof(chunk))) > 0) {
		data->insert(data->end(), chunk, chunk + ret);
		total += ret;
	}

	return ret < 0 ? ret : total;
}

/**
 * \brief Check if \a name exists and isn't a directory
 */
bool File::exists(const std::string &name)
{
	struct stat st;

	return stat(name.c_str(), &st) == 0 && !S_ISDIR(st.st_mode);
}

} /* namespace arducam */
