/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2020, Google Inc.
 * Copyright (C) 2025, Arducam
 *
 * Configuration and mapping table file access
 */

#pragma once

#include <stdint.h>
#include <string>
#include <sys/types.h>
#include <vector>

#include <arducam/base/class.h>
#include <arducam/base/unique_fd.h>

namespace arducam {

class File
{
public:
	enum class OpenModeFlag {
		NotOpen = 0,
		ReadOnly = (1 << 0),
		WriteOnly = (1 << 1),
		Truncate = (1 << 2),
	};

	explicit File(const std::string &name);
	~File();

	const std::string &fileName() const { return name_; }

	bool open(OpenModeFlag mode);
	bool isOpen() const { return fd_.isValid(); }
	void close() { fd_.reset(); }

	int fd() const { return fd_.get(); }
	int error() const { return error_; }

	ssize_t read(uint8_t *data, size_t size);
	ssize_t write(const uint8_t *data, size_t size);
	ssize_t readAll(std::vector<uint8_t> *data);

	static bool exists(const std::string &name);

private:
	ARDUCAM_DISABLE_COPY(File)

	std::string name_;
	UniqueFD fd_;
	int error_;
};

constexpr File::OpenModeFlag operator|(File::OpenModeFlag lhs, File::OpenModeFlag rhs)
{
	return static_cast<File::OpenModeFlag>(static_cast<int>(lhs) |
					       static_cast<int>(rhs));
}

constexpr bool operator&(File::OpenModeFlag lhs, File::OpenModeFlag rhs)
{
	return static_cast<int>(lhs) & static_cast<int>(rhs);
}

} /* namespace arducam */
