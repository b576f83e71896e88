/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2018, Google Inc.
 * Copyright (C) 2025, Arducam
 *
 * String and number helpers
 */

#pragma once

#include <ostream>
#include <stdint.h>
#include <string>
#include <type_traits>
#include <vector>

namespace arducam {

namespace utils {

const char *basename(const char *path);

char *secure_getenv(const char *name);

std::vector<std::string> split(const std::string &str, const std::string &delim);

bool parseUnsigned(const std::string &str, unsigned long max,
		   unsigned long *result);
bool parseSigned(const std::string &str, long min, long max, long *result);

#ifndef __DOXYGEN__
struct _hex {
	uint64_t value;
	unsigned int digits;
};

std::ostream &operator<<(std::ostream &stream, const _hex &h);
#endif

template<typename T,
	 std::enable_if_t<std::is_integral<T>::value> * = nullptr>
_hex hex(T value, unsigned int digits = 0)
{
	using U = std::make_unsigned_t<T>;

	return { static_cast<uint64_t>(static_cast<U>(value)),
		 digits ? digits : static_cast<unsigned int>(sizeof(T) * 2) };
}

} /* namespace utils */

} /* namespace arducam */
