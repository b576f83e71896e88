/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2019, Google Inc.
 * Copyright (C) 2025, Arducam
 *
 * String and number helpers
 */

#include <arducam/base/utils.h>

#include <ctype.h>
#include <errno.h>
#include <iomanip>
#include <limits>
#include <stdlib.h>
#include <string.h>

/**
 * \file base/utils.h
 * \brief String and number helpers shared by the library and the tools
 */

namespace arducam {

namespace utils {

/**
 * \brief Strip the directory components from \a path
 * \param[in] path The path
 *
 * Unlike POSIX basename(), \a path is never modified.
 *
 * \return A pointer to the last component of \a path
 */
const char *basename(const char *path)
{
	const char *slash = strrchr(path, '/');
	return slash ? slash + 1 : path;
}

/**
 * \brief Read an environment variable, ignoring it for setuid processes
 * \param[in] name The variable name
 * \return The variable value, or nullptr if unset or if secure execution is
 * required
 */
char *secure_getenv(const char *name)
{
	return ::secure_getenv(name);
}

/**
 * \brief Split \a str at every occurrence of \a delim
 * \param[in] str The string to split
 * \param[in] delim The delimiter
 *
 * Empty fields are kept, splitting "a::b" on ":" yields "a", "" and "b". An
 * empty \a str yields a single empty field.
 *
 * \return The fields in order
 */
std::vector<std::string> split(const std::string &str, const std::string &delim)
{
	std::vector<std::string> fields;
	std::string::size_type pos = 0;

	while (true) {
		std::string::size_type next = str.find(delim, pos);
		if (next == std::string::npos || delim.empty()) {
			fields.push_back(str.substr(pos));
			break;
		}

		fields.push_back(str.substr(pos, next - pos));
		pos = next + delim.size();
	}

	return fields;
}

namespace {

/*
 * Locate the digits of an integer literal. Leading blanks and one sign
 * character are skipped, a "0x" or "0X" prefix selects base 16.
 */
struct Literal {
	bool negative;
	int base;
	std::string::size_type digits;
};

bool scanLiteral(const std::string &str, Literal *literal)
{
	std::string::size_type pos = str.find_first_not_of(" \t");
	if (pos == std::string::npos)
		return false;

	literal->negative = str[pos] == '-';
	if (str[pos] == '-' || str[pos] == '+')
		pos++;

	literal->base = 10;
	if (str.compare(pos, 2, "0x") == 0 || str.compare(pos, 2, "0X") == 0) {
		literal->base = 16;
		pos += 2;
	}

	/* strtoul() would accept a second sign or blanks here. */
	if (pos >= str.size() || !isxdigit(static_cast<unsigned char>(str[pos])))
		return false;

	literal->digits = pos;
	return true;
}

bool parseMagnitude(const std::string &str, const Literal &literal,
		    unsigned long *magnitude)
{
	char *end;

	errno = 0;
	*magnitude = strtoul(str.c_str() + literal.digits, &end, literal.base);

	return *end == '\0' && errno != ERANGE;
}

} /* namespace */

/**
 * \brief Parse an unsigned integer in decimal or 0x-prefixed hexadecimal form
 * \param[in] str The string to parse
 * \param[in] max The largest accepted value
 * \param[out] result The parsed value
 *
 * Negative numbers are rejected rather than wrapped around.
 *
 * \return True if \a str holds a valid value not larger than \a max
 */
bool parseUnsigned(const std::string &str, unsigned long max,
		   unsigned long *result)
{
	Literal literal;
	unsigned long value;

	if (!scanLiteral(str, &literal) || literal.negative)
		return false;

	if (!parseMagnitude(str, literal, &value) || value > max)
		return false;

	*result = value;
	return true;
}

/**
 * \brief Parse a signed integer in decimal or 0x-prefixed hexadecimal form
 * \param[in] str The string to parse
 * \param[in] min The smallest accepted value
 * \param[in] max The largest accepted value
 * \param[out] result The parsed value
 *
 * \return True if \a str holds a valid value within [\a min, \a max]
 */
bool parseSigned(const std::string &str, long min, long max, long *result)
{
	Literal literal;
	unsigned long magnitude;

	if (!scanLiteral(str, &literal) || !parseMagnitude(str, literal, &magnitude))
		return false;

	constexpr unsigned long longMax = std::numeric_limits<long>::max();
	if (magnitude > longMax + (literal.negative ? 1 : 0))
		return false;

	long value = literal.negative
		   ? static_cast<long>(0 - magnitude)
		   : static_cast<long>(magnitude);
	if (value < min || value > max)
		return false;

	*result = value;
	return true;
}

/**
 * \fn hex(T value, unsigned int digits)
 * \brief Format an integer as 0x-prefixed, zero-padded hexadecimal
 * \param[in] value The value
 * \param[in] digits The number of digits, the native width of T if zero
 *
 * \code{.cpp}
 * os << utils::hex(static_cast<uint16_t>(0x100)); // 0x0100
 * \endcode
 *
 * The stream formatting state is left unchanged.
 */

std::ostream &operator<<(std::ostream &stream, const _hex &h)
{
	std::ios_base::fmtflags flags = stream.flags();
	char fill = stream.fill('0');

	stream << "0x" << std::hex << std::setw(h.digits) << h.value;

	stream.flags(flags);
	stream.fill(fill);

	return stream;
}

} /* namespace utils */

} /* namespace arducam */
