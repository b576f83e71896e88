/* SPDX-License-Identifier: GPL-2.0-or-later */
/*
 * Copyright (C) 2018, Google Inc.
 * Copyright (C) 2025, Arducam
 *
 * String and number helper tests
 */

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include <arducam/base/utils.h>

#include "test.h"

using namespace std;
using namespace arducam;

class UtilsTest : public Test
{
protected:
	int testHex()
	{
		std::ostringstream os;

		os << utils::hex(static_cast<uint16_t>(0x0100)) << " "
		   << utils::hex(static_cast<int32_t>(-2)) << " "
		   << utils::hex(static_cast<uint8_t>(0x0c), 2) << " "
		   << utils::hex(static_cast<uint32_t>(0x981906), 6) << " "
		   << utils::hex(static_cast<uint32_t>(0x42), 1);

		if (os.str() != "0x0100 0xfffffffe 0x0c 0x981906 0x42") {
			cerr << "utils::hex() produced '" << os.str() << "'" << endl;
			return TestFail;
		}

		/* The stream goes back to decimal afterwards. */
		os.str("");
		os << utils::hex(255u) << " " << 255;
		if (os.str() != "0x000000ff 255") {
			cerr << "utils::hex() leaked stream state: '" << os.str()
			     << "'" << endl;
			return TestFail;
		}

		return TestPass;
	}

	int testSplit()
	{
		const std::vector<std::pair<std::string, std::vector<std::string>>> cases = {
			{ "Decoder:0,Transport:DEBUG", { "Decoder:0", "Transport:DEBUG" } },
			{ "platform/soc/i2c-10", { "platform", "soc", "i2c-10" } },
			{ "/sys/bus/", { "", "sys", "bus", "" } },
			{ "a,,b", { "a", "", "b" } },
			{ "", { "" } },
		};

		for (const auto &[input, expected] : cases) {
			const std::string delim = input.find('/') != std::string::npos ? "/" : ",";
			if (utils::split(input, delim) != expected) {
				cerr << "utils::split() failed on '" << input << "'" << endl;
				return TestFail;
			}
		}

		return TestPass;
	}

	int testParse()
	{
		unsigned long u;
		long l;

		if (!utils::parseUnsigned("12", 0xff, &u) || u != 12 ||
		    !utils::parseUnsigned("0x0c", 0xff, &u) || u != 0x0c ||
		    !utils::parseUnsigned(" 0XA56", 0xffff, &u) || u != 0xa56 ||
		    !utils::parseUnsigned("+7", 0xff, &u) || u != 7) {
			cerr << "utils::parseUnsigned() failed on valid input" << endl;
			return TestFail;
		}

		if (utils::parseUnsigned("", 0xff, &u) ||
		    utils::parseUnsigned("0x", 0xff, &u) ||
		    utils::parseUnsigned("-1", 0xff, &u) ||
		    utils::parseUnsigned("0x100", 0xff, &u) ||
		    utils::parseUnsigned("12a", 0xff, &u) ||
		    utils::parseUnsigned("0x-1", 0xff, &u)) {
			cerr << "utils::parseUnsigned() accepted invalid input" << endl;
			return TestFail;
		}

		if (!utils::parseSigned("-100", -1000, 1000, &l) || l != -100 ||
		    !utils::parseSigned("-0x10", -1000, 1000, &l) || l != -16 ||
		    !utils::parseSigned("0x10", -1000, 1000, &l) || l != 16) {
			cerr << "utils::parseSigned() failed on valid input" << endl;
			return TestFail;
		}

		if (utils::parseSigned("-1001", -1000, 1000, &l) ||
		    utils::parseSigned("0x1000", -1000, 1000, &l) ||
		    utils::parseSigned("ten", -1000, 1000, &l) ||
		    utils::parseSigned("--1", -1000, 1000, &l)) {
			cerr << "utils::parseSigned() accepted invalid input" << endl;
			return TestFail;
		}

		return TestPass;
	}

	int run()
	{
		if (std::string(utils::basename("/dev/video0")) != "video0" ||
		    std::string(utils::basename("video0")) != "video0" ||
		    std::string(utils::basename("/dev/")) != "") {
			cerr << "utils::basename() test failed" << endl;
			return TestFail;
		}

		if (testHex() != TestPass)
			return TestFail;

		if (testSplit() != TestPass)
			return TestFail;

		if (testParse() != TestPass)
			return TestFail;

		return TestPass;
	}
};

TEST_REGISTER(UtilsTest)
