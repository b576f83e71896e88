/* SPDX-License-Identifier: GPL-2.0-or-later */
/*
 * Copyright (C) 2025, Arducam
 *
 * YAML emitter tests
 */

#include <errno.h>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <arducam/base/file.h>

#include "arducam/internal/yaml_emitter.h"
#include "arducam/internal/yaml_parser.h"

#include "test.h"

using namespace arducam;
using namespace std;

class YamlEmitterTest : public Test
{
protected:
	int init()
	{
		if (createTemporaryDirectory())
			return TestFail;

		fileName_ = temporaryDirectory() + "/emitted.yaml";

		return TestPass;
	}

	int emit(YamlEmitter &emitter)
	{
		int ret;

		ret = emitter.beginMapping();
		if (ret)
			return ret;

		ret = emitter.entry("name", "arducam");
		if (ret)
			return ret;

		ret = emitter.entry("address", "0x0c");
		if (ret)
			return ret;

		ret = emitter.scalar("buses");
		if (ret)
			return ret;

		ret = emitter.beginSequence();
		if (ret)
			return ret;

		for (const char *bus : { "10", "11" }) {
			ret = emitter.beginMapping();
			if (ret)
				return ret;

			ret = emitter.entry("bus", bus);
			if (ret)
				return ret;

			ret = emitter.endMapping();
			if (ret)
				return ret;
		}

		ret = emitter.endSequence();
		if (ret)
			return ret;

		ret = emitter.scalar("empty");
		if (ret)
			return ret;

		ret = emitter.beginSequence();
		if (ret)
			return ret;

		ret = emitter.endSequence();
		if (ret)
			return ret;

		return emitter.endMapping();
	}

	int run()
	{
		YamlEmitter unused;
		if (unused.beginMapping() != -EINVAL) {
			cerr << "Uninitialized emitter accepted events" << endl;
			return TestFail;
		}

		{
			File file(fileName_);
			if (!file.open(File::OpenModeFlag::WriteOnly)) {
				cerr << "Failed to open " << fileName_ << endl;
				return TestFail;
			}

			YamlEmitter emitter;
			if (emitter.init(file)) {
				cerr << "Failed to initialize emitter" << endl;
				return TestFail;
			}

			if (emitter.init(file) != -EBUSY) {
				cerr << "Emitter initialized twice" << endl;
				return TestFail;
			}

			if (emit(emitter) || emitter.finish()) {
				cerr << "Failed to emit document" << endl;
				return TestFail;
			}
		}

		File file(fileName_);
		if (!file.open(File::OpenModeFlag::ReadOnly)) {
			cerr << "Failed to reopen " << fileName_ << endl;
			return TestFail;
		}

		std::unique_ptr<YamlObject> root = YamlParser::parse(file);
		if (!root || !root->isDictionary()) {
			cerr << "Emitted document doesn't parse" << endl;
			return TestFail;
		}

		if ((*root)["name"].get<string>() != "arducam" ||
		    (*root)["address"].get<uint16_t>() != 0x0c) {
			cerr << "Scalars emitted incorrectly" << endl;
			return TestFail;
		}

		const YamlObject &buses = (*root)["buses"];
		if (!buses.isList() || buses.size() != 2 ||
		    buses[0]["bus"].get<uint32_t>() != 10u ||
		    buses[1]["bus"].get<uint32_t>() != 11u) {
			cerr << "Sequence emitted incorrectly" << endl;
			return TestFail;
		}

		const YamlObject &empty = (*root)["empty"];
		if (!empty.isList() || empty.size() != 0) {
			cerr << "Empty sequence emitted incorrectly" << endl;
			return TestFail;
		}

		return TestPass;
	}

private:
	string fileName_;
};

TEST_REGISTER(YamlEmitterTest)
