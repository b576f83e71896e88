/* SPDX-License-Identifier: GPL-2.0-or-later */
/*
 * Copyright (C) 2019, Google Inc.
 * Copyright (C) 2025, Arducam
 *
 * arducli - Arducam MIPI camera command line interface
 */

#include <errno.h>
#include <iostream>
#include <stdlib.h>
#include <string.h>
#include <vector>

#include "arducam/internal/device_mapping.h"
#include "arducam/internal/sensor_formatter.h"

#include "../common/options.h"
#include "../common/sensor_context.h"

#include "main.h"

using namespace arducam;

namespace {

constexpr unsigned int kVersionMajor = 1;
constexpr unsigned int kVersionMinor = 5;

} /* namespace */

class ArduCliApp
{
public:
	ArduCliApp() = default;

	int init(int argc, char **argv);
	int exec();

private:
	int parseOptions(int argc, char *argv[]);
	int selectEntries(std::vector<DeviceMappingEntry> *entries);
	int probe(const DeviceMappingEntry &entry);

	void printBanner() const;

	OptionsParser::Options options_;
	SensorContext context_;
	SensorFormatter::Mode mode_ = SensorFormatter::Mode::Diagnostic;
};

int ArduCliApp::init(int argc, char **argv)
{
	int ret = parseOptions(argc, argv);
	if (ret < 0)
		return ret;

	if (options_.isSet(OptListFormatsExt))
		mode_ = SensorFormatter::Mode::ListFormatsExt;
	else if (options_.isSet(OptListFormats))
		mode_ = SensorFormatter::Mode::ListFormats;

	return context_.init(options_[OptTable].toString());
}

int ArduCliApp::parseOptions(int argc, char *argv[])
{
	OptionsParser parser;
	parser.addOption(OptBus, OptionInteger, "Specify the I2C bus number",
			 "bus", ArgumentRequired, "bus");
	parser.addOption(OptDevice, OptionString,
			 "Specify the video device node, as in /dev/video0",
			 "device", ArgumentRequired, "device");
	parser.addOption(OptHelp, OptionNone, "Display this help message",
			 "help");
	parser.addOption(OptListFormats, OptionNone,
			 "List the pixel formats", "list-formats");
	parser.addOption(OptListFormatsExt, OptionNone,
			 "List the pixel formats with their sizes and frame intervals",
			 "list-formats-ext");
	parser.addOption(OptTable, OptionString,
			 "Read the device mapping table from <path>", "table",
			 ArgumentRequired, "path");
	parser.addOption(OptVerbose, OptionNone,
			 "Show version information", "verbose");

	options_ = parser.parse(argc, argv);
	if (!options_.valid())
		return -EINVAL;

	if (options_.isSet(OptHelp)) {
		parser.usage();
		return -EINTR;
	}

	if (options_.isSet(OptBus) && options_.isSet(OptDevice)) {
		std::cerr << "Options -b and -d are mutually exclusive" << std::endl;
		return -EINVAL;
	}

	return 0;
}

int ArduCliApp::exec()
{
	if (options_.isSet(OptVerbose))
		printBanner();

	std::vector<DeviceMappingEntry> entries;
	int ret = selectEntries(&entries);
	if (ret)
		return ret;

	if (entries.empty()) {
		std::cerr << "No sensor found in " << context_.tablePath()
			  << ", run ardu-i2c-detect first" << std::endl;
		return -ENODEV;
	}

	for (const DeviceMappingEntry &entry : entries) {
		ret = probe(entry);
		if (ret)
			return ret;
	}

	return 0;
}

int ArduCliApp::selectEntries(std::vector<DeviceMappingEntry> *entries)
{
	DeviceMappingResolver *resolver = context_.resolver();
	DeviceMappingEntry entry;
	int ret;

	if (options_.isSet(OptBus) || options_.isSet(OptDevice)) {
		DeviceSelector selector;
		if (options_.isSet(OptBus))
			selector.bus = options_[OptBus].toInteger();
		else
			selector.deviceNode = options_[OptDevice].toString();

		ret = resolver->resolve(selector, &entry);
		if (ret) {
			std::cerr << "Failed to resolve the camera: "
				  << strerror(-ret) << std::endl;
			return ret;
		}

		if (!entry.identity) {
			std::cerr << "No sensor detected on bus " << entry.bus
				  << std::endl;
			return -ENODEV;
		}

		entries->push_back(entry);
		return 0;
	}

	ret = resolver->ensureLoaded();
	if (ret) {
		std::cerr << "Failed to load the mapping table: "
			  << strerror(-ret) << std::endl;
		return ret;
	}

	for (const DeviceMappingEntry &e : resolver->table().entries()) {
		if (e.identity)
			entries->push_back(e);
	}

	return 0;
}

int ArduCliApp::probe(const DeviceMappingEntry &entry)
{
	SensorReport report;

	int ret = SensorFormatter::collect(context_.decoder(), entry.bus, mode_,
					   options_.isSet(OptVerbose), &report);
	if (ret) {
		std::cerr << "Failed to decode the sensor on bus " << entry.bus
			  << ": " << strerror(-ret) << std::endl;
		return ret;
	}

	SensorFormatter::render(std::cout, mode_, report);

	return 0;
}

void ArduCliApp::printBanner() const
{
	std::cout << "=================================" << std::endl;
	std::cout << "             arducli" << std::endl;
	std::cout << " arducam command line interface" << std::endl;
	std::cout << "            v." << kVersionMajor << "." << kVersionMinor
		  << " / 2025" << std::endl;
	std::cout << "=================================" << std::endl;
}

int main(int argc, char **argv)
{
	ArduCliApp app;
	int ret;

	ret = app.init(argc, argv);
	if (ret)
		return ret == -EINTR ? 0 : EXIT_FAILURE;

	if (app.exec())
		return EXIT_FAILURE;

	return 0;
}
