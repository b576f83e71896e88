/* SPDX-License-Identifier: GPL-2.0-or-later */
/*
 * Copyright (C) 2019, Google Inc.
 * Copyright (C) 2025, Arducam
 *
 * ardu-i2c-detect - Detect the I2C bus of Arducam MIPI cameras
 */

#include <errno.h>
#include <iomanip>
#include <iostream>
#include <optional>
#include <stdlib.h>
#include <string.h>

#include <arducam/base/utils.h>

#include "arducam/internal/csi_device_registry.h"
#include "arducam/internal/device_mapping.h"
#include "arducam/internal/sensor_decoder.h"

#include "../common/options.h"
#include "../common/sensor_context.h"

using namespace arducam;

enum {
	OptDevice = 'd',
	OptHelp = 'h',
	OptTable = 't',
};

class DetectApp
{
public:
	DetectApp() = default;

	int init(int argc, char **argv);
	int exec();

private:
	int parseOptions(int argc, char *argv[]);
	int detectDevice(const std::string &node);
	int detectAll();

	static void printEntry(const DeviceMappingEntry &entry);

	OptionsParser::Options options_;
	SensorContext context_;
};

int DetectApp::init(int argc, char **argv)
{
	int ret = parseOptions(argc, argv);
	if (ret < 0)
		return ret;

	return context_.init(options_[OptTable].toString());
}

int DetectApp::parseOptions(int argc, char *argv[])
{
	OptionsParser parser;
	parser.addOption(OptDevice, OptionString,
			 "Only detect the bus of the video device node <device>",
			 "device", ArgumentRequired, "device");
	parser.addOption(OptHelp, OptionNone, "Display this help message",
			 "help");
	parser.addOption(OptTable, OptionString,
			 "Save the mapping table\n"
			 "The table is written to <path> when given, or to the configured\n"
			 "location otherwise. A directory receives the default file name.",
			 "table", ArgumentOptional, "path");

	options_ = parser.parse(argc, argv);
	if (!options_.valid())
		return -EINVAL;

	if (options_.isSet(OptHelp)) {
		parser.usage();
		return -EINTR;
	}

	if (options_.isSet(OptDevice) && options_.isSet(OptTable)) {
		std::cerr << "Options -d and -t are mutually exclusive" << std::endl;
		return -EINVAL;
	}

	return 0;
}

int DetectApp::exec()
{
	if (options_.isSet(OptDevice))
		return detectDevice(options_[OptDevice]);

	return detectAll();
}

int DetectApp::detectDevice(const std::string &node)
{
	CsiDeviceRegistry *registry = context_.registry();
	if (!registry) {
		std::cerr << "[-] " << node << " -> device nodes are not available"
			  << std::endl;
		return -ENOTTY;
	}

	unsigned int bus;
	int ret = registry->busForDeviceNode(node, &bus);
	if (ret) {
		std::cerr << "[-] " << node << " -> " << strerror(-ret)
			  << std::endl;
		return ret;
	}

	SensorDecoder *decoder = context_.decoder();
	std::optional<SensorIdentity> identity;

	ret = decoder->probeIdentity(bus, &identity);
	if (ret) {
		std::cerr << "[-] " << node << " -> failed to probe bus " << bus
			  << ": " << strerror(-ret) << std::endl;
		return ret;
	}

	printEntry({ bus, decoder->deviceAddress(), node, identity });

	return 0;
}

int DetectApp::detectAll()
{
	DeviceMappingResolver *resolver = context_.resolver();
	int ret;

	if (options_.isSet(OptTable)) {
		ret = resolver->enumerate();
		if (ret) {
			std::cerr << "Failed to save the mapping table: "
				  << strerror(-ret) << std::endl;
			return ret;
		}

		for (const DeviceMappingEntry &entry : resolver->table().entries())
			printEntry(entry);

		std::cout << "[+] Saved mapping table to " << resolver->tablePath()
			  << std::endl;

		return 0;
	}

	MappingTable table;
	ret = resolver->scan(&table);
	if (ret) {
		std::cerr << "Failed to enumerate the I2C buses: "
			  << strerror(-ret) << std::endl;
		return ret;
	}

	if (table.empty())
		std::cout << "[-] No I2C bus found" << std::endl;

	for (const DeviceMappingEntry &entry : table.entries())
		printEntry(entry);

	return 0;
}

void DetectApp::printEntry(const DeviceMappingEntry &entry)
{
	if (!entry.identity) {
		std::cout << "[-] bus " << entry.bus << " -> no sensor detected"
			  << std::endl;
		return;
	}

	std::cout << "[+] ";
	if (entry.deviceNode)
		std::cout << *entry.deviceNode << " -> bus " << entry.bus << ", ";
	else
		std::cout << "bus " << entry.bus << " -> ";

	std::cout << "addr " << utils::hex(entry.address, 2)
		  << ", sensor 0x" << std::uppercase << std::hex
		  << std::setfill('0') << std::setw(4) << entry.identity->sensorId
		  << std::nouppercase << std::dec << std::setfill(' ')
		  << std::endl;
}

int main(int argc, char **argv)
{
	DetectApp app;
	int ret;

	ret = app.init(argc, argv);
	if (ret)
		return ret == -EINTR ? 0 : EXIT_FAILURE;

	if (app.exec())
		return EXIT_FAILURE;

	return 0;
}
