/* SPDX-License-Identifier: GPL-2.0-or-later */
/*
 * Copyright (C) 2019, Google Inc.
 * Copyright (C) 2025, Arducam
 *
 * Sensor access stack shared by the command line tools
 */

#include "sensor_context.h"

#include <chrono>
#include <errno.h>
#include <filesystem>
#include <iostream>
#include <string.h>

#include "arducam/internal/sensor_register_map.h"

using namespace arducam;

SensorContext::SensorContext() = default;

SensorContext::~SensorContext() = default;

int SensorContext::init(const std::string &tablePath)
{
	SensorRegisterMap registerMap;
	int ret = registerMap.load(configuration_);
	if (ret) {
		std::cerr << "Invalid register map: " << strerror(-ret)
			  << std::endl;
		return ret;
	}

	uint16_t address = configuration_.option<uint16_t>({ "i2c", "address" })
				   .value_or(RegisterTransport::kDefaultDeviceAddress);
	if (address > 0x7f) {
		std::cerr << "Invalid I2C address " << address << std::endl;
		return -EINVAL;
	}

	transport_ = std::make_unique<RegisterTransport>(&platform_, address);

	unsigned int retries =
		configuration_.option<uint32_t>({ "i2c", "retries" })
			.value_or(RegisterTransport::kDefaultRetries);
	std::chrono::microseconds delay{
		configuration_.option<uint32_t>({ "i2c", "retry_delay_us" })
			.value_or(RegisterTransport::kDefaultRetryDelay.count())
	};
	transport_->setRetryPolicy(retries, delay);

	decoder_ = std::make_unique<SensorDecoder>(transport_.get(), registerMap);

	/* Device nodes are optional, buses can still be selected by number. */
	registry_ = CsiDeviceRegistry::create();
	if (!registry_)
		std::cerr << "Video device nodes are not available" << std::endl;

	tablePath_ = mappingTablePath(tablePath);
	resolver_ = std::make_unique<DeviceMappingResolver>(tablePath_, &platform_,
							    decoder_.get(),
							    registry_.get());

	return 0;
}

std::string SensorContext::mappingTablePath(const std::string &override) const
{
	std::string path = override;

	if (path.empty())
		path = configuration_.envOption("ARDUCAM_MAPPING_TABLE",
						{ "mapping_table" })
			       .value_or(DeviceMappingResolver::kDefaultTablePath);

	/* A directory receives the table under its default name. */
	std::error_code ec;
	if (std::filesystem::is_directory(path, ec)) {
		std::filesystem::path defaultPath{ DeviceMappingResolver::kDefaultTablePath };
		path = (std::filesystem::path(path) / defaultPath.filename()).string();
	}

	return path;
}
