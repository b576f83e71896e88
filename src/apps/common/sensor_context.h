/* SPDX-License-Identifier: GPL-2.0-or-later */
/*
 * Copyright (C) 2019, Google Inc.
 * Copyright (C) 2025, Arducam
 *
 * Sensor access stack shared by the command line tools
 */

#pragma once

#include <memory>
#include <string>

#include "arducam/internal/csi_device_registry.h"
#include "arducam/internal/device_mapping.h"
#include "arducam/internal/global_configuration.h"
#include "arducam/internal/i2c_device.h"
#include "arducam/internal/register_transport.h"
#include "arducam/internal/sensor_decoder.h"

class SensorContext
{
public:
	SensorContext();
	~SensorContext();

	int init(const std::string &tablePath = std::string());

	const std::string &tablePath() const { return tablePath_; }

	arducam::SensorDecoder *decoder() { return decoder_.get(); }
	arducam::CsiDeviceRegistry *registry() { return registry_.get(); }
	arducam::DeviceMappingResolver *resolver() { return resolver_.get(); }

private:
	std::string mappingTablePath(const std::string &override) const;

	arducam::GlobalConfiguration configuration_;
	arducam::I2CDevicePlatform platform_;

	std::unique_ptr<arducam::RegisterTransport> transport_;
	std::unique_ptr<arducam::SensorDecoder> decoder_;
	std::unique_ptr<arducam::CsiDeviceRegistry> registry_;
	std::unique_ptr<arducam::DeviceMappingResolver> resolver_;

	std::string tablePath_;
};
