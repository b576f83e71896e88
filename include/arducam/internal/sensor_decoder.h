/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2025, Arducam
 *
 * Sensor register protocol decoder
 */

#pragma once

#include <chrono>
#include <optional>
#include <stdint.h>
#include <vector>

#include <arducam/sensor_info.h>

#include "arducam/internal/register_codec.h"
#include "arducam/internal/sensor_register_map.h"

namespace arducam {

class RegisterTransport;

class SensorDecoder
{
public:
	struct Limits {
		unsigned int maxFormats = 16;
		unsigned int maxResolutions = 64;
		unsigned int maxControls = 64;
	};

	static constexpr uint32_t kFramerateControl = 0x981906;

	SensorDecoder(RegisterTransport *transport,
		      const SensorRegisterMap &registerMap);

	const SensorRegisterMap &registerMap() const { return map_; }
	uint16_t deviceAddress() const;

	const Limits &limits() const { return limits_; }
	void setLimits(const Limits &limits) { limits_ = limits; }
	void setIdlePolling(unsigned int polls, std::chrono::microseconds interval);

	int probeIdentity(unsigned int bus, std::optional<SensorIdentity> *identity);
	int listPixelFormats(unsigned int bus,
			     std::vector<PixelFormatDescriptor> *formats);
	int listResolutions(unsigned int bus, unsigned int formatIndex,
			    std::vector<ResolutionDescriptor> *resolutions);
	int listControls(unsigned int bus,
			 std::vector<ControlDescriptor> *controls);
	int readFirmwareInfo(unsigned int bus, FirmwareInfo *info);
	int waitForIdle(unsigned int bus);

private:
	int readWindow(unsigned int bus, SensorRegisterMap::Register reg,
		       RegisterWindow *window);
	int readValue(unsigned int bus, SensorRegisterMap::Register reg,
		      uint32_t *value);
	int writeValue(unsigned int bus, SensorRegisterMap::Register reg,
		       uint32_t value);
	int selectIndex(unsigned int bus, SensorRegisterMap::Register reg,
			uint32_t index, bool *end);
	int selectControl(unsigned int bus, uint32_t index,
			  RegisterWindow *id, bool *end);
	int readFrameIntervals(unsigned int bus,
			       std::vector<FrameInterval> *intervals);

	RegisterTransport *transport_;
	SensorRegisterMap map_;
	Limits limits_;

	unsigned int idlePolls_;
	std::chrono::microseconds idleInterval_;
};

} /* namespace arducam */
