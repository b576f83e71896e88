/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2025, Arducam
 *
 * Sensor descriptor listings
 */

#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include <arducam/sensor_info.h>

namespace arducam {

class SensorDecoder;

struct SensorReport {
	SensorIdentity identity;
	std::optional<FirmwareInfo> firmware;
	std::vector<PixelFormatDescriptor> formats;
	std::vector<std::vector<ResolutionDescriptor>> resolutions;
	std::vector<ControlDescriptor> controls;
};

class SensorFormatter
{
public:
	enum class Mode {
		Diagnostic,
		ListFormats,
		ListFormatsExt,
	};

	static int collect(SensorDecoder *decoder, unsigned int bus, Mode mode,
			   bool firmware, SensorReport *report);

	static void render(std::ostream &out, Mode mode, const SensorReport &report);

	static void diagnostic(std::ostream &out, const SensorReport &report);
	static void listFormats(std::ostream &out, const SensorReport &report,
				bool extended);

	static std::string intervalToString(const FrameInterval &interval);
};

} /* namespace arducam */
