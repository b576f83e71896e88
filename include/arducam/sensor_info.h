/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2019, Google Inc.
 * Copyright (C) 2025, Arducam
 *
 * Sensor descriptors
 */

#pragma once

#include <optional>
#include <ostream>
#include <stdint.h>
#include <string>
#include <vector>

namespace arducam {

struct Size {
	unsigned int width = 0;
	unsigned int height = 0;
};

bool operator==(const Size &lhs, const Size &rhs);
static inline bool operator!=(const Size &lhs, const Size &rhs)
{
	return !(lhs == rhs);
}
std::ostream &operator<<(std::ostream &out, const Size &size);

struct SensorIdentity {
	uint8_t deviceId;
	uint8_t deviceVersion;
	uint16_t sensorId;
};

bool operator==(const SensorIdentity &lhs, const SensorIdentity &rhs);
static inline bool operator!=(const SensorIdentity &lhs, const SensorIdentity &rhs)
{
	return !(lhs == rhs);
}

enum class PixelFormatType {
	Raw8,
	Raw10,
	Raw12,
	Yuv420_8Bit,
	Yuv420_10Bit,
	Yuv422_8Bit,
	Jpeg,
	Unknown,
};

enum class PixelOrder {
	None,
	BGGR,
	GBRG,
	GRBG,
	RGGB,
	Mono,
	YUYV,
	YVYU,
	UYVY,
	VYUY,
};

PixelFormatType pixelFormatTypeFromCode(uint32_t code);
const char *pixelFormatTypeName(PixelFormatType type);
const char *pixelOrderName(PixelOrder order);

struct PixelFormatDescriptor {
	PixelFormatType type;
	PixelOrder order;
	unsigned int lanes;

	bool isRaw() const;
	bool isYuv() const;
	std::string fourcc() const;
};

struct ResolutionEntry {
	unsigned int index;
	Size size;
};

struct FrameInterval {
	uint32_t numerator;
	uint32_t denominator;
};

struct ResolutionDescriptor {
	ResolutionEntry entry;
	std::vector<FrameInterval> intervals;
};

struct ControlDescriptor {
	uint32_t id;
	std::string name;
	int32_t min;
	int32_t max;
	int32_t def;
};

const char *controlName(uint32_t id);

struct FirmwareInfo {
	std::optional<std::string> ispVersion;
	std::optional<std::string> softwareVersion;
};

std::ostream &operator<<(std::ostream &out, const SensorIdentity &identity);

} /* namespace arducam */
