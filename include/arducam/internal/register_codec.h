/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2025, Arducam
 *
 * Sensor register value decoding
 */

#pragma once

#include <array>
#include <stdint.h>
#include <string>
#include <vector>

#include <arducam/sensor_info.h>

namespace arducam {

using RegisterWindow = std::array<uint8_t, 4>;

constexpr uint32_t kNoDataAvailable = 0xfffffffe;

enum class Endianness {
	Big,
	Little,
};

struct FieldLayout {
	unsigned int offset;
	unsigned int width;
	Endianness endianness;
};

struct IdentityLayout {
	FieldLayout deviceId;
	FieldLayout deviceVersion;
	FieldLayout sensorId;
};

struct PixelFormatLayout {
	FieldLayout type;
	FieldLayout order;
	FieldLayout lanes;
};

struct ResolutionLayout {
	FieldLayout width;
	FieldLayout height;
};

struct ControlLayout {
	FieldLayout id;
	FieldLayout min;
	FieldLayout max;
	FieldLayout def;
};

RegisterWindow makeWindow(uint32_t value);
int makeWindow(const std::vector<uint8_t> &data, RegisterWindow *window);

bool isNoData(const RegisterWindow &window);

int decodeField(const RegisterWindow &window, const FieldLayout &layout,
		uint32_t *value);
int decodeSigned(const RegisterWindow &window, const FieldLayout &layout,
		 int32_t *value);

int decodeIdentity(const RegisterWindow &deviceId,
		   const RegisterWindow &deviceVersion,
		   const RegisterWindow &sensorId,
		   const IdentityLayout &layout, SensorIdentity *identity);
int decodePixelFormat(const RegisterWindow &type, const RegisterWindow &order,
		      const RegisterWindow &lanes,
		      const PixelFormatLayout &layout,
		      PixelFormatDescriptor *format);
int decodeResolution(unsigned int index, const RegisterWindow &width,
		     const RegisterWindow &height,
		     const ResolutionLayout &layout, ResolutionEntry *entry);
int decodeControl(const RegisterWindow &id, const RegisterWindow &min,
		  const RegisterWindow &max, const RegisterWindow &def,
		  const ControlLayout &layout, ControlDescriptor *control);
int decodeIspFirmwareVersion(const RegisterWindow &window,
			     std::string *version);

} /* namespace arducam */
