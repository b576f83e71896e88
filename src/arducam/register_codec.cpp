/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2025, Arducam
 *
 * Sensor register value decoding
 */

#include "arducam/internal/register_codec.h"

#include <algorithm>
#include <errno.h>
#include <iomanip>
#include <iterator>
#include <sstream>

#include <arducam/base/log.h>
#include <arducam/base/utils.h>

/**
 * \file arducam/internal/register_codec.h
 * \brief Decode functions for sensor register windows
 *
 * Every register value is read into a fixed size RegisterWindow holding the
 * raw bytes as transferred on the bus. The decode functions extract fields
 * from windows according to an explicit FieldLayout and validate them. They
 * never access hardware.
 *
 * All decode functions return 0 on success or -EBADMSG when the register
 * contents violate the register map, and leave their output untouched on
 * error.
 */

namespace arducam {

LOG_DECLARE_CATEGORY(SensorDecoder)

/**
 * \typedef RegisterWindow
 * \brief The raw bytes of one 32-bit register value, in bus order
 */

/**
 * \var kNoDataAvailable
 * \brief The register value reported by the firmware past the end of a table
 */

/**
 * \enum Endianness
 * \brief Byte order of a field in a register window
 * \var Endianness::Big
 * \brief Most significant byte first
 * \var Endianness::Little
 * \brief Least significant byte first
 */

/**
 * \struct FieldLayout
 * \brief The location of a field in a register window
 *
 * \var FieldLayout::offset
 * \brief The offset of the first byte of the field in the window
 *
 * \var FieldLayout::width
 * \brief The field width in bytes
 *
 * \var FieldLayout::endianness
 * \brief The byte order of the field
 */

/**
 * \brief Create a register window from a big-endian register value
 * \param[in] value The register value
 * \return The register window
 */
RegisterWindow makeWindow(uint32_t value)
{
	return { {
		static_cast<uint8_t>(value >> 24),
		static_cast<uint8_t>(value >> 16),
		static_cast<uint8_t>(value >> 8),
		static_cast<uint8_t>(value),
	} };
}

/**
 * \brief Create a register window from the bytes read from a register
 * \param[in] data The big-endian register bytes
 * \param[out] window The register window
 *
 * Registers narrower than 32 bits are right-aligned in the window.
 *
 * \return 0 on success or -EBADMSG if \a data doesn't fit in a window
 */
int makeWindow(const std::vector<uint8_t> &data, RegisterWindow *window)
{
	if (data.empty() || data.size() > window->size())
		return -EBADMSG;

	window->fill(0);
	std::copy(data.begin(), data.end(),
		  window->end() - data.size());

	return 0;
}

/**
 * \brief Check if a window holds the no data marker
 * \param[in] window The register window
 * \return True if the window holds kNoDataAvailable, false otherwise
 */
bool isNoData(const RegisterWindow &window)
{
	return window == makeWindow(kNoDataAvailable);
}

/**
 * \brief Extract an unsigned field from a register window
 * \param[in] window The register window
 * \param[in] layout The field layout
 * \param[out] value The field value
 *
 * The bytes of the window outside of the field must be zero, a field that
 * overflows its layout is malformed.
 *
 * \return 0 on success or -EBADMSG otherwise
 */
int decodeField(const RegisterWindow &window, const FieldLayout &layout,
		uint32_t *value)
{
	if (!layout.width || layout.width > window.size() ||
	    layout.offset > window.size() - layout.width) {
		LOG(SensorDecoder, Error)
			<< "Invalid field layout " << layout.offset << "+"
			<< layout.width;
		return -EBADMSG;
	}

	for (unsigned int i = 0; i < window.size(); ++i) {
		if (i >= layout.offset && i < layout.offset + layout.width)
			continue;

		if (window[i]) {
			LOG(SensorDecoder, Debug)
				<< "Field at " << layout.offset << "+"
				<< layout.width << " overflows its layout";
			return -EBADMSG;
		}
	}

	uint32_t result = 0;
	for (unsigned int i = 0; i < layout.width; ++i) {
		unsigned int pos = layout.endianness == Endianness::Big
				 ? layout.offset + i
				 : layout.offset + layout.width - 1 - i;
		result = (result << 8) | window[pos];
	}

	*value = result;

	return 0;
}

/**
 * \brief Extract a two's complement signed field from a register window
 * \param[in] window The register window
 * \param[in] layout The field layout
 * \param[out] value The sign extended field value
 * \return 0 on success or -EBADMSG otherwise
 */
int decodeSigned(const RegisterWindow &window, const FieldLayout &layout,
		 int32_t *value)
{
	uint32_t raw;
	int ret = decodeField(window, layout, &raw);
	if (ret)
		return ret;

	unsigned int bits = layout.width * 8;
	if (bits < 32 && raw & (1U << (bits - 1)))
		raw |= ~((1U << bits) - 1);

	*value = static_cast<int32_t>(raw);

	return 0;
}

/**
 * \brief Decode the sensor identity registers
 * \param[in] deviceId The device id register window
 * \param[in] deviceVersion The device version register window
 * \param[in] sensorId The sensor id register window
 * \param[in] layout The identity field layouts
 * \param[out] identity The sensor identity
 * \return 0 on success or -EBADMSG otherwise
 */
int decodeIdentity(const RegisterWindow &deviceId,
		   const RegisterWindow &deviceVersion,
		   const RegisterWindow &sensorId,
		   const IdentityLayout &layout, SensorIdentity *identity)
{
	uint32_t id, version, sensor;
	int ret;

	ret = decodeField(deviceId, layout.deviceId, &id);
	if (ret)
		return ret;

	ret = decodeField(deviceVersion, layout.deviceVersion, &version);
	if (ret)
		return ret;

	ret = decodeField(sensorId, layout.sensorId, &sensor);
	if (ret)
		return ret;

	if (id > 0xff || version > 0xff || sensor > 0xffff) {
		LOG(SensorDecoder, Error) << "Identity field out of range";
		return -EBADMSG;
	}

	identity->deviceId = id;
	identity->deviceVersion = version;
	identity->sensorId = sensor;

	return 0;
}

/**
 * \brief Decode a pixel format table record
 * \param[in] type The pixel format type register window
 * \param[in] order The pixel order register window
 * \param[in] lanes The MIPI lanes register window
 * \param[in] layout The pixel format field layouts
 * \param[out] format The pixel format descriptor
 *
 * The record is malformed when the type isn't a known PixelFormatType, when
 * the order isn't valid for the type, or when the lane count isn't in the
 * [1, 4] range. The order is ignored for JPEG.
 *
 * \return 0 on success or -EBADMSG otherwise
 */
int decodePixelFormat(const RegisterWindow &type, const RegisterWindow &order,
		      const RegisterWindow &lanes,
		      const PixelFormatLayout &layout,
		      PixelFormatDescriptor *format)
{
	static const PixelOrder bayerOrders[] = {
		PixelOrder::BGGR, PixelOrder::GBRG, PixelOrder::GRBG,
		PixelOrder::RGGB, PixelOrder::Mono,
	};
	static const PixelOrder yuvOrders[] = {
		PixelOrder::YUYV, PixelOrder::YVYU, PixelOrder::UYVY,
		PixelOrder::VYUY,
	};

	uint32_t code, orderValue, laneCount;
	int ret;

	ret = decodeField(type, layout.type, &code);
	if (ret)
		return ret;

	PixelFormatDescriptor result;
	result.type = pixelFormatTypeFromCode(code);
	result.order = PixelOrder::None;

	if (result.type == PixelFormatType::Unknown) {
		LOG(SensorDecoder, Error)
			<< "Unknown pixel format type " << utils::hex(code);
		return -EBADMSG;
	}

	if (result.type != PixelFormatType::Jpeg) {
		ret = decodeField(order, layout.order, &orderValue);
		if (ret)
			return ret;

		if (result.isRaw() && orderValue < std::size(bayerOrders)) {
			result.order = bayerOrders[orderValue];
		} else if (result.isYuv() && orderValue < std::size(yuvOrders)) {
			result.order = yuvOrders[orderValue];
		} else {
			LOG(SensorDecoder, Error)
				<< "Invalid order " << orderValue << " for "
				<< pixelFormatTypeName(result.type);
			return -EBADMSG;
		}
	}

	ret = decodeField(lanes, layout.lanes, &laneCount);
	if (ret)
		return ret;

	if (laneCount < 1 || laneCount > 4) {
		LOG(SensorDecoder, Error) << "Invalid lane count " << laneCount;
		return -EBADMSG;
	}

	result.lanes = laneCount;
	*format = result;

	return 0;
}

/**
 * \brief Decode a resolution table record
 * \param[in] index The position of the record in the resolution table
 * \param[in] width The width register window
 * \param[in] height The height register window
 * \param[in] layout The resolution field layouts
 * \param[out] entry The resolution entry
 * \return 0 on success or -EBADMSG otherwise
 */
int decodeResolution(unsigned int index, const RegisterWindow &width,
		     const RegisterWindow &height,
		     const ResolutionLayout &layout, ResolutionEntry *entry)
{
	uint32_t w, h;
	int ret;

	ret = decodeField(width, layout.width, &w);
	if (ret)
		return ret;

	ret = decodeField(height, layout.height, &h);
	if (ret)
		return ret;

	if (!w || !h) {
		LOG(SensorDecoder, Error)
			<< "Invalid size " << w << "x" << h
			<< " for resolution " << index;
		return -EBADMSG;
	}

	entry->index = index;
	entry->size = Size{ w, h };

	return 0;
}

/**
 * \brief Decode a control table record
 * \param[in] id The control id register window
 * \param[in] min The minimum value register window
 * \param[in] max The maximum value register window
 * \param[in] def The default value register window
 * \param[in] layout The control field layouts
 * \param[out] control The control descriptor
 *
 * Records with min > max or with a default value outside of [min, max] are
 * malformed. Values are never clamped.
 *
 * \return 0 on success or -EBADMSG otherwise
 */
int decodeControl(const RegisterWindow &id, const RegisterWindow &min,
		  const RegisterWindow &max, const RegisterWindow &def,
		  const ControlLayout &layout, ControlDescriptor *control)
{
	ControlDescriptor result;
	int ret;

	ret = decodeField(id, layout.id, &result.id);
	if (ret)
		return ret;

	if (result.id > 0xffffff) {
		LOG(SensorDecoder, Error)
			<< "Control id " << utils::hex(result.id)
			<< " exceeds 24 bits";
		return -EBADMSG;
	}

	ret = decodeSigned(min, layout.min, &result.min);
	if (ret)
		return ret;

	ret = decodeSigned(max, layout.max, &result.max);
	if (ret)
		return ret;

	ret = decodeSigned(def, layout.def, &result.def);
	if (ret)
		return ret;

	if (result.min > result.max) {
		LOG(SensorDecoder, Error)
			<< "Control " << utils::hex(result.id, 6)
			<< " has min " << result.min << " > max " << result.max;
		return -EBADMSG;
	}

	if (result.def < result.min || result.def > result.max) {
		LOG(SensorDecoder, Error)
			<< "Control " << utils::hex(result.id, 6)
			<< " default " << result.def << " outside of ["
			<< result.min << ", " << result.max << "]";
		return -EBADMSG;
	}

	result.name = controlName(result.id);
	*control = std::move(result);

	return 0;
}

/**
 * \brief Decode the ISP firmware version from the unique id register
 * \param[in] window The unique id register window
 * \param[out] version The version string, "v<major>.<minor> 20<yy>/<mm>/<dd>"
 *
 * The upper 16 bits hold the ISP id, major version in the high byte and minor
 * version in the low byte. The lower 16 bits hold the build date, packed as a
 * 7-bit year, a 4-bit month and a 5-bit day.
 *
 * \return 0 on success, -ENODATA when the register holds no data
 */
int decodeIspFirmwareVersion(const RegisterWindow &window, std::string *version)
{
	if (isNoData(window))
		return -ENODATA;

	uint32_t value;
	int ret = decodeField(window, { 0, 4, Endianness::Big }, &value);
	if (ret)
		return ret;

	unsigned int ispId = value >> 16;
	unsigned int date = value & 0xffff;

	std::ostringstream ss;
	ss << "v" << std::hex << (ispId >> 8) << "."
	   << std::setw(2) << std::setfill('0') << (ispId & 0xff)
	   << std::dec << " 20" << std::setw(2) << (date >> 9)
	   << "/" << std::setw(2) << ((date >> 5) & 0x0f)
	   << "/" << std::setw(2) << (date & 0x1f);

	*version = ss.str();

	return 0;
}

} /* namespace arducam */
