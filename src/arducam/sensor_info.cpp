/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2019, Google Inc.
 * Copyright (C) 2025, Arducam
 *
 * Sensor descriptors
 */

#include <arducam/sensor_info.h>

#include <map>

#include <arducam/base/utils.h>

/**
 * \file sensor_info.h
 * \brief Descriptors decoded from the sensor register map
 */

namespace arducam {

/**
 * \struct SensorIdentity
 * \brief The identity of a sensor module
 *
 * \var SensorIdentity::deviceId
 * \brief The firmware device identifier
 *
 * \var SensorIdentity::deviceVersion
 * \brief The firmware device version
 *
 * \var SensorIdentity::sensorId
 * \brief The image sensor identifier, which selects the sensor variant
 */

/**
 * \brief Compare sensor identities for equality
 * \return True if the two identities are equal, false otherwise
 */
bool operator==(const SensorIdentity &lhs, const SensorIdentity &rhs)
{
	return lhs.deviceId == rhs.deviceId &&
	       lhs.deviceVersion == rhs.deviceVersion &&
	       lhs.sensorId == rhs.sensorId;
}

/**
 * \struct Size
 * \brief Width and height of a resolution, in pixels
 */

bool operator==(const Size &lhs, const Size &rhs)
{
	return lhs.width == rhs.width && lhs.height == rhs.height;
}

/**
 * \brief Write \a size as WIDTHxHEIGHT
 */
std::ostream &operator<<(std::ostream &out, const Size &size)
{
	return out << size.width << "x" << size.height;
}

/**
 * \brief Insert a text representation of a SensorIdentity into an output stream
 * \param[in] out The output stream
 * \param[in] identity The sensor identity
 * \return The output stream \a out
 */
std::ostream &operator<<(std::ostream &out, const SensorIdentity &identity)
{
	out << "device " << utils::hex(identity.deviceId)
	    << " version " << utils::hex(identity.deviceVersion)
	    << " sensor " << utils::hex(identity.sensorId);
	return out;
}

/**
 * \enum PixelFormatType
 * \brief The pixel format types reported by the sensor firmware
 *
 * Raw values are the MIPI CSI-2 data type codes. Codes missing from the table
 * map to PixelFormatType::Unknown.
 */

namespace {

const std::map<uint32_t, PixelFormatType> pixelFormatCodes = {
	{ 0x2a, PixelFormatType::Raw8 },
	{ 0x2b, PixelFormatType::Raw10 },
	{ 0x2c, PixelFormatType::Raw12 },
	{ 0x18, PixelFormatType::Yuv420_8Bit },
	{ 0x19, PixelFormatType::Yuv420_10Bit },
	{ 0x1e, PixelFormatType::Yuv422_8Bit },
	{ 0x30, PixelFormatType::Jpeg },
};

const std::map<uint32_t, const char *> controlNames = {
	{ 0x980900, "brightness" },
	{ 0x980901, "contrast" },
	{ 0x980902, "Saturation" },
	{ 0x98090c, "AWBMode" },
	{ 0x98090e, "RedGain" },
	{ 0x98090f, "BlueGain" },
	{ 0x980911, "Exposure" },
	{ 0x980913, "gain" },
	{ 0x980914, "horizontal_flip" },
	{ 0x980915, "vertical_flip" },
	{ 0x98091a, "ColorTemperature" },
	{ 0x98091b, "sharpness" },
	{ 0x98091c, "backlight_compensation" },
	{ 0x981901, "TriggerMode" },
	{ 0x981906, "Framerate" },
	{ 0x98190e, "strobe_width" },
	{ 0x98190f, "strobe_shift" },
	{ 0x9a0901, "AEEnable" },
	{ 0x9a090a, "Focus" },
	{ 0x9a0919, "ExposureMetering" },
	{ 0x9e0901, "vertical_blanking" },
	{ 0x9e0902, "horizontal_blanking" },
	{ 0x9e0903, "AnalogueGain" },
	{ 0x9f0902, "pixel_rate" },
};

} /* namespace */

/**
 * \brief Look up the pixel format type for a raw firmware code
 * \param[in] code The raw pixel format type register value
 * \return The pixel format type, or PixelFormatType::Unknown
 */
PixelFormatType pixelFormatTypeFromCode(uint32_t code)
{
	auto it = pixelFormatCodes.find(code);
	if (it == pixelFormatCodes.end())
		return PixelFormatType::Unknown;

	return it->second;
}

/**
 * \brief Retrieve the name of a pixel format type
 * \param[in] type The pixel format type
 * \return The name used in listings, such as "YUV422_8BIT"
 */
const char *pixelFormatTypeName(PixelFormatType type)
{
	switch (type) {
	case PixelFormatType::Raw8:
		return "RAW8";
	case PixelFormatType::Raw10:
		return "RAW10";
	case PixelFormatType::Raw12:
		return "RAW12";
	case PixelFormatType::Yuv420_8Bit:
		return "YUV420_8BIT";
	case PixelFormatType::Yuv420_10Bit:
		return "YUV420_10BIT";
	case PixelFormatType::Yuv422_8Bit:
		return "YUV422_8BIT";
	case PixelFormatType::Jpeg:
		return "JPEG";
	case PixelFormatType::Unknown:
		break;
	}

	return "Unknown";
}

/**
 * \brief Retrieve the name of a pixel order
 * \param[in] order The pixel order
 * \return The pixel order name, or an empty string for PixelOrder::None
 */
const char *pixelOrderName(PixelOrder order)
{
	switch (order) {
	case PixelOrder::BGGR:
		return "BGGR";
	case PixelOrder::GBRG:
		return "GBRG";
	case PixelOrder::GRBG:
		return "GRBG";
	case PixelOrder::RGGB:
		return "RGGB";
	case PixelOrder::Mono:
		return "MONO";
	case PixelOrder::YUYV:
		return "YUYV";
	case PixelOrder::YVYU:
		return "YVYU";
	case PixelOrder::UYVY:
		return "UYVY";
	case PixelOrder::VYUY:
		return "VYUY";
	case PixelOrder::None:
		break;
	}

	return "";
}

/**
 * \struct PixelFormatDescriptor
 * \brief A pixel format supported by the sensor
 *
 * Raw formats carry a Bayer order (or PixelOrder::Mono), YUV formats carry a
 * component order and JPEG carries PixelOrder::None.
 */

/**
 * \brief Check if the format is a raw Bayer format
 * \return True for RAW8, RAW10 and RAW12
 */
bool PixelFormatDescriptor::isRaw() const
{
	return type == PixelFormatType::Raw8 ||
	       type == PixelFormatType::Raw10 ||
	       type == PixelFormatType::Raw12;
}

/**
 * \brief Check if the format is a YUV format
 * \return True for the YUV420 and YUV422 formats
 */
bool PixelFormatDescriptor::isYuv() const
{
	return type == PixelFormatType::Yuv420_8Bit ||
	       type == PixelFormatType::Yuv420_10Bit ||
	       type == PixelFormatType::Yuv422_8Bit;
}

/**
 * \brief Retrieve the four character code reported in V4L2 listings
 * \return The pixel order name, "MJPG" for JPEG or "UNKN"
 */
std::string PixelFormatDescriptor::fourcc() const
{
	if (type == PixelFormatType::Jpeg)
		return "MJPG";

	if (order == PixelOrder::None)
		return "UNKN";

	return pixelOrderName(order);
}

/**
 * \struct ResolutionEntry
 * \brief A frame size supported under a pixel format
 *
 * The index is the position of the entry in the firmware resolution table.
 */

/**
 * \struct FrameInterval
 * \brief A frame interval expressed in seconds per frame
 */

/**
 * \struct ResolutionDescriptor
 * \brief A resolution entry and its frame intervals
 */

/**
 * \struct ControlDescriptor
 * \brief A tunable control exposed by the sensor firmware
 *
 * The identifier is a 24-bit V4L2 style control id. The bounds satisfy
 * min <= def <= max.
 */

/**
 * \brief Retrieve the name of a control
 * \param[in] id The control id
 * \return The control name, or "Unknown"
 */
const char *controlName(uint32_t id)
{
	auto it = controlNames.find(id);
	if (it == controlNames.end())
		return "Unknown";

	return it->second;
}

/**
 * \struct FirmwareInfo
 * \brief Versions of the firmware running on the sensor module
 *
 * Each member has no value when the firmware doesn't report it.
 */

} /* namespace arducam */
