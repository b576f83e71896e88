/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2025, Arducam
 *
 * Sensor family register maps
 */

#include "arducam/internal/sensor_register_map.h"

#include <errno.h>
#include <optional>

#include <arducam/base/log.h>
#include <arducam/base/utils.h>

#include "arducam/internal/global_configuration.h"
#include "arducam/internal/yaml_parser.h"

/**
 * \file arducam/internal/sensor_register_map.h
 * \brief Register addresses and field layouts of a sensor family
 */

namespace arducam {

LOG_DEFINE_CATEGORY(SensorRegisterMap)

namespace {

constexpr FieldLayout kWord = { 0, 4, Endianness::Big };
constexpr FieldLayout kByte = { 3, 1, Endianness::Big };
constexpr FieldLayout kHalf = { 2, 2, Endianness::Big };
constexpr FieldLayout kId24 = { 1, 3, Endianness::Big };

struct RegisterInfo {
	const char *key;
	SensorRegisterMap::Entry entry;
};

/* The Pivariety register map, all registers are 32-bit wide. */
const std::array<RegisterInfo, SensorRegisterMap::RegisterCount> pivarietyRegisters = { {
	{ "stream_on", { { 0x0100, 4 }, kWord } },
	{ "device_version", { { 0x0101, 4 }, kByte } },
	{ "sensor_id", { { 0x0102, 4 }, kHalf } },
	{ "device_id", { { 0x0103, 4 }, kByte } },
	{ "firmware_sensor_id", { { 0x0105, 4 }, kHalf } },
	{ "unique_id", { { 0x0106, 4 }, kWord } },
	{ "system_idle", { { 0x0107, 4 }, kWord } },
	{ "soft_version_length", { { 0x01f0, 4 }, kWord } },
	{ "soft_version_index", { { 0x01f1, 4 }, kWord } },
	{ "soft_version", { { 0x01f2, 4 }, kWord } },
	{ "pixformat_index", { { 0x0200, 4 }, kWord } },
	{ "pixformat_type", { { 0x0201, 4 }, kByte } },
	{ "pixformat_order", { { 0x0202, 4 }, kByte } },
	{ "mipi_lanes", { { 0x0203, 4 }, kByte } },
	{ "resolution_index", { { 0x0300, 4 }, kWord } },
	{ "resolution_width", { { 0x0301, 4 }, kWord } },
	{ "resolution_height", { { 0x0302, 4 }, kWord } },
	{ "ctrl_index", { { 0x0400, 4 }, kWord } },
	{ "ctrl_id", { { 0x0401, 4 }, kId24 } },
	{ "ctrl_min", { { 0x0402, 4 }, kWord } },
	{ "ctrl_max", { { 0x0403, 4 }, kWord } },
	{ "ctrl_default", { { 0x0405, 4 }, kWord } },
	{ "ctrl_value", { { 0x0406, 4 }, kWord } },
} };

} /* namespace */

/**
 * \class SensorRegisterMap
 * \brief The register map of a sensor family
 *
 * The register map associates each register used by the SensorDecoder with
 * its address, width and the layout of its field in the 32-bit register
 * window. The decoder never hardcodes addresses, and families other than the
 * built-in Pivariety map are described through the configuration file:
 *
 * \code{.yaml}
 * configuration:
 *   sensor_family: custom
 *   register_maps:
 *     custom:
 *       device_id: 0x0103
 *       firmware_sensor_id:
 *         address: 0x0105
 *         offset: 2
 *         width: 2
 *         endianness: big
 * \endcode
 *
 * Families start from the Pivariety map, and override individual registers.
 * A scalar value overrides the register address only.
 */

/**
 * \enum SensorRegisterMap::Register
 * \brief The registers of the map
 */

/**
 * \struct SensorRegisterMap::Entry
 * \brief The address and field layout of a register
 */

/**
 * \brief Construct the built-in Pivariety register map
 */
SensorRegisterMap::SensorRegisterMap()
	: family_(kDefaultFamily)
{
	for (unsigned int i = 0; i < RegisterCount; ++i)
		entries_[i] = pivarietyRegisters[i].entry;
}

/**
 * \brief Load the register map selected by the global configuration
 * \param[in] configuration The global configuration
 *
 * The family is selected by the `sensor_family` option, and its overrides are
 * read from `register_maps.<family>`. A family without overrides uses the
 * built-in map.
 *
 * \return 0 on success or -EINVAL if the overrides are invalid
 */
int SensorRegisterMap::load(const GlobalConfiguration &configuration)
{
	std::string family = configuration.option<std::string>({ "sensor_family" })
				     .value_or(kDefaultFamily);

	const YamlObject &maps = configuration.configuration()["register_maps"];
	return parse(family, maps[family]);
}

/**
 * \brief Apply register overrides for a sensor family
 * \param[in] family The sensor family name
 * \param[in] overrides The register overrides dictionary, may be empty
 * \return 0 on success or -EINVAL if the overrides are invalid
 */
int SensorRegisterMap::parse(const std::string &family,
			     const YamlObject &overrides)
{
	family_ = family;

	if (!overrides)
		return 0;

	if (!overrides.isDictionary()) {
		LOG(SensorRegisterMap, Error)
			<< "Register map '" << family << "' isn't a dictionary";
		return -EINVAL;
	}

	for (const auto &[key, value] : overrides.asDict()) {
		unsigned int i;
		for (i = 0; i < RegisterCount; ++i) {
			if (key == pivarietyRegisters[i].key)
				break;
		}

		if (i == RegisterCount) {
			LOG(SensorRegisterMap, Error)
				<< "Unknown register '" << key << "' in map '"
				<< family << "'";
			return -EINVAL;
		}

		int ret = parseEntry(static_cast<Register>(i), value);
		if (ret)
			return ret;
	}

	LOG(SensorRegisterMap, Debug)
		<< "Using register map '" << family << "' with "
		<< overrides.size() << " override(s)";

	return 0;
}

int SensorRegisterMap::parseEntry(Register reg, const YamlObject &value)
{
	Entry &entry = entries_[reg];

	if (value.isValue()) {
		std::optional<uint16_t> address = value.get<uint16_t>();
		if (!address) {
			LOG(SensorRegisterMap, Error)
				<< "Invalid address for '" << registerKey(reg) << "'";
			return -EINVAL;
		}

		entry.reg.address = *address;
		return 0;
	}

	if (!value.isDictionary()) {
		LOG(SensorRegisterMap, Error)
			<< "Invalid entry for '" << registerKey(reg) << "'";
		return -EINVAL;
	}

	Entry result = entry;

	if (value.contains("address")) {
		std::optional<uint16_t> address = value["address"].get<uint16_t>();
		if (!address) {
			LOG(SensorRegisterMap, Error)
				<< "Invalid address for '" << registerKey(reg) << "'";
			return -EINVAL;
		}
		result.reg.address = *address;
	}

	if (value.contains("offset"))
		result.layout.offset = value["offset"].get<uint32_t>(~0U);
	if (value.contains("width"))
		result.layout.width = value["width"].get<uint32_t>(0);

	if (value.contains("endianness")) {
		std::string endianness = value["endianness"].get<std::string>("");
		if (endianness == "big") {
			result.layout.endianness = Endianness::Big;
		} else if (endianness == "little") {
			result.layout.endianness = Endianness::Little;
		} else {
			LOG(SensorRegisterMap, Error)
				<< "Invalid endianness '" << endianness
				<< "' for '" << registerKey(reg) << "'";
			return -EINVAL;
		}
	}

	if (!result.layout.width || result.layout.width > result.reg.width ||
	    result.layout.offset > result.reg.width - result.layout.width) {
		LOG(SensorRegisterMap, Error)
			<< "Invalid field layout for '" << registerKey(reg) << "'";
		return -EINVAL;
	}

	entry = result;

	return 0;
}

/**
 * \fn SensorRegisterMap::family()
 * \brief Retrieve the sensor family name
 * \return The sensor family name
 */

/**
 * \fn SensorRegisterMap::address()
 * \brief Retrieve the address of a register
 * \param[in] reg The register
 * \return The register address
 */

/**
 * \fn SensorRegisterMap::layout()
 * \brief Retrieve the field layout of a register
 * \param[in] reg The register
 * \return The field layout
 */

/**
 * \brief Retrieve the layouts of the identity registers
 * \return The identity layout
 */
IdentityLayout SensorRegisterMap::identityLayout() const
{
	return { layout(DeviceId), layout(DeviceVersion), layout(FirmwareSensorId) };
}

/**
 * \brief Retrieve the layouts of the pixel format table registers
 * \return The pixel format layout
 */
PixelFormatLayout SensorRegisterMap::pixelFormatLayout() const
{
	return { layout(PixFormatType), layout(PixFormatOrder), layout(MipiLanes) };
}

/**
 * \brief Retrieve the layouts of the resolution table registers
 * \return The resolution layout
 */
ResolutionLayout SensorRegisterMap::resolutionLayout() const
{
	return { layout(ResolutionWidth), layout(ResolutionHeight) };
}

/**
 * \brief Retrieve the layouts of the control table registers
 * \return The control layout
 */
ControlLayout SensorRegisterMap::controlLayout() const
{
	return { layout(ControlId), layout(ControlMin), layout(ControlMax),
		 layout(ControlDefault) };
}

/**
 * \brief Retrieve the configuration key of a register
 * \param[in] reg The register
 * \return The key naming the register in configuration files
 */
const char *SensorRegisterMap::registerKey(Register reg)
{
	return pivarietyRegisters[reg].key;
}

} /* namespace arducam */
