/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2025, Arducam
 *
 * Sensor family register maps
 */

#pragma once

#include <array>
#include <string>

#include "arducam/internal/register_codec.h"
#include "arducam/internal/register_transport.h"

namespace arducam {

class GlobalConfiguration;
class YamlObject;

class SensorRegisterMap
{
public:
	enum Register {
		StreamOn,
		DeviceVersion,
		SensorId,
		DeviceId,
		FirmwareSensorId,
		UniqueId,
		SystemIdle,
		SoftVersionLength,
		SoftVersionIndex,
		SoftVersion,
		PixFormatIndex,
		PixFormatType,
		PixFormatOrder,
		MipiLanes,
		ResolutionIndex,
		ResolutionWidth,
		ResolutionHeight,
		ControlIndex,
		ControlId,
		ControlMin,
		ControlMax,
		ControlDefault,
		ControlValue,
		RegisterCount,
	};

	struct Entry {
		RegisterAddress reg;
		FieldLayout layout;
	};

	static constexpr const char *kDefaultFamily = "pivariety";

	SensorRegisterMap();

	int load(const GlobalConfiguration &configuration);
	int parse(const std::string &family, const YamlObject &overrides);

	const std::string &family() const { return family_; }

	const RegisterAddress &address(Register reg) const { return entries_[reg].reg; }
	const FieldLayout &layout(Register reg) const { return entries_[reg].layout; }

	IdentityLayout identityLayout() const;
	PixelFormatLayout pixelFormatLayout() const;
	ResolutionLayout resolutionLayout() const;
	ControlLayout controlLayout() const;

	static const char *registerKey(Register reg);

private:
	int parseEntry(Register reg, const YamlObject &value);

	std::string family_;
	std::array<Entry, RegisterCount> entries_;
};

} /* namespace arducam */
