/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2025, Arducam
 *
 * Device mapping table and resolver
 */

#pragma once

#include <optional>
#include <stdint.h>
#include <string>
#include <vector>

#include <arducam/base/class.h>
#include <arducam/sensor_info.h>

namespace arducam {

class CsiDeviceRegistry;
class File;
class I2CPlatform;
class SensorDecoder;

struct DeviceMappingEntry {
	unsigned int bus;
	uint16_t address;
	std::optional<std::string> deviceNode;
	std::optional<SensorIdentity> identity;
};

class MappingTable
{
public:
	static constexpr unsigned int kSchemaVersion = 1;

	unsigned int schemaVersion() const { return kSchemaVersion; }
	const std::vector<DeviceMappingEntry> &entries() const { return entries_; }
	bool empty() const { return entries_.empty(); }
	void clear() { entries_.clear(); }

	int addEntry(const DeviceMappingEntry &entry);
	const DeviceMappingEntry *findByBus(unsigned int bus) const;
	const DeviceMappingEntry *findByDeviceNode(const std::string &path) const;

	static int load(const std::string &path, MappingTable *table);
	int save(const std::string &path) const;

private:
	int write(File &file) const;

	std::vector<DeviceMappingEntry> entries_;
};

struct DeviceSelector {
	std::optional<unsigned int> bus;
	std::optional<std::string> deviceNode;
};

class DeviceMappingResolver
{
public:
	enum class State {
		Unloaded,
		NeedsEnumeration,
		Loaded,
	};

	static constexpr const char *kDefaultTablePath =
		"/opt/arducam/arducam_i2c_map.yaml";

	DeviceMappingResolver(const std::string &tablePath,
			      I2CPlatform *platform, SensorDecoder *decoder,
			      CsiDeviceRegistry *registry);

	const std::string &tablePath() const { return tablePath_; }
	State state() const { return state_; }
	const MappingTable &table() const { return table_; }

	int load();
	int scan(MappingTable *table);
	int enumerate();
	int invalidate();
	int ensureLoaded();

	int resolve(const DeviceSelector &selector, DeviceMappingEntry *entry);
	int resolveByBus(unsigned int bus, DeviceMappingEntry *entry);
	int resolveByDeviceNode(const std::string &path, DeviceMappingEntry *entry);

private:
	ARDUCAM_DISABLE_COPY_AND_MOVE(DeviceMappingResolver)

	std::string tablePath_;
	I2CPlatform *platform_;
	SensorDecoder *decoder_;
	CsiDeviceRegistry *registry_;

	State state_;
	MappingTable table_;
};

} /* namespace arducam */
