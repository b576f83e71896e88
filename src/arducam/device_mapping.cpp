/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2025, Arducam
 *
 * Device mapping table and resolver
 */

#include "arducam/internal/device_mapping.h"

#include <algorithm>
#include <errno.h>
#include <fcntl.h>
#include <filesystem>
#include <map>
#include <memory>
#include <sstream>
#include <stdio.h>
#include <string.h>
#include <sys/file.h>
#include <system_error>
#include <unistd.h>

#include <arducam/base/file.h>
#include <arducam/base/log.h>
#include <arducam/base/unique_fd.h>
#include <arducam/base/utils.h>

#include "arducam/internal/csi_device_registry.h"
#include "arducam/internal/i2c_device.h"
#include "arducam/internal/sensor_decoder.h"
#include "arducam/internal/yaml_emitter.h"
#include "arducam/internal/yaml_parser.h"

/**
 * \file arducam/internal/device_mapping.h
 * \brief Persisted correlation of I2C buses, device nodes and sensors
 */

namespace arducam {

LOG_DEFINE_CATEGORY(DeviceMapping)

namespace {

bool sameDeviceNode(const std::string &lhs, const std::string &rhs)
{
	if (lhs == rhs)
		return true;

	return !strcmp(utils::basename(lhs.c_str()), utils::basename(rhs.c_str()));
}

template<typename T>
std::string hexString(T value, unsigned int width)
{
	std::ostringstream ss;
	ss << utils::hex(value, width);
	return ss.str();
}

int parseEntry(const YamlObject &device, DeviceMappingEntry *entry)
{
	if (!device.isDictionary()) {
		LOG(DeviceMapping, Error) << "Device entry isn't a dictionary";
		return -EINVAL;
	}

	std::optional<uint32_t> bus = device["bus"].get<uint32_t>();
	if (!bus) {
		LOG(DeviceMapping, Error) << "Device entry without a valid bus";
		return -EINVAL;
	}

	std::optional<uint16_t> address = device["address"].get<uint16_t>();
	if (!address || *address > 0x7f) {
		LOG(DeviceMapping, Error)
			<< "Device entry for bus " << *bus
			<< " without a valid address";
		return -EINVAL;
	}

	DeviceMappingEntry result{ *bus, *address, std::nullopt, std::nullopt };

	const YamlObject &node = device["device_node"];
	if (node) {
		std::optional<std::string> path = node.get<std::string>();
		if (!path || path->empty()) {
			LOG(DeviceMapping, Error)
				<< "Invalid device node for bus " << *bus;
			return -EINVAL;
		}
		result.deviceNode = *path;
	}

	const YamlObject &sensor = device["sensor"];
	if (sensor) {
		std::optional<uint8_t> deviceId = sensor["device_id"].get<uint8_t>();
		std::optional<uint8_t> deviceVersion = sensor["device_version"].get<uint8_t>();
		std::optional<uint16_t> sensorId = sensor["sensor_id"].get<uint16_t>();

		if (!deviceId || !deviceVersion || !sensorId) {
			LOG(DeviceMapping, Error)
				<< "Invalid sensor identity for bus " << *bus;
			return -EINVAL;
		}

		result.identity = SensorIdentity{ *deviceId, *deviceVersion, *sensorId };
	}

	*entry = std::move(result);

	return 0;
}

} /* namespace */

/**
 * \struct DeviceMappingEntry
 * \brief One camera slot of the platform
 *
 * \var DeviceMappingEntry::bus
 * \brief The I2C bus number
 *
 * \var DeviceMappingEntry::address
 * \brief The I2C address probed on the bus
 *
 * \var DeviceMappingEntry::deviceNode
 * \brief The video device node fed by the sensor, if known
 *
 * \var DeviceMappingEntry::identity
 * \brief The sensor identity, or no value if no sensor answered the probe
 */

/**
 * \class MappingTable
 * \brief The set of camera slots of the platform
 *
 * Entries are ordered by bus number. Bus numbers are unique, and a device
 * node is associated with at most one bus.
 *
 * The table is persisted as a YAML document:
 *
 * \code{.yaml}
 * schema_version: 1
 * devices:
 * - bus: 10
 *   address: 0x0c
 *   device_node: /dev/video0
 *   sensor:
 *     device_id: 0x30
 *     device_version: 0x10
 *     sensor_id: 0x0a56
 * - bus: 11
 *   address: 0x0c
 * \endcode
 */

/**
 * \brief Add an entry to the table
 * \param[in] entry The entry
 * \return 0 on success or -EEXIST if the bus or device node is already in the
 * table
 */
int MappingTable::addEntry(const DeviceMappingEntry &entry)
{
	if (findByBus(entry.bus)) {
		LOG(DeviceMapping, Error) << "Duplicate bus " << entry.bus;
		return -EEXIST;
	}

	if (entry.deviceNode && findByDeviceNode(*entry.deviceNode)) {
		LOG(DeviceMapping, Error)
			<< "Duplicate device node " << *entry.deviceNode;
		return -EEXIST;
	}

	auto it = std::upper_bound(entries_.begin(), entries_.end(), entry.bus,
				   [](unsigned int bus, const DeviceMappingEntry &e) {
					   return bus < e.bus;
				   });
	entries_.insert(it, entry);

	return 0;
}

/**
 * \brief Find the entry of a bus
 * \param[in] bus The bus number
 * \return The entry, or nullptr if the bus isn't in the table
 */
const DeviceMappingEntry *MappingTable::findByBus(unsigned int bus) const
{
	for (const DeviceMappingEntry &entry : entries_) {
		if (entry.bus == bus)
			return &entry;
	}

	return nullptr;
}

/**
 * \brief Find the entry of a device node
 * \param[in] path The device node path
 *
 * Device nodes match on their full path or their basename, "video0" matches
 * "/dev/video0".
 *
 * \return The entry, or nullptr if the device node isn't in the table
 */
const DeviceMappingEntry *MappingTable::findByDeviceNode(const std::string &path) const
{
	for (const DeviceMappingEntry &entry : entries_) {
		if (entry.deviceNode && sameDeviceNode(*entry.deviceNode, path))
			return &entry;
	}

	return nullptr;
}

/**
 * \brief Load a table from a file
 * \param[in] path The table file path
 * \param[out] table The table
 * \return 0 on success or a negative error code otherwise
 * \retval -ENOENT The file doesn't exist
 * \retval -EINVAL The file is malformed or uses an unsupported schema
 */
int MappingTable::load(const std::string &path, MappingTable *table)
{
	File file(path);
	if (!file.open(File::OpenModeFlag::ReadOnly)) {
		int ret = file.error();
		if (ret == -ENOENT)
			return ret;

		LOG(DeviceMapping, Error)
			<< "Failed to open mapping table " << path << ": "
			<< strerror(-ret);
		return -EINVAL;
	}

	std::unique_ptr<YamlObject> root = YamlParser::parse(file);
	if (!root || !root->isDictionary()) {
		LOG(DeviceMapping, Error) << "Failed to parse mapping table " << path;
		return -EINVAL;
	}

	std::optional<uint32_t> version = (*root)["schema_version"].get<uint32_t>();
	if (version != kSchemaVersion) {
		LOG(DeviceMapping, Error)
			<< "Unsupported mapping table schema version "
			<< (version ? std::to_string(*version) : "\"unspecified\"")
			<< ", expected version " << kSchemaVersion;
		return -EINVAL;
	}

	const YamlObject &devices = (*root)["devices"];
	if (!devices.isList()) {
		LOG(DeviceMapping, Error) << "Mapping table without a device list";
		return -EINVAL;
	}

	MappingTable result;

	for (const YamlObject &device : devices.asList()) {
		DeviceMappingEntry entry;

		int ret = parseEntry(device, &entry);
		if (ret)
			return ret;

		if (result.addEntry(entry))
			return -EINVAL;
	}

	*table = std::move(result);

	return 0;
}

/**
 * \brief Save the table to a file
 * \param[in] path The table file path
 *
 * The table is written to a temporary file that is then renamed to \a path,
 * readers never see a partially written table. Saving the same table always
 * produces the same bytes.
 *
 * \return 0 on success or a negative error code otherwise
 */
int MappingTable::save(const std::string &path) const
{
	std::error_code ec;
	std::filesystem::path directory = std::filesystem::path(path).parent_path();
	if (!directory.empty()) {
		std::filesystem::create_directories(directory, ec);
		if (ec) {
			LOG(DeviceMapping, Error)
				<< "Failed to create " << directory << ": "
				<< ec.message();
			return -ec.value();
		}
	}

	std::string tmpPath = path + ".tmp";
	File file(tmpPath);
	if (!file.open(File::OpenModeFlag::WriteOnly | File::OpenModeFlag::Truncate)) {
		int ret = file.error();
		LOG(DeviceMapping, Error)
			<< "Failed to create " << tmpPath << ": " << strerror(-ret);
		return ret;
	}

	int ret = write(file);
	if (!ret && fsync(file.fd()) < 0)
		ret = -errno;

	file.close();

	if (!ret && rename(tmpPath.c_str(), path.c_str()) < 0)
		ret = -errno;

	if (ret) {
		LOG(DeviceMapping, Error)
			<< "Failed to write mapping table " << path << ": "
			<< strerror(-ret);
		unlink(tmpPath.c_str());
		return ret;
	}

	return 0;
}

int MappingTable::write(File &file) const
{
	YamlEmitter emitter;
	int ret = emitter.init(file);
	if (ret)
		return ret;

	ret = emitter.beginMapping();
	if (ret)
		return ret;

	ret = emitter.entry("schema_version", std::to_string(kSchemaVersion));
	if (ret)
		return ret;

	ret = emitter.scalar("devices");
	if (ret)
		return ret;

	ret = emitter.beginSequence();
	if (ret)
		return ret;

	for (const DeviceMappingEntry &entry : entries_) {
		ret = emitter.beginMapping();
		if (ret)
			return ret;

		ret = emitter.entry("bus", std::to_string(entry.bus));
		if (ret)
			return ret;

		ret = emitter.entry("address", hexString(entry.address, 2));
		if (ret)
			return ret;

		if (entry.deviceNode) {
			ret = emitter.entry("device_node", *entry.deviceNode);
			if (ret)
				return ret;
		}

		if (entry.identity) {
			const SensorIdentity &identity = *entry.identity;

			ret = emitter.scalar("sensor");
			if (ret)
				return ret;

			ret = emitter.beginMapping();
			if (ret)
				return ret;

			ret = emitter.entry("device_id", hexString(identity.deviceId, 2));
			if (ret)
				return ret;

			ret = emitter.entry("device_version",
					    hexString(identity.deviceVersion, 2));
			if (ret)
				return ret;

			ret = emitter.entry("sensor_id", hexString(identity.sensorId, 4));
			if (ret)
				return ret;

			ret = emitter.endMapping();
			if (ret)
				return ret;
		}

		ret = emitter.endMapping();
		if (ret)
			return ret;
	}

	ret = emitter.endSequence();
	if (ret)
		return ret;

	ret = emitter.endMapping();
	if (ret)
		return ret;

	return emitter.finish();
}

/**
 * \struct DeviceSelector
 * \brief Select a camera slot by bus number or by device node
 *
 * Exactly one of the two members must be set.
 */

/**
 * \class DeviceMappingResolver
 * \brief Resolve camera slots through the persisted mapping table
 *
 * The resolver owns the MappingTable of the platform. The table is loaded
 * from its file on first access. When the file doesn't exist the platform is
 * enumerated, and the resulting table is persisted. Once loaded, the table is
 * trusted and never compared with the hardware again. Deleting the file, or
 * calling invalidate(), is the only way to force a new enumeration.
 */

/**
 * \enum DeviceMappingResolver::State
 * \brief The state of the mapping table
 * \var DeviceMappingResolver::State::Unloaded
 * \brief The table file hasn't been read yet
 * \var DeviceMappingResolver::State::NeedsEnumeration
 * \brief The table file doesn't exist
 * \var DeviceMappingResolver::State::Loaded
 * \brief The table is available
 */

/**
 * \brief Construct a DeviceMappingResolver
 * \param[in] tablePath The mapping table file path
 * \param[in] platform The I2C platform to enumerate
 * \param[in] decoder The decoder used to probe buses
 * \param[in] registry The device node registry, may be nullptr
 */
DeviceMappingResolver::DeviceMappingResolver(const std::string &tablePath,
					     I2CPlatform *platform,
					     SensorDecoder *decoder,
					     CsiDeviceRegistry *registry)
	: tablePath_(tablePath), platform_(platform), decoder_(decoder),
	  registry_(registry), state_(State::Unloaded)
{
}

/**
 * \brief Load the mapping table from its file
 *
 * A missing file isn't an error, the resolver then needs an enumeration. A
 * malformed file leaves the resolver state unchanged.
 *
 * \return 0 on success or a negative error code otherwise
 */
int DeviceMappingResolver::load()
{
	MappingTable table;

	int ret = MappingTable::load(tablePath_, &table);
	if (ret == -ENOENT) {
		LOG(DeviceMapping, Debug)
			<< "No mapping table at " << tablePath_;
		table_.clear();
		state_ = State::NeedsEnumeration;
		return 0;
	}
	if (ret)
		return ret;

	LOG(DeviceMapping, Debug)
		<< "Loaded " << table.entries().size() << " entries from "
		<< tablePath_;

	table_ = std::move(table);
	state_ = State::Loaded;

	return 0;
}

/**
 * \brief Enumerate the platform without persisting the result
 * \param[out] table The enumerated table
 *
 * Every I2C bus of the platform is probed. Buses where no sensor answers, and
 * buses that can't be opened, are recorded without identity. Identified sensors are associated with the first
 * device node, in device number order, that the registry resolves to their
 * bus.
 *
 * \return 0 on success or a negative error code otherwise
 */
int DeviceMappingResolver::scan(MappingTable *table)
{
	std::map<unsigned int, std::string> nodes;

	if (registry_) {
		for (const std::string &node : registry_->deviceNodes()) {
			unsigned int bus;
			int ret = registry_->busForDeviceNode(node, &bus);
			if (ret) {
				LOG(DeviceMapping, Debug)
					<< "Skipping " << node << ": " << strerror(-ret);
				continue;
			}

			nodes.emplace(bus, node);
		}
	}

	MappingTable result;

	for (unsigned int bus : platform_->buses()) {
		std::optional<SensorIdentity> identity;

		int ret = decoder_->probeIdentity(bus, &identity);
		if (ret == -ENODEV) {
			LOG(DeviceMapping, Warning)
				<< "Skipping unusable bus i2c-" << bus;
			identity = std::nullopt;
			ret = 0;
		}
		if (ret) {
			LOG(DeviceMapping, Error)
				<< "Failed to probe i2c-" << bus << ": "
				<< strerror(-ret);
			return ret;
		}

		DeviceMappingEntry entry{ bus, decoder_->deviceAddress(),
					  std::nullopt, identity };

		auto node = nodes.find(bus);
		if (identity && node != nodes.end())
			entry.deviceNode = node->second;

		ret = result.addEntry(entry);
		if (ret)
			return ret;
	}

	*table = std::move(result);

	return 0;
}

/**
 * \brief Enumerate the platform and persist the mapping table
 *
 * The table file is protected by an advisory lock on "<table>.lock" while the
 * platform is enumerated and the table written.
 *
 * \return 0 on success or a negative error code otherwise
 */
int DeviceMappingResolver::enumerate()
{
	std::error_code ec;
	std::filesystem::path directory = std::filesystem::path(tablePath_).parent_path();
	if (!directory.empty()) {
		std::filesystem::create_directories(directory, ec);
		if (ec) {
			LOG(DeviceMapping, Error)
				<< "Failed to create " << directory << ": "
				<< ec.message();
			return -ec.value();
		}
	}

	std::string lockPath = tablePath_ + ".lock";
	UniqueFD lock(::open(lockPath.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0666));
	if (!lock.isValid()) {
		int ret = -errno;
		LOG(DeviceMapping, Error)
			<< "Failed to open " << lockPath << ": " << strerror(-ret);
		return ret;
	}

	if (flock(lock.get(), LOCK_EX) < 0) {
		int ret = -errno;
		LOG(DeviceMapping, Error)
			<< "Failed to lock " << lockPath << ": " << strerror(-ret);
		return ret;
	}

	MappingTable table;
	int ret = scan(&table);
	if (ret)
		return ret;

	ret = table.save(tablePath_);
	if (ret)
		return ret;

	LOG(DeviceMapping, Info)
		<< "Saved " << table.entries().size() << " entries to "
		<< tablePath_;

	table_ = std::move(table);
	state_ = State::Loaded;

	return 0;
}

/**
 * \brief Delete the persisted mapping table
 *
 * The next lookup enumerates the platform again.
 *
 * \return 0 on success or a negative error code otherwise
 */
int DeviceMappingResolver::invalidate()
{
	if (unlink(tablePath_.c_str()) < 0 && errno != ENOENT) {
		int ret = -errno;
		LOG(DeviceMapping, Error)
			<< "Failed to delete " << tablePath_ << ": "
			<< strerror(-ret);
		return ret;
	}

	table_.clear();
	state_ = State::NeedsEnumeration;

	return 0;
}

/**
 * \brief Make the mapping table available
 *
 * The table file is loaded if it hasn't been yet, and the platform is
 * enumerated when the file doesn't exist.
 *
 * \return 0 on success or a negative error code otherwise
 */
int DeviceMappingResolver::ensureLoaded()
{
	int ret;

	if (state_ == State::Unloaded) {
		ret = load();
		if (ret)
			return ret;
	}

	if (state_ == State::NeedsEnumeration) {
		ret = enumerate();
		if (ret)
			return ret;
	}

	return 0;
}

/**
 * \brief Resolve a camera slot
 * \param[in] selector The slot selector
 * \param[out] entry The mapping entry
 *
 * The selector is validated before the table or the hardware is accessed.
 *
 * \return 0 on success or a negative error code otherwise
 * \retval -EINVAL The selector doesn't set exactly one of its members
 * \retval -ENOENT No entry matches the selector
 */
int DeviceMappingResolver::resolve(const DeviceSelector &selector,
				   DeviceMappingEntry *entry)
{
	if (selector.bus.has_value() == selector.deviceNode.has_value()) {
		LOG(DeviceMapping, Error)
			<< "Exactly one of bus number and device node must be selected";
		return -EINVAL;
	}

	int ret = ensureLoaded();
	if (ret)
		return ret;

	const DeviceMappingEntry *match;
	if (selector.bus)
		match = table_.findByBus(*selector.bus);
	else
		match = table_.findByDeviceNode(*selector.deviceNode);

	if (!match) {
		LOG(DeviceMapping, Error)
			<< "No mapping for "
			<< (selector.bus ? "bus " + std::to_string(*selector.bus)
					 : *selector.deviceNode);
		return -ENOENT;
	}

	*entry = *match;

	return 0;
}

/**
 * \brief Resolve a camera slot by bus number
 * \param[in] bus The bus number
 * \param[out] entry The mapping entry
 * \return 0 on success or a negative error code otherwise, see resolve()
 */
int DeviceMappingResolver::resolveByBus(unsigned int bus,
					DeviceMappingEntry *entry)
{
	return resolve({ bus, std::nullopt }, entry);
}

/**
 * \brief Resolve a camera slot by device node
 * \param[in] path The device node path
 * \param[out] entry The mapping entry
 * \return 0 on success or a negative error code otherwise, see resolve()
 */
int DeviceMappingResolver::resolveByDeviceNode(const std::string &path,
					       DeviceMappingEntry *entry)
{
	return resolve({ std::nullopt, path }, entry);
}

} /* namespace arducam */
