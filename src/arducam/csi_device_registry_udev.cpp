/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2018-2019, Google Inc.
 * Copyright (C) 2025, Arducam
 *
 * udev-based CSI camera device node registry
 */

#include "arducam/internal/csi_device_registry_udev.h"

#include <errno.h>
#include <libudev.h>
#include <string.h>

#include <arducam/base/log.h>
#include <arducam/base/utils.h>

namespace arducam {

LOG_DECLARE_CATEGORY(CsiRegistry)

/**
 * \class CsiDeviceRegistryUdev
 * \brief CSI device registry based on libudev
 */

CsiDeviceRegistryUdev::CsiDeviceRegistryUdev()
	: udev_(nullptr)
{
}

CsiDeviceRegistryUdev::~CsiDeviceRegistryUdev()
{
	if (udev_)
		udev_unref(udev_);
}

int CsiDeviceRegistryUdev::init()
{
	if (udev_)
		return -EBUSY;

	udev_ = udev_new();
	if (!udev_)
		return -ENODEV;

	return 0;
}

std::vector<std::string> CsiDeviceRegistryUdev::deviceNodes()
{
	std::vector<std::string> nodes;
	struct udev_list_entry *ents, *ent;

	struct udev_enumerate *udev_enum = udev_enumerate_new(udev_);
	if (!udev_enum)
		return nodes;

	int ret = udev_enumerate_add_match_subsystem(udev_enum, "video4linux");
	if (ret < 0)
		goto done;

	ret = udev_enumerate_add_match_sysname(udev_enum, "video*");
	if (ret < 0)
		goto done;

	ret = udev_enumerate_scan_devices(udev_enum);
	if (ret < 0)
		goto done;

	ents = udev_enumerate_get_list_entry(udev_enum);

	udev_list_entry_foreach(ent, ents) {
		const char *syspath = udev_list_entry_get_name(ent);

		struct udev_device *dev = udev_device_new_from_syspath(udev_, syspath);
		if (!dev) {
			LOG(CsiRegistry, Warning)
				<< "Failed to get device for '" << syspath
				<< "', skipping";
			continue;
		}

		unsigned int index;
		const char *devnode = udev_device_get_devnode(dev);
		if (devnode && parseVideoNode(udev_device_get_sysname(dev), &index))
			nodes.push_back(devnode);

		udev_device_unref(dev);
	}

done:
	udev_enumerate_unref(udev_enum);
	if (ret < 0)
		LOG(CsiRegistry, Error)
			<< "Failed to enumerate video devices: " << strerror(-ret);

	sortDeviceNodes(&nodes);

	return nodes;
}

/* Walk up the device hierarchy to the closest I2C client. */
int CsiDeviceRegistryUdev::busFromDevice(struct udev_device *dev,
					 unsigned int *bus)
{
	/* Parents are owned by their child, they must not be unreferenced. */
	struct udev_device *client =
		udev_device_get_parent_with_subsystem_devtype(dev, "i2c", nullptr);

	for (; client; client = udev_device_get_parent_with_subsystem_devtype(client, "i2c", nullptr)) {
		const char *sysname = udev_device_get_sysname(client);
		if (sysname && parseI2CClient(sysname, bus))
			return 0;
	}

	return -ENOTTY;
}

std::vector<std::string>
CsiDeviceRegistryUdev::mediaNodes(struct udev_device *parent)
{
	std::vector<std::string> nodes;
	struct udev_list_entry *ents, *ent;

	struct udev_enumerate *udev_enum = udev_enumerate_new(udev_);
	if (!udev_enum)
		return nodes;

	if (udev_enumerate_add_match_subsystem(udev_enum, "media") < 0 ||
	    udev_enumerate_add_match_parent(udev_enum, parent) < 0 ||
	    udev_enumerate_scan_devices(udev_enum) < 0) {
		udev_enumerate_unref(udev_enum);
		return nodes;
	}

	ents = udev_enumerate_get_list_entry(udev_enum);

	udev_list_entry_foreach(ent, ents) {
		struct udev_device *dev =
			udev_device_new_from_syspath(udev_, udev_list_entry_get_name(ent));
		if (!dev)
			continue;

		const char *devnode = udev_device_get_devnode(dev);
		if (devnode)
			nodes.push_back(devnode);

		udev_device_unref(dev);
	}

	udev_enumerate_unref(udev_enum);

	return nodes;
}

int CsiDeviceRegistryUdev::busForCharDevice(dev_t devnum, unsigned int *bus)
{
	struct udev_device *dev = udev_device_new_from_devnum(udev_, 'c', devnum);
	if (!dev)
		return -ENOENT;

	int ret = busFromDevice(dev, bus);
	udev_device_unref(dev);

	return ret;
}

int CsiDeviceRegistryUdev::busForDeviceNode(const std::string &path,
					    unsigned int *bus)
{
	const char *name = utils::basename(path.c_str());

	struct udev_device *dev =
		udev_device_new_from_subsystem_sysname(udev_, "video4linux", name);
	if (!dev) {
		LOG(CsiRegistry, Debug) << "Device node " << path << " not found";
		return -ENOENT;
	}

	int ret = busFromDevice(dev, bus);
	if (!ret) {
		LOG(CsiRegistry, Debug)
			<< path << " is backed by an I2C client on bus " << *bus;
	} else {
		struct udev_device *parent = udev_device_get_parent(dev);
		if (parent)
			ret = busFromMediaGraphs(path, udev_device_get_devnum(dev),
						 mediaNodes(parent), bus);
		else
			LOG(CsiRegistry, Debug)
				<< "Device node " << path << " has no parent device";
	}

	udev_device_unref(dev);

	return ret;
}

} /* namespace arducam */
