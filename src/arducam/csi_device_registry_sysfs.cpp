/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2019, Google Inc.
 * Copyright (C) 2025, Arducam
 *
 * sysfs-based CSI camera device node registry
 */

#include "arducam/internal/csi_device_registry_sysfs.h"

#include <algorithm>
#include <ctype.h>
#include <dirent.h>
#include <errno.h>
#include <fstream>
#include <limits.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/sysmacros.h>

#include <arducam/base/log.h>
#include <arducam/base/utils.h>

namespace arducam {

LOG_DECLARE_CATEGORY(CsiRegistry)

namespace {

/* Parse a "major:minor" sysfs dev attribute. */
bool readDevnum(const std::string &path, dev_t *devnum)
{
	std::ifstream file(path);
	std::string line;
	if (!std::getline(file, line))
		return false;

	std::vector<std::string> fields = utils::split(line, ":");
	unsigned long maj, min;
	if (fields.size() != 2 ||
	    !utils::parseUnsigned(fields[0], UINT_MAX, &maj) ||
	    !utils::parseUnsigned(fields[1], UINT_MAX, &min))
		return false;

	*devnum = makedev(maj, min);
	return true;
}

} /* namespace */

/**
 * \class CsiDeviceRegistrySysfs
 * \brief CSI device registry based on the video4linux sysfs class
 *
 * \param[in] sysfsRoot The sysfs mount point
 */
CsiDeviceRegistrySysfs::CsiDeviceRegistrySysfs(const std::string &sysfsRoot)
	: sysfsRoot_(sysfsRoot), classDir_(sysfsRoot + "/class/video4linux")
{
}

int CsiDeviceRegistrySysfs::init()
{
	struct stat st;

	if (stat(classDir_.c_str(), &st) < 0 || !S_ISDIR(st.st_mode)) {
		LOG(CsiRegistry, Error)
			<< "No valid sysfs video4linux directory " << classDir_;
		return -ENODEV;
	}

	return 0;
}

std::vector<std::string> CsiDeviceRegistrySysfs::deviceNodes()
{
	std::vector<std::string> nodes;

	DIR *dir = opendir(classDir_.c_str());
	if (!dir) {
		LOG(CsiRegistry, Error)
			<< "Failed to open " << classDir_ << ": "
			<< strerror(errno);
		return nodes;
	}

	struct dirent *ent;
	while ((ent = readdir(dir)) != nullptr) {
		unsigned int index;
		if (!parseVideoNode(ent->d_name, &index))
			continue;

		nodes.push_back(std::string("/dev/") + ent->d_name);
	}

	closedir(dir);

	sortDeviceNodes(&nodes);

	return nodes;
}

/* Walk up the device hierarchy to the closest I2C client. */
int CsiDeviceRegistrySysfs::busFromDevicePath(const std::string &devicePath,
					      unsigned int *bus)
{
	std::vector<std::string> components = utils::split(devicePath, "/");

	for (auto it = components.rbegin(); it != components.rend(); ++it) {
		if (parseI2CClient(*it, bus))
			return 0;
	}

	return -ENOTTY;
}

int CsiDeviceRegistrySysfs::busForCharDevice(dev_t devnum, unsigned int *bus)
{
	std::string link = sysfsRoot_ + "/dev/char/" +
			   std::to_string(major(devnum)) + ":" +
			   std::to_string(minor(devnum)) + "/device";

	char resolved[PATH_MAX];
	if (!realpath(link.c_str(), resolved))
		return -ENOENT;

	return busFromDevicePath(resolved, bus);
}

int CsiDeviceRegistrySysfs::busForDeviceNode(const std::string &path,
					     unsigned int *bus)
{
	std::string name = utils::basename(path.c_str());
	std::string classPath = classDir_ + "/" + name;

	struct stat st;
	if (name.empty() || stat(classPath.c_str(), &st) < 0) {
		LOG(CsiRegistry, Debug) << "Device node " << path << " not found";
		return -ENOENT;
	}

	char resolved[PATH_MAX];
	if (!realpath((classPath + "/device").c_str(), resolved)) {
		LOG(CsiRegistry, Debug)
			<< "Device node " << path << " has no parent device";
		return -ENOTTY;
	}

	if (!busFromDevicePath(resolved, bus)) {
		LOG(CsiRegistry, Debug)
			<< path << " is backed by an I2C client on bus " << *bus;
		return 0;
	}

	dev_t devnum;
	if (!readDevnum(classPath + "/dev", &devnum)) {
		LOG(CsiRegistry, Debug)
			<< "Device node " << path << " has no device number";
		return -ENOTTY;
	}

	/* Media devices of the receiver are children of its device. */
	std::vector<unsigned long> indices;
	DIR *dir = opendir(resolved);
	if (dir) {
		struct dirent *ent;
		while ((ent = readdir(dir)) != nullptr) {
			unsigned long index;
			if (strncmp(ent->d_name, "media", 5) ||
			    !isdigit(ent->d_name[5]) ||
			    !utils::parseUnsigned(ent->d_name + 5, UINT_MAX, &index))
				continue;

			indices.push_back(index);
		}
		closedir(dir);
	}

	std::sort(indices.begin(), indices.end());

	std::vector<std::string> mediaNodes;
	for (unsigned long index : indices)
		mediaNodes.push_back("/dev/media" + std::to_string(index));

	return busFromMediaGraphs(path, devnum, mediaNodes, bus);
}

} /* namespace arducam */
