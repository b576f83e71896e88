/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2018, Google Inc.
 * Copyright (C) 2025, Arducam
 *
 * CSI camera device node registry
 */

#include "arducam/internal/csi_device_registry.h"

#include <algorithm>
#include <ctype.h>
#include <stdlib.h>
#include <string.h>

#include <arducam/base/log.h>
#include <arducam/base/utils.h>

#include "arducam/internal/csi_device_registry_sysfs.h"
#include "arducam/internal/csi_device_registry_udev.h"
#include "arducam/internal/media_device.h"

/**
 * \file arducam/internal/csi_device_registry.h
 * \brief Correlation of V4L2 device nodes with the I2C bus of their sensor
 */

namespace arducam {

LOG_DEFINE_CATEGORY(CsiRegistry)

/**
 * \class CsiDeviceRegistry
 * \brief Look up the I2C bus backing a camera device node
 *
 * The registry lists the V4L2 video capture device nodes of the system and
 * finds, for a device node, the I2C bus of the sensor that feeds it.
 *
 * When the video device sits below an I2C client device, named
 * "<bus>-<address>" by the kernel, that client is the sensor. CSI-2
 * receivers (unicam, rp1-cfe) instead register their video devices under the
 * receiver platform device. The sensor is then found in the media controller
 * graph of the receiver, upstream of the entity of the video node, and its
 * bus is read from the I2C client owning the sensor subdevice node or, when
 * the sensor has no subdevice node, from the "<driver> <bus>-<address>"
 * entity name.
 */

/**
 * \brief Create a registry matching the system capabilities
 *
 * The udev registry is preferred when libudev is available, with a fallback
 * on the sysfs registry.
 *
 * \return A pointer to the newly created registry on success, or nullptr if
 * no registry can be initialized
 */
std::unique_ptr<CsiDeviceRegistry> CsiDeviceRegistry::create()
{
	std::unique_ptr<CsiDeviceRegistry> registry;

#ifdef HAVE_LIBUDEV
	registry = std::make_unique<CsiDeviceRegistryUdev>();
	if (!registry->init())
		return registry;
#endif

	/*
	 * Either udev is not available or udev initialization failed. Fall back
	 * on the sysfs registry.
	 */
	registry = std::make_unique<CsiDeviceRegistrySysfs>();
	if (!registry->init())
		return registry;

	return nullptr;
}

CsiDeviceRegistry::~CsiDeviceRegistry() = default;

/**
 * \fn CsiDeviceRegistry::init()
 * \brief Initialize the registry
 * \return 0 on success or a negative error code otherwise
 */

/**
 * \fn CsiDeviceRegistry::deviceNodes()
 * \brief List the candidate video capture device nodes
 *
 * V4L2 subdevice nodes are excluded.
 *
 * \return The device node paths, sorted by device number
 */

/**
 * \fn CsiDeviceRegistry::busForDeviceNode()
 * \brief Find the I2C bus of the sensor feeding a device node
 * \param[in] path The device node path, or its basename
 * \param[out] bus The I2C bus number
 * \return 0 on success or a negative error code otherwise
 * \retval -ENOENT The device node doesn't exist
 * \retval -ENOTTY The device node isn't backed by an I2C sensor
 */

/**
 * \fn CsiDeviceRegistry::busForCharDevice()
 * \brief Find the I2C client owning a character device
 * \param[in] devnum The device number
 * \param[out] bus The I2C bus number
 * \return 0 on success or a negative error code otherwise
 */

/**
 * \brief Read the media graph of \a mediaNode
 * \param[in] mediaNode The media device node path
 * \param[out] graph The graph
 * \return 0 on success or a negative error code otherwise
 */
int CsiDeviceRegistry::loadMediaGraph(const std::string &mediaNode,
				      MediaGraph *graph)
{
	MediaDevice media(mediaNode);
	return media.populate(graph);
}

/**
 * \brief Resolve a video node through the media graphs of its receiver
 * \param[in] path The video device node path, for diagnostics
 * \param[in] devnum The video device number
 * \param[in] mediaNodes The media device nodes of the receiver
 * \param[out] bus The I2C bus number
 *
 * Media devices that can't be read are skipped.
 *
 * \return 0 on success, or -ENOTTY if no graph leads to an I2C sensor
 */
int CsiDeviceRegistry::busFromMediaGraphs(const std::string &path, dev_t devnum,
					  const std::vector<std::string> &mediaNodes,
					  unsigned int *bus)
{
	for (const std::string &mediaNode : mediaNodes) {
		MediaGraph graph;
		if (loadMediaGraph(mediaNode, &graph))
			continue;

		const MediaEntity *video = graph.entityByDevnum(devnum);
		if (!video)
			continue;

		const MediaEntity *sensor = graph.upstreamSensor(*video);
		if (!sensor) {
			LOG(CsiRegistry, Debug)
				<< path << " (" << video->name << ") has no sensor in "
				<< mediaNode;
			return -ENOTTY;
		}

		if (sensor->devnum && !busForCharDevice(*sensor->devnum, bus)) {
			LOG(CsiRegistry, Debug)
				<< path << " is fed by " << sensor->name
				<< " on bus " << *bus;
			return 0;
		}

		/* I2C subdevices are named "<driver> <bus>-<address>". */
		std::string::size_type space = sensor->name.rfind(' ');
		std::string client = space == std::string::npos
				   ? sensor->name : sensor->name.substr(space + 1);
		if (parseI2CClient(client, bus)) {
			LOG(CsiRegistry, Debug)
				<< path << " is fed by " << sensor->name
				<< " on bus " << *bus;
			return 0;
		}

		LOG(CsiRegistry, Debug)
			<< path << " is fed by " << sensor->name
			<< " which isn't an I2C device";
		return -ENOTTY;
	}

	LOG(CsiRegistry, Debug) << path << " isn't part of a media graph";

	return -ENOTTY;
}

/**
 * \brief Parse an I2C client device name
 * \param[in] name The device name, such as "10-000c"
 * \param[out] bus The bus number
 * \return True if \a name is an I2C client device name, false otherwise
 */
bool CsiDeviceRegistry::parseI2CClient(const std::string &name, unsigned int *bus)
{
	std::string::size_type dash = name.find('-');
	if (dash == std::string::npos || dash == 0)
		return false;

	std::string number = name.substr(0, dash);
	std::string address = name.substr(dash + 1);

	if (address.size() != 4 ||
	    !std::all_of(address.begin(), address.end(),
			 [](unsigned char c) { return isxdigit(c); }))
		return false;

	if (!std::all_of(number.begin(), number.end(),
			 [](unsigned char c) { return isdigit(c); }))
		return false;

	*bus = strtoul(number.c_str(), nullptr, 10);

	return true;
}

/**
 * \brief Parse a video capture device name
 * \param[in] name The device name, such as "video0"
 * \param[out] index The device index
 * \return True if \a name names a video capture device, false otherwise
 */
bool CsiDeviceRegistry::parseVideoNode(const std::string &name, unsigned int *index)
{
	if (name.compare(0, 5, "video") || name.size() == 5)
		return false;

	const char *number = name.c_str() + 5;
	char *end;
	unsigned long idx = strtoul(number, &end, 10);
	if (*end != '\0' || !isdigit(static_cast<unsigned char>(*number)))
		return false;

	*index = idx;

	return true;
}

/**
 * \brief Sort device node paths by device number
 * \param[in,out] nodes The device node paths
 */
void CsiDeviceRegistry::sortDeviceNodes(std::vector<std::string> *nodes)
{
	auto index = [](const std::string &path) {
		unsigned int idx = 0;
		parseVideoNode(utils::basename(path.c_str()), &idx);
		return idx;
	};

	std::sort(nodes->begin(), nodes->end(),
		  [&](const std::string &a, const std::string &b) {
			  return index(a) < index(b);
		  });
}

} /* namespace arducam */
