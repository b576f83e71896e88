/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2018, Google Inc.
 * Copyright (C) 2025, Arducam
 *
 * Media controller graph of a camera receiver
 */

#include "arducam/internal/media_device.h"

#include <deque>
#include <errno.h>
#include <fcntl.h>
#include <linux/media.h>
#include <set>
#include <string.h>
#include <sys/ioctl.h>
#include <sys/sysmacros.h>

#include <arducam/base/log.h>
#include <arducam/base/unique_fd.h>

/**
 * \file media_device.h
 * \brief Media controller graph of a camera receiver
 *
 * CSI-2 receivers such as unicam and rp1-cfe register their video nodes under
 * the receiver platform device, not under the sensor. The sensor is only
 * reachable through the media controller graph, upstream of the video node
 * entity.
 */

namespace arducam {

LOG_DEFINE_CATEGORY(MediaDevice)

/**
 * \struct MediaEntity
 * \brief An entity of the media graph
 *
 * \var MediaEntity::sources
 * \brief Entities linked to one of this entity's sink pads
 */

/**
 * \class MediaGraph
 * \brief The entities of a media device and the data links between them
 */

void MediaGraph::addEntity(unsigned int id, const std::string &name,
			   uint32_t function, std::optional<dev_t> devnum)
{
	entities_[id] = MediaEntity{ id, name, function, devnum, {} };
}

/**
 * \brief Record a data link from \a source to \a sink
 * \return False if either entity is unknown
 */
bool MediaGraph::addLink(unsigned int source, unsigned int sink)
{
	auto it = entities_.find(sink);
	if (it == entities_.end() || !entities_.count(source))
		return false;

	it->second.sources.push_back(source);
	return true;
}

/**
 * \brief Associate the device node number \a devnum with entity \a id
 * \return False if the entity is unknown
 */
bool MediaGraph::setDevnum(unsigned int id, dev_t devnum)
{
	auto it = entities_.find(id);
	if (it == entities_.end())
		return false;

	it->second.devnum = devnum;
	return true;
}

const MediaEntity *MediaGraph::entity(unsigned int id) const
{
	auto it = entities_.find(id);
	return it != entities_.end() ? &it->second : nullptr;
}

const MediaEntity *MediaGraph::entityByDevnum(dev_t devnum) const
{
	for (const auto &[id, entity] : entities_) {
		if (entity.devnum == devnum)
			return &entity;
	}

	return nullptr;
}

/**
 * \brief Find the camera sensor feeding \a entity
 * \param[in] entity The entity, usually a video capture node
 *
 * The graph is walked upstream breadth first. The closest entity with the
 * MEDIA_ENT_F_CAM_SENSOR function wins. Drivers that don't set the function
 * leave their sensor as a source-only entity, the closest one that isn't a
 * video node is used in that case.
 *
 * \return The sensor entity, or nullptr if none feeds \a entity
 */
const MediaEntity *MediaGraph::upstreamSensor(const MediaEntity &entity) const
{
	std::deque<const MediaEntity *> queue = { &entity };
	std::set<unsigned int> visited = { entity.id };
	const MediaEntity *root = nullptr;

	while (!queue.empty()) {
		const MediaEntity *current = queue.front();
		queue.pop_front();

		if (current != &entity) {
			if (current->function == MEDIA_ENT_F_CAM_SENSOR)
				return current;

			if (!root && current->sources.empty() &&
			    current->function != MEDIA_ENT_F_IO_V4L)
				root = current;
		}

		for (unsigned int id : current->sources) {
			const MediaEntity *source = this->entity(id);
			if (source && visited.insert(id).second)
				queue.push_back(source);
		}
	}

	return root;
}

/**
 * \class MediaDevice
 * \brief A media controller device node
 */

MediaDevice::MediaDevice(const std::string &deviceNode)
	: deviceNode_(deviceNode)
{
}

/**
 * \brief Read the topology of the media device into \a graph
 *
 * The topology is read until its version is stable, in case it changes
 * between the size query and the data query.
 *
 * \return 0 on success or a negative error code otherwise
 */
int MediaDevice::populate(MediaGraph *graph)
{
	UniqueFD fd(::open(deviceNode_.c_str(), O_RDWR | O_CLOEXEC));
	if (!fd.isValid()) {
		int ret = -errno;
		LOG(MediaDevice, Debug)
			<< "Failed to open " << deviceNode_ << ": " << strerror(-ret);
		return ret;
	}

	struct media_v2_topology topology = {};
	std::vector<struct media_v2_entity> entities;
	std::vector<struct media_v2_interface> interfaces;
	std::vector<struct media_v2_link> links;
	std::vector<struct media_v2_pad> pads;
	__u64 version = ~0ULL;

	while (true) {
		topology.ptr_entities = reinterpret_cast<uintptr_t>(entities.data());
		topology.ptr_interfaces = reinterpret_cast<uintptr_t>(interfaces.data());
		topology.ptr_links = reinterpret_cast<uintptr_t>(links.data());
		topology.ptr_pads = reinterpret_cast<uintptr_t>(pads.data());

		if (ioctl(fd.get(), MEDIA_IOC_G_TOPOLOGY, &topology) < 0) {
			int ret = -errno;
			LOG(MediaDevice, Error)
				<< "Failed to read the topology of " << deviceNode_
				<< ": " << strerror(-ret);
			return ret;
		}

		if (topology.topology_version == version)
			break;

		version = topology.topology_version;
		entities.resize(topology.num_entities);
		interfaces.resize(topology.num_interfaces);
		links.resize(topology.num_links);
		pads.resize(topology.num_pads);
	}

	for (const struct media_v2_entity &entity : entities)
		graph->addEntity(entity.id, entity.name, entity.function);

	std::map<unsigned int, unsigned int> padEntity;
	for (const struct media_v2_pad &pad : pads)
		padEntity[pad.id] = pad.entity_id;

	std::map<unsigned int, dev_t> interfaceDevnum;
	for (const struct media_v2_interface &interface : interfaces)
		interfaceDevnum[interface.id] = makedev(interface.devnode.major,
							interface.devnode.minor);

	for (const struct media_v2_link &link : links) {
		switch (link.flags & MEDIA_LNK_FL_LINK_TYPE) {
		case MEDIA_LNK_FL_DATA_LINK: {
			auto source = padEntity.find(link.source_id);
			auto sink = padEntity.find(link.sink_id);
			if (source == padEntity.end() || sink == padEntity.end() ||
			    !graph->addLink(source->second, sink->second)) {
				LOG(MediaDevice, Error)
					<< deviceNode_ << ": dangling link " << link.id;
				return -EBADMSG;
			}
			break;
		}

		case MEDIA_LNK_FL_INTERFACE_LINK: {
			auto devnum = interfaceDevnum.find(link.source_id);
			if (devnum != interfaceDevnum.end())
				graph->setDevnum(link.sink_id, devnum->second);
			break;
		}

		default:
			break;
		}
	}

	LOG(MediaDevice, Debug)
		<< deviceNode_ << ": " << entities.size() << " entities, "
		<< links.size() << " links";

	return 0;
}

} /* namespace arducam */
