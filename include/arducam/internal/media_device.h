/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2018, Google Inc.
 * Copyright (C) 2025, Arducam
 *
 * Media controller graph of a camera receiver
 */

#pragma once

#include <map>
#include <optional>
#include <stdint.h>
#include <string>
#include <sys/types.h>
#include <vector>

namespace arducam {

struct MediaEntity {
	unsigned int id;
	std::string name;
	uint32_t function;
	std::optional<dev_t> devnum;
	std::vector<unsigned int> sources;
};

class MediaGraph
{
public:
	void addEntity(unsigned int id, const std::string &name, uint32_t function,
		       std::optional<dev_t> devnum = std::nullopt);
	bool addLink(unsigned int source, unsigned int sink);
	bool setDevnum(unsigned int id, dev_t devnum);

	const MediaEntity *entity(unsigned int id) const;
	const MediaEntity *entityByDevnum(dev_t devnum) const;
	const MediaEntity *upstreamSensor(const MediaEntity &entity) const;

	bool empty() const { return entities_.empty(); }

private:
	std::map<unsigned int, MediaEntity> entities_;
};

class MediaDevice
{
public:
	explicit MediaDevice(const std::string &deviceNode);

	int populate(MediaGraph *graph);

private:
	std::string deviceNode_;
};

} /* namespace arducam */
