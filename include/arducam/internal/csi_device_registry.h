/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2018, Google Inc.
 * Copyright (C) 2025, Arducam
 *
 * CSI camera device node registry
 */

#pragma once

#include <memory>
#include <string>
#include <sys/types.h>
#include <vector>

namespace arducam {

class MediaGraph;

class CsiDeviceRegistry
{
public:
	static std::unique_ptr<CsiDeviceRegistry> create();

	virtual ~CsiDeviceRegistry();

	virtual int init() = 0;
	virtual std::vector<std::string> deviceNodes() = 0;
	virtual int busForDeviceNode(const std::string &path, unsigned int *bus) = 0;

protected:
	virtual int loadMediaGraph(const std::string &mediaNode, MediaGraph *graph);
	virtual int busForCharDevice(dev_t devnum, unsigned int *bus) = 0;

	int busFromMediaGraphs(const std::string &path, dev_t devnum,
			       const std::vector<std::string> &mediaNodes,
			       unsigned int *bus);

	static bool parseI2CClient(const std::string &name, unsigned int *bus);
	static bool parseVideoNode(const std::string &name, unsigned int *index);
	static void sortDeviceNodes(std::vector<std::string> *nodes);
};

} /* namespace arducam */
