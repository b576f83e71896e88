/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2019, Google Inc.
 * Copyright (C) 2025, Arducam
 *
 * sysfs-based CSI camera device node registry
 */

#pragma once

#include <string>
#include <vector>

#include "arducam/internal/csi_device_registry.h"

namespace arducam {

class CsiDeviceRegistrySysfs : public CsiDeviceRegistry
{
public:
	explicit CsiDeviceRegistrySysfs(const std::string &sysfsRoot = "/sys");

	int init() override;
	std::vector<std::string> deviceNodes() override;
	int busForDeviceNode(const std::string &path, unsigned int *bus) override;

protected:
	int busForCharDevice(dev_t devnum, unsigned int *bus) override;

private:
	int busFromDevicePath(const std::string &devicePath, unsigned int *bus);

	std::string sysfsRoot_;
	std::string classDir_;
};

} /* namespace arducam */
