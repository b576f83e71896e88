/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2018-2019, Google Inc.
 * Copyright (C) 2025, Arducam
 *
 * udev-based CSI camera device node registry
 */

#pragma once

#include <string>
#include <vector>

#include "arducam/internal/csi_device_registry.h"

struct udev;
struct udev_device;

namespace arducam {

class CsiDeviceRegistryUdev final : public CsiDeviceRegistry
{
public:
	CsiDeviceRegistryUdev();
	~CsiDeviceRegistryUdev();

	int init() override;
	std::vector<std::string> deviceNodes() override;
	int busForDeviceNode(const std::string &path, unsigned int *bus) override;

protected:
	int busForCharDevice(dev_t devnum, unsigned int *bus) override;

private:
	int busFromDevice(struct udev_device *dev, unsigned int *bus);
	std::vector<std::string> mediaNodes(struct udev_device *parent);

	struct udev *udev_;
};

} /* namespace arducam */
