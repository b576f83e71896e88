/* SPDX-License-Identifier: GPL-2.0-or-later */
/*
 * Copyright (C) 2025, Arducam
 *
 * sysfs CSI device registry tests
 */

#include <errno.h>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <linux/media.h>
#include <map>
#include <string>
#include <sys/sysmacros.h>
#include <vector>

#include "arducam/internal/csi_device_registry_sysfs.h"
#include "arducam/internal/media_device.h"

#include "test.h"

using namespace arducam;
using namespace std;

namespace fs = std::filesystem;

/* Serve media graphs from memory instead of /dev/media* nodes. */
class TestRegistry : public CsiDeviceRegistrySysfs
{
public:
	TestRegistry(const string &sysfsRoot)
		: CsiDeviceRegistrySysfs(sysfsRoot)
	{
	}

	map<string, MediaGraph> graphs;
	vector<string> loaded;

protected:
	int loadMediaGraph(const string &mediaNode, MediaGraph *graph) override
	{
		loaded.push_back(mediaNode);

		auto it = graphs.find(mediaNode);
		if (it == graphs.end())
			return -ENOENT;

		*graph = it->second;
		return 0;
	}
};

class CsiDeviceRegistryTest : public Test
{
protected:
	bool link(const fs::path &path, const string &device)
	{
		std::error_code ec;

		fs::path target = root_ / "devices" / device;
		fs::create_directories(target, ec);
		if (ec)
			return false;

		fs::create_directories(path, ec);
		if (ec)
			return false;

		fs::create_directory_symlink(target, path / "device", ec);
		return !ec;
	}

	bool addNode(const string &name, const string &device,
		     const string &devnum = "")
	{
		std::error_code ec;

		fs::path node = root_ / "class" / "video4linux" / name;
		fs::create_directories(node, ec);
		if (ec)
			return false;

		if (!devnum.empty()) {
			ofstream dev(node / "dev");
			dev << devnum << endl;
			if (!dev)
				return false;
		}

		if (device.empty())
			return true;

		return link(node, device);
	}

	bool addMedia(const string &device, const string &name)
	{
		std::error_code ec;
		fs::create_directories(root_ / "devices" / device / name, ec);
		return !ec;
	}

	int init()
	{
		if (createTemporaryDirectory())
			return TestFail;

		root_ = fs::path(temporaryDirectory()) / "sys";

		/*
		 * unicam and rp1-cfe video nodes sit under the receiver, the
		 * sensor of the unicam graph has a subdevice node on i2c-10.
		 */
		if (!addNode("video0", "platform/soc/fe801000.csi", "81:0") ||
		    !addMedia("platform/soc/fe801000.csi", "media0") ||
		    !link(root_ / "dev" / "char" / "81:3",
			  "platform/soc/fe205000.i2c/i2c-10/10-001a") ||
		    !addNode("video4", "platform/axi/1f00128000.csi", "81:4") ||
		    !addMedia("platform/axi/1f00128000.csi", "media12") ||
		    !addMedia("platform/axi/1f00128000.csi", "media2") ||
		    /* A bridge driver registering its node below the I2C client. */
		    !addNode("video1", "platform/soc/i2c-12/12-000c/bridge", "81:1") ||
		    /* An ISP node and a node without parent device. */
		    !addNode("video10", "platform/soc/bcm2835-isp", "81:10") ||
		    !addMedia("platform/soc/bcm2835-isp", "media1") ||
		    !addNode("video2", "") ||
		    !addNode("v4l-subdev0", "platform/soc/fe205000.i2c/i2c-10/10-001a",
			     "81:3")) {
			cerr << "Failed to create sysfs tree" << endl;
			return TestFail;
		}

		return TestPass;
	}

	void addGraphs(TestRegistry *registry)
	{
		MediaGraph &unicam = registry->graphs["/dev/media0"];
		unicam.addEntity(1, "imx477 10-001a", MEDIA_ENT_F_CAM_SENSOR,
				 makedev(81, 3));
		unicam.addEntity(2, "unicam-image", MEDIA_ENT_F_IO_V4L,
				 makedev(81, 0));
		unicam.addLink(1, 2);

		/* The rp1-cfe graph has no sensor subdevice node. */
		MediaGraph &cfe = registry->graphs["/dev/media2"];
		cfe.addEntity(1, "imx219 11-0010", MEDIA_ENT_F_CAM_SENSOR);
		cfe.addEntity(2, "csi2", MEDIA_ENT_F_VID_IF_BRIDGE);
		cfe.addEntity(3, "rp1-cfe-csi2_ch0", MEDIA_ENT_F_IO_V4L,
			      makedev(81, 4));
		cfe.addEntity(4, "rp1-cfe-fe_image0", MEDIA_ENT_F_IO_V4L,
			      makedev(81, 5));
		cfe.addLink(1, 2);
		cfe.addLink(2, 3);
		cfe.addLink(2, 4);

		MediaGraph &isp = registry->graphs["/dev/media1"];
		isp.addEntity(1, "bcm2835-isp0-output0", MEDIA_ENT_F_IO_V4L,
			      makedev(81, 13));
		isp.addEntity(2, "bcm2835_isp0", MEDIA_ENT_F_PROC_VIDEO_ISP);
		isp.addEntity(3, "bcm2835-isp0-capture1", MEDIA_ENT_F_IO_V4L,
			      makedev(81, 10));
		isp.addLink(1, 2);
		isp.addLink(2, 3);
	}

	int run()
	{
		CsiDeviceRegistrySysfs missing(temporaryDirectory() + "/none");
		if (missing.init() != -ENODEV) {
			cerr << "Missing sysfs tree accepted" << endl;
			return TestFail;
		}

		TestRegistry registry(root_.string());
		if (registry.init()) {
			cerr << "Failed to initialize registry" << endl;
			return TestFail;
		}

		addGraphs(&registry);

		const vector<string> expected = {
			"/dev/video0", "/dev/video1", "/dev/video2", "/dev/video4",
			"/dev/video10",
		};

		if (registry.deviceNodes() != expected) {
			cerr << "Device nodes not listed in device number order" << endl;
			return TestFail;
		}

		unsigned int bus;

		if (registry.busForDeviceNode("/dev/video0", &bus) || bus != 10) {
			cerr << "Failed to resolve unicam node through its sensor subdevice"
			     << endl;
			return TestFail;
		}

		/* media2 is read before media12. */
		registry.loaded.clear();
		if (registry.busForDeviceNode("video4", &bus) || bus != 11) {
			cerr << "Failed to resolve rp1-cfe node through the sensor name"
			     << endl;
			return TestFail;
		}

		if (registry.loaded != vector<string>{ "/dev/media2" }) {
			cerr << "Media devices not read in device number order" << endl;
			return TestFail;
		}

		registry.loaded.clear();
		if (registry.busForDeviceNode("/dev/video1", &bus) || bus != 12 ||
		    !registry.loaded.empty()) {
			cerr << "Failed to resolve node below its I2C client" << endl;
			return TestFail;
		}

		if (registry.busForDeviceNode("/dev/video10", &bus) != -ENOTTY ||
		    registry.busForDeviceNode("/dev/video2", &bus) != -ENOTTY) {
			cerr << "Node without I2C sensor resolved" << endl;
			return TestFail;
		}

		if (registry.busForDeviceNode("/dev/video7", &bus) != -ENOENT) {
			cerr << "Unknown node resolved" << endl;
			return TestFail;
		}

		return TestPass;
	}

private:
	fs::path root_;
};

TEST_REGISTER(CsiDeviceRegistryTest)
