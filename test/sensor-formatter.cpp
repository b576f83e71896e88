/* SPDX-License-Identifier: GPL-2.0-or-later */
/*
 * Copyright (C) 2025, Arducam
 *
 * Sensor listing output tests
 */

#include <chrono>
#include <errno.h>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include "arducam/internal/register_transport.h"
#include "arducam/internal/sensor_decoder.h"
#include "arducam/internal/sensor_formatter.h"
#include "arducam/internal/sensor_register_map.h"

#include "simulated_platform.h"
#include "test.h"

using namespace std;
using namespace arducam;

static const string diagnosticOutput =
	"Device ID: 0x30\n"
	"Device Version: 0x10\n"
	"Sensor ID: 0xA56\n"
	"ISP FW Version: v1.02 2023/05/17\n"
	"Software FW Version: 1.2.3\n"
	"PixelFormat Type: YUV422_8BIT, Order: UYVY, Lanes: 4\n"
	"index: 0, 3840x2160\n"
	"index: 1, 1920x1080\n"
	"ID: 0x981906, control_name: Framerate MAX: 90, MIN: 1, DEF: 90\n"
	"ID: 0x980911, control_name: Exposure MAX: 200000, MIN: 1, DEF: 33333\n"
	"ID: 0x9E0903, control_name: AnalogueGain MAX: 1600, MIN: 100, DEF: 100\n";

static const string listFormatsOutput =
	"ioctl: VIDIOC_ENUM_FMT\n"
	"\tType: Video Capture\n"
	"\n"
	"\t[0]: 'UYVY' (YUV422_8BIT)\n";

static const string listFormatsExtOutput =
	"ioctl: VIDIOC_ENUM_FMT\n"
	"\tType: Video Capture\n"
	"\n"
	"\t[0]: 'UYVY' (YUV422_8BIT)\n"
	"\t\tSize: Discrete 3840x2160\n"
	"\t\t\tInterval: Discrete 0.017s (30 fps)\n"
	"\t\tSize: Discrete 1920x1080\n"
	"\t\t\tInterval: Discrete 0.008s (60 fps)\n";

class SensorFormatterTest : public Test
{
protected:
	int init()
	{
		sensor_.populate();
		platform_.addBus(10, &sensor_);
		platform_.addBus(11);

		transport_ = std::make_unique<RegisterTransport>(&platform_);
		transport_->setRetryPolicy(1, std::chrono::microseconds(0));

		decoder_ = std::make_unique<SensorDecoder>(transport_.get(),
							   SensorRegisterMap());
		decoder_->setIdlePolling(5, std::chrono::microseconds(0));

		return TestPass;
	}

	int check(SensorFormatter::Mode mode, bool firmware, const string &expected)
	{
		SensorReport report;

		int ret = SensorFormatter::collect(decoder_.get(), 10, mode,
						   firmware, &report);
		if (ret) {
			cerr << "Failed to collect sensor report" << endl;
			return TestFail;
		}

		ostringstream out;
		SensorFormatter::render(out, mode, report);

		if (out.str() != expected) {
			cerr << "Unexpected output:" << endl << out.str()
			     << "expected:" << endl << expected;
			return TestFail;
		}

		return TestPass;
	}

	int testIntervals()
	{
		static const struct {
			FrameInterval interval;
			const char *text;
		} intervals[] = {
			{ { 1, 15 }, "0.033s (15 fps)" },
			{ { 1, 30 }, "0.017s (30 fps)" },
			{ { 1, 90 }, "0.006s (90 fps)" },
			{ { 2, 15 }, "0.067s (7.500 fps)" },
		};

		for (const auto &interval : intervals) {
			string text = SensorFormatter::intervalToString(interval.interval);
			if (text != interval.text) {
				cerr << "Interval " << interval.interval.numerator
				     << "/" << interval.interval.denominator
				     << " rendered as " << text << endl;
				return TestFail;
			}
		}

		return TestPass;
	}

	int run()
	{
		if (check(SensorFormatter::Mode::Diagnostic, true,
			  diagnosticOutput) != TestPass)
			return TestFail;

		/* Firmware versions are only reported on request. */
		string withoutFirmware = diagnosticOutput;
		size_t pos = withoutFirmware.find("ISP FW Version");
		size_t end = withoutFirmware.find("PixelFormat Type");
		withoutFirmware.erase(pos, end - pos);

		if (check(SensorFormatter::Mode::Diagnostic, false,
			  withoutFirmware) != TestPass)
			return TestFail;

		if (check(SensorFormatter::Mode::ListFormats, false,
			  listFormatsOutput) != TestPass)
			return TestFail;

		if (check(SensorFormatter::Mode::ListFormatsExt, false,
			  listFormatsExtOutput) != TestPass)
			return TestFail;

		SensorReport report;
		int ret = SensorFormatter::collect(decoder_.get(), 11,
						   SensorFormatter::Mode::Diagnostic,
						   false, &report);
		if (ret != -ENODEV) {
			cerr << "Empty bus not reported" << endl;
			return TestFail;
		}

		if (testIntervals() != TestPass)
			return TestFail;

		return TestPass;
	}

private:
	SimulatedI2CPlatform platform_;
	SimulatedSensor sensor_;

	std::unique_ptr<RegisterTransport> transport_;
	std::unique_ptr<SensorDecoder> decoder_;
};

TEST_REGISTER(SensorFormatterTest)
