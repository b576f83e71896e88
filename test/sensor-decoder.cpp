/* SPDX-License-Identifier: GPL-2.0-or-later */
/*
 * Copyright (C) 2025, Arducam
 *
 * Sensor register protocol decoder tests
 */

#include <chrono>
#include <errno.h>
#include <iostream>
#include <memory>
#include <optional>
#include <vector>

#include "arducam/internal/register_transport.h"
#include "arducam/internal/sensor_decoder.h"
#include "arducam/internal/sensor_register_map.h"

#include "simulated_platform.h"
#include "test.h"

using namespace std;
using namespace arducam;

class SensorDecoderTest : public Test
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

	int testIdentity()
	{
		std::optional<SensorIdentity> identity;

		int ret = decoder_->probeIdentity(10, &identity);
		if (ret || !identity ||
		    *identity != SensorIdentity{ 0x30, 0x10, 0x0a56 }) {
			cerr << "Failed to probe sensor identity" << endl;
			return TestFail;
		}

		identity = SensorIdentity{};
		ret = decoder_->probeIdentity(11, &identity);
		if (ret || identity) {
			cerr << "Empty bus not reported as sensor not present" << endl;
			return TestFail;
		}

		/* Only the identity probe turns a NAK into an absent sensor. */
		std::vector<PixelFormatDescriptor> formats;
		if (decoder_->listPixelFormats(11, &formats) != -ENXIO) {
			cerr << "NAK not propagated by table decoding" << endl;
			return TestFail;
		}

		return TestPass;
	}

	int testPixelFormats()
	{
		std::vector<PixelFormatDescriptor> formats;

		sensor_.formats().push_back({ 0x2b, 0x0, 2, { { 640, 480, 120 } } });
		sensor_.formats().push_back({ 0x30, kNoDataAvailable, 2, { { 640, 480, 30 } } });

		int ret = decoder_->listPixelFormats(10, &formats);
		if (ret || formats.size() != 3) {
			cerr << "Failed to list pixel formats" << endl;
			return TestFail;
		}

		if (formats[0].type != PixelFormatType::Yuv422_8Bit ||
		    formats[0].order != PixelOrder::UYVY || formats[0].lanes != 4 ||
		    formats[1].type != PixelFormatType::Raw10 ||
		    formats[1].order != PixelOrder::BGGR ||
		    formats[2].type != PixelFormatType::Jpeg ||
		    formats[2].order != PixelOrder::None) {
			cerr << "Pixel formats decoded incorrectly" << endl;
			return TestFail;
		}

		if (sensor_.value(SimulatedSensor::PixFormatIndex) != 0) {
			cerr << "Pixel format index not restored" << endl;
			return TestFail;
		}

		std::vector<ResolutionDescriptor> resolutions;
		ret = decoder_->listResolutions(10, 1, &resolutions);
		if (ret || resolutions.size() != 1 ||
		    resolutions[0].entry.size != Size{ 640, 480 }) {
			cerr << "Failed to list resolutions of second format" << endl;
			return TestFail;
		}

		sensor_.formats().resize(1);

		/* Unknown pixel format type. */
		sensor_.formats().push_back({ 0x55, 0x0, 2, {} });
		ret = decoder_->listPixelFormats(10, &formats);
		sensor_.formats().pop_back();
		if (ret != -EBADMSG) {
			cerr << "Unknown pixel format type accepted" << endl;
			return TestFail;
		}

		return TestPass;
	}

	int testResolutions()
	{
		SimulatedSensor::Format &format = sensor_.formats()[0];
		std::vector<SimulatedSensor::Resolution> saved = format.resolutions;
		std::vector<ResolutionDescriptor> resolutions;

		format.resolutions = {
			{ 1920, 1080, 60 },
			{ 3840, 2160, 15 },
			{ 1280, 720, 120 },
		};

		int ret = decoder_->listResolutions(10, 0, &resolutions);
		if (ret || resolutions.size() != 3) {
			cerr << "Failed to list resolutions" << endl;
			return TestFail;
		}

		static const Size sizes[] = {
			{ 1920, 1080 }, { 3840, 2160 }, { 1280, 720 },
		};
		static const uint32_t rates[] = { 60, 15, 120 };

		for (unsigned int i = 0; i < resolutions.size(); ++i) {
			const ResolutionDescriptor &resolution = resolutions[i];

			if (resolution.entry.index != i ||
			    resolution.entry.size != sizes[i]) {
				cerr << "Resolution " << i << " is "
				     << resolution.entry.size << " at index "
				     << resolution.entry.index << endl;
				return TestFail;
			}

			if (resolution.intervals.size() != 1 ||
			    resolution.intervals[0].numerator != 1 ||
			    resolution.intervals[0].denominator != rates[i]) {
				cerr << "Wrong frame intervals for resolution "
				     << i << endl;
				return TestFail;
			}
		}

		ret = decoder_->listResolutions(10, 5, &resolutions);
		if (ret != -EINVAL) {
			cerr << "Undeclared pixel format accepted" << endl;
			return TestFail;
		}

		format.resolutions.push_back({ 0, 480, 30 });
		ret = decoder_->listResolutions(10, 0, &resolutions);
		format.resolutions.pop_back();
		if (ret != -EBADMSG) {
			cerr << "Zero width resolution accepted" << endl;
			return TestFail;
		}

		/* Without a frame rate control no interval is reported. */
		std::vector<SimulatedSensor::Control> controls = sensor_.controls();
		sensor_.controls().erase(sensor_.controls().begin());
		ret = decoder_->listResolutions(10, 0, &resolutions);
		sensor_.controls() = controls;
		if (ret || resolutions.size() != 3 || !resolutions[0].intervals.empty()) {
			cerr << "Frame intervals reported without frame rate control"
			     << endl;
			return TestFail;
		}

		format.resolutions = saved;

		return TestPass;
	}

	int testControls()
	{
		std::vector<ControlDescriptor> controls;

		int ret = decoder_->listControls(10, &controls);
		if (ret || controls.size() != 3) {
			cerr << "Failed to list controls" << endl;
			return TestFail;
		}

		if (controls[0].id != SimulatedSensor::kFramerate ||
		    controls[0].name != "Framerate" ||
		    controls[1].name != "Exposure" ||
		    controls[2].name != "AnalogueGain" ||
		    controls[2].min != 100 || controls[2].max != 1600 ||
		    controls[2].def != 100) {
			cerr << "Controls decoded incorrectly" << endl;
			return TestFail;
		}

		std::vector<SimulatedSensor::Control> saved = sensor_.controls();

		sensor_.controls().push_back({ 0x980900, 10, 5, 5 });
		ret = decoder_->listControls(10, &controls);
		sensor_.controls() = saved;
		if (ret != -EBADMSG) {
			cerr << "Control with min > max accepted" << endl;
			return TestFail;
		}

		sensor_.controls().push_back({ 0x980900, 0, 10, 20 });
		ret = decoder_->listControls(10, &controls);
		sensor_.controls() = saved;
		if (ret != -EBADMSG) {
			cerr << "Control with default out of range accepted" << endl;
			return TestFail;
		}

		sensor_.controls().push_back({ 0x980911, 0, 10, 5 });
		ret = decoder_->listControls(10, &controls);
		sensor_.controls() = saved;
		if (ret != -EBADMSG) {
			cerr << "Duplicate control accepted" << endl;
			return TestFail;
		}

		/* Control values are signed. */
		sensor_.controls().push_back({ 0x980900, static_cast<uint32_t>(-64), 64, 0 });
		ret = decoder_->listControls(10, &controls);
		sensor_.controls() = saved;
		if (ret || controls.size() != 4 || controls[3].min != -64 ||
		    controls[3].name != "brightness") {
			cerr << "Negative control minimum decoded incorrectly" << endl;
			return TestFail;
		}

		return TestPass;
	}

	int testLimits()
	{
		SensorDecoder::Limits limits;
		std::vector<PixelFormatDescriptor> formats;
		std::vector<ResolutionDescriptor> resolutions;
		std::vector<ControlDescriptor> controls;

		limits.maxFormats = 1;
		limits.maxResolutions = 1;
		limits.maxControls = 2;
		decoder_->setLimits(limits);

		int ret = decoder_->listPixelFormats(10, &formats);
		if (ret || formats.size() != 1) {
			cerr << "Table within bounds rejected" << endl;
			return TestFail;
		}

		sensor_.formats().push_back(sensor_.formats()[0]);
		ret = decoder_->listPixelFormats(10, &formats);
		sensor_.formats().pop_back();
		if (ret != -EBADMSG) {
			cerr << "Pixel format table bound not enforced" << endl;
			return TestFail;
		}

		ret = decoder_->listResolutions(10, 0, &resolutions);
		if (ret != -EBADMSG) {
			cerr << "Resolution table bound not enforced" << endl;
			return TestFail;
		}

		ret = decoder_->listControls(10, &controls);
		if (ret != -EBADMSG) {
			cerr << "Control table bound not enforced" << endl;
			return TestFail;
		}

		decoder_->setLimits(SensorDecoder::Limits());

		return TestPass;
	}

	int testIdle()
	{
		std::vector<ControlDescriptor> controls;

		sensor_.setBusyPolls(3);
		if (decoder_->waitForIdle(10)) {
			cerr << "Sensor didn't become idle" << endl;
			return TestFail;
		}

		sensor_.setBusyPolls(10);
		if (decoder_->listControls(10, &controls) != -ETIMEDOUT) {
			cerr << "Busy sensor not reported" << endl;
			return TestFail;
		}

		sensor_.setBusyPolls(0);

		return TestPass;
	}

	int testFirmware()
	{
		FirmwareInfo info;

		int ret = decoder_->readFirmwareInfo(10, &info);
		if (ret || info.ispVersion != "v1.02 2023/05/17" ||
		    info.softwareVersion != "1.2.3") {
			cerr << "Failed to read firmware versions" << endl;
			return TestFail;
		}

		sensor_.setUniqueId(kNoDataAvailable);
		sensor_.setSoftwareVersion(std::nullopt);

		ret = decoder_->readFirmwareInfo(10, &info);
		if (ret || info.ispVersion || info.softwareVersion) {
			cerr << "Missing firmware versions reported" << endl;
			return TestFail;
		}

		return TestPass;
	}

	int run()
	{
		if (testIdentity() != TestPass)
			return TestFail;

		if (testPixelFormats() != TestPass)
			return TestFail;

		if (testResolutions() != TestPass)
			return TestFail;

		if (testControls() != TestPass)
			return TestFail;

		if (testLimits() != TestPass)
			return TestFail;

		if (testIdle() != TestPass)
			return TestFail;

		if (testFirmware() != TestPass)
			return TestFail;

		return TestPass;
	}

private:
	SimulatedI2CPlatform platform_;
	SimulatedSensor sensor_;

	std::unique_ptr<RegisterTransport> transport_;
	std::unique_ptr<SensorDecoder> decoder_;
};

TEST_REGISTER(SensorDecoderTest)
