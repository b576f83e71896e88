/* SPDX-License-Identifier: GPL-2.0-or-later */
/*
 * Copyright (C) 2025, Arducam
 *
 * Register field decoding tests
 */

#include <errno.h>
#include <iostream>
#include <string>
#include <vector>

#include "arducam/internal/register_codec.h"
#include "arducam/internal/sensor_register_map.h"

#include "test.h"

using namespace std;
using namespace arducam;

class RegisterCodecTest : public Test
{
protected:
	int testWindows()
	{
		RegisterWindow window;

		if (makeWindow({ 0x12, 0x34 }, &window) ||
		    window != RegisterWindow{ { 0x00, 0x00, 0x12, 0x34 } }) {
			cerr << "Short register data isn't right-aligned" << endl;
			return TestFail;
		}

		if (makeWindow(std::vector<uint8_t>{}, &window) != -EBADMSG ||
		    makeWindow({ 1, 2, 3, 4, 5 }, &window) != -EBADMSG) {
			cerr << "Invalid register data sizes accepted" << endl;
			return TestFail;
		}

		if (!isNoData(makeWindow(0xfffffffe)) || isNoData(makeWindow(0xffffffff))) {
			cerr << "NO_DATA detection failed" << endl;
			return TestFail;
		}

		return TestPass;
	}

	int testFields()
	{
		uint32_t value;
		int32_t svalue;

		if (decodeField(makeWindow(0x0000001e), { 3, 1, Endianness::Big }, &value) ||
		    value != 0x1e) {
			cerr << "Failed to decode byte field" << endl;
			return TestFail;
		}

		if (decodeField(makeWindow(0x00000a56), { 2, 2, Endianness::Big }, &value) ||
		    value != 0x0a56) {
			cerr << "Failed to decode big endian field" << endl;
			return TestFail;
		}

		if (decodeField(makeWindow(0x0000560a), { 2, 2, Endianness::Little }, &value) ||
		    value != 0x0a56) {
			cerr << "Failed to decode little endian field" << endl;
			return TestFail;
		}

		/* Bytes outside of the field must be zero. */
		if (decodeField(makeWindow(0x0000011e), { 3, 1, Endianness::Big }, &value) != -EBADMSG) {
			cerr << "Overflowing field accepted" << endl;
			return TestFail;
		}

		if (decodeField(makeWindow(0), { 3, 2, Endianness::Big }, &value) != -EBADMSG ||
		    decodeField(makeWindow(0), { 0, 0, Endianness::Big }, &value) != -EBADMSG) {
			cerr << "Invalid layout accepted" << endl;
			return TestFail;
		}

		if (decodeSigned(makeWindow(0xffffffff), { 0, 4, Endianness::Big }, &svalue) ||
		    svalue != -1) {
			cerr << "Failed to decode negative word" << endl;
			return TestFail;
		}

		if (decodeSigned(makeWindow(0x0000ff9c), { 2, 2, Endianness::Big }, &svalue) ||
		    svalue != -100) {
			cerr << "Failed to sign-extend half word" << endl;
			return TestFail;
		}

		return TestPass;
	}

	int testIdentity(const SensorRegisterMap &map)
	{
		SensorIdentity identity;

		int ret = decodeIdentity(makeWindow(0x30), makeWindow(0x10),
					 makeWindow(0x0a56), map.identityLayout(),
					 &identity);
		if (ret || identity != SensorIdentity{ 0x30, 0x10, 0x0a56 }) {
			cerr << "Failed to decode identity" << endl;
			return TestFail;
		}

		ret = decodeIdentity(makeWindow(0x130), makeWindow(0x10),
				     makeWindow(0x0a56), map.identityLayout(),
				     &identity);
		if (ret != -EBADMSG) {
			cerr << "Out of range device id accepted" << endl;
			return TestFail;
		}

		return TestPass;
	}

	int testPixelFormats(const SensorRegisterMap &map)
	{
		const PixelFormatLayout layout = map.pixelFormatLayout();
		PixelFormatDescriptor format;

		int ret = decodePixelFormat(makeWindow(0x1e), makeWindow(0x2),
					    makeWindow(4), layout, &format);
		if (ret || format.type != PixelFormatType::Yuv422_8Bit ||
		    format.order != PixelOrder::UYVY || format.lanes != 4 ||
		    format.fourcc() != "UYVY") {
			cerr << "Failed to decode YUV format" << endl;
			return TestFail;
		}

		ret = decodePixelFormat(makeWindow(0x2b), makeWindow(0x3),
					makeWindow(2), layout, &format);
		if (ret || format.type != PixelFormatType::Raw10 ||
		    format.order != PixelOrder::RGGB || format.fourcc() != "RGGB") {
			cerr << "Failed to decode RAW format" << endl;
			return TestFail;
		}

		ret = decodePixelFormat(makeWindow(0x2a), makeWindow(0x4),
					makeWindow(1), layout, &format);
		if (ret || format.order != PixelOrder::Mono ||
		    std::string(pixelOrderName(format.order)) != "MONO") {
			cerr << "Failed to decode monochrome format" << endl;
			return TestFail;
		}

		/* JPEG has no pixel order, whatever the register contains. */
		ret = decodePixelFormat(makeWindow(0x30), makeWindow(kNoDataAvailable),
					makeWindow(2), layout, &format);
		if (ret || format.type != PixelFormatType::Jpeg ||
		    format.order != PixelOrder::None || format.fourcc() != "MJPG") {
			cerr << "Failed to decode JPEG format" << endl;
			return TestFail;
		}

		ret = decodePixelFormat(makeWindow(0x55), makeWindow(0),
					makeWindow(2), layout, &format);
		if (ret != -EBADMSG) {
			cerr << "Unknown pixel format type accepted" << endl;
			return TestFail;
		}

		ret = decodePixelFormat(makeWindow(0x1e), makeWindow(0x4),
					makeWindow(2), layout, &format);
		if (ret != -EBADMSG) {
			cerr << "Bayer order accepted for YUV format" << endl;
			return TestFail;
		}

		for (uint32_t lanes : { 0U, 5U }) {
			ret = decodePixelFormat(makeWindow(0x1e), makeWindow(0),
						makeWindow(lanes), layout, &format);
			if (ret != -EBADMSG) {
				cerr << "Lane count " << lanes << " accepted" << endl;
				return TestFail;
			}
		}

		return TestPass;
	}

	int testResolutions(const SensorRegisterMap &map)
	{
		ResolutionEntry entry;

		int ret = decodeResolution(2, makeWindow(1280), makeWindow(720),
					   map.resolutionLayout(), &entry);
		if (ret || entry.index != 2 || entry.size != Size{ 1280, 720 }) {
			cerr << "Failed to decode resolution" << endl;
			return TestFail;
		}

		ret = decodeResolution(0, makeWindow(0), makeWindow(720),
				       map.resolutionLayout(), &entry);
		if (ret != -EBADMSG) {
			cerr << "Zero width accepted" << endl;
			return TestFail;
		}

		return TestPass;
	}

	int testControls(const SensorRegisterMap &map)
	{
		const ControlLayout layout = map.controlLayout();
		ControlDescriptor control;

		int ret = decodeControl(makeWindow(0x981906), makeWindow(1),
					makeWindow(90), makeWindow(90), layout,
					&control);
		if (ret || control.id != 0x981906 || control.name != "Framerate" ||
		    control.min != 1 || control.max != 90 || control.def != 90) {
			cerr << "Failed to decode control" << endl;
			return TestFail;
		}

		ret = decodeControl(makeWindow(0x123456), makeWindow(-10),
				    makeWindow(10), makeWindow(0), layout, &control);
		if (ret || control.name != "Unknown" || control.min != -10) {
			cerr << "Failed to decode unknown control" << endl;
			return TestFail;
		}

		ret = decodeControl(makeWindow(0x980911), makeWindow(100),
				    makeWindow(10), makeWindow(50), layout, &control);
		if (ret != -EBADMSG) {
			cerr << "Control with min > max accepted" << endl;
			return TestFail;
		}

		ret = decodeControl(makeWindow(0x980911), makeWindow(1),
				    makeWindow(10), makeWindow(11), layout, &control);
		if (ret != -EBADMSG) {
			cerr << "Control with out of range default accepted" << endl;
			return TestFail;
		}

		ret = decodeControl(makeWindow(0x01981906), makeWindow(1),
				    makeWindow(10), makeWindow(1), layout, &control);
		if (ret != -EBADMSG) {
			cerr << "Control id wider than 24 bits accepted" << endl;
			return TestFail;
		}

		return TestPass;
	}

	int testFirmwareVersion()
	{
		std::string version;

		uint32_t value = (0x0102 << 16) | (23 << 9) | (5 << 5) | 17;
		int ret = decodeIspFirmwareVersion(makeWindow(value), &version);
		if (ret || version != "v1.02 2023/05/17") {
			cerr << "ISP firmware version decoded as '" << version
			     << "'" << endl;
			return TestFail;
		}

		ret = decodeIspFirmwareVersion(makeWindow(kNoDataAvailable), &version);
		if (ret != -ENODATA) {
			cerr << "Missing ISP firmware version not reported" << endl;
			return TestFail;
		}

		return TestPass;
	}

	int run()
	{
		SensorRegisterMap map;

		if (testWindows() != TestPass)
			return TestFail;

		if (testFields() != TestPass)
			return TestFail;

		if (testIdentity(map) != TestPass)
			return TestFail;

		if (testPixelFormats(map) != TestPass)
			return TestFail;

		if (testResolutions(map) != TestPass)
			return TestFail;

		if (testControls(map) != TestPass)
			return TestFail;

		if (testFirmwareVersion() != TestPass)
			return TestFail;

		return TestPass;
	}
};

TEST_REGISTER(RegisterCodecTest)
