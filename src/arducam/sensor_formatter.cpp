/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2025, Arducam
 *
 * Sensor descriptor listings
 */

#include "arducam/internal/sensor_formatter.h"

#include <errno.h>
#include <iomanip>
#include <sstream>

#include <arducam/base/log.h>

#include "arducam/internal/sensor_decoder.h"

/**
 * \file arducam/internal/sensor_formatter.h
 * \brief Render decoded sensor descriptors
 */

namespace arducam {

namespace {

struct upperHex {
	uint32_t value;
	unsigned int width;
};

std::ostream &operator<<(std::ostream &out, const upperHex &h)
{
	std::ios_base::fmtflags flags = out.flags();
	char fill = out.fill('0');

	out << "0x" << std::uppercase << std::hex << std::setw(h.width)
	    << h.value;

	out.fill(fill);
	out.flags(flags);

	return out;
}

} /* namespace */

/**
 * \struct SensorReport
 * \brief The decoded descriptors of one sensor
 *
 * The resolutions member holds one list of resolutions per pixel format, in
 * the order of the formats member.
 */

/**
 * \class SensorFormatter
 * \brief Render sensor descriptors as diagnostic or V4L2 style listings
 *
 * The formatter only reads decoded descriptors. collect() decodes all the
 * tables required by a rendering mode beforehand, so that a decoding failure
 * never results in a truncated listing.
 */

/**
 * \enum SensorFormatter::Mode
 * \brief The rendering modes
 * \var SensorFormatter::Mode::Diagnostic
 * \brief Identity, formats, resolutions and controls, one item per line
 * \var SensorFormatter::Mode::ListFormats
 * \brief The pixel formats, as listed by v4l2-ctl --list-formats
 * \var SensorFormatter::Mode::ListFormatsExt
 * \brief The pixel formats with their sizes and frame intervals, as listed by
 * v4l2-ctl --list-formats-ext
 */

/**
 * \brief Decode the tables required to render a sensor
 * \param[in] decoder The sensor decoder
 * \param[in] bus The I2C bus number
 * \param[in] mode The rendering mode
 * \param[in] firmware Read the firmware versions in diagnostic mode
 * \param[out] report The decoded descriptors
 * \return 0 on success or a negative error code otherwise
 * \retval -ENODEV No sensor answered on \a bus
 */
int SensorFormatter::collect(SensorDecoder *decoder, unsigned int bus,
			     Mode mode, bool firmware, SensorReport *report)
{
	SensorReport result;
	std::optional<SensorIdentity> identity;

	int ret = decoder->probeIdentity(bus, &identity);
	if (ret)
		return ret;

	if (!identity)
		return -ENODEV;

	result.identity = *identity;

	if (mode == Mode::Diagnostic && firmware) {
		FirmwareInfo info;
		ret = decoder->readFirmwareInfo(bus, &info);
		if (ret)
			return ret;

		result.firmware = info;
	}

	ret = decoder->listPixelFormats(bus, &result.formats);
	if (ret)
		return ret;

	if (mode != Mode::ListFormats) {
		for (unsigned int i = 0; i < result.formats.size(); ++i) {
			std::vector<ResolutionDescriptor> resolutions;

			ret = decoder->listResolutions(bus, i, &resolutions);
			if (ret)
				return ret;

			result.resolutions.push_back(std::move(resolutions));
		}
	}

	if (mode == Mode::Diagnostic) {
		ret = decoder->listControls(bus, &result.controls);
		if (ret)
			return ret;
	}

	*report = std::move(result);

	return 0;
}

/**
 * \brief Render a sensor report
 * \param[in] out The output stream
 * \param[in] mode The rendering mode
 * \param[in] report The sensor report
 */
void SensorFormatter::render(std::ostream &out, Mode mode,
			     const SensorReport &report)
{
	switch (mode) {
	case Mode::Diagnostic:
		diagnostic(out, report);
		break;
	case Mode::ListFormats:
		listFormats(out, report, false);
		break;
	case Mode::ListFormatsExt:
		listFormats(out, report, true);
		break;
	}
}

/**
 * \brief Render a sensor report as a diagnostic listing
 * \param[in] out The output stream
 * \param[in] report The sensor report
 *
 * \code{.unparsed}
 * Device ID: 0x30
 * Device Version: 0x10
 * Sensor ID: 0xA56
 * PixelFormat Type: YUV422_8BIT, Order: UYVY, Lanes: 4
 * index: 0, 3840x2160
 * ID: 0x981906, control_name: Framerate MAX: 90, MIN: 1, DEF: 90
 * \endcode
 */
void SensorFormatter::diagnostic(std::ostream &out, const SensorReport &report)
{
	const SensorIdentity &identity = report.identity;

	out << "Device ID: " << upperHex{ identity.deviceId, 2 } << std::endl;
	out << "Device Version: " << upperHex{ identity.deviceVersion, 2 } << std::endl;
	out << "Sensor ID: " << upperHex{ identity.sensorId, 2 } << std::endl;

	if (report.firmware) {
		const FirmwareInfo &firmware = *report.firmware;

		out << "ISP FW Version: "
		    << firmware.ispVersion.value_or("None") << std::endl;
		out << "Software FW Version: "
		    << firmware.softwareVersion.value_or("None") << std::endl;
	}

	for (unsigned int i = 0; i < report.formats.size(); ++i) {
		const PixelFormatDescriptor &format = report.formats[i];

		out << "PixelFormat Type: " << pixelFormatTypeName(format.type);
		if (format.order != PixelOrder::None)
			out << ", Order: " << pixelOrderName(format.order);
		out << ", Lanes: " << format.lanes << std::endl;

		if (i >= report.resolutions.size())
			continue;

		for (const ResolutionDescriptor &resolution : report.resolutions[i])
			out << "index: " << resolution.entry.index << ", "
			    << resolution.entry.size << std::endl;
	}

	for (const ControlDescriptor &control : report.controls)
		out << "ID: " << upperHex{ control.id, 6 }
		    << ", control_name: " << control.name
		    << " MAX: " << control.max
		    << ", MIN: " << control.min
		    << ", DEF: " << control.def << std::endl;
}

/**
 * \brief Render a sensor report as a V4L2 style format listing
 * \param[in] out The output stream
 * \param[in] report The sensor report
 * \param[in] extended List the sizes and frame intervals of each format
 */
void SensorFormatter::listFormats(std::ostream &out, const SensorReport &report,
				  bool extended)
{
	out << "ioctl: VIDIOC_ENUM_FMT" << std::endl;
	out << "\tType: Video Capture" << std::endl;
	out << std::endl;

	for (unsigned int i = 0; i < report.formats.size(); ++i) {
		const PixelFormatDescriptor &format = report.formats[i];

		out << "\t[" << i << "]: '" << format.fourcc() << "' ("
		    << pixelFormatTypeName(format.type) << ")" << std::endl;

		if (!extended || i >= report.resolutions.size())
			continue;

		for (const ResolutionDescriptor &resolution : report.resolutions[i]) {
			out << "\t\tSize: Discrete " << resolution.entry.size
			    << std::endl;

			for (const FrameInterval &interval : resolution.intervals)
				out << "\t\t\tInterval: Discrete "
				    << intervalToString(interval) << std::endl;
		}
	}
}

/**
 * \brief Render a frame interval as in V4L2 style listings
 * \param[in] interval The frame interval
 *
 * The interval is rendered as "<seconds>s (<fps> fps)".
 *
 * The seconds field is numerator / (2 * denominator), half of the frame
 * period, printed with three decimals. A 1/15 interval thus reads
 * "0.033s (15 fps)" and not "0.067s", as in the listings of the vendor tools.
 * The frame rate is the actual rate, printed as an integer when whole, and
 * with three decimals otherwise.
 *
 * \return The frame interval string
 */
std::string SensorFormatter::intervalToString(const FrameInterval &interval)
{
	std::ostringstream ss;

	double seconds = static_cast<double>(interval.numerator) /
			 (2.0 * interval.denominator);
	ss << std::fixed << std::setprecision(3) << seconds << "s (";

	if (interval.denominator % interval.numerator == 0) {
		ss << interval.denominator / interval.numerator;
	} else {
		double fps = static_cast<double>(interval.denominator) /
			     interval.numerator;
		ss << fps;
	}

	ss << " fps)";

	return ss.str();
}

} /* namespace arducam */
