/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2025, Arducam
 *
 * Sensor register protocol decoder
 */

#include "arducam/internal/sensor_decoder.h"

#include <errno.h>
#include <set>
#include <string.h>
#include <thread>

#include <arducam/base/log.h>
#include <arducam/base/utils.h>

#include "arducam/internal/register_transport.h"

/**
 * \file arducam/internal/sensor_decoder.h
 * \brief Decode the sensor identity and capability tables
 */

namespace arducam {

LOG_DEFINE_CATEGORY(SensorDecoder)

/**
 * \class SensorDecoder
 * \brief Read and decode the register tables of a sensor
 *
 * The sensor firmware exposes its capabilities through indexed tables. An
 * entry is selected by writing its index to the table index register, and its
 * fields are then read from the table data registers. Reading the index back
 * confirms the selection, and reads kNoDataAvailable past the end of the
 * table. The control table is terminated by kNoDataAvailable in the control
 * id register instead.
 *
 * The decoder doesn't cache anything, every call reads the registers again.
 * All functions return 0 on success or a negative error code. Transport
 * errors are propagated unchanged, and register contents that violate the
 * register map are reported as -EBADMSG.
 */

/**
 * \struct SensorDecoder::Limits
 * \brief Upper bounds on the size of the firmware tables
 *
 * Tables larger than their bound are considered corrupted.
 */

/**
 * \brief Construct a SensorDecoder
 * \param[in] transport The register transport
 * \param[in] registerMap The register map of the sensor family
 */
SensorDecoder::SensorDecoder(RegisterTransport *transport,
			     const SensorRegisterMap &registerMap)
	: transport_(transport), map_(registerMap), idlePolls_(50),
	  idleInterval_(1000)
{
}

/**
 * \fn SensorDecoder::registerMap()
 * \brief Retrieve the register map used by the decoder
 * \return The register map
 */

/**
 * \brief Retrieve the I2C address of the sensors handled by the decoder
 * \return The 7-bit device address
 */
uint16_t SensorDecoder::deviceAddress() const
{
	return transport_->deviceAddress();
}

/**
 * \brief Set the polling parameters of waitForIdle()
 * \param[in] polls The maximum number of reads of the system idle register
 * \param[in] interval The delay between two reads
 */
void SensorDecoder::setIdlePolling(unsigned int polls,
				   std::chrono::microseconds interval)
{
	idlePolls_ = polls;
	idleInterval_ = interval;
}

int SensorDecoder::readWindow(unsigned int bus, SensorRegisterMap::Register reg,
			      RegisterWindow *window)
{
	std::vector<uint8_t> data;

	int ret = transport_->read(bus, map_.address(reg), &data);
	if (ret)
		return ret;

	return makeWindow(data, window);
}

int SensorDecoder::readValue(unsigned int bus, SensorRegisterMap::Register reg,
			     uint32_t *value)
{
	return transport_->readValue(bus, map_.address(reg), value);
}

int SensorDecoder::writeValue(unsigned int bus, SensorRegisterMap::Register reg,
			      uint32_t value)
{
	return transport_->write(bus, map_.address(reg), value);
}

int SensorDecoder::selectIndex(unsigned int bus, SensorRegisterMap::Register reg,
			       uint32_t index, bool *end)
{
	int ret = writeValue(bus, reg, index);
	if (ret)
		return ret;

	RegisterWindow window;
	ret = readWindow(bus, reg, &window);
	if (ret)
		return ret;

	if (isNoData(window)) {
		*end = true;
		return 0;
	}

	uint32_t value;
	ret = decodeField(window, map_.layout(reg), &value);
	if (ret)
		return ret;

	if (value != index) {
		LOG(SensorDecoder, Error)
			<< SensorRegisterMap::registerKey(reg) << " reads back "
			<< value << " instead of " << index;
		return -EBADMSG;
	}

	*end = false;

	return 0;
}

int SensorDecoder::selectControl(unsigned int bus, uint32_t index,
				 RegisterWindow *id, bool *end)
{
	int ret = writeValue(bus, SensorRegisterMap::ControlIndex, index);
	if (ret)
		return ret;

	ret = readWindow(bus, SensorRegisterMap::ControlId, id);
	if (ret)
		return ret;

	*end = isNoData(*id);

	return 0;
}

/**
 * \brief Probe a bus for a sensor and read its identity
 * \param[in] bus The I2C bus number
 * \param[out] identity The sensor identity, or std::nullopt if no sensor
 * acknowledged its address
 *
 * A sensor that doesn't acknowledge the first read is reported as absent,
 * which isn't an error.
 *
 * \return 0 on success or a negative error code otherwise
 */
int SensorDecoder::probeIdentity(unsigned int bus,
				 std::optional<SensorIdentity> *identity)
{
	RegisterWindow deviceId, deviceVersion, sensorId;

	int ret = readWindow(bus, SensorRegisterMap::DeviceId, &deviceId);
	if (ret == -ENXIO) {
		LOG(SensorDecoder, Debug) << "No sensor on i2c-" << bus;
		*identity = std::nullopt;
		return 0;
	}
	if (ret)
		return ret;

	ret = readWindow(bus, SensorRegisterMap::DeviceVersion, &deviceVersion);
	if (ret)
		return ret;

	ret = readWindow(bus, SensorRegisterMap::FirmwareSensorId, &sensorId);
	if (ret)
		return ret;

	SensorIdentity result;
	ret = decodeIdentity(deviceId, deviceVersion, sensorId,
			     map_.identityLayout(), &result);
	if (ret)
		return ret;

	LOG(SensorDecoder, Debug) << "Found " << result << " on i2c-" << bus;

	*identity = result;

	return 0;
}

/**
 * \brief List the pixel formats supported by a sensor
 * \param[in] bus The I2C bus number
 * \param[out] formats The pixel formats, in table order
 *
 * The pixel format index is reset to the first entry when the table has been
 * walked.
 *
 * \return 0 on success or a negative error code otherwise
 */
int SensorDecoder::listPixelFormats(unsigned int bus,
				    std::vector<PixelFormatDescriptor> *formats)
{
	const PixelFormatLayout layout = map_.pixelFormatLayout();
	std::vector<PixelFormatDescriptor> result;
	int ret;

	for (uint32_t index = 0;; ++index) {
		bool end;
		ret = selectIndex(bus, SensorRegisterMap::PixFormatIndex, index, &end);
		if (ret)
			return ret;
		if (end)
			break;

		if (index >= limits_.maxFormats) {
			LOG(SensorDecoder, Error)
				<< "Pixel format table exceeds "
				<< limits_.maxFormats << " entries";
			return -EBADMSG;
		}

		RegisterWindow type, order, lanes;

		ret = readWindow(bus, SensorRegisterMap::PixFormatType, &type);
		if (ret)
			return ret;

		ret = readWindow(bus, SensorRegisterMap::PixFormatOrder, &order);
		if (ret)
			return ret;

		ret = readWindow(bus, SensorRegisterMap::MipiLanes, &lanes);
		if (ret)
			return ret;

		PixelFormatDescriptor format;
		ret = decodePixelFormat(type, order, lanes, layout, &format);
		if (ret)
			return ret;

		result.push_back(format);
	}

	ret = writeValue(bus, SensorRegisterMap::PixFormatIndex, 0);
	if (ret)
		return ret;

	*formats = std::move(result);

	return 0;
}

int SensorDecoder::readFrameIntervals(unsigned int bus,
				      std::vector<FrameInterval> *intervals)
{
	intervals->clear();

	for (uint32_t index = 0;; ++index) {
		RegisterWindow idWindow;
		bool end;

		int ret = selectControl(bus, index, &idWindow, &end);
		if (ret)
			return ret;
		if (end)
			return 0;

		if (index >= limits_.maxControls) {
			LOG(SensorDecoder, Error)
				<< "Control table exceeds "
				<< limits_.maxControls << " entries";
			return -EBADMSG;
		}

		uint32_t id;
		ret = decodeField(idWindow, map_.layout(SensorRegisterMap::ControlId), &id);
		if (ret)
			return ret;

		if (id != kFramerateControl)
			continue;

		RegisterWindow maxWindow;
		ret = readWindow(bus, SensorRegisterMap::ControlMax, &maxWindow);
		if (ret)
			return ret;

		int32_t maxFps;
		ret = decodeSigned(maxWindow, map_.layout(SensorRegisterMap::ControlMax),
				   &maxFps);
		if (ret)
			return ret;

		if (maxFps <= 0) {
			LOG(SensorDecoder, Warning)
				<< "Ignoring invalid maximum frame rate " << maxFps;
			return 0;
		}

		intervals->push_back({ 1, static_cast<uint32_t>(maxFps) });
		return 0;
	}
}

/**
 * \brief List the resolutions supported by a sensor for a pixel format
 * \param[in] bus The I2C bus number
 * \param[in] formatIndex The index of the pixel format in the format table
 * \param[out] resolutions The resolutions, in table order
 *
 * Resolution indices are the positions of the entries in the firmware table,
 * the entries are never sorted. The frame interval of each resolution is
 * derived from the maximum value of the frame rate control while the
 * resolution is selected. Resolutions have no frame interval when the sensor
 * has no frame rate control.
 *
 * \return 0 on success or a negative error code otherwise
 * \retval -EINVAL The sensor doesn't declare \a formatIndex
 */
int SensorDecoder::listResolutions(unsigned int bus, unsigned int formatIndex,
				   std::vector<ResolutionDescriptor> *resolutions)
{
	const ResolutionLayout layout = map_.resolutionLayout();
	std::vector<ResolutionDescriptor> result;
	bool end;

	int ret = selectIndex(bus, SensorRegisterMap::PixFormatIndex,
			      formatIndex, &end);
	if (ret)
		return ret;

	if (end) {
		LOG(SensorDecoder, Error)
			<< "Pixel format " << formatIndex << " isn't declared";
		return -EINVAL;
	}

	for (uint32_t index = 0;; ++index) {
		ret = selectIndex(bus, SensorRegisterMap::ResolutionIndex, index, &end);
		if (ret)
			return ret;
		if (end)
			break;

		if (index >= limits_.maxResolutions) {
			LOG(SensorDecoder, Error)
				<< "Resolution table exceeds "
				<< limits_.maxResolutions << " entries";
			return -EBADMSG;
		}

		RegisterWindow width, height;

		ret = readWindow(bus, SensorRegisterMap::ResolutionWidth, &width);
		if (ret)
			return ret;

		ret = readWindow(bus, SensorRegisterMap::ResolutionHeight, &height);
		if (ret)
			return ret;

		ResolutionDescriptor resolution;
		ret = decodeResolution(index, width, height, layout,
				       &resolution.entry);
		if (ret)
			return ret;

		ret = readFrameIntervals(bus, &resolution.intervals);
		if (ret)
			return ret;

		result.push_back(std::move(resolution));
	}

	*resolutions = std::move(result);

	return 0;
}

/**
 * \brief List the controls exposed by a sensor
 * \param[in] bus The I2C bus number
 * \param[out] controls The controls, in table order
 *
 * The firmware is given time to settle with waitForIdle() before the control
 * table is read. Control ids must be unique.
 *
 * \return 0 on success or a negative error code otherwise
 */
int SensorDecoder::listControls(unsigned int bus,
				std::vector<ControlDescriptor> *controls)
{
	const ControlLayout layout = map_.controlLayout();
	std::vector<ControlDescriptor> result;
	std::set<uint32_t> ids;

	int ret = waitForIdle(bus);
	if (ret)
		return ret;

	for (uint32_t index = 0;; ++index) {
		RegisterWindow id, min, max, def;
		bool end;

		ret = selectControl(bus, index, &id, &end);
		if (ret)
			return ret;
		if (end)
			break;

		if (index >= limits_.maxControls) {
			LOG(SensorDecoder, Error)
				<< "Control table exceeds "
				<< limits_.maxControls << " entries";
			return -EBADMSG;
		}

		ret = readWindow(bus, SensorRegisterMap::ControlMin, &min);
		if (ret)
			return ret;

		ret = readWindow(bus, SensorRegisterMap::ControlMax, &max);
		if (ret)
			return ret;

		ret = readWindow(bus, SensorRegisterMap::ControlDefault, &def);
		if (ret)
			return ret;

		ControlDescriptor control;
		ret = decodeControl(id, min, max, def, layout, &control);
		if (ret)
			return ret;

		if (!ids.insert(control.id).second) {
			LOG(SensorDecoder, Error)
				<< "Duplicate control " << utils::hex(control.id, 6);
			return -EBADMSG;
		}

		result.push_back(std::move(control));
	}

	*controls = std::move(result);

	return 0;
}

/**
 * \brief Read the firmware versions of a sensor module
 * \param[in] bus The I2C bus number
 * \param[out] info The firmware versions
 *
 * The software version string is read one character at a time. A missing
 * length, or a length larger than 255, means that the firmware doesn't
 * report a software version. Characters outside of the 8-bit range are
 * skipped.
 *
 * \return 0 on success or a negative error code otherwise
 */
int SensorDecoder::readFirmwareInfo(unsigned int bus, FirmwareInfo *info)
{
	FirmwareInfo result;
	RegisterWindow window;

	int ret = readWindow(bus, SensorRegisterMap::UniqueId, &window);
	if (ret)
		return ret;

	std::string version;
	ret = decodeIspFirmwareVersion(window, &version);
	if (!ret)
		result.ispVersion = version;
	else if (ret != -ENODATA)
		return ret;

	uint32_t length;
	ret = readValue(bus, SensorRegisterMap::SoftVersionLength, &length);
	if (ret)
		return ret;

	if (length != kNoDataAvailable && length <= 255) {
		std::string software;

		for (uint32_t i = 0; i < length; ++i) {
			ret = writeValue(bus, SensorRegisterMap::SoftVersionIndex, i);
			if (ret)
				return ret;

			uint32_t ch;
			ret = readValue(bus, SensorRegisterMap::SoftVersion, &ch);
			if (ret)
				return ret;

			if (ch > 255)
				continue;

			software += static_cast<char>(ch);
		}

		result.softwareVersion = software;
	}

	*info = std::move(result);

	return 0;
}

/**
 * \brief Wait for the sensor firmware to report idle
 * \param[in] bus The I2C bus number
 *
 * The system idle register reads 1 when the firmware is idle. Firmware
 * versions that don't implement the register are considered idle.
 *
 * \return 0 on success or a negative error code otherwise
 * \retval -ETIMEDOUT The firmware didn't become idle in time
 */
int SensorDecoder::waitForIdle(unsigned int bus)
{
	for (unsigned int poll = 0; poll < idlePolls_; ++poll) {
		uint32_t idle;

		int ret = readValue(bus, SensorRegisterMap::SystemIdle, &idle);
		if (ret)
			return ret;

		if (idle == 1 || idle == kNoDataAvailable)
			return 0;

		std::this_thread::sleep_for(idleInterval_);
	}

	LOG(SensorDecoder, Error) << "Sensor on i2c-" << bus << " is busy";

	return -ETIMEDOUT;
}

} /* namespace arducam */
