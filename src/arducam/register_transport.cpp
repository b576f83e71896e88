/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2025, Arducam
 *
 * Sensor register access over I2C
 */

#include "arducam/internal/register_transport.h"

#include <algorithm>
#include <errno.h>
#include <string.h>
#include <thread>

#include <arducam/base/log.h>
#include <arducam/base/utils.h>

#include "arducam/internal/i2c_device.h"

/**
 * \file arducam/internal/register_transport.h
 * \brief Addressed register reads and writes over an I2C bus
 */

namespace arducam {

LOG_DEFINE_CATEGORY(Transport)

namespace {

bool validWidth(unsigned int width)
{
	return width == 1 || width == 2 || width == 4;
}

} /* namespace */

/**
 * \struct RegisterAddress
 * \brief The location of a register on the sensor register map
 *
 * \var RegisterAddress::address
 * \brief The 16-bit register address
 *
 * \var RegisterAddress::width
 * \brief The register value width in bytes, 1, 2 or 4
 */

/**
 * \class RegisterTransport
 * \brief Read and write sensor registers through an I2CPlatform
 *
 * Register addresses are sent as two big-endian bytes, and register values
 * are transferred big-endian on \a width bytes.
 *
 * Transient failures (-EAGAIN, -ETIMEDOUT and -EIO) are retried a bounded
 * number of times with a backoff that doubles after each attempt. When the
 * retry budget is exhausted the transaction fails with -ETIMEDOUT. A device
 * that doesn't acknowledge its address is never retried and is reported as
 * -ENXIO. A bus that can't be opened is reported as -ENODEV.
 *
 * Bus handles are opened on first use and kept open for the lifetime of the
 * transport.
 */

/**
 * \brief Construct a RegisterTransport
 * \param[in] platform The I2C platform
 * \param[in] deviceAddress The 7-bit I2C address of the sensor
 */
RegisterTransport::RegisterTransport(I2CPlatform *platform,
				     uint16_t deviceAddress)
	: platform_(platform), deviceAddress_(deviceAddress),
	  retries_(kDefaultRetries), retryDelay_(kDefaultRetryDelay)
{
}

RegisterTransport::~RegisterTransport()
{
	for (auto &[number, bus] : buses_)
		bus->close();
}

/**
 * \fn RegisterTransport::deviceAddress()
 * \brief Retrieve the I2C address of the sensor
 * \return The 7-bit device address
 */

/**
 * \brief Set the retry policy for transient failures
 * \param[in] retries The maximum number of attempts, at least 1
 * \param[in] delay The delay before the first retry
 */
void RegisterTransport::setRetryPolicy(unsigned int retries,
				       std::chrono::microseconds delay)
{
	retries_ = std::max(retries, 1U);
	retryDelay_ = delay;
}

int RegisterTransport::openBus(unsigned int number, I2CBus **bus)
{
	auto iter = buses_.find(number);
	if (iter != buses_.end()) {
		*bus = iter->second.get();
		return 0;
	}

	std::unique_ptr<I2CBus> handle = platform_->bus(number);
	if (!handle) {
		LOG(Transport, Error) << "I2C bus " << number << " doesn't exist";
		return -ENODEV;
	}

	int ret = handle->open();
	if (ret < 0) {
		LOG(Transport, Error)
			<< "Failed to open I2C bus " << number << ": "
			<< strerror(-ret);
		return -ENODEV;
	}

	*bus = handle.get();
	buses_[number] = std::move(handle);

	return 0;
}

template<typename Func>
int RegisterTransport::transaction(unsigned int bus, const RegisterAddress &reg,
				   Func &&func)
{
	if (!validWidth(reg.width)) {
		LOG(Transport, Error)
			<< "Invalid width " << reg.width << " for register "
			<< utils::hex(reg.address);
		return -EINVAL;
	}

	I2CBus *handle;
	int ret = openBus(bus, &handle);
	if (ret)
		return ret;

	std::chrono::microseconds delay = retryDelay_;

	for (unsigned int attempt = 1; attempt <= retries_; ++attempt) {
		ret = func(handle);
		switch (ret) {
		case 0:
			return 0;

		case -ENXIO:
		case -EREMOTEIO:
			LOG(Transport, Debug)
				<< "i2c-" << bus << ": no acknowledge from "
				<< utils::hex(deviceAddress_, 2);
			return -ENXIO;

		case -EAGAIN:
		case -ETIMEDOUT:
		case -EIO:
			LOG(Transport, Debug)
				<< "i2c-" << bus << ": register "
				<< utils::hex(reg.address) << " attempt "
				<< attempt << "/" << retries_ << " failed: "
				<< strerror(-ret);
			break;

		default:
			LOG(Transport, Error)
				<< "i2c-" << bus << ": register "
				<< utils::hex(reg.address) << " access failed: "
				<< strerror(-ret);
			return ret;
		}

		if (attempt < retries_) {
			std::this_thread::sleep_for(delay);
			delay *= 2;
		}
	}

	LOG(Transport, Error)
		<< "i2c-" << bus << ": register " << utils::hex(reg.address)
		<< " timed out after " << retries_ << " attempts";

	return -ETIMEDOUT;
}

/**
 * \brief Read a register
 * \param[in] bus The I2C bus number
 * \param[in] reg The register to read
 * \param[out] data The register value bytes, big-endian, \a reg.width long
 * \return 0 on success or a negative error code otherwise
 * \retval -EINVAL The register width is invalid
 * \retval -ENODEV The bus can't be opened
 * \retval -ENXIO The device didn't acknowledge
 * \retval -ETIMEDOUT The retry budget has been exhausted
 */
int RegisterTransport::read(unsigned int bus, const RegisterAddress &reg,
			    std::vector<uint8_t> *data)
{
	const uint8_t address[2] = {
		static_cast<uint8_t>(reg.address >> 8),
		static_cast<uint8_t>(reg.address),
	};
	std::vector<uint8_t> buffer(reg.width);

	int ret = transaction(bus, reg, [&](I2CBus *handle) {
		return handle->read(deviceAddress_, address, sizeof(address),
				    buffer.data(), buffer.size());
	});
	if (ret)
		return ret;

	*data = std::move(buffer);

	return 0;
}

/**
 * \brief Write a register
 * \param[in] bus The I2C bus number
 * \param[in] reg The register to write
 * \param[in] value The value to write, which must fit in \a reg.width bytes
 * \return 0 on success or a negative error code otherwise
 * \retval -EINVAL The register width is invalid or the value doesn't fit
 * \retval -ENODEV The bus can't be opened
 * \retval -ENXIO The device didn't acknowledge
 * \retval -ETIMEDOUT The retry budget has been exhausted
 */
int RegisterTransport::write(unsigned int bus, const RegisterAddress &reg,
			     uint32_t value)
{
	if (!validWidth(reg.width)) {
		LOG(Transport, Error)
			<< "Invalid width " << reg.width << " for register "
			<< utils::hex(reg.address);
		return -EINVAL;
	}

	if (reg.width < 4 && value >> (reg.width * 8)) {
		LOG(Transport, Error)
			<< "Value " << utils::hex(value) << " doesn't fit in "
			<< reg.width << " byte(s)";
		return -EINVAL;
	}

	std::vector<uint8_t> buffer;
	buffer.push_back(reg.address >> 8);
	buffer.push_back(reg.address & 0xff);
	for (unsigned int i = reg.width; i > 0; --i)
		buffer.push_back((value >> ((i - 1) * 8)) & 0xff);

	return transaction(bus, reg, [&](I2CBus *handle) {
		return handle->write(deviceAddress_, buffer.data(), buffer.size());
	});
}

/**
 * \brief Read a register as a big-endian unsigned value
 * \param[in] bus The I2C bus number
 * \param[in] reg The register to read
 * \param[out] value The register value
 * \return 0 on success or a negative error code otherwise, see read()
 */
int RegisterTransport::readValue(unsigned int bus, const RegisterAddress &reg,
				 uint32_t *value)
{
	std::vector<uint8_t> data;

	int ret = read(bus, reg, &data);
	if (ret)
		return ret;

	uint32_t result = 0;
	for (uint8_t byte : data)
		result = (result << 8) | byte;

	*value = result;

	return 0;
}

} /* namespace arducam */
