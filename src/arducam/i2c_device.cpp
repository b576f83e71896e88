/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2019, Google Inc.
 * Copyright (C) 2025, Arducam
 *
 * I2C bus access
 */

#include "arducam/internal/i2c_device.h"

#include <algorithm>
#include <dirent.h>
#include <errno.h>
#include <fcntl.h>
#include <stdlib.h>
#include <string.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include <linux/i2c-dev.h>
#include <linux/i2c.h>

#include <arducam/base/log.h>

/**
 * \file arducam/internal/i2c_device.h
 * \brief Platform I2C bus primitives
 */

namespace arducam {

LOG_DEFINE_CATEGORY(I2C)

/**
 * \class I2CBus
 * \brief A handle to one I2C bus
 *
 * The I2CBus class is the narrow interface through which the register
 * transport talks to hardware. It only supports addressed transactions: a
 * write of register address bytes followed by a repeated start read, and a
 * plain write of a register address followed by its value.
 *
 * All transaction functions return 0 on success or a negative error code. A
 * device that doesn't acknowledge its address is reported as -ENXIO or
 * -EREMOTEIO, depending on the bus driver.
 */

/**
 * \brief Construct an I2CBus for bus \a number
 * \param[in] number The bus number
 */
I2CBus::I2CBus(unsigned int number)
	: number_(number)
{
}

I2CBus::~I2CBus() = default;

/**
 * \fn I2CBus::number()
 * \brief Retrieve the bus number
 * \return The bus number
 */

/**
 * \fn I2CBus::open()
 * \brief Open the bus
 * \return 0 on success or a negative error code otherwise
 */

/**
 * \fn I2CBus::isOpen()
 * \brief Check if the bus is open
 * \return True if the bus is open, false otherwise
 */

/**
 * \fn I2CBus::close()
 * \brief Close the bus
 */

/**
 * \fn I2CBus::read()
 * \brief Read data from a register of a device
 * \param[in] address The 7-bit device address
 * \param[in] reg The register address bytes, in bus order
 * \param[in] regSize The number of register address bytes
 * \param[out] data The buffer to read to
 * \param[in] size The number of bytes to read
 * \return 0 on success or a negative error code otherwise
 */

/**
 * \fn I2CBus::write()
 * \brief Write data to a device
 * \param[in] address The 7-bit device address
 * \param[in] data The register address bytes followed by the value bytes
 * \param[in] size The number of bytes to write
 * \return 0 on success or a negative error code otherwise
 */

/**
 * \class I2CPlatform
 * \brief The set of I2C buses of a platform
 *
 * \fn I2CPlatform::buses()
 * \brief List the I2C buses, sorted by number
 * \return The bus numbers
 *
 * \fn I2CPlatform::bus()
 * \brief Create a handle to bus \a number
 * \param[in] number The bus number
 *
 * The returned handle is closed.
 *
 * \return The bus handle, or nullptr if the bus doesn't exist
 */

I2CPlatform::~I2CPlatform() = default;

/**
 * \class I2CDevice
 * \brief An I2C bus accessed through the Linux i2c-dev interface
 *
 * Transactions use the I2C_RDWR ioctl, which doesn't require claiming the
 * device address, as sensors are usually bound to a kernel driver.
 */

/**
 * \brief Construct an I2CDevice for /dev/i2c-\a number
 * \param[in] number The bus number
 */
I2CDevice::I2CDevice(unsigned int number)
	: I2CBus(number), deviceNode_("/dev/i2c-" + std::to_string(number))
{
}

I2CDevice::~I2CDevice()
{
	close();
}

int I2CDevice::open()
{
	if (isOpen()) {
		LOG(I2C, Error) << "Device already open";
		return -EBUSY;
	}

	UniqueFD fd(::open(deviceNode_.c_str(), O_RDWR | O_CLOEXEC));
	if (!fd.isValid()) {
		int ret = -errno;
		LOG(I2C, Error) << "Failed to open I2C device '"
				<< deviceNode_ << "': " << strerror(-ret);
		return ret;
	}

	unsigned long funcs;
	if (ioctl(fd.get(), I2C_FUNCS, &funcs) < 0) {
		int ret = -errno;
		LOG(I2C, Error) << "Failed to query adapter functionality: "
				<< strerror(-ret);
		return ret;
	}

	if (!(funcs & I2C_FUNC_I2C)) {
		LOG(I2C, Error) << "Adapter doesn't support plain I2C transfers";
		return -ENOTSUP;
	}

	fd_ = std::move(fd);

	return 0;
}

void I2CDevice::close()
{
	fd_.reset();
}

int I2CDevice::read(uint16_t address, const uint8_t *reg, size_t regSize,
		    uint8_t *data, size_t size)
{
	struct i2c_msg msgs[2] = {};

	msgs[0].addr = address;
	msgs[0].flags = 0;
	msgs[0].len = regSize;
	msgs[0].buf = const_cast<uint8_t *>(reg);

	msgs[1].addr = address;
	msgs[1].flags = I2C_M_RD;
	msgs[1].len = size;
	msgs[1].buf = data;

	return transfer(msgs, 2);
}

int I2CDevice::write(uint16_t address, const uint8_t *data, size_t size)
{
	struct i2c_msg msg = {};

	msg.addr = address;
	msg.flags = 0;
	msg.len = size;
	msg.buf = const_cast<uint8_t *>(data);

	return transfer(&msg, 1);
}

int I2CDevice::transfer(void *msgs, unsigned int count)
{
	if (!isOpen())
		return -EBADF;

	struct i2c_rdwr_ioctl_data data = {};
	data.msgs = static_cast<struct i2c_msg *>(msgs);
	data.nmsgs = count;

	int ret = ioctl(fd_.get(), I2C_RDWR, &data);
	if (ret < 0) {
		ret = -errno;
		LOG(I2C, Debug) << "Transfer failed: " << strerror(-ret);
		return ret;
	}

	/* The ioctl returns the number of messages transferred. */
	if (static_cast<unsigned int>(ret) != count) {
		LOG(I2C, Debug) << "Short transfer: " << ret << "/" << count;
		return -EIO;
	}

	return 0;
}

std::string I2CDevice::logPrefix() const
{
	return "i2c-" + std::to_string(number());
}

/**
 * \class I2CDevicePlatform
 * \brief The I2C buses exposed by the Linux i2c-dev driver
 *
 * Buses are listed from /sys/class/i2c-dev, with a fallback on the /dev/i2c-*
 * device nodes when sysfs isn't available.
 */

namespace {

int listBuses(const char *dirname, const char *prefix,
	      std::vector<unsigned int> *buses)
{
	DIR *dir = opendir(dirname);
	if (!dir)
		return -errno;

	size_t prefixLen = strlen(prefix);
	struct dirent *ent;

	while ((ent = readdir(dir)) != nullptr) {
		if (strncmp(ent->d_name, prefix, prefixLen))
			continue;

		const char *number = ent->d_name + prefixLen;
		if (*number == '\0')
			continue;

		char *end;
		unsigned long idx = strtoul(number, &end, 10);
		if (*end != '\0')
			continue;

		buses->push_back(idx);
	}

	closedir(dir);

	return 0;
}

} /* namespace */

std::vector<unsigned int> I2CDevicePlatform::buses()
{
	std::vector<unsigned int> buses;

	int ret = listBuses("/sys/class/i2c-dev", "i2c-", &buses);
	if (ret < 0) {
		LOG(I2C, Debug) << "No sysfs i2c-dev class, scanning /dev";
		buses.clear();
		ret = listBuses("/dev", "i2c-", &buses);
		if (ret < 0)
			LOG(I2C, Warning) << "Failed to list I2C buses: "
					  << strerror(-ret);
	}

	std::sort(buses.begin(), buses.end());
	buses.erase(std::unique(buses.begin(), buses.end()), buses.end());

	return buses;
}

std::unique_ptr<I2CBus> I2CDevicePlatform::bus(unsigned int number)
{
	std::string node = "/dev/i2c-" + std::to_string(number);
	if (access(node.c_str(), F_OK) < 0)
		return nullptr;

	return std::make_unique<I2CDevice>(number);
}

} /* namespace arducam */
