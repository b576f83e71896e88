/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2019, Google Inc.
 * Copyright (C) 2025, Arducam
 *
 * I2C bus access
 */

#pragma once

#include <memory>
#include <stddef.h>
#include <stdint.h>
#include <string>
#include <vector>

#include <arducam/base/class.h>
#include <arducam/base/log.h>
#include <arducam/base/unique_fd.h>

namespace arducam {

class I2CBus
{
public:
	virtual ~I2CBus();

	unsigned int number() const { return number_; }

	virtual int open() = 0;
	virtual bool isOpen() const = 0;
	virtual void close() = 0;

	virtual int read(uint16_t address, const uint8_t *reg, size_t regSize,
			 uint8_t *data, size_t size) = 0;
	virtual int write(uint16_t address, const uint8_t *data, size_t size) = 0;

protected:
	explicit I2CBus(unsigned int number);

private:
	ARDUCAM_DISABLE_COPY_AND_MOVE(I2CBus)

	unsigned int number_;
};

class I2CPlatform
{
public:
	virtual ~I2CPlatform();

	virtual std::vector<unsigned int> buses() = 0;
	virtual std::unique_ptr<I2CBus> bus(unsigned int number) = 0;
};

class I2CDevice : public I2CBus, protected Loggable
{
public:
	explicit I2CDevice(unsigned int number);
	~I2CDevice();

	const std::string &deviceNode() const { return deviceNode_; }

	int open() override;
	bool isOpen() const override { return fd_.isValid(); }
	void close() override;

	int read(uint16_t address, const uint8_t *reg, size_t regSize,
		 uint8_t *data, size_t size) override;
	int write(uint16_t address, const uint8_t *data, size_t size) override;

protected:
	std::string logPrefix() const override;

private:
	int transfer(void *msgs, unsigned int count);

	std::string deviceNode_;
	UniqueFD fd_;
};

class I2CDevicePlatform : public I2CPlatform
{
public:
	std::vector<unsigned int> buses() override;
	std::unique_ptr<I2CBus> bus(unsigned int number) override;
};

} /* namespace arducam */
