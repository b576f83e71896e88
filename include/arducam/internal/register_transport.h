/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2025, Arducam
 *
 * Sensor register access over I2C
 */

#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <stdint.h>
#include <vector>

#include <arducam/base/class.h>

namespace arducam {

class I2CBus;
class I2CPlatform;

struct RegisterAddress {
	uint16_t address;
	unsigned int width;
};

class RegisterTransport
{
public:
	static constexpr uint16_t kDefaultDeviceAddress = 0x0c;
	static constexpr unsigned int kDefaultRetries = 3;
	static constexpr std::chrono::microseconds kDefaultRetryDelay{ 1000 };

	RegisterTransport(I2CPlatform *platform,
			  uint16_t deviceAddress = kDefaultDeviceAddress);
	~RegisterTransport();

	uint16_t deviceAddress() const { return deviceAddress_; }
	void setRetryPolicy(unsigned int retries,
			    std::chrono::microseconds delay);

	int read(unsigned int bus, const RegisterAddress &reg,
		 std::vector<uint8_t> *data);
	int write(unsigned int bus, const RegisterAddress &reg, uint32_t value);

	int readValue(unsigned int bus, const RegisterAddress &reg,
		      uint32_t *value);

private:
	ARDUCAM_DISABLE_COPY_AND_MOVE(RegisterTransport)

	int openBus(unsigned int number, I2CBus **bus);
	template<typename Func>
	int transaction(unsigned int bus, const RegisterAddress &reg,
			Func &&func);

	I2CPlatform *platform_;
	uint16_t deviceAddress_;
	unsigned int retries_;
	std::chrono::microseconds retryDelay_;

	std::map<unsigned int, std::unique_ptr<I2CBus>> buses_;
};

} /* namespace arducam */
