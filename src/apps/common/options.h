/* SPDX-License-Identifier: GPL-2.0-or-later */
/*
 * Copyright (C) 2019, Google Inc.
 * Copyright (C) 2025, Arducam
 *
 * Command line option parsing
 */

#pragma once

#include <map>
#include <string>
#include <vector>

enum OptionArgument {
	ArgumentNone,
	ArgumentRequired,
	ArgumentOptional,
};

enum OptionType {
	OptionNone,
	OptionInteger,
	OptionString,
};

class OptionValue
{
public:
	OptionValue();
	explicit OptionValue(int value);
	explicit OptionValue(const std::string &value);

	bool empty() const { return type_ == OptionNone; }

	operator std::string() const { return toString(); }

	int toInteger() const;
	std::string toString() const;

private:
	OptionType type_;
	int integer_;
	std::string string_;
};

class OptionsParser
{
public:
	class Options
	{
	public:
		bool valid() const { return valid_; }
		bool isSet(int opt) const { return values_.count(opt) != 0; }
		const OptionValue &operator[](int opt) const;

	private:
		friend class OptionsParser;

		std::map<int, OptionValue> values_;
		bool valid_ = false;
	};

	bool addOption(int opt, OptionType type, const char *help,
		       const char *name = nullptr,
		       OptionArgument argument = ArgumentNone,
		       const char *argumentName = nullptr);

	Options parse(int argc, char *argv[]);
	void usage() const;

private:
	struct Option {
		int opt;
		OptionType type;
		std::string name;
		OptionArgument argument;
		std::string argumentName;
		std::string help;

		std::string spelling() const;
	};

	const Option *find(int opt) const;

	std::vector<Option> options_;
};
