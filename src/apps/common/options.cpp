/* SPDX-License-Identifier: GPL-2.0-or-later */
/*
 * Copyright (C) 2019, Google Inc.
 * Copyright (C) 2025, Arducam
 *
 * Command line option parsing
 */

#include "options.h"

#include <algorithm>
#include <ctype.h>
#include <getopt.h>
#include <iomanip>
#include <iostream>
#include <limits.h>

#include <arducam/base/utils.h>

using namespace arducam;

OptionValue::OptionValue()
	: type_(OptionNone), integer_(0)
{
}

OptionValue::OptionValue(int value)
	: type_(OptionInteger), integer_(value)
{
}

OptionValue::OptionValue(const std::string &value)
	: type_(OptionString), integer_(0), string_(value)
{
}

int OptionValue::toInteger() const
{
	return type_ == OptionInteger ? integer_ : 0;
}

std::string OptionValue::toString() const
{
	return type_ == OptionString ? string_ : std::string();
}

const OptionValue &OptionsParser::Options::operator[](int opt) const
{
	static const OptionValue none;

	auto it = values_.find(opt);
	return it != values_.end() ? it->second : none;
}

/* The option as shown in diagnostics, long form preferred. */
std::string OptionsParser::Option::spelling() const
{
	if (!name.empty())
		return "--" + name;

	return std::string("-") + static_cast<char>(opt);
}

const OptionsParser::Option *OptionsParser::find(int opt) const
{
	auto it = std::find_if(options_.begin(), options_.end(),
			       [opt](const Option &option) {
				       return option.opt == opt;
			       });
	return it != options_.end() ? &*it : nullptr;
}

/*
 * Register an option. It needs a short (alphanumeric) or long name and a help
 * text, and an argument name when it takes an argument. Registering the same
 * identifier twice fails.
 */
bool OptionsParser::addOption(int opt, OptionType type, const char *help,
			      const char *name, OptionArgument argument,
			      const char *argumentName)
{
	if ((!isalnum(opt) && !name) || !help || !*help)
		return false;

	if (argument != ArgumentNone && !argumentName)
		return false;

	if (find(opt))
		return false;

	options_.push_back({ opt, type, name ? name : "", argument,
			     argumentName ? argumentName : "", help });
	return true;
}

OptionsParser::Options OptionsParser::parse(int argc, char *argv[])
{
	Options options;

	/* A leading ':' reports missing arguments as ':' instead of '?'. */
	std::string shortOptions = ":";
	std::vector<struct option> longOptions;

	for (const Option &option : options_) {
		/* Indexed by OptionArgument. */
		static const int hasArg[] = {
			no_argument,
			required_argument,
			optional_argument,
		};

		if (isalnum(option.opt)) {
			shortOptions += static_cast<char>(option.opt);
			if (option.argument == ArgumentRequired)
				shortOptions += ":";
			else if (option.argument == ArgumentOptional)
				shortOptions += "::";
		}

		if (!option.name.empty())
			longOptions.push_back({ option.name.c_str(),
						hasArg[option.argument],
						nullptr, option.opt });
	}

	longOptions.push_back({ nullptr, 0, nullptr, 0 });

	opterr = 0;
	optind = 1;

	int c;
	while ((c = getopt_long(argc, argv, shortOptions.c_str(),
				longOptions.data(), nullptr)) != -1) {
		if (c == '?' || c == ':') {
			std::cerr << (c == '?' ? "Invalid option " : "Missing argument for option ")
				  << argv[optind - 1] << std::endl;
			usage();
			return options;
		}

		const Option *option = find(c);
		OptionValue value;

		switch (option->type) {
		case OptionNone:
			break;

		case OptionInteger: {
			unsigned long integer = 0;

			if (optarg && !utils::parseUnsigned(optarg, INT_MAX, &integer)) {
				std::cerr << "Can't parse integer argument for option "
					  << option->spelling() << std::endl;
				usage();
				return options;
			}

			value = OptionValue(static_cast<int>(integer));
			break;
		}

		case OptionString:
			value = OptionValue(std::string(optarg ? optarg : ""));
			break;
		}

		options.values_[c] = value;
	}

	if (optind < argc) {
		std::cerr << "Unexpected argument " << argv[optind] << std::endl;
		usage();
		return options;
	}

	options.valid_ = true;
	return options;
}

void OptionsParser::usage() const
{
	std::vector<std::string> columns;

	for (const Option &option : options_) {
		std::string column = "  ";

		column += isalnum(option.opt)
			? std::string("-") + static_cast<char>(option.opt) + (option.name.empty() ? "" : ", ")
			: std::string("    ");

		if (!option.name.empty())
			column += "--" + option.name;

		if (option.argument == ArgumentRequired)
			column += " " + option.argumentName;
		else if (option.argument == ArgumentOptional)
			column += "[=" + option.argumentName + "]";

		columns.push_back(column);
	}

	size_t width = 0;
	for (const std::string &column : columns)
		width = std::max(width, column.size());
	width = (width + 2 + 7) / 8 * 8;

	std::cerr << "Options:" << std::endl;

	for (size_t i = 0; i < options_.size(); ++i) {
		std::cerr << std::left << std::setw(width) << columns[i];

		/* Continuation lines of the help text align with the first. */
		std::vector<std::string> lines = utils::split(options_[i].help, "\n");
		for (size_t j = 0; j < lines.size(); ++j) {
			if (j)
				std::cerr << std::string(width, ' ');
			std::cerr << lines[j] << std::endl;
		}
	}
}
