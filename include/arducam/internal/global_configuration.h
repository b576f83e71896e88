/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2024-2025 Red Hat, inc.
 * Copyright (C) 2025, Arducam
 *
 * Tools configuration file
 */

#pragma once

#include <filesystem>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>

#include "arducam/internal/yaml_parser.h"

namespace arducam {

class GlobalConfiguration
{
public:
	using Configuration = const YamlObject &;

	GlobalConfiguration();
	explicit GlobalConfiguration(const std::filesystem::path &fileName);

	unsigned int version() const { return version_; }
	Configuration configuration() const;

	template<typename T>
	std::optional<T> option(std::initializer_list<std::string> confPath) const
	{
		const YamlObject *node = &configuration();
		for (const std::string &key : confPath)
			node = &(*node)[key];

		return node->get<T>();
	}

	std::optional<std::string> envOption(const char *envVariable,
					     std::initializer_list<std::string> confPath) const;

private:
	int loadFile(const std::filesystem::path &fileName);

	std::unique_ptr<YamlObject> root_;
	unsigned int version_;
};

} /* namespace arducam */
