/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2024-2025 Red Hat, inc.
 * Copyright (C) 2025, Arducam
 *
 * Tools configuration file
 */

#include "arducam/internal/global_configuration.h"

#include <errno.h>
#include <string.h>
#include <vector>

#include <arducam/base/file.h>
#include <arducam/base/log.h>
#include <arducam/base/utils.h>

/**
 * \file global_configuration.h
 * \brief Tools configuration file
 *
 * \verbatim
   version: 1
   configuration:
     mapping_table: /var/lib/arducam/map.yaml
     sensor_family: custom
     register_maps:
       custom:
         device_id: 0x0110
   \endverbatim
 */

namespace arducam {

LOG_DEFINE_CATEGORY(Configuration)

namespace {

constexpr unsigned int kSupportedVersion = 1;

/*
 * Configuration files in lookup order, $XDG_CONFIG_HOME (or ~/.config)
 * first, then the system-wide directory.
 */
std::vector<std::filesystem::path> searchPaths()
{
	std::vector<std::filesystem::path> paths;

	if (const char *xdg = utils::secure_getenv("XDG_CONFIG_HOME"))
		paths.push_back(std::filesystem::path(xdg) / "arducam" / "configuration.yaml");
	else if (const char *home = utils::secure_getenv("HOME"))
		paths.push_back(std::filesystem::path(home) / ".config" / "arducam" / "configuration.yaml");

	paths.push_back(std::filesystem::path(ARDUCAM_SYSCONF_DIR) / "configuration.yaml");

	return paths;
}

} /* namespace */

/**
 * \class GlobalConfiguration
 * \brief Settings shared by arducli and ardu-i2c-detect
 *
 * Settings live under the top-level `configuration` key of a version 1 YAML
 * document. The first configuration file found is used, files are never
 * merged. A file that exists but can't be used (unreadable, malformed or of
 * another version) is reported and results in an empty configuration, the
 * search doesn't continue past it.
 */

/**
 * \brief Load the configuration from the first file found in the search paths
 */
GlobalConfiguration::GlobalConfiguration()
	: root_(std::make_unique<YamlObject>()), version_(0)
{
	for (const std::filesystem::path &path : searchPaths()) {
		if (loadFile(path) != -ENOENT)
			return;
	}

	LOG(Configuration, Debug) << "No configuration file, using defaults";
}

/**
 * \brief Load the configuration from \a fileName
 * \param[in] fileName The configuration file
 *
 * A missing file results in an empty configuration.
 */
GlobalConfiguration::GlobalConfiguration(const std::filesystem::path &fileName)
	: root_(std::make_unique<YamlObject>()), version_(0)
{
	loadFile(fileName);
}

/*
 * \return 0 when the file is loaded, -ENOENT when it doesn't exist, or
 * another negative error code when it exists but can't be used
 */
int GlobalConfiguration::loadFile(const std::filesystem::path &fileName)
{
	File file(fileName.string());
	if (!file.open(File::OpenModeFlag::ReadOnly)) {
		if (file.error() != -ENOENT)
			LOG(Configuration, Error)
				<< "Failed to open " << fileName << ": "
				<< strerror(-file.error());
		return file.error();
	}

	std::unique_ptr<YamlObject> root = YamlParser::parse(file);
	if (!root)
		return -EBADMSG;

	std::optional<uint32_t> version = (*root)["version"].get<uint32_t>();
	if (version != kSupportedVersion) {
		LOG(Configuration, Error)
			<< "Ignoring " << fileName << ": version "
			<< (version ? std::to_string(*version) : "missing")
			<< ", expected " << kSupportedVersion;
		return -EINVAL;
	}

	LOG(Configuration, Debug) << "Using configuration file " << fileName;

	root_ = std::move(root);
	version_ = *version;

	return 0;
}

/**
 * \fn GlobalConfiguration::version()
 * \brief Retrieve the version of the loaded configuration file
 * \return The version, or 0 when no configuration file is in use
 */

/**
 * \brief Retrieve the `configuration` section
 * \return The section, an empty node when no configuration file is in use
 */
GlobalConfiguration::Configuration GlobalConfiguration::configuration() const
{
	return (*root_)["configuration"];
}

/**
 * \fn GlobalConfiguration::option(std::initializer_list<std::string> confPath) const
 * \brief Retrieve a setting
 * \param[in] confPath The keys leading to the setting below `configuration`
 * \return The setting converted to \a T, or std::nullopt if it is missing or
 * doesn't convert
 */

/**
 * \brief Retrieve a string setting that an environment variable can override
 * \param[in] envVariable The environment variable
 * \param[in] confPath The keys leading to the setting below `configuration`
 *
 * A set \a envVariable wins even when its value is empty.
 *
 * \return The setting, or std::nullopt if neither source defines it
 */
std::optional<std::string>
GlobalConfiguration::envOption(const char *envVariable,
			       std::initializer_list<std::string> confPath) const
{
	if (const char *value = utils::secure_getenv(envVariable))
		return std::string(value);

	return option<std::string>(confPath);
}

} /* namespace arducam */
