/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2022, Google Inc.
 * Copyright (C) 2025, Arducam
 *
 * YAML emitting helper
 */

#pragma once

#include <string>

#include <arducam/base/class.h>

#include <yaml.h>

namespace arducam {

class File;

class YamlEmitter final
{
public:
	YamlEmitter();
	~YamlEmitter();

	int init(File &file);
	int finish();

	int beginMapping();
	int endMapping();
	int beginSequence();
	int endSequence();

	int scalar(const std::string &value);
	int entry(const std::string &key, const std::string &value);

private:
	ARDUCAM_DISABLE_COPY_AND_MOVE(YamlEmitter)

	static int yamlWrite(void *data, unsigned char *buffer, size_t size);

	int emit(yaml_event_t *event);

	bool emitterValid_;
	yaml_emitter_t emitter_;
};

} /* namespace arducam */
