/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2022, Google Inc.
 * Copyright (C) 2025, Arducam
 *
 * YAML emitting helper
 */

#include "arducam/internal/yaml_emitter.h"

#include <errno.h>

#include <arducam/base/file.h>
#include <arducam/base/log.h>

/**
 * \file arducam/internal/yaml_emitter.h
 * \brief A YAML emitter helper
 */

namespace arducam {

LOG_DEFINE_CATEGORY(YamlEmitter)

/**
 * \class YamlEmitter
 * \brief A helper class to write a YAML document to a file
 *
 * The YamlEmitter wraps the libyaml event based emitter. Collections are
 * written in block style and scalars in plain style, so that emitting the same
 * sequence of events always produces the same bytes.
 *
 * The emitter must be initialized with init(), which starts the stream and the
 * document, and completed with finish(), which ends them and flushes the
 * output. The file must stay open until finish() returns.
 *
 * All functions return 0 on success or a negative error code otherwise. Once
 * an error has occurred the emitter can't be used anymore.
 */

YamlEmitter::YamlEmitter()
	: emitterValid_(false)
{
}

YamlEmitter::~YamlEmitter()
{
	if (emitterValid_) {
		yaml_emitter_delete(&emitter_);
		emitterValid_ = false;
	}
}

/**
 * \brief Initialize the emitter and start the document
 * \param[in] file The file to write to, opened for writing
 * \return 0 on success or a negative error code otherwise
 */
int YamlEmitter::init(File &file)
{
	if (emitterValid_)
		return -EBUSY;

	/* yaml_emitter_initialize returns 1 when it succeeds */
	if (!yaml_emitter_initialize(&emitter_)) {
		LOG(YamlEmitter, Error) << "Failed to initialize YAML emitter";
		return -EINVAL;
	}
	emitterValid_ = true;

	yaml_emitter_set_output(&emitter_, &YamlEmitter::yamlWrite, &file);
	yaml_emitter_set_unicode(&emitter_, 1);
	yaml_emitter_set_indent(&emitter_, 2);
	yaml_emitter_set_width(&emitter_, -1);

	yaml_event_t event;

	yaml_stream_start_event_initialize(&event, YAML_UTF8_ENCODING);
	int ret = emit(&event);
	if (ret)
		return ret;

	yaml_document_start_event_initialize(&event, nullptr, nullptr, nullptr, 1);
	return emit(&event);
}

/**
 * \brief End the document and flush the output
 * \return 0 on success or a negative error code otherwise
 */
int YamlEmitter::finish()
{
	yaml_event_t event;

	yaml_document_end_event_initialize(&event, 1);
	int ret = emit(&event);
	if (ret)
		return ret;

	yaml_stream_end_event_initialize(&event);
	ret = emit(&event);
	if (ret)
		return ret;

	if (!yaml_emitter_flush(&emitter_)) {
		LOG(YamlEmitter, Error) << "Failed to flush YAML output";
		return -EIO;
	}

	return 0;
}

/**
 * \brief Start a block mapping
 * \return 0 on success or a negative error code otherwise
 */
int YamlEmitter::beginMapping()
{
	yaml_event_t event;

	yaml_mapping_start_event_initialize(&event, nullptr, nullptr, 1,
					    YAML_BLOCK_MAPPING_STYLE);
	return emit(&event);
}

/**
 * \brief End the current mapping
 * \return 0 on success or a negative error code otherwise
 */
int YamlEmitter::endMapping()
{
	yaml_event_t event;

	yaml_mapping_end_event_initialize(&event);
	return emit(&event);
}

/**
 * \brief Start a block sequence
 * \return 0 on success or a negative error code otherwise
 */
int YamlEmitter::beginSequence()
{
	yaml_event_t event;

	yaml_sequence_start_event_initialize(&event, nullptr, nullptr, 1,
					     YAML_BLOCK_SEQUENCE_STYLE);
	return emit(&event);
}

/**
 * \brief End the current sequence
 * \return 0 on success or a negative error code otherwise
 */
int YamlEmitter::endSequence()
{
	yaml_event_t event;

	yaml_sequence_end_event_initialize(&event);
	return emit(&event);
}

/**
 * \brief Emit a plain scalar
 * \param[in] value The scalar value
 *
 * Inside a mapping, scalars alternate between keys and values.
 *
 * \return 0 on success or a negative error code otherwise
 */
int YamlEmitter::scalar(const std::string &value)
{
	yaml_event_t event;

	yaml_scalar_event_initialize(&event, nullptr, nullptr,
				     reinterpret_cast<const yaml_char_t *>(value.c_str()),
				     value.size(), 1, 1, YAML_PLAIN_SCALAR_STYLE);
	return emit(&event);
}

/**
 * \brief Emit a key and scalar value pair in the current mapping
 * \param[in] key The key
 * \param[in] value The value
 * \return 0 on success or a negative error code otherwise
 */
int YamlEmitter::entry(const std::string &key, const std::string &value)
{
	int ret = scalar(key);
	if (ret)
		return ret;

	return scalar(value);
}

int YamlEmitter::yamlWrite(void *data, unsigned char *buffer, size_t size)
{
	File *file = static_cast<File *>(data);

	while (size) {
		ssize_t ret = file->write(buffer, size);
		if (ret <= 0)
			return 0;

		buffer += ret;
		size -= ret;
	}

	return 1;
}

int YamlEmitter::emit(yaml_event_t *event)
{
	if (!emitterValid_)
		return -EINVAL;

	/* The emitter takes ownership of the event, even on failure. */
	if (!yaml_emitter_emit(&emitter_, event)) {
		LOG(YamlEmitter, Error)
			<< "Failed to emit YAML event: "
			<< (emitter_.problem ? emitter_.problem : "unknown error");
		return -EIO;
	}

	return 0;
}

} /* namespace arducam */
