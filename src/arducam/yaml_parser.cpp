/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2022, Google Inc.
 * Copyright (C) 2025, Arducam
 *
 * YAML document tree for configuration and mapping tables
 */

#include "arducam/internal/yaml_parser.h"

#include <algorithm>
#include <errno.h>
#include <limits>

#include <arducam/base/file.h>
#include <arducam/base/log.h>
#include <arducam/base/utils.h>

#include <yaml.h>

/**
 * \file arducam/internal/yaml_parser.h
 * \brief YAML document tree
 *
 * The configuration file and the device mapping table are small YAML
 * documents made of dictionaries, lists and scalars. Anchors, aliases and
 * tags are not interpreted.
 */

namespace arducam {

LOG_DEFINE_CATEGORY(YamlParser)

namespace {

const YamlObject emptyObject;

/* Documents nested deeper than this are rejected. */
constexpr unsigned int kMaxDepth = 32;

} /* namespace */

/**
 * \class YamlObject
 * \brief A node of a parsed YAML document
 *
 * A node is a scalar value, a list or a dictionary. Looking up a missing
 * index or key returns an empty node that converts to false, so lookups can
 * be chained without intermediate checks:
 *
 * \code{.cpp}
 * std::optional<uint16_t> address = root["i2c"]["address"].get<uint16_t>();
 * \endcode
 *
 * Dictionary members keep the order of the document.
 */

YamlObject::YamlObject()
	: type_(Type::Empty)
{
}

YamlObject::~YamlObject() = default;

/**
 * \brief Retrieve the number of list elements or dictionary members
 * \return The size, 0 for scalars and empty nodes
 */
std::size_t YamlObject::size() const
{
	switch (type_) {
	case Type::List:
		return elements_.size();
	case Type::Dictionary:
		return members_.size();
	default:
		return 0;
	}
}

std::optional<unsigned long> YamlObject::unsignedValue(unsigned long max) const
{
	unsigned long value;

	if (type_ != Type::Value || !utils::parseUnsigned(value_, max, &value))
		return std::nullopt;

	return value;
}

/**
 * \fn template<typename T> YamlObject::get<T>() const
 * \brief Convert a scalar node to \a T
 *
 * Supported types are std::string, uint8_t, uint16_t, uint32_t and int32_t.
 * Integers may be written in decimal or with a 0x prefix, values out of the
 * range of \a T are rejected.
 *
 * \return The value, or std::nullopt if the node isn't a scalar of type \a T
 */

/**
 * \fn template<typename T> YamlObject::get(const T &defaultValue) const
 * \brief Convert a scalar node to \a T, falling back to \a defaultValue
 */

template<>
std::optional<std::string> YamlObject::get() const
{
	if (type_ != Type::Value)
		return std::nullopt;

	return value_;
}

template<>
std::optional<uint8_t> YamlObject::get() const
{
	return unsignedValue(std::numeric_limits<uint8_t>::max());
}

template<>
std::optional<uint16_t> YamlObject::get() const
{
	return unsignedValue(std::numeric_limits<uint16_t>::max());
}

template<>
std::optional<uint32_t> YamlObject::get() const
{
	return unsignedValue(std::numeric_limits<uint32_t>::max());
}

template<>
std::optional<int32_t> YamlObject::get() const
{
	long value;

	if (type_ != Type::Value ||
	    !utils::parseSigned(value_, std::numeric_limits<int32_t>::min(),
				std::numeric_limits<int32_t>::max(), &value))
		return std::nullopt;

	return value;
}

/**
 * \fn YamlObject::asList()
 * \brief Retrieve the elements of a list node
 * \return The elements, empty if the node isn't a list
 */

/**
 * \fn YamlObject::asDict()
 * \brief Retrieve the members of a dictionary node as (key, value) pairs
 * \return The members in document order, empty if the node isn't a dictionary
 */

/**
 * \brief Retrieve a list element
 * \param[in] index The element index
 * \return The element, or an empty node if out of range
 */
const YamlObject &YamlObject::operator[](std::size_t index) const
{
	if (type_ != Type::List || index >= elements_.size())
		return emptyObject;

	return elements_[index];
}

/**
 * \brief Retrieve a dictionary member
 * \param[in] key The member key
 *
 * When a key appears more than once, the first occurrence is returned.
 *
 * \return The member value, or an empty node if \a key doesn't exist
 */
const YamlObject &YamlObject::operator[](const std::string &key) const
{
	auto it = std::find_if(members_.begin(), members_.end(),
			       [&key](const Member &member) {
				       return member.first == key;
			       });
	if (it == members_.end())
		return emptyObject;

	return it->second;
}

/**
 * \brief Check if a dictionary has a member named \a key
 * \param[in] key The member key
 * \return True if the member exists
 */
bool YamlObject::contains(const std::string &key) const
{
	return static_cast<bool>((*this)[key]);
}

/*
 * Build a YamlObject tree from the libyaml event stream. Each call to
 * parseNode() consumes the events of exactly one node.
 */
class YamlReader
{
public:
	YamlReader(File &file);
	~YamlReader();

	int read(YamlObject *root);

private:
	class Event
	{
	public:
		Event() : valid_(false) {}
		~Event() { reset(); }

		void reset()
		{
			if (valid_)
				yaml_event_delete(&event_);
			valid_ = false;
		}

		yaml_event_t *get() { return &event_; }
		const yaml_event_t *operator->() const { return &event_; }
		void setValid() { valid_ = true; }

	private:
		yaml_event_t event_;
		bool valid_;
	};

	static int readHandler(void *data, unsigned char *buffer, size_t size,
			       size_t *sizeRead);

	int next(Event *event);
	int expect(yaml_event_type_t type);
	int parseNode(YamlObject *node, const Event &event, unsigned int depth);

	File &file_;
	yaml_parser_t parser_;
	bool initialized_;
};

YamlReader::YamlReader(File &file)
	: file_(file)
{
	initialized_ = yaml_parser_initialize(&parser_);
	if (initialized_)
		yaml_parser_set_input(&parser_, &YamlReader::readHandler, &file_);
}

YamlReader::~YamlReader()
{
	if (initialized_)
		yaml_parser_delete(&parser_);
}

int YamlReader::readHandler(void *data, unsigned char *buffer, size_t size,
			    size_t *sizeRead)
{
	File *file = static_cast<File *>(data);

	ssize_t ret = file->read(buffer, size);
	if (ret < 0)
		return 0;

	*sizeRead = ret;
	return 1;
}

int YamlReader::next(Event *event)
{
	event->reset();

	if (!yaml_parser_parse(&parser_, event->get())) {
		LOG(YamlParser, Error)
			<< file_.fileName() << ":" << parser_.problem_mark.line + 1
			<< ": " << (parser_.problem ? parser_.problem : "syntax error");
		return -EBADMSG;
	}

	event->setValid();
	return 0;
}

int YamlReader::expect(yaml_event_type_t type)
{
	Event event;

	int ret = next(&event);
	if (ret)
		return ret;

	return event->type == type ? 0 : -EBADMSG;
}

int YamlReader::parseNode(YamlObject *node, const Event &event,
			  unsigned int depth)
{
	if (depth > kMaxDepth) {
		LOG(YamlParser, Error) << "Document nested too deeply";
		return -EBADMSG;
	}

	switch (event->type) {
	case YAML_SCALAR_EVENT:
		node->type_ = YamlObject::Type::Value;
		node->value_.assign(reinterpret_cast<const char *>(event->data.scalar.value),
				    event->data.scalar.length);
		return 0;

	case YAML_SEQUENCE_START_EVENT:
		node->type_ = YamlObject::Type::List;

		while (true) {
			Event item;
			int ret = next(&item);
			if (ret)
				return ret;

			if (item->type == YAML_SEQUENCE_END_EVENT)
				return 0;

			ret = parseNode(&node->elements_.emplace_back(), item,
					depth + 1);
			if (ret)
				return ret;
		}

	case YAML_MAPPING_START_EVENT:
		node->type_ = YamlObject::Type::Dictionary;

		while (true) {
			Event key;
			int ret = next(&key);
			if (ret)
				return ret;

			if (key->type == YAML_MAPPING_END_EVENT)
				return 0;

			if (key->type != YAML_SCALAR_EVENT) {
				LOG(YamlParser, Error)
					<< file_.fileName() << ":"
					<< key->start_mark.line + 1
					<< ": dictionary keys must be scalars";
				return -EBADMSG;
			}

			std::string name(reinterpret_cast<const char *>(key->data.scalar.value),
					 key->data.scalar.length);

			Event value;
			ret = next(&value);
			if (ret)
				return ret;

			YamlObject::Member &member =
				node->members_.emplace_back(std::move(name), YamlObject());
			ret = parseNode(&member.second, value, depth + 1);
			if (ret)
				return ret;
		}

	default:
		LOG(YamlParser, Error)
			<< file_.fileName() << ":" << event->start_mark.line + 1
			<< ": unsupported YAML construct";
		return -EBADMSG;
	}
}

/*
 * Read a stream holding a single document. An empty stream yields an empty
 * root node.
 */
int YamlReader::read(YamlObject *root)
{
	if (!initialized_) {
		LOG(YamlParser, Error) << "Failed to initialize YAML parser";
		return -ENOMEM;
	}

	int ret = expect(YAML_STREAM_START_EVENT);
	if (ret)
		return ret;

	Event event;
	ret = next(&event);
	if (ret)
		return ret;

	if (event->type == YAML_STREAM_END_EVENT)
		return 0;

	if (event->type != YAML_DOCUMENT_START_EVENT)
		return -EBADMSG;

	ret = next(&event);
	if (ret)
		return ret;

	ret = parseNode(root, event, 0);
	if (ret)
		return ret;

	ret = expect(YAML_DOCUMENT_END_EVENT);
	if (ret)
		return ret;

	return expect(YAML_STREAM_END_EVENT);
}

/**
 * \class YamlParser
 * \brief Parse YAML files into YamlObject trees
 */

/**
 * \brief Parse the document held in \a file
 * \param[in] file The file, open for reading
 * \return The root node, or nullptr if the file isn't a valid YAML document
 */
std::unique_ptr<YamlObject> YamlParser::parse(File &file)
{
	auto root = std::make_unique<YamlObject>();

	YamlReader reader(file);
	if (reader.read(root.get())) {
		LOG(YamlParser, Error)
			<< "Failed to parse YAML content from " << file.fileName();
		return nullptr;
	}

	return root;
}

} /* namespace arducam */
