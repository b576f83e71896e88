/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2022, Google Inc.
 * Copyright (C) 2025, Arducam
 *
 * YAML document tree for configuration and mapping tables
 */

#pragma once

#include <memory>
#include <optional>
#include <stdint.h>
#include <string>
#include <utility>
#include <vector>

namespace arducam {

class File;
class YamlReader;

class YamlObject
{
public:
	using Member = std::pair<std::string, YamlObject>;

	YamlObject();
	YamlObject(YamlObject &&) = default;
	YamlObject &operator=(YamlObject &&) = default;
	~YamlObject();

	bool isValue() const { return type_ == Type::Value; }
	bool isList() const { return type_ == Type::List; }
	bool isDictionary() const { return type_ == Type::Dictionary; }
	explicit operator bool() const { return type_ != Type::Empty; }

	std::size_t size() const;

	template<typename T>
	std::optional<T> get() const;

	template<typename T>
	T get(const T &defaultValue) const
	{
		return get<T>().value_or(defaultValue);
	}

	const std::vector<YamlObject> &asList() const { return elements_; }
	const std::vector<Member> &asDict() const { return members_; }

	const YamlObject &operator[](std::size_t index) const;
	const YamlObject &operator[](const std::string &key) const;
	bool contains(const std::string &key) const;

private:
	friend class YamlReader;

	enum class Type {
		Empty,
		Value,
		List,
		Dictionary,
	};

	std::optional<unsigned long> unsignedValue(unsigned long max) const;

	Type type_;
	std::string value_;
	std::vector<YamlObject> elements_;
	std::vector<Member> members_;
};

#ifndef __DOXYGEN__
template<> std::optional<std::string> YamlObject::get() const;
template<> std::optional<uint8_t> YamlObject::get() const;
template<> std::optional<uint16_t> YamlObject::get() const;
template<> std::optional<uint32_t> YamlObject::get() const;
template<> std::optional<int32_t> YamlObject::get() const;
#endif

class YamlParser final
{
public:
	static std::unique_ptr<YamlObject> parse(File &file);
};

} /* namespace arducam */
