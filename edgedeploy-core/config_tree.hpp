// Copyright 2026 The edgedeploy Authors
//
//    Licensed under the Apache License, Version 2.0 (the "License");
//    you may not use this file except in compliance with the License.
//    You may obtain a copy of the License at
//
//        http://www.apache.org/licenses/LICENSE-2.0
//
//    Unless required by applicable law or agreed to in writing, software
//    distributed under the License is distributed on an "AS IS" BASIS,
//    WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//    See the License for the specific language governing permissions and
//    limitations under the License.


#ifndef EDGEDEPLOY_CORE_CONFIG_TREE_HPP
#define EDGEDEPLOY_CORE_CONFIG_TREE_HPP

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include <common/error.hpp>
#include <common/expected.hpp>
#include <common/json.hpp>

namespace edgedeploy {
namespace core {
namespace config_tree {

using namespace std;

namespace error = edgedeploy::common::error;
namespace expected = edgedeploy::common::expected;
namespace json = edgedeploy::common::json;

enum ConfigTreeErrorCode {
	NoError = 0,
	InvalidPointerError,
	PathTypeError,
	ValueTypeError,
};

class ConfigTreeErrorCategoryClass : public std::error_category {
public:
	const char *name() const noexcept override;
	string message(int code) const override;
};
extern const ConfigTreeErrorCategoryClass ConfigTreeErrorCategory;

error::Error MakeError(ConfigTreeErrorCode code, const string &msg);

// Decoded JSON Pointer (RFC 6901). Empty means the whole tree.
using Pointer = vector<string>;
using ExpectedPointer = expected::expected<Pointer, error::Error>;

ExpectedPointer ParsePointer(const string &pointer);
string PointerToString(const Pointer &pointer);

class Value;
using ExpectedValue = expected::expected<Value, error::Error>;

class Value {
public:
	enum class Type {
		Null,
		Bool,
		Int,
		Double,
		String,
		List,
		Map,
	};

	using List = vector<Value>;
	using Map = map<string, Value>;

	Value() = default;
	Value(bool b) :
		type_ {Type::Bool},
		bool_ {b} {
	}
	Value(int i) :
		type_ {Type::Int},
		int_ {i} {
	}
	Value(int64_t i) :
		type_ {Type::Int},
		int_ {i} {
	}
	Value(double d) :
		type_ {Type::Double},
		double_ {d} {
	}
	Value(const char *s) :
		type_ {Type::String},
		string_ {s} {
	}
	Value(string s) :
		type_ {Type::String},
		string_ {std::move(s)} {
	}
	Value(List l) :
		type_ {Type::List},
		list_ {std::move(l)} {
	}
	Value(Map m) :
		type_ {Type::Map},
		map_ {std::move(m)} {
	}

	static ExpectedValue FromJson(const json::Json &j);
	static ExpectedValue FromJsonString(const string &str);

	Type GetType() const {
		return type_;
	}
	bool IsNull() const {
		return type_ == Type::Null;
	}
	bool IsMap() const {
		return type_ == Type::Map;
	}
	bool IsList() const {
		return type_ == Type::List;
	}

	bool AsBool() const {
		return bool_;
	}
	int64_t AsInt() const {
		return int_;
	}
	double AsDouble() const {
		return double_;
	}
	const string &AsString() const {
		return string_;
	}
	const List &AsList() const {
		return list_;
	}
	const Map &AsMap() const {
		return map_;
	}

	// Maps are merged key by key, recursively. Anything else in `patch` replaces the receiver.
	void Merge(const Value &patch);

	// Adds whatever `defaults` has and the receiver lacks, recursively through maps.
	void FillDefaults(const Value &defaults);

	// nullptr when the path does not exist or would descend into a list.
	const Value *Lookup(const Pointer &pointer) const;
	bool Contains(const Pointer &pointer) const {
		return Lookup(pointer) != nullptr;
	}

	// Removes the value at `pointer`. Returns whether anything was removed. Removing the root
	// turns the tree into an empty map.
	expected::ExpectedBool RemovePath(const Pointer &pointer);

	// Creates intermediate maps as needed.
	error::Error Set(const Pointer &pointer, Value value);

	// Compact JSON with sorted keys.
	string Dump() const;

	bool operator==(const Value &other) const;
	bool operator!=(const Value &other) const {
		return !(*this == other);
	}

private:
	Type type_ {Type::Null};
	bool bool_ {false};
	int64_t int_ {0};
	double double_ {0};
	string string_;
	List list_;
	Map map_;
};

// Convenience for an empty map, the neutral configuration.
inline Value EmptyMap() {
	return Value(Value::Map {});
}

} // namespace config_tree
} // namespace core
} // namespace edgedeploy

#endif // EDGEDEPLOY_CORE_CONFIG_TREE_HPP
