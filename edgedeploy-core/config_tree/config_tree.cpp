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


#include <edgedeploy-core/config_tree.hpp>

#include <cassert>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <sstream>

#include <common/common.hpp>

namespace edgedeploy {
namespace core {
namespace config_tree {

namespace common = edgedeploy::common;

const ConfigTreeErrorCategoryClass ConfigTreeErrorCategory;

const char *ConfigTreeErrorCategoryClass::name() const noexcept {
	return "ConfigTreeErrorCategory";
}

string ConfigTreeErrorCategoryClass::message(int code) const {
	switch (code) {
	case NoError:
		return "Success";
	case InvalidPointerError:
		return "Invalid JSON pointer";
	case PathTypeError:
		return "Path crosses a value which is not a map";
	case ValueTypeError:
		return "Unsupported value type";
	}
	assert(false);
	return "Unknown";
}

error::Error MakeError(ConfigTreeErrorCode code, const string &msg) {
	return error::Error(error_condition(code, ConfigTreeErrorCategory), msg);
}

ExpectedPointer ParsePointer(const string &pointer) {
	Pointer result;
	if (pointer.empty()) {
		return result;
	}
	if (pointer[0] != '/') {
		return expected::unexpected(
			MakeError(InvalidPointerError, "\"" + pointer + "\" does not start with '/'"));
	}

	for (const auto &token : common::SplitString(pointer.substr(1), "/")) {
		string decoded;
		for (size_t i = 0; i < token.size(); i++) {
			if (token[i] != '~') {
				decoded += token[i];
				continue;
			}
			if (i + 1 < token.size() && token[i + 1] == '0') {
				decoded += '~';
			} else if (i + 1 < token.size() && token[i + 1] == '1') {
				decoded += '/';
			} else {
				return expected::unexpected(
					MakeError(InvalidPointerError, "Invalid escape in \"" + pointer + "\""));
			}
			i++;
		}
		result.push_back(decoded);
	}
	return result;
}

string PointerToString(const Pointer &pointer) {
	string ret;
	for (const auto &token : pointer) {
		ret += '/';
		for (char c : token) {
			if (c == '~') {
				ret += "~0";
			} else if (c == '/') {
				ret += "~1";
			} else {
				ret += c;
			}
		}
	}
	return ret;
}

ExpectedValue Value::FromJson(const json::Json &j) {
	if (j.IsNull()) {
		return Value();
	} else if (j.IsBool()) {
		return Value(j.GetBool().value());
	} else if (j.IsInt64()) {
		auto i = j.GetInt64();
		if (!i) {
			return expected::unexpected(i.error());
		}
		return Value(i.value());
	} else if (j.IsDouble()) {
		return Value(j.GetDouble().value());
	} else if (j.IsString()) {
		return Value(j.GetString().value());
	} else if (j.IsArray()) {
		auto size = j.GetArraySize();
		if (!size) {
			return expected::unexpected(size.error());
		}
		List list;
		for (size_t i = 0; i < size.value(); i++) {
			auto elem = j.Get(i).and_then(FromJson);
			if (!elem) {
				return expected::unexpected(elem.error());
			}
			list.push_back(std::move(elem.value()));
		}
		return Value(std::move(list));
	} else if (j.IsObject()) {
		auto children = j.GetChildren();
		if (!children) {
			return expected::unexpected(children.error());
		}
		Map m;
		for (const auto &child : children.value()) {
			auto elem = FromJson(child.second);
			if (!elem) {
				return expected::unexpected(elem.error());
			}
			m.emplace(child.first, std::move(elem.value()));
		}
		return Value(std::move(m));
	}
	return expected::unexpected(MakeError(ValueTypeError, "Unknown JSON value type"));
}

ExpectedValue Value::FromJsonString(const string &str) {
	return json::Load(str).and_then(FromJson);
}

void Value::Merge(const Value &patch) {
	if (type_ != Type::Map || patch.type_ != Type::Map) {
		*this = patch;
		return;
	}
	for (const auto &entry : patch.map_) {
		auto it = map_.find(entry.first);
		if (it == map_.end()) {
			map_.emplace(entry.first, entry.second);
		} else {
			it->second.Merge(entry.second);
		}
	}
}

void Value::FillDefaults(const Value &defaults) {
	if (type_ == Type::Null) {
		*this = defaults;
		return;
	}
	if (type_ != Type::Map || defaults.type_ != Type::Map) {
		return;
	}
	for (const auto &entry : defaults.map_) {
		auto it = map_.find(entry.first);
		if (it == map_.end()) {
			map_.emplace(entry.first, entry.second);
		} else {
			it->second.FillDefaults(entry.second);
		}
	}
}

const Value *Value::Lookup(const Pointer &pointer) const {
	const Value *current = this;
	for (const auto &token : pointer) {
		if (current->type_ != Type::Map) {
			return nullptr;
		}
		auto it = current->map_.find(token);
		if (it == current->map_.end()) {
			return nullptr;
		}
		current = &it->second;
	}
	return current;
}

expected::ExpectedBool Value::RemovePath(const Pointer &pointer) {
	if (pointer.empty()) {
		bool had_content = !(type_ == Type::Map && map_.empty());
		*this = EmptyMap();
		return had_content;
	}

	Value *current = this;
	for (size_t i = 0; i + 1 < pointer.size(); i++) {
		if (current->type_ == Type::List) {
			return expected::unexpected(MakeError(
				PathTypeError, PointerToString(pointer) + " descends into a list"));
		}
		if (current->type_ != Type::Map) {
			return false;
		}
		auto it = current->map_.find(pointer[i]);
		if (it == current->map_.end()) {
			return false;
		}
		current = &it->second;
	}

	if (current->type_ == Type::List) {
		return expected::unexpected(
			MakeError(PathTypeError, PointerToString(pointer) + " descends into a list"));
	}
	if (current->type_ != Type::Map) {
		return false;
	}
	return current->map_.erase(pointer.back()) > 0;
}

error::Error Value::Set(const Pointer &pointer, Value value) {
	Value *current = this;
	for (const auto &token : pointer) {
		if (current->type_ == Type::Null) {
			*current = EmptyMap();
		}
		if (current->type_ != Type::Map) {
			return MakeError(
				PathTypeError, PointerToString(pointer) + " crosses a value which is not a map");
		}
		current = &current->map_[token];
	}
	*current = std::move(value);
	return error::NoError;
}

static string DumpDouble(double d) {
	if (!std::isfinite(d)) {
		// JSON has no representation for these.
		return "null";
	}
	ostringstream ss;
	ss << setprecision(15) << d;
	if (strtod(ss.str().c_str(), nullptr) != d) {
		ss.str("");
		ss << setprecision(17) << d;
	}
	string ret = ss.str();
	if (ret.find_first_of(".eE") == string::npos) {
		ret += ".0";
	}
	return ret;
}

string Value::Dump() const {
	switch (type_) {
	case Type::Null:
		return "null";
	case Type::Bool:
		return bool_ ? "true" : "false";
	case Type::Int:
		return to_string(int_);
	case Type::Double:
		return DumpDouble(double_);
	case Type::String:
		return "\"" + json::EscapeString(string_) + "\"";
	case Type::List: {
		string ret = "[";
		for (size_t i = 0; i < list_.size(); i++) {
			if (i > 0) {
				ret += ",";
			}
			ret += list_[i].Dump();
		}
		return ret + "]";
	}
	case Type::Map: {
		string ret = "{";
		bool first = true;
		for (const auto &entry : map_) {
			if (!first) {
				ret += ",";
			}
			first = false;
			ret += "\"" + json::EscapeString(entry.first) + "\":" + entry.second.Dump();
		}
		return ret + "}";
	}
	}
	assert(false);
	return "null";
}

bool Value::operator==(const Value &other) const {
	if (type_ != other.type_) {
		return false;
	}
	switch (type_) {
	case Type::Null:
		return true;
	case Type::Bool:
		return bool_ == other.bool_;
	case Type::Int:
		return int_ == other.int_;
	case Type::Double:
		return double_ == other.double_;
	case Type::String:
		return string_ == other.string_;
	case Type::List:
		return list_ == other.list_;
	case Type::Map:
		return map_ == other.map_;
	}
	assert(false);
	return false;
}

} // namespace config_tree
} // namespace core
} // namespace edgedeploy
