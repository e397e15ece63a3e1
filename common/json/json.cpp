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

#include <common/json.hpp>

#include <cstdio>
#include <string>
#include <unordered_map>
#include <vector>

namespace edgedeploy {
namespace common {
namespace json {

const JsonErrorCategoryClass JsonErrorCategory;

const char *JsonErrorCategoryClass::name() const noexcept {
	return "JsonErrorCategory";
}

string JsonErrorCategoryClass::message(int code) const {
	switch (code) {
	case NoError:
		return "Success";
	case ParseError:
		return "Parse error";
	case KeyError:
		return "Key error";
	case IndexError:
		return "Index error";
	case TypeError:
		return "Type error";
	case EmptyError:
		return "Empty input";
	default:
		return "Unknown";
	}
}

error::Error MakeError(JsonErrorCode code, const string &msg) {
	return error::Error(error_condition(code, JsonErrorCategory), msg);
}

template <>
ExpectedKeyValueMap Json::Get<KeyValueMap>() const {
	return ToKeyValueMap(*this);
}

template <>
ExpectedStringVector Json::Get<vector<string>>() const {
	return ToStringVector(*this);
}

template <>
ExpectedString Json::Get<string>() const {
	return GetString();
}

template <>
ExpectedInt64 Json::Get<int64_t>() const {
	return GetInt64();
}

template <>
ExpectedDouble Json::Get<double>() const {
	return GetDouble();
}

template <>
ExpectedBool Json::Get<bool>() const {
	return GetBool();
}

string EscapeString(const string &str) {
	string ret;
	ret.reserve(str.size());
	for (auto c : str) {
		switch (c) {
		case '"':
			ret += "\\\"";
			break;
		case '\\':
			ret += "\\\\";
			break;
		case '\n':
			ret += "\\n";
			break;
		case '\t':
			ret += "\\t";
			break;
		case '\r':
			ret += "\\r";
			break;
		case '\f':
			ret += "\\f";
			break;
		case '\b':
			ret += "\\b";
			break;
		default:
			if (static_cast<unsigned char>(c) < 0x20) {
				char buf[8];
				snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned int>(c));
				ret += buf;
			} else {
				ret += c;
			}
		}
	}
	return ret;
}

ExpectedString ToString(const json::Json &j) {
	return j.GetString();
}

ExpectedStringVector ToStringVector(const json::Json &j) {
	if (!j.IsArray()) {
		return expected::unexpected(
			MakeError(JsonErrorCode::TypeError, "The JSON value is not an array"));
	}
	vector<string> vector_elements {};
	size_t vector_size {j.GetArraySize().value()};
	for (size_t i = 0; i < vector_size; ++i) {
		auto element = j.Get(i).and_then(ToString);
		if (!element) {
			return expected::unexpected(element.error());
		}
		vector_elements.push_back(element.value());
	}
	return vector_elements;
}

ExpectedKeyValueMap ToKeyValueMap(const json::Json &j) {
	if (!j.IsObject()) {
		return expected::unexpected(
			MakeError(JsonErrorCode::TypeError, "The JSON value is not an object"));
	}

	auto expected_children = j.GetChildren();
	if (!expected_children) {
		return expected::unexpected(expected_children.error());
	}

	KeyValueMap kv_map {};

	for (const auto &kv : expected_children.value()) {
		auto expected_value = kv.second.GetString();
		if (!expected_value) {
			return expected::unexpected(expected_value.error().WithContext(kv.first));
		}
		kv_map[kv.first] = expected_value.value();
	}

	return kv_map;
}

template <typename T>
expected::expected<T, error::Error> Get(
	const json::Json &json, const string &key, MissingOk missing_ok) {
	auto exp_value = json.Get(key);
	if (!exp_value) {
		if (missing_ok == MissingOk::Yes
			&& exp_value.error().code == json::MakeError(json::KeyError, "").code) {
			return T();
		}
		return expected::unexpected(exp_value.error().WithContext("Could not get `" + key + "`"));
	}
	auto value = exp_value.value().Get<T>();
	if (!value) {
		return expected::unexpected(value.error().WithContext("Value of `" + key + "`"));
	}
	return value;
}
// One instantiation per JSON type, which is a fixed set.
template expected::expected<KeyValueMap, error::Error> Get(
	const json::Json &json, const string &key, MissingOk missing_ok);
template expected::expected<vector<string>, error::Error> Get(
	const json::Json &json, const string &key, MissingOk missing_ok);
template expected::expected<string, error::Error> Get(
	const json::Json &json, const string &key, MissingOk missing_ok);
template expected::expected<int64_t, error::Error> Get(
	const json::Json &json, const string &key, MissingOk missing_ok);
template expected::expected<double, error::Error> Get(
	const json::Json &json, const string &key, MissingOk missing_ok);
template expected::expected<bool, error::Error> Get(
	const json::Json &json, const string &key, MissingOk missing_ok);

} // namespace json
} // namespace common
} // namespace edgedeploy
