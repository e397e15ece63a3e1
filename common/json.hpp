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

#ifndef EDGEDEPLOY_COMMON_JSON_HPP
#define EDGEDEPLOY_COMMON_JSON_HPP

#include <config.h>

#include <istream>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

#include <common/error.hpp>
#include <common/expected.hpp>

#ifdef EDGEDEPLOY_USE_NLOHMANN_JSON
#include <nlohmann/json.hpp>
#endif

namespace edgedeploy {
namespace common {
namespace json {

using namespace std;

namespace error = edgedeploy::common::error;
namespace expected = edgedeploy::common::expected;

enum JsonErrorCode {
	NoError = 0,
	ParseError,
	KeyError,
	IndexError,
	TypeError,
	EmptyError,
};

class JsonErrorCategoryClass : public std::error_category {
public:
	const char *name() const noexcept override;
	string message(int code) const override;
};
extern const JsonErrorCategoryClass JsonErrorCategory;

error::Error MakeError(JsonErrorCode code, const string &msg);

using ExpectedString = expected::ExpectedString;
using ExpectedInt64 = expected::ExpectedInt64;
using ExpectedDouble = expected::ExpectedDouble;
using ExpectedBool = expected::ExpectedBool;
using ExpectedSize = expected::ExpectedSize;

class Json {
public:
	using ExpectedJson = expected::expected<Json, error::Error>;
	using ChildrenMap = map<string, Json>;
	using ExpectedChildrenMap = expected::expected<ChildrenMap, error::Error>;

	Json() = default;

	// A negative indent produces the compact, single line representation.
	string Dump(const int indent = 2) const;

	ExpectedJson Get(const char *child_key) const;
	ExpectedJson operator[](const char *child_key) const {
		return this->Get(child_key);
	}
	ExpectedJson Get(const string &child_key) const {
		return this->Get(child_key.data());
	}
	ExpectedJson operator[](const string &child_key) const {
		return this->Get(child_key.data());
	}
	ExpectedJson Get(const size_t idx) const;
	ExpectedJson operator[](const size_t idx) const {
		return this->Get(idx);
	}

	// Children of an object, ordered by key.
	ExpectedChildrenMap GetChildren() const;

	bool IsObject() const;
	bool IsArray() const;
	bool IsString() const;
	bool IsInt64() const;
	bool IsDouble() const;
	bool IsNumber() const;
	bool IsBool() const;
	bool IsNull() const;

	ExpectedString GetString() const;
	ExpectedInt64 GetInt64() const;
	ExpectedDouble GetDouble() const;
	ExpectedBool GetBool() const;

	template <typename T>
	expected::expected<T, error::Error> Get() const;

	ExpectedSize GetArraySize() const;

	friend ExpectedJson LoadFromFile(string file_path);
	friend ExpectedJson Load(string json_str);
	friend ExpectedJson Load(istream &str);

private:
#ifdef EDGEDEPLOY_USE_NLOHMANN_JSON
	nlohmann::json n_json;
	Json(nlohmann::json n_json) :
		n_json(n_json) {};
#endif
};

using ExpectedJson = expected::expected<Json, error::Error>;

using ExpectedStringVector = expected::ExpectedStringVector;
using KeyValueMap = unordered_map<string, string>;
using ExpectedKeyValueMap = expected::expected<KeyValueMap, error::Error>;

template <>
ExpectedKeyValueMap Json::Get<KeyValueMap>() const;
template <>
ExpectedStringVector Json::Get<vector<string>>() const;
template <>
ExpectedString Json::Get<string>() const;
template <>
ExpectedInt64 Json::Get<int64_t>() const;
template <>
ExpectedDouble Json::Get<double>() const;
template <>
ExpectedBool Json::Get<bool>() const;

using ChildrenMap = map<string, Json>;
using ExpectedChildrenMap = expected::expected<ChildrenMap, error::Error>;

ExpectedJson LoadFromFile(string file_path);
ExpectedJson Load(string json_str);
ExpectedJson Load(istream &str);

string EscapeString(const string &str);

ExpectedStringVector ToStringVector(const json::Json &j);
ExpectedKeyValueMap ToKeyValueMap(const json::Json &j);
ExpectedString ToString(const json::Json &j);

enum class MissingOk {
	No,
	Yes,
};

// Gets the value of `key` in `json` as a `T`. With `MissingOk::Yes` an absent key yields a
// default constructed `T`.
template <typename T>
expected::expected<T, error::Error> Get(
	const json::Json &json, const string &key, MissingOk missing_ok);

} // namespace json
} // namespace common
} // namespace edgedeploy

#endif // EDGEDEPLOY_COMMON_JSON_HPP
