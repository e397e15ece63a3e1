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

#include <cerrno>
#include <cstring>
#include <fstream>
#include <map>
#include <string>

#include <nlohmann/json.hpp>

#include <common/common.hpp>

using njson = nlohmann::json;
using namespace std;
namespace expected = edgedeploy::common::expected;
namespace error = edgedeploy::common::error;

namespace edgedeploy {
namespace common {
namespace json {

static error::Error GetErrorFromException(exception &e, const string &context_message) {
	try {
		// Lippincott function: rethrow to dispatch on the exception type.
		throw;
	} catch (njson::parse_error &e) {
		return MakeError(JsonErrorCode::ParseError, context_message + ": " + e.what());
	} catch (njson::type_error &e) {
		return MakeError(JsonErrorCode::TypeError, context_message + ": " + e.what());
	} catch (njson::out_of_range &e) {
		return MakeError(JsonErrorCode::KeyError, context_message + ": " + e.what());
	} catch (system_error &e) {
		return error::Error(e.code().default_error_condition(), context_message + ": " + e.what());
	} catch (exception &e) {
		return error::MakeError(error::GenericError, context_message + ": " + e.what());
	}
}

// Documents can be large, error messages only quote their start.
static string QuotedPrefix(const string &str) {
	const size_t max_quoted = 64;
	if (str.size() <= max_quoted) {
		return str;
	}
	return str.substr(0, max_quoted) + "...";
}

ExpectedJson LoadFromFile(string file_path) {
	ifstream f;
	errno = 0;
	f.open(file_path);
	if (!f) {
		int io_errno = errno;
		auto err = error::Error(
			std::generic_category().default_error_condition(io_errno),
			"Failed to open '" + file_path + "': " + strerror(io_errno));
		return expected::unexpected(err);
	}

	try {
		njson parsed = njson::parse(f);
		return Json(parsed);
	} catch (exception &e) {
		return expected::unexpected(
			GetErrorFromException(e, "Failed to parse '" + file_path + "'"));
	}
}

ExpectedJson Load(string json_str) {
	if (StringTrim(json_str).empty()) {
		return expected::unexpected(MakeError(JsonErrorCode::EmptyError, "No JSON to parse"));
	}
	try {
		njson parsed = njson::parse(json_str);
		return Json(parsed);
	} catch (exception &e) {
		return expected::unexpected(
			GetErrorFromException(e, "Failed to parse '" + QuotedPrefix(json_str) + "'"));
	}
}

ExpectedJson Load(istream &str) {
	try {
		njson parsed = njson::parse(str);
		return Json(parsed);
	} catch (exception &e) {
		return expected::unexpected(GetErrorFromException(e, "Failed to parse JSON from stream"));
	}
}

string Json::Dump(const int indent) const {
	return this->n_json.dump(indent);
}

ExpectedJson Json::Get(const char *child_key) const {
	if (!this->n_json.is_object()) {
		auto err = MakeError(
			JsonErrorCode::TypeError, "Invalid JSON type to get '" + string(child_key) + "' from");
		return expected::unexpected(err);
	}

	auto it = this->n_json.find(child_key);
	if (it == this->n_json.end()) {
		auto err =
			MakeError(JsonErrorCode::KeyError, "Key '" + string(child_key) + "' doesn't exist");
		return expected::unexpected(err);
	}

	return Json(*it);
}

ExpectedJson Json::Get(const size_t idx) const {
	if (!this->n_json.is_array()) {
		auto err = MakeError(
			JsonErrorCode::TypeError,
			"Invalid JSON type to get item at index " + to_string(idx) + " from");
		return expected::unexpected(err);
	}

	if (this->n_json.size() <= idx) {
		auto err =
			MakeError(JsonErrorCode::IndexError, "Index " + to_string(idx) + " out of range");
		return expected::unexpected(err);
	}

	return Json(this->n_json.at(idx));
}

ExpectedChildrenMap Json::GetChildren() const {
	if (!this->IsObject()) {
		auto err = MakeError(JsonErrorCode::TypeError, "Invalid JSON type to get children from");
		return expected::unexpected(err);
	}

	ChildrenMap ret {};
	for (const auto &item : this->n_json.items()) {
		ret[item.key()] = Json(item.value());
	}
	return ret;
}

bool Json::IsObject() const {
	return this->n_json.is_object();
}

bool Json::IsArray() const {
	return this->n_json.is_array();
}

bool Json::IsString() const {
	return this->n_json.is_string();
}

bool Json::IsInt64() const {
	return this->n_json.is_number_integer();
}

bool Json::IsDouble() const {
	return this->n_json.is_number_float();
}

bool Json::IsNumber() const {
	return this->n_json.is_number();
}

bool Json::IsBool() const {
	return this->n_json.is_boolean();
}

bool Json::IsNull() const {
	return this->n_json.is_null();
}

ExpectedString Json::GetString() const {
	try {
		return this->n_json.get<string>();
	} catch (exception &e) {
		return expected::unexpected(GetErrorFromException(e, "Type mismatch when getting string"));
	}
}

ExpectedInt64 Json::GetInt64() const {
	if (!this->n_json.is_number_integer()) {
		return expected::unexpected(
			MakeError(JsonErrorCode::TypeError, "Type mismatch when getting integer"));
	}
	try {
		return this->n_json.get<int64_t>();
	} catch (exception &e) {
		return expected::unexpected(GetErrorFromException(e, "Type mismatch when getting integer"));
	}
}

ExpectedDouble Json::GetDouble() const {
	try {
		return this->n_json.get<double>();
	} catch (exception &e) {
		return expected::unexpected(GetErrorFromException(e, "Type mismatch when getting double"));
	}
}

ExpectedBool Json::GetBool() const {
	try {
		return this->n_json.get<bool>();
	} catch (exception &e) {
		return expected::unexpected(GetErrorFromException(e, "Type mismatch when getting bool"));
	}
}

ExpectedSize Json::GetArraySize() const {
	if (!this->n_json.is_array()) {
		auto err = MakeError(JsonErrorCode::TypeError, "Not a JSON array");
		return expected::unexpected(err);
	}
	return this->n_json.size();
}

} // namespace json
} // namespace common
} // namespace edgedeploy
