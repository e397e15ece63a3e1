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

#ifndef EDGEDEPLOY_COMMON_HPP
#define EDGEDEPLOY_COMMON_HPP

#include <common/expected.hpp>

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace edgedeploy {
namespace common {

using namespace std;

inline static vector<uint8_t> ByteVectorFromString(const char *str) {
	return vector<uint8_t>(
		reinterpret_cast<const uint8_t *>(str),
		reinterpret_cast<const uint8_t *>(str + strlen(str)));
}

// Using a template here allows use of `string_view`.
template <typename STR>
vector<uint8_t> ByteVectorFromString(const STR &str) {
	return vector<uint8_t>(str.begin(), str.end());
}

inline static string StringFromByteVector(const vector<uint8_t> &vec) {
	return string(vec.begin(), vec.end());
}

edgedeploy::common::expected::ExpectedLongLong StringToLongLong(const string &str, int base = 10);

vector<string> SplitString(const string &str, const string &delim);
string JoinStrings(const vector<string> &str, const string &delim);
vector<string> JoinStringsMaxWidth(
	const vector<string> &str, const string &delim, size_t max_width);

string StringToLower(const string &str);
string StringTrim(const string &str);

bool StartsWith(const string &str, const string &prefix);
bool EndsWith(const string &str, const string &suffix);

} // namespace common
} // namespace edgedeploy

#endif // EDGEDEPLOY_COMMON_HPP
