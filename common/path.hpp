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

#ifndef EDGEDEPLOY_COMMON_PATH_HPP
#define EDGEDEPLOY_COMMON_PATH_HPP

#include <functional>
#include <string>

#include <common/error.hpp>
#include <common/expected.hpp>

namespace edgedeploy {
namespace common {
namespace path {

using namespace std;

namespace error = edgedeploy::common::error;
namespace expected = edgedeploy::common::expected;

string JoinOne(const string &prefix, const string &path);

template <typename... Paths>
string Join(const string &prefix, const Paths &...paths) {
	string final_path {prefix};
	for (const auto &path : {paths...}) {
		final_path = JoinOne(final_path, path);
	}
	return final_path;
}

string BaseName(const string &path);
string DirName(const string &path);

bool IsAbsolute(const string &path);

bool FileExists(const string &path);

error::Error CreateDirectories(const string &path);

// Removes a regular file. Removing a file which does not exist is not an error.
error::Error FileDelete(const string &path);

error::Error Rename(const string &from, const string &to);

// Lists regular files directly inside `in`, in lexicographical order, keeping only those for
// which `matcher` returns true.
expected::ExpectedStringVector ListFiles(const string &in, function<bool(string)> matcher);

} // namespace path
} // namespace common
} // namespace edgedeploy

#endif // EDGEDEPLOY_COMMON_PATH_HPP
