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

#include <common/path.hpp>

#include <algorithm>
#include <filesystem>
#include <string>
#include <system_error>

#include <common/log.hpp>

namespace edgedeploy {
namespace common {
namespace path {

using namespace std;
namespace fs = std::filesystem;

namespace log = edgedeploy::common::log;

static error::Error FromErrorCode(const std::error_code &ec, const string &msg) {
	return error::Error(ec.default_error_condition(), msg + ": " + ec.message());
}

string JoinOne(const string &prefix, const string &suffix) {
	return (fs::path(prefix) / suffix).string();
}

string BaseName(const string &path) {
	return fs::path(path).filename().string();
}

string DirName(const string &path) {
	return fs::path(path).parent_path().string();
}

bool IsAbsolute(const string &path) {
	return fs::path(path).is_absolute();
}

bool FileExists(const string &path) {
	std::error_code ec;
	return fs::exists(path, ec);
}

error::Error CreateDirectories(const string &path) {
	std::error_code ec;
	fs::create_directories(path, ec);
	if (ec) {
		return FromErrorCode(ec, "Could not create directory '" + path + "'");
	}
	return error::NoError;
}

error::Error FileDelete(const string &path) {
	std::error_code ec;
	fs::remove(path, ec);
	if (ec) {
		return FromErrorCode(ec, "Could not remove '" + path + "'");
	}
	return error::NoError;
}

error::Error Rename(const string &from, const string &to) {
	std::error_code ec;
	fs::rename(from, to, ec);
	if (ec) {
		return FromErrorCode(ec, "Could not rename '" + from + "' to '" + to + "'");
	}
	return error::NoError;
}

expected::ExpectedStringVector ListFiles(
	const string &in_directory, function<bool(string)> matcher) {
	vector<string> matching_files {};
	std::error_code ec;
	fs::directory_iterator it {fs::path(in_directory), ec};
	if (ec) {
		return expected::unexpected(
			FromErrorCode(ec, "Could not list directory '" + in_directory + "'"));
	}

	for (const auto &entry : it) {
		fs::path file_path = entry.path();
		if (!entry.is_regular_file(ec)) {
			log::Debug("'" + file_path.string() + "'" + " is not a regular file. Ignoring.");
			continue;
		}

		if (matcher(file_path.string())) {
			matching_files.push_back(file_path.string());
		}
	}

	sort(matching_files.begin(), matching_files.end());
	return matching_files;
}

} // namespace path
} // namespace common
} // namespace edgedeploy
