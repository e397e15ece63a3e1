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

#include <common/testing.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <random>

#include <common/json.hpp>

namespace edgedeploy {
namespace common {
namespace testing {

namespace fs = std::filesystem;

namespace json = edgedeploy::common::json;

TemporaryDirectory::TemporaryDirectory() {
	fs::path path = fs::temp_directory_path();
	path.append("edgedeploy-test-" + std::to_string(std::random_device()()));
	fs::create_directories(path);
	path_ = path.string();
}

TemporaryDirectory::~TemporaryDirectory() {
	std::error_code ec;
	fs::remove_all(path_, ec);
}

std::string TemporaryDirectory::Path() const {
	return path_;
}

void TemporaryDirectory::CreateSubDirectory(const string &dirname) {
	fs::create_directories(fs::path(path_) / dirname);
}

::testing::AssertionResult FileContains(const string &filename, const string &expected_content) {
	ifstream is {filename};
	ostringstream contents_s;
	contents_s << is.rdbuf();
	string contents {contents_s.str()};
	if (contents == expected_content) {
		return ::testing::AssertionSuccess();
	}
	return ::testing::AssertionFailure()
		   << "Expected: '" << expected_content << "' Got: '" << contents << "'";
}

::testing::AssertionResult FileJsonEquals(const string &filename, const string &expected_content) {
	auto contents = json::LoadFromFile(filename);
	if (!contents) {
		return ::testing::AssertionFailure() << contents.error().String();
	}
	auto expected_contents = json::Load(expected_content);
	if (!expected_contents) {
		return ::testing::AssertionFailure() << expected_contents.error().String();
	}
	if (contents.value().Dump() == expected_contents.value().Dump()) {
		return ::testing::AssertionSuccess();
	}
	return ::testing::AssertionFailure() << "Expected: '" << expected_contents.value().Dump()
										 << "' Got: '" << contents.value().Dump() << "'";
}

void WriteFile(const string &filename, const string &content) {
	ofstream os {filename, ios::out | ios::trunc};
	os << content;
}

} // namespace testing
} // namespace common
} // namespace edgedeploy
