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

#ifndef EDGEDEPLOY_COMMON_TESTING
#define EDGEDEPLOY_COMMON_TESTING

#include <chrono>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

#include <gtest/gtest.h>

#include <common/events.hpp>

namespace edgedeploy {
namespace common {
namespace testing {

using namespace std;

namespace error = edgedeploy::common::error;
namespace events = edgedeploy::common::events;

class TemporaryDirectory {
public:
	TemporaryDirectory();
	~TemporaryDirectory();

	std::string Path() const;

	void CreateSubDirectory(const string &dirname);

private:
	std::string path_;
};

// An event loop which automatically times out after a given amount of time.
class TestEventLoop : public events::EventLoop {
public:
	TestEventLoop(chrono::seconds seconds = chrono::seconds(5)) :
		timer_ {*this} {
		timer_.AsyncWait(seconds, [this](error::Error err) {
			if (err.code == make_error_condition(errc::operation_canceled)) {
				return;
			}
			Stop();
			// Throw rather than FAIL(), so that the caller is escaped as well.
			throw runtime_error("Test timed out");
		});
	}

private:
	events::Timer timer_;
};

::testing::AssertionResult FileContains(const string &filename, const string &expected_content);
::testing::AssertionResult FileJsonEquals(const string &filename, const string &expected_content);

// Writes `content` to `filename`, truncating it first.
void WriteFile(const string &filename, const string &content);

class RedirectStreamOutputs {
public:
	RedirectStreamOutputs() {
		cout_stream_ = cout.rdbuf(cout_string_.rdbuf());
		cerr_stream_ = cerr.rdbuf(cerr_string_.rdbuf());
	}
	~RedirectStreamOutputs() {
		cout.rdbuf(cout_stream_);
		cerr.rdbuf(cerr_stream_);
	}

	string GetCout() const {
		return cout_string_.str();
	}

	string GetCerr() const {
		return cerr_string_.str();
	}

private:
	streambuf *cout_stream_;
	streambuf *cerr_stream_;
	stringstream cout_string_;
	stringstream cerr_string_;
};

} // namespace testing
} // namespace common
} // namespace edgedeploy

#endif // EDGEDEPLOY_COMMON_TESTING
