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

#include <common/log.hpp>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <fstream>
#include <sstream>

#include <common/common.hpp>
#include <common/path.hpp>
#include <common/testing.hpp>

using namespace std;

namespace path = edgedeploy::common::path;
namespace mtesting = edgedeploy::common::testing;

class LogTestEnv : public testing::Test {
protected:
	static void SetUpTestSuite() {
		namespace log = edgedeploy::common::log;
		log::Setup();
	}

	void SetUp() override {
		namespace log = edgedeploy::common::log;
		log::SetLevel(log::LogLevel::Info);
	}

	void TearDown() override {
		namespace log = edgedeploy::common::log;
		// Drop any file sinks a test may have added.
		log::Setup();
	}
};

TEST_F(LogTestEnv, LoggerInheritsGlobalLevel) {
	namespace log = edgedeploy::common::log;
	log::SetLevel(log::LogLevel::Debug);
	auto logger = log::Logger("Deployments");
	EXPECT_EQ(logger.Level(), log::LogLevel::Debug);

	logger.SetLevel(log::LogLevel::Error);
	EXPECT_EQ(logger.Level(), log::LogLevel::Error);
	EXPECT_EQ(log::Level(), log::LogLevel::Debug);
}

TEST_F(LogTestEnv, LevelFilter) {
	namespace log = edgedeploy::common::log;
	auto logger = log::Logger("Deployments");

	testing::internal::CaptureStderr();
	logger.Error("queue rejected document");
	logger.Info("deployment accepted");
	string output = testing::internal::GetCapturedStderr();
	EXPECT_THAT(output, testing::HasSubstr("severity=error"));
	EXPECT_THAT(output, testing::HasSubstr("severity=info"));
	EXPECT_THAT(output, testing::HasSubstr("name=\"Deployments\""));

	testing::internal::CaptureStderr();
	logger.Debug("resolving");
	log::Trace("details");
	output = testing::internal::GetCapturedStderr();
	EXPECT_EQ(output, "");
}

TEST_F(LogTestEnv, FieldsAccumulateOnDerivedLoggers) {
	namespace log = edgedeploy::common::log;
	auto logger = log::Logger("Deployments");
	auto with_id = logger.WithFields(log::LogField {"deployment_id", "d-1"});
	auto with_component =
		with_id.WithFields(log::LogField {"component", "com.example.Sensor"});

	testing::internal::CaptureStderr();
	with_component.Info("installing");
	logger.Info("plain");
	auto output = testing::internal::GetCapturedStderr();

	auto lines = edgedeploy::common::SplitString(output, "\n");
	ASSERT_GE(lines.size(), 2u);
	EXPECT_THAT(lines[0], testing::HasSubstr("deployment_id=\"d-1\""));
	EXPECT_THAT(lines[0], testing::HasSubstr("component=\"com.example.Sensor\""));
	EXPECT_THAT(lines[0], testing::HasSubstr("msg=\"installing\""));
	EXPECT_THAT(lines[1], testing::Not(testing::HasSubstr("deployment_id")));
}

TEST_F(LogTestEnv, StringToLogLevel) {
	namespace log = edgedeploy::common::log;
	auto level = log::StringToLogLevel("warning");
	ASSERT_TRUE(level);
	EXPECT_EQ(level.value(), log::LogLevel::Warning);
	EXPECT_EQ(log::ToStringLogLevel(level.value()), "warning");

	level = log::StringToLogLevel("verbose");
	ASSERT_FALSE(level);
	EXPECT_EQ(level.error().code, log::MakeError(log::InvalidLogLevelError, "").code);
	EXPECT_THAT(level.error().String(), testing::HasSubstr("'verbose'"));
}

TEST_F(LogTestEnv, FileLogging) {
	namespace log = edgedeploy::common::log;
	mtesting::TemporaryDirectory tmpdir;
	auto log_file = path::Join(tmpdir.Path(), "edgedeploy.log");

	auto err = log::SetupFileLogging(log_file, true);
	ASSERT_EQ(err, edgedeploy::common::error::NoError) << err.String();

	log::WithFields(log::LogField {"deployment_id", "d-7"}).Warning("gate timed out");

	ifstream is {log_file};
	stringstream contents;
	contents << is.rdbuf();
	EXPECT_THAT(contents.str(), testing::HasSubstr("deployment_id=\"d-7\""));
	EXPECT_THAT(contents.str(), testing::HasSubstr("msg=\"gate timed out\""));
}

TEST_F(LogTestEnv, FileLoggingBadPath) {
	namespace log = edgedeploy::common::log;
	mtesting::TemporaryDirectory tmpdir;
	auto err =
		log::SetupFileLogging(path::Join(tmpdir.Path(), "no", "such", "dir", "x.log"), false);
	EXPECT_EQ(err.code, log::MakeError(log::LogFileError, "").code);
}

TEST_F(LogTestEnv, ValuesAreEscaped) {
	namespace log = edgedeploy::common::log;
	auto logger = log::Logger("Deployments").WithFields(log::LogField {"target", "a \"b\""});

	testing::internal::CaptureStderr();
	logger.Info("config {\"k\":\"v\"}\nnext");
	auto output = testing::internal::GetCapturedStderr();

	EXPECT_THAT(output, testing::HasSubstr(R"(target="a \"b\"")"));
	EXPECT_THAT(output, testing::HasSubstr(R"(msg="config {\"k\":\"v\"}\nnext")"));
	EXPECT_EQ(output.find('\n'), output.size() - 1);
}

TEST_F(LogTestEnv, RepeatedFieldTakesTheNewestValue) {
	namespace log = edgedeploy::common::log;
	auto logger = log::Logger("Deployments")
					  .WithFields(log::LogField {"deployment_id", "first"})
					  .WithFields(log::LogField {"deployment_id", "second"});

	testing::internal::CaptureStderr();
	logger.Info("x");
	auto output = testing::internal::GetCapturedStderr();

	EXPECT_THAT(output, testing::HasSubstr("deployment_id=\"second\""));
	EXPECT_THAT(output, testing::Not(testing::HasSubstr("first")));
}
