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


#include <edgedeploy-core/cli/cli.hpp>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <common/common.hpp>
#include <common/conf.hpp>
#include <common/error.hpp>
#include <common/io.hpp>
#include <common/path.hpp>
#include <common/testing.hpp>

#include <edgedeploy-core/cli/actions.hpp>
#include <edgedeploy-core/daemon/spool.hpp>

namespace cli = edgedeploy::core::cli;
namespace common = edgedeploy::common;
namespace deployment = edgedeploy::core::deployment;
namespace error = edgedeploy::common::error;
namespace io = edgedeploy::common::io;
namespace mtesting = edgedeploy::common::testing;
namespace path = edgedeploy::common::path;
namespace spool = edgedeploy::core::daemon::spool;

using namespace std;

using testing::HasSubstr;

class CliTest : public testing::Test {
protected:
	void SetUp() override {
		recipes_dir_ = path::Join(tmpdir_.Path(), "recipes");
		data_dir_ = path::Join(tmpdir_.Path(), "data");
		config_file_ = path::Join(tmpdir_.Path(), "edgedeploy.conf");

		tmpdir_.CreateSubDirectory("recipes");
		mtesting::WriteFile(
			config_file_,
			R"({"ComponentRecipesDir": ")" + recipes_dir_
				+ R"(", "UpdateGateCancellationCheckMilliseconds": 20})");
		mtesting::WriteFile(
			path::Join(recipes_dir_, "CustomerApp-1.0.0.json"),
			R"({
  "componentName": "CustomerApp",
  "componentVersion": "1.0.0",
  "componentConfiguration": {"defaultConfiguration": {"sampleText": "Hello world"}}
})");
	}

	vector<string> Args(const vector<string> &command) {
		vector<string> args {"--config", config_file_, "--data", data_dir_};
		args.insert(args.end(), command.begin(), command.end());
		return args;
	}

	string Document(const string &name, const string &content) {
		auto file = path::Join(tmpdir_.Path(), name);
		mtesting::WriteFile(file, content);
		return file;
	}

	mtesting::TemporaryDirectory tmpdir_;
	string recipes_dir_;
	string data_dir_;
	string config_file_;
};

const string kMergeDocument = R"({
  "deploymentId": "local-1",
  "components": {
    "CustomerApp": {
      "version": "1.0.0",
      "configurationUpdate": {"merge": {"sampleText": "This is a test"}}
    }
  }
})";

TEST_F(CliTest, NoCommand) {
	mtesting::RedirectStreamOutputs redirect_output;
	EXPECT_EQ(cli::Main(Args({})), 1);
	EXPECT_EQ(
		redirect_output.GetCerr(),
		"Could not fulfill request: Invalid options given: Need a command\n");
}

TEST_F(CliTest, UnknownCommand) {
	mtesting::RedirectStreamOutputs redirect_output;
	EXPECT_EQ(cli::Main(Args({"install"})), 1);
	EXPECT_EQ(
		redirect_output.GetCerr(),
		"Could not fulfill request: Invalid options given: No such command: install\n");
}

TEST_F(CliTest, ArgumentErrors) {
	{
		mtesting::RedirectStreamOutputs redirect_output;
		EXPECT_EQ(cli::Main(Args({"deploy"})), 1);
		EXPECT_EQ(
			redirect_output.GetCerr(),
			"Could not fulfill request: Invalid options given: Need a path to a deployment document\n");
	}

	{
		mtesting::RedirectStreamOutputs redirect_output;
		EXPECT_EQ(cli::Main(Args({"deploy", "one.json", "two.json"})), 1);
		EXPECT_EQ(
			redirect_output.GetCerr(),
			"Could not fulfill request: Invalid options given: Too many arguments: two.json\n");
	}

	{
		mtesting::RedirectStreamOutputs redirect_output;
		EXPECT_EQ(cli::Main(Args({"submit", "--type", "bogus", "doc.json"})), 1);
		EXPECT_EQ(
			redirect_output.GetCerr(),
			"Could not fulfill request: Invalid options given: Invalid deployment type: bogus\n");
	}

	{
		mtesting::RedirectStreamOutputs redirect_output;
		EXPECT_EQ(cli::Main(Args({"show-state", "--bogus-option"})), 1);
		EXPECT_EQ(
			redirect_output.GetCerr(),
			"Could not fulfill request: Invalid options given: Unrecognized option '--bogus-option'\n");
	}

	{
		mtesting::RedirectStreamOutputs redirect_output;
		EXPECT_EQ(cli::Main(Args({"daemon", "bogus-argument"})), 1);
		EXPECT_EQ(
			redirect_output.GetCerr(),
			"Could not fulfill request: Invalid options given: Unexpected argument 'bogus-argument'\n");
	}
}

TEST_F(CliTest, ShowStateOfNewDevice) {
	mtesting::RedirectStreamOutputs redirect_output;
	EXPECT_EQ(cli::Main(Args({"show-state"})), 0);
	EXPECT_EQ(
		redirect_output.GetCout(),
		R"({
  "currentState": null,
  "groupToRootComponents": {},
  "lastKnownGood": null
}
)");
}

TEST_F(CliTest, DeployAndShowState) {
	auto doc = Document("deployment.json", kMergeDocument);
	{
		mtesting::RedirectStreamOutputs redirect_output;
		EXPECT_EQ(cli::Main(Args({"deploy", doc})), 0);
		EXPECT_THAT(redirect_output.GetCout(), HasSubstr("Deployment local-1: SUCCESSFUL\n"));
	}

	{
		mtesting::RedirectStreamOutputs redirect_output;
		EXPECT_EQ(cli::Main(Args({"show-state"})), 0);
		auto output = redirect_output.GetCout();
		EXPECT_THAT(output, HasSubstr(R"("LOCAL_DEPLOYMENT": {)"));
		EXPECT_THAT(output, HasSubstr(R"("CustomerApp": "1.0.0")"));
		EXPECT_THAT(output, HasSubstr(R"("sampleText": "This is a test")"));
	}
}

TEST_F(CliTest, FailedDeployment) {
	auto doc = Document("deployment.json", R"({
  "deploymentId": "local-2",
  "components": {"Unknown": {"version": "1.0.0"}}
})");

	mtesting::RedirectStreamOutputs redirect_output;
	EXPECT_EQ(cli::Main(Args({"deploy", doc})), 1);
	EXPECT_THAT(
		redirect_output.GetCout(), HasSubstr("Deployment local-2: FAILED_NO_STATE_CHANGE\n"));
}

TEST_F(CliTest, DeployBrokenDocument) {
	auto doc = Document("deployment.json", R"({"components": {}})");

	mtesting::RedirectStreamOutputs redirect_output;
	EXPECT_EQ(cli::Main(Args({"deploy", doc})), 1);
	EXPECT_THAT(
		redirect_output.GetCerr(),
		HasSubstr("Could not fulfill request: Could not read the deployment from '" + doc + "'"));
}

TEST_F(CliTest, ResolveDoesNotApply) {
	auto doc = Document("deployment.json", kMergeDocument);
	{
		mtesting::RedirectStreamOutputs redirect_output;
		EXPECT_EQ(cli::Main(Args({"resolve", doc})), 0);
		auto output = redirect_output.GetCout();
		EXPECT_THAT(output, HasSubstr(R"("CustomerApp")"));
		EXPECT_THAT(output, HasSubstr(R"("sampleText": "This is a test")"));
	}

	{
		mtesting::RedirectStreamOutputs redirect_output;
		EXPECT_EQ(cli::Main(Args({"show-state"})), 0);
		EXPECT_THAT(redirect_output.GetCout(), HasSubstr(R"("currentState": null)"));
	}
}

TEST_F(CliTest, SubmitDropsIntoTheSpool) {
	auto doc = Document("deployment.json", R"({
  "deploymentId": "shadow-1",
  "targetArn": "arn:aws:iot:eu-west-1:123456789012:thing/Device",
  "components": {"CustomerApp": {"version": "1.0.0"}}
})");

	EXPECT_EQ(cli::Main(Args({"submit", "--type", "shadow", doc})), 0);

	auto files = path::ListFiles(path::Join(data_dir_, "deployments"), [](string file) {
		return common::EndsWith(file, spool::kSubmissionSuffix);
	});
	ASSERT_TRUE(files) << files.error().String();
	ASSERT_EQ(files.value().size(), 1u);

	auto is = io::OpenIfstream(files.value()[0]);
	ASSERT_TRUE(is);
	auto content = io::ReadAll(is.value());
	ASSERT_TRUE(content);
	auto dep = spool::ParseSubmission(content.value(), 0);
	ASSERT_TRUE(dep) << dep.error().String();
	EXPECT_EQ(dep.value().Id(), "shadow-1");
	EXPECT_EQ(dep.value().Type(), deployment::DeploymentType::Shadow);
	EXPECT_EQ(dep.value().Document().group_name, "thing/Device");
}

TEST_F(CliTest, SubmitRejectsInvalidDocuments) {
	// A local document has no target, but a shadow document must.
	auto doc = Document("deployment.json", kMergeDocument);

	mtesting::RedirectStreamOutputs redirect_output;
	EXPECT_EQ(cli::Main(Args({"submit", "--type", "shadow", doc})), 1);
	EXPECT_THAT(redirect_output.GetCerr(), HasSubstr("Could not submit '" + doc + "'"));
}
