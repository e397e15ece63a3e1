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


#include <edgedeploy-core/daemon/state_machine.hpp>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <common/common.hpp>
#include <common/key_value_database_in_memory.hpp>
#include <common/testing.hpp>

#include <edgedeploy-core/testing.hpp>

namespace common = edgedeploy::common;
namespace conf = edgedeploy::common::conf;
namespace core_daemon = edgedeploy::core::daemon;
namespace deployment = edgedeploy::core::deployment;
namespace error = edgedeploy::common::error;
namespace events = edgedeploy::common::events;
namespace executor = edgedeploy::core::executor;
namespace kvdb = edgedeploy::common::key_value_database;
namespace mtesting = edgedeploy::common::testing;
namespace queue = edgedeploy::core::queue;
namespace resolved_state = edgedeploy::core::resolved_state;
namespace root_components = edgedeploy::core::root_components;
namespace catalog = edgedeploy::core::catalog;
namespace update_gate = edgedeploy::core::update_gate;
namespace testing_fakes = edgedeploy::core::testing;

using namespace std;

using DeploymentStatus = deployment::DeploymentStatus;
using DetailedStatus = deployment::DetailedStatus;

static deployment::Deployment CloudDeployment(
	const string &id, const string &group, const string &components, const string &policies = "{}") {
	string doc = R"({"deploymentId": ")" + id
				 + R"(", "targetArn": "arn:aws:iot:eu-west-1:123456789012:thinggroup/)" + group
				 + R"(", "components": )" + components + R"(, "deploymentPolicies": )" + policies
				 + "}";
	auto dep = deployment::Deployment::FromString(deployment::DeploymentType::CloudJob, doc, 1);
	EXPECT_TRUE(dep) << dep.error().String();
	return dep.value();
}

class DaemonTests : public testing::Test {
protected:
	DaemonTests() :
		runtime_ {loop_} {
		config_.update_gate_cancellation_check_milliseconds = 20;
		config_.component_terminal_state_timeout_seconds = 5;
		ctx_ = MakeContext();
	}

	unique_ptr<core_daemon::Context> MakeContext() {
		return unique_ptr<core_daemon::Context>(new core_daemon::Context(
			config_,
			loop_,
			db_,
			core_daemon::Collaborators {
				catalog_, safety_, validation_, runtime_, runtime_, reporter_}));
	}

	// Runs the daemon until one deployment is finished.
	error::Error RunOne() {
		core_daemon::StateMachine state_machine(*ctx_, loop_);
		state_machine.StopAfterDeployment();
		return state_machine.Run();
	}

	error::Error Deploy(const deployment::Deployment &dep) {
		ctx_->Submit(dep);
		return RunOne();
	}

	string ReadKey(const string &key) {
		auto data = db_.Read(key);
		if (!data) {
			return "";
		}
		return common::StringFromByteVector(data.value());
	}

	conf::EdgeDeployConfig config_;
	mtesting::TestEventLoop loop_;
	kvdb::KeyValueDatabaseInMemory db_;
	catalog::InMemoryCatalog catalog_;
	testing_fakes::FakeSafetyCheckClient safety_;
	testing_fakes::FakeValidationClient validation_;
	testing_fakes::FakeComponentRuntime runtime_;
	testing_fakes::RecordingStatusReporter reporter_;
	unique_ptr<core_daemon::Context> ctx_;
};

TEST_F(DaemonTests, ConfigurationMergeOnFreshDevice) {
	testing_fakes::AddRecipe(
		catalog_,
		"CustomerApp",
		"1.0.0",
		{},
		R"({"sampleText": "Hello world", "listKey": ["item1", "item2"],
		    "path": {"leafKey": "default value of /path/leafKey"}})");

	auto err = Deploy(CloudDeployment(
		"deployment-a",
		"Fleet",
		R"({"CustomerApp": {"version": "1.0.0",
		    "configurationUpdate": {"merge": "{\"sampleText\": \"This is a test\"}"}}})"));
	ASSERT_EQ(err, error::NoError) << err.String();

	const auto &last = reporter_.Last("deployment-a");
	EXPECT_EQ(last.status, DeploymentStatus::Succeeded);
	ASSERT_TRUE(last.details.detailed_status);
	EXPECT_EQ(last.details.detailed_status.value(), DetailedStatus::Successful);

	ASSERT_EQ(runtime_.applied.size(), 1u);
	EXPECT_EQ(runtime_.applied[0].type, executor::ActionType::Install);
	const string expected_configuration =
		R"({"listKey":["item1","item2"],"path":{"leafKey":"default value of /path/leafKey"},)"
		R"("sampleText":"This is a test"})";
	EXPECT_EQ(runtime_.applied[0].configuration.Dump(), expected_configuration);
	EXPECT_EQ(runtime_.installed["CustomerApp"], "1.0.0");

	auto app = ctx_->current_state.Find("CustomerApp");
	ASSERT_NE(app, nullptr);
	EXPECT_EQ(app->configuration.Dump(), expected_configuration);
	// Nothing asked, the component was not running yet.
	EXPECT_TRUE(validation_.requests.empty());

	EXPECT_EQ(ReadKey(core_daemon::Context::current_state_key), ctx_->current_state.ToJson());
	EXPECT_EQ(ReadKey(core_daemon::Context::last_known_good_key), ctx_->current_state.ToJson());
	EXPECT_EQ(
		ReadKey(core_daemon::Context::group_to_root_components_key),
		root_components::ToJson({{"thinggroup/Fleet", {{"CustomerApp", "1.0.0"}}}}));

	// Reported while it went.
	vector<DeploymentStatus> statuses;
	for (const auto &record : reporter_.records) {
		statuses.push_back(record.status);
	}
	EXPECT_THAT(
		statuses,
		testing::ElementsAre(
			DeploymentStatus::Queued, DeploymentStatus::InProgress, DeploymentStatus::Succeeded));
}

TEST_F(DaemonTests, RejectedConfigurationChangesNothing) {
	testing_fakes::AddRecipe(
		catalog_, "CustomerApp", "1.0.0", {}, R"({"sampleText": "Hello world"})");

	auto err = Deploy(CloudDeployment("first", "Fleet", R"({"CustomerApp": {"version": "1.0.0"}})"));
	ASSERT_EQ(err, error::NoError) << err.String();
	ASSERT_EQ(runtime_.applied.size(), 1u);
	auto before = ctx_->current_state;

	validation_.Reject("CustomerApp", "sampleText must not be empty");
	err = Deploy(CloudDeployment(
		"second",
		"Fleet",
		R"({"CustomerApp": {"version": "1.0.0",
		    "configurationUpdate": {"merge": "{\"sampleText\": \"\"}"}}})"));
	ASSERT_EQ(err, error::NoError) << err.String();

	const auto &last = reporter_.Last("second");
	EXPECT_EQ(last.status, DeploymentStatus::Failed);
	ASSERT_TRUE(last.details.detailed_status);
	EXPECT_EQ(last.details.detailed_status.value(), DetailedStatus::FailedNoStateChange);
	EXPECT_THAT(last.details.error_stack, testing::Contains("COMPONENT_CONFIGURATION_NOT_VALID"));
	EXPECT_THAT(last.details.failure_cause, testing::HasSubstr("sampleText must not be empty"));

	ASSERT_EQ(validation_.requests.size(), 1u);
	EXPECT_EQ(validation_.requests[0].component, "CustomerApp");
	EXPECT_EQ(validation_.requests[0].deployment_id, "second");
	EXPECT_EQ(validation_.requests[0].configuration, R"({"sampleText":""})");

	// Validation comes before the update gate, and nothing was applied.
	EXPECT_TRUE(safety_.requests.empty());
	EXPECT_EQ(runtime_.applied.size(), 1u);
	EXPECT_EQ(ctx_->current_state, before);
}

TEST_F(DaemonTests, AcceptedConfigurationIsApplied) {
	testing_fakes::AddRecipe(
		catalog_, "CustomerApp", "1.0.0", {}, R"({"sampleText": "Hello world"})");

	auto err = Deploy(CloudDeployment("first", "Fleet", R"({"CustomerApp": {"version": "1.0.0"}})"));
	ASSERT_EQ(err, error::NoError) << err.String();

	validation_.Subscribe("CustomerApp");
	err = Deploy(CloudDeployment(
		"second",
		"Fleet",
		R"({"CustomerApp": {"version": "1.0.0",
		    "configurationUpdate": {"merge": "{\"sampleText\": \"Bye\"}"}}})"));
	ASSERT_EQ(err, error::NoError) << err.String();

	EXPECT_EQ(reporter_.Last("second").status, DeploymentStatus::Succeeded);
	ASSERT_EQ(validation_.requests.size(), 1u);
	ASSERT_EQ(runtime_.applied.size(), 2u);
	EXPECT_EQ(runtime_.applied[1].configuration.Dump(), R"({"sampleText":"Bye"})");
}

TEST_F(DaemonTests, UnansweredValidationTimesOut) {
	testing_fakes::AddRecipe(catalog_, "CustomerApp", "1.0.0");

	auto err = Deploy(CloudDeployment("first", "Fleet", R"({"CustomerApp": {"version": "1.0.0"}})"));
	ASSERT_EQ(err, error::NoError) << err.String();

	validation_.Silence("CustomerApp");
	err = Deploy(CloudDeployment(
		"second",
		"Fleet",
		R"({"CustomerApp": {"version": "1.0.0",
		    "configurationUpdate": {"merge": "{\"key\": 1}"}}})",
		R"({"configurationValidationPolicy": {"timeout": 0}})"));
	ASSERT_EQ(err, error::NoError) << err.String();

	const auto &last = reporter_.Last("second");
	ASSERT_TRUE(last.details.detailed_status);
	EXPECT_EQ(last.details.detailed_status.value(), DetailedStatus::FailedNoStateChange);
	EXPECT_THAT(last.details.failure_cause, testing::HasSubstr("Timed out"));
	EXPECT_EQ(runtime_.applied.size(), 1u);
}

TEST_F(DaemonTests, ComponentReleasesTheGate) {
	testing_fakes::AddRecipe(catalog_, "CustomerApp", "1.0.0");
	testing_fakes::AddRecipe(catalog_, "CustomerApp", "2.0.0");

	auto err = Deploy(CloudDeployment("first", "Fleet", R"({"CustomerApp": {"version": "1.0.0"}})"));
	ASSERT_EQ(err, error::NoError) << err.String();

	update_gate::SafetyDecision defer;
	defer.proceed = false;
	defer.defer_for = chrono::seconds(60);
	safety_.Script("CustomerApp", {defer});

	events::Timer releaser {loop_};
	releaser.AsyncWait(chrono::milliseconds(100), [this](error::Error err) {
		ASSERT_EQ(err, error::NoError);
		safety_.ReleaseFrom("CustomerApp");
	});

	err = Deploy(CloudDeployment("second", "Fleet", R"({"CustomerApp": {"version": "2.0.0"}})"));
	ASSERT_EQ(err, error::NoError) << err.String();

	EXPECT_EQ(reporter_.Last("second").status, DeploymentStatus::Succeeded);
	EXPECT_THAT(safety_.requests, testing::ElementsAre("CustomerApp"));
	ASSERT_EQ(safety_.releases.size(), 1u);
	EXPECT_EQ(safety_.releases[0].reason, update_gate::ReleaseReason::Proceeding);
	EXPECT_EQ(runtime_.installed["CustomerApp"], "2.0.0");
}

TEST_F(DaemonTests, ConflictingGroupsChangeNothing) {
	testing_fakes::AddRecipe(catalog_, "ComponentX", "1.0.0");
	testing_fakes::AddRecipe(catalog_, "ComponentX", "2.0.0");

	auto err = Deploy(CloudDeployment("from-a", "A", R"({"ComponentX": {"version": "==1.0.0"}})"));
	ASSERT_EQ(err, error::NoError) << err.String();
	ASSERT_EQ(reporter_.Last("from-a").status, DeploymentStatus::Succeeded);
	auto before = ctx_->current_state;
	auto roots_before = ReadKey(core_daemon::Context::group_to_root_components_key);

	err = Deploy(CloudDeployment("from-b", "B", R"({"ComponentX": {"version": "==2.0.0"}})"));
	ASSERT_EQ(err, error::NoError) << err.String();

	const auto &last = reporter_.Last("from-b");
	EXPECT_EQ(last.status, DeploymentStatus::Failed);
	ASSERT_TRUE(last.details.detailed_status);
	EXPECT_EQ(last.details.detailed_status.value(), DetailedStatus::FailedNoStateChange);
	EXPECT_THAT(last.details.failure_cause, testing::HasSubstr("thinggroup/A: ==1.0.0"));
	EXPECT_THAT(last.details.failure_cause, testing::HasSubstr("thinggroup/B: ==2.0.0"));

	EXPECT_EQ(runtime_.applied.size(), 1u);
	EXPECT_EQ(runtime_.installed["ComponentX"], "1.0.0");
	EXPECT_EQ(ctx_->current_state, before);
	EXPECT_EQ(ReadKey(core_daemon::Context::group_to_root_components_key), roots_before);
}

TEST_F(DaemonTests, BrokenComponentIsRolledBack) {
	testing_fakes::AddRecipe(catalog_, "CustomerApp", "1.0.0");
	testing_fakes::AddRecipe(catalog_, "CustomerApp", "2.0.0");

	auto err = Deploy(CloudDeployment("good", "Fleet", R"({"CustomerApp": {"version": "1.0.0"}})"));
	ASSERT_EQ(err, error::NoError) << err.String();
	auto snapshot = ctx_->current_state;
	auto roots_before = ReadKey(core_daemon::Context::group_to_root_components_key);

	runtime_.SetOutcome("CustomerApp", "2.0.0", {executor::LifecycleState::Broken});
	err = Deploy(CloudDeployment(
		"bad",
		"Fleet",
		R"({"CustomerApp": {"version": "2.0.0"}})",
		R"({"failureHandlingPolicy": "ROLLBACK"})"));
	ASSERT_EQ(err, error::NoError) << err.String();

	const auto &last = reporter_.Last("bad");
	EXPECT_EQ(last.status, DeploymentStatus::Failed);
	ASSERT_TRUE(last.details.detailed_status);
	EXPECT_EQ(last.details.detailed_status.value(), DetailedStatus::FailedRollbackComplete);
	EXPECT_THAT(last.details.failure_cause, testing::HasSubstr("BROKEN"));

	EXPECT_EQ(ctx_->current_state, snapshot);
	EXPECT_EQ(ReadKey(core_daemon::Context::last_known_good_key), snapshot.ToJson());
	EXPECT_EQ(runtime_.installed["CustomerApp"], "1.0.0");
	EXPECT_EQ(ReadKey(core_daemon::Context::current_state_key), snapshot.ToJson());
	EXPECT_EQ(ReadKey(core_daemon::Context::group_to_root_components_key), roots_before);
}

TEST_F(DaemonTests, FailureWithoutRollbackKeepsTheNewRoots) {
	testing_fakes::AddRecipe(catalog_, "CustomerApp", "1.0.0");
	runtime_.SetOutcome("CustomerApp", {executor::LifecycleState::Broken});

	auto err = Deploy(CloudDeployment(
		"no-rollback",
		"Fleet",
		R"({"CustomerApp": {"version": "1.0.0"}})",
		R"({"failureHandlingPolicy": "DO_NOTHING"})"));
	ASSERT_EQ(err, error::NoError) << err.String();

	const auto &last = reporter_.Last("no-rollback");
	EXPECT_EQ(last.status, DeploymentStatus::Failed);
	ASSERT_TRUE(last.details.detailed_status);
	EXPECT_EQ(last.details.detailed_status.value(), DetailedStatus::FailedRollbackNotRequested);

	EXPECT_NE(ctx_->current_state.Find("CustomerApp"), nullptr);
	EXPECT_EQ(ReadKey(core_daemon::Context::last_known_good_key), "");
	EXPECT_EQ(
		ReadKey(core_daemon::Context::group_to_root_components_key),
		root_components::ToJson({{"thinggroup/Fleet", {{"CustomerApp", "1.0.0"}}}}));
}

TEST_F(DaemonTests, CancelWhileTheGateWaits) {
	testing_fakes::AddRecipe(catalog_, "CustomerApp", "1.0.0");
	testing_fakes::AddRecipe(catalog_, "CustomerApp", "2.0.0");

	auto err = Deploy(CloudDeployment("first", "Fleet", R"({"CustomerApp": {"version": "1.0.0"}})"));
	ASSERT_EQ(err, error::NoError) << err.String();
	ASSERT_EQ(runtime_.applied.size(), 1u);

	update_gate::SafetyDecision defer;
	defer.proceed = false;
	defer.defer_for = chrono::seconds(60);
	safety_.Script("CustomerApp", {defer});

	// Supersedes the deployment in progress while the component holds the gate closed.
	events::Timer newer {loop_};
	newer.AsyncWait(chrono::milliseconds(100), [this](error::Error err) {
		ASSERT_EQ(err, error::NoError);
		ctx_->Submit(
			CloudDeployment("third", "Fleet", R"({"CustomerApp": {"version": "2.0.0"}})"));
	});

	err = Deploy(CloudDeployment("second", "Fleet", R"({"CustomerApp": {"version": "2.0.0"}})"));
	ASSERT_EQ(err, error::NoError) << err.String();

	const auto &last = reporter_.Last("second");
	EXPECT_EQ(last.status, DeploymentStatus::Canceled);
	ASSERT_TRUE(last.details.detailed_status);
	EXPECT_EQ(last.details.detailed_status.value(), DetailedStatus::Canceled);

	EXPECT_THAT(safety_.requests, testing::ElementsAre("CustomerApp"));
	ASSERT_EQ(safety_.releases.size(), 1u);
	EXPECT_EQ(safety_.releases[0].component, "CustomerApp");
	EXPECT_EQ(safety_.releases[0].deployment_id, "second");
	EXPECT_EQ(safety_.releases[0].reason, update_gate::ReleaseReason::Canceled);

	// Nothing was touched.
	EXPECT_EQ(runtime_.applied.size(), 1u);
	EXPECT_EQ(runtime_.installed["CustomerApp"], "1.0.0");

	// The newer one was waiting when the daemon stopped.
	EXPECT_THAT(ReadKey(core_daemon::Context::deployment_queue_key), testing::HasSubstr("third"));
}

TEST_F(DaemonTests, QueuedDeploymentsSurviveRestart) {
	testing_fakes::AddRecipe(catalog_, "A", "1.0.0");
	testing_fakes::AddRecipe(catalog_, "B", "1.0.0");

	ctx_->Submit(CloudDeployment("one", "GroupA", R"({"A": {"version": "1.0.0"}})"));
	ctx_->Submit(CloudDeployment("two", "GroupB", R"({"B": {"version": "1.0.0"}})"));
	auto err = RunOne();
	ASSERT_EQ(err, error::NoError) << err.String();
	EXPECT_EQ(reporter_.Last("one").status, DeploymentStatus::Succeeded);
	EXPECT_THAT(ReadKey(core_daemon::Context::deployment_queue_key), testing::HasSubstr("two"));

	// A new process, with the same database.
	ctx_ = MakeContext();
	err = RunOne();
	ASSERT_EQ(err, error::NoError) << err.String();
	EXPECT_EQ(reporter_.Last("two").status, DeploymentStatus::Succeeded);
	EXPECT_THAT(
		ReadKey(core_daemon::Context::deployment_queue_key), testing::HasSubstr(R"("deployments":[])"));

	// Finished deployments delivered again after another restart are not run twice.
	ctx_ = MakeContext();
	ASSERT_EQ(ctx_->LoadState(), error::NoError);
	EXPECT_EQ(
		ctx_->Submit(CloudDeployment("one", "GroupA", R"({"A": {"version": "1.0.0"}})")),
		::queue::OfferResult::Ignored);
	EXPECT_EQ(
		ctx_->Submit(CloudDeployment("two", "GroupB", R"({"B": {"version": "1.0.0"}})")),
		::queue::OfferResult::Ignored);
	EXPECT_EQ(ctx_->deployment_queue.StatusOf("two"), DeploymentStatus::Succeeded);

	EXPECT_EQ(runtime_.installed["A"], "1.0.0");
	EXPECT_EQ(runtime_.installed["B"], "1.0.0");
	EXPECT_EQ(
		ReadKey(core_daemon::Context::group_to_root_components_key),
		root_components::ToJson({
			{"thinggroup/GroupA", {{"A", "1.0.0"}}},
			{"thinggroup/GroupB", {{"B", "1.0.0"}}},
		}));
}

TEST_F(DaemonTests, UnparsablePersistedStateStopsTheDaemon) {
	auto err = db_.Write(
		core_daemon::Context::current_state_key, common::ByteVectorFromString("{not json"));
	ASSERT_EQ(err, error::NoError);

	err = RunOne();
	EXPECT_NE(err, error::NoError);
	EXPECT_TRUE(reporter_.records.empty());
}
