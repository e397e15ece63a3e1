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


#include <edgedeploy-core/executor.hpp>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <common/testing.hpp>

#include <edgedeploy-core/deployment.hpp>
#include <edgedeploy-core/testing.hpp>

namespace config_tree = edgedeploy::core::config_tree;
namespace deployment = edgedeploy::core::deployment;
namespace error = edgedeploy::common::error;
namespace events = edgedeploy::common::events;
namespace executor = edgedeploy::core::executor;
namespace mtesting = edgedeploy::common::testing;
namespace ctesting = edgedeploy::core::testing;
namespace resolved_state = edgedeploy::core::resolved_state;
namespace semver = edgedeploy::core::semver;

using namespace std;

using executor::ActionType;
using executor::LifecycleState;

resolved_state::ResolvedComponent Component(
	const string &name, const semver::Version &version, const string &configuration = "{}") {
	resolved_state::ResolvedComponent comp;
	comp.name = name;
	comp.version = version;
	auto conf = config_tree::Value::FromJsonString(configuration);
	EXPECT_TRUE(conf) << conf.error().String();
	comp.configuration = conf.value();
	return comp;
}

TEST(ComputePlanTests, InstallUpdateRemove) {
	resolved_state::ResolvedState current;
	current.components["a"] = Component("a", semver::Version(1, 0, 0));
	current.components["b"] = Component("b", semver::Version(1, 0, 0), R"({"x": 1})");
	current.components["d"] = Component("d", semver::Version(1, 0, 0));
	current.components["e"] = Component("e", semver::Version(1, 0, 0));

	resolved_state::ResolvedState target;
	target.components["b"] = Component("b", semver::Version(1, 0, 0), R"({"x": 2})");
	target.components["c"] = Component("c", semver::Version(3, 0, 0));
	target.components["d"] = Component("d", semver::Version(1, 0, 0));
	target.components["e"] = Component("e", semver::Version(1, 1, 0));

	auto plan = executor::ComputePlan(current, target);
	ASSERT_EQ(plan.size(), 4u);
	EXPECT_EQ(plan[0].type, ActionType::Remove);
	EXPECT_EQ(plan[0].component, "a");
	EXPECT_EQ(plan[1].type, ActionType::Update);
	EXPECT_EQ(plan[1].component, "b");
	EXPECT_EQ(plan[1].configuration.Dump(), R"({"x":2})");
	EXPECT_EQ(plan[2].type, ActionType::Install);
	EXPECT_EQ(plan[2].component, "c");
	EXPECT_EQ(plan[2].version, semver::Version(3, 0, 0));
	EXPECT_EQ(plan[3].type, ActionType::Update);
	EXPECT_EQ(plan[3].component, "e");

	EXPECT_TRUE(executor::ComputePlan(target, target).empty());
}

TEST(LifecycleStateTests, TerminalStates) {
	EXPECT_TRUE(executor::IsTerminal(LifecycleState::Running));
	EXPECT_TRUE(executor::IsTerminal(LifecycleState::Finished));
	EXPECT_TRUE(executor::IsTerminal(LifecycleState::Broken));
	EXPECT_FALSE(executor::IsTerminal(LifecycleState::Errored));
	EXPECT_FALSE(executor::IsTerminal(LifecycleState::Starting));
	EXPECT_EQ(executor::LifecycleStateToString(LifecycleState::Errored), "ERRORED");
}

class ExecutorTests : public testing::Test {
protected:
	ExecutorTests() :
		runtime_ {loop_},
		executor_ {loop_, runtime_, runtime_, chrono::seconds(3)} {
	}

	error::Error Run(const executor::Plan &plan) {
		error::Error result = error::MakeError(error::GenericError, "Executor never finished");
		bool done = false;
		executor_.Execute("exec", plan, [this, &result, &done](error::Error err) {
			result = err;
			done = true;
			loop_.Stop();
		});
		if (!done) {
			loop_.Run();
		}
		return result;
	}

	executor::ComponentAction Install(const string &component) {
		return executor::ComponentAction {
			ActionType::Install, component, semver::Version(1, 0, 0), config_tree::EmptyMap()};
	}

	mtesting::TestEventLoop loop_;
	ctesting::FakeComponentRuntime runtime_;
	executor::DeploymentExecutor executor_;
};

TEST_F(ExecutorTests, AlreadyRunningComponentsFinishAtOnce) {
	EXPECT_EQ(Run({Install("a"), Install("b")}), error::NoError);
	ASSERT_EQ(runtime_.applied.size(), 2u);
	EXPECT_EQ(runtime_.installed["a"], "1.0.0");
	EXPECT_FALSE(executor_.InProgress());
}

TEST_F(ExecutorTests, WaitsForTerminalStates) {
	runtime_.SetOutcome("a", {LifecycleState::Installed, LifecycleState::Starting, LifecycleState::Running});
	runtime_.SetOutcome("b", {LifecycleState::Starting, LifecycleState::Finished});

	EXPECT_EQ(Run({Install("a"), Install("b")}), error::NoError);
	EXPECT_EQ(runtime_.SubscriberCount("a"), 0u);
	EXPECT_EQ(runtime_.SubscriberCount("b"), 0u);
}

TEST_F(ExecutorTests, BrokenComponentFails) {
	runtime_.SetOutcome("a", {LifecycleState::Starting, LifecycleState::Broken});

	auto err = Run({Install("a"), Install("b")});
	EXPECT_TRUE(deployment::IsError(err, deployment::ComponentBrokenError)) << err.String();
	EXPECT_THAT(err.message, testing::HasSubstr("a is BROKEN"));
}

TEST_F(ExecutorTests, BrokenRightAfterApplyFails) {
	runtime_.SetOutcome("a", {LifecycleState::Broken});

	auto err = Run({Install("a")});
	EXPECT_TRUE(deployment::IsError(err, deployment::ComponentBrokenError)) << err.String();
}

TEST_F(ExecutorTests, ErroredComponentMayRecover) {
	runtime_.SetOutcome(
		"a", {LifecycleState::Starting, LifecycleState::Errored, LifecycleState::Running});

	EXPECT_EQ(Run({Install("a")}), error::NoError);
}

TEST_F(ExecutorTests, FailedActionFails) {
	runtime_.FailApply("b");

	auto err = Run({Install("a"), Install("b"), Install("c")});
	EXPECT_TRUE(deployment::IsError(err, deployment::ComponentUpdateError)) << err.String();
	// Stops at the first failure.
	EXPECT_EQ(runtime_.applied.size(), 2u);
	EXPECT_EQ(runtime_.SubscriberCount("a"), 0u);
}

TEST_F(ExecutorTests, ComponentTimeout) {
	runtime_.SetOutcome("a", {LifecycleState::Starting});
	executor_.SetComponentTimeout(chrono::milliseconds(50));

	auto err = Run({Install("a")});
	EXPECT_TRUE(deployment::IsError(err, deployment::ComponentUpdateError)) << err.String();
	EXPECT_THAT(err.message, testing::HasSubstr("Timed out waiting for a"));
}

TEST_F(ExecutorTests, RemovalsAreNotWaitedFor) {
	runtime_.installed["old"] = "1.0.0";
	auto remove = Install("old");
	remove.type = ActionType::Remove;

	EXPECT_EQ(Run({remove}), error::NoError);
	EXPECT_EQ(runtime_.installed.count("old"), 0u);
	EXPECT_EQ(runtime_.SubscriberCount("old"), 0u);
}

TEST_F(ExecutorTests, CancelStopsWaiting) {
	runtime_.SetOutcome("a", {LifecycleState::Starting});

	bool called = false;
	executor_.Execute("exec", {Install("a")}, [&called](error::Error err) { called = true; });
	EXPECT_TRUE(executor_.InProgress());
	EXPECT_EQ(runtime_.SubscriberCount("a"), 1u);

	executor_.Cancel();
	EXPECT_FALSE(executor_.InProgress());
	EXPECT_EQ(runtime_.SubscriberCount("a"), 0u);

	// A late state change goes nowhere.
	runtime_.SetState("a", LifecycleState::Broken);
	events::Timer timer(loop_);
	timer.AsyncWait(chrono::milliseconds(20), [this](error::Error err) { loop_.Stop(); });
	loop_.Run();
	EXPECT_FALSE(called);
}

TEST_F(ExecutorTests, RefusesConcurrentExecution) {
	runtime_.SetOutcome("a", {LifecycleState::Starting, LifecycleState::Running});
	executor_.Execute("exec", {Install("a")}, [this](error::Error err) { loop_.Stop(); });

	error::Error second;
	executor_.Execute("other", {Install("b")}, [&second](error::Error err) { second = err; });
	EXPECT_EQ(second.code, error::MakeError(error::ProgrammingError, "").code);

	loop_.Run();
	EXPECT_FALSE(executor_.InProgress());
}
