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


#include <edgedeploy-core/rollback.hpp>

#include <gtest/gtest.h>

#include <common/testing.hpp>

#include <edgedeploy-core/deployment.hpp>
#include <edgedeploy-core/testing.hpp>

namespace deployment = edgedeploy::core::deployment;
namespace error = edgedeploy::common::error;
namespace executor = edgedeploy::core::executor;
namespace mtesting = edgedeploy::common::testing;
namespace ctesting = edgedeploy::core::testing;
namespace resolved_state = edgedeploy::core::resolved_state;
namespace rollback = edgedeploy::core::rollback;
namespace semver = edgedeploy::core::semver;

using namespace std;

class RollbackTests : public testing::Test {
protected:
	RollbackTests() :
		runtime_ {loop_},
		executor_ {loop_, runtime_, runtime_, chrono::seconds(3)},
		rollback_ {executor_} {
	}

	void SetUp() override {
		resolved_state::ResolvedComponent app;
		app.name = "app";
		app.version = semver::Version(1, 0, 0);
		good_.components["app"] = app;

		partial_ = good_;
		partial_.components["app"].version = semver::Version(2, 0, 0);
		resolved_state::ResolvedComponent extra;
		extra.name = "extra";
		extra.version = semver::Version(1, 0, 0);
		partial_.components["extra"] = extra;

		runtime_.installed = {{"app", "2.0.0"}, {"extra", "1.0.0"}};
	}

	error::Error Run() {
		error::Error result = error::MakeError(error::GenericError, "Rollback never finished");
		bool done = false;
		rollback_.Rollback("failed-deployment", partial_, [this, &result, &done](error::Error err) {
			result = err;
			done = true;
			loop_.Stop();
		});
		if (!done) {
			loop_.Run();
		}
		return result;
	}

	mtesting::TestEventLoop loop_;
	ctesting::FakeComponentRuntime runtime_;
	executor::DeploymentExecutor executor_;
	rollback::RollbackManager rollback_;

	resolved_state::ResolvedState good_;
	resolved_state::ResolvedState partial_;
};

TEST_F(RollbackTests, RestoresTheSnapshot) {
	rollback_.Capture(good_);
	runtime_.SetOutcome("app", {executor::LifecycleState::Starting, executor::LifecycleState::Running});

	EXPECT_EQ(Run(), error::NoError);
	EXPECT_FALSE(rollback_.InProgress());
	EXPECT_EQ(rollback_.Snapshot(), good_);

	map<string, string> expected_installed {{"app", "1.0.0"}};
	EXPECT_EQ(runtime_.installed, expected_installed);
	ASSERT_EQ(runtime_.applied.size(), 2u);
	EXPECT_EQ(runtime_.applied[0].type, executor::ActionType::Update);
	EXPECT_EQ(runtime_.applied[1].type, executor::ActionType::Remove);
}

TEST_F(RollbackTests, FailedRollbackIsARollbackError) {
	rollback_.Capture(good_);
	runtime_.SetOutcome("app", {executor::LifecycleState::Broken});

	auto err = Run();
	EXPECT_TRUE(deployment::IsError(err, deployment::RollbackError)) << err.String();
	EXPECT_FALSE(rollback_.InProgress());
	// Applied once, nothing is retried.
	EXPECT_EQ(runtime_.applied.size(), 2u);
}

TEST_F(RollbackTests, DoesNotNest) {
	rollback_.Capture(good_);
	runtime_.SetOutcome("app", {executor::LifecycleState::Starting, executor::LifecycleState::Running});

	rollback_.Rollback("first", partial_, [this](error::Error err) { loop_.Stop(); });
	EXPECT_TRUE(rollback_.InProgress());

	error::Error nested;
	rollback_.Rollback("second", partial_, [&nested](error::Error err) { nested = err; });
	EXPECT_TRUE(deployment::IsError(nested, deployment::RollbackError)) << nested.String();

	loop_.Run();
	EXPECT_FALSE(rollback_.InProgress());
}
