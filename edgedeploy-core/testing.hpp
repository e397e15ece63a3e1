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


#ifndef EDGEDEPLOY_CORE_TESTING_HPP
#define EDGEDEPLOY_CORE_TESTING_HPP

#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include <common/error.hpp>
#include <common/events.hpp>
#include <common/expected.hpp>

#include <edgedeploy-core/catalog.hpp>
#include <edgedeploy-core/config_tree.hpp>
#include <edgedeploy-core/config_validation.hpp>
#include <edgedeploy-core/deployment.hpp>
#include <edgedeploy-core/executor.hpp>
#include <edgedeploy-core/status.hpp>
#include <edgedeploy-core/update_gate.hpp>

namespace edgedeploy {
namespace core {
namespace testing {

using namespace std;

namespace catalog = edgedeploy::core::catalog;
namespace config_tree = edgedeploy::core::config_tree;
namespace config_validation = edgedeploy::core::config_validation;
namespace deployment = edgedeploy::core::deployment;
namespace error = edgedeploy::common::error;
namespace events = edgedeploy::common::events;
namespace expected = edgedeploy::common::expected;
namespace executor = edgedeploy::core::executor;
namespace status = edgedeploy::core::status;
namespace update_gate = edgedeploy::core::update_gate;

// Answers safety checks with scripted decisions, in order, and proceeds once the script for a
// component runs out. A component marked silent never answers.
class FakeSafetyCheckClient : public update_gate::SafetyCheckClient {
public:
	struct Release {
		string component;
		string deployment_id;
		update_gate::ReleaseReason reason;
	};

	void Script(const string &component, vector<update_gate::SafetyDecision> decisions);
	void Silence(const string &component) {
		silent_.insert(component);
	}

	void RequestSafetyCheck(
		const string &component,
		const string &deployment_id,
		DecisionHandler handler,
		ReleaseHandler release) override;
	void NotifyReleased(
		const string &component,
		const string &deployment_id,
		update_gate::ReleaseReason reason) override;

	// Calls the release handler of the last request to `component`, as the component would.
	void ReleaseFrom(const string &component);

	// Component names, in the order they were asked.
	vector<string> requests;
	vector<Release> releases;

private:
	map<string, deque<update_gate::SafetyDecision>> scripts_;
	set<string> silent_;
	map<string, ReleaseHandler> release_handlers_;
};

// Answers configuration validation requests. Components are accepting unless told otherwise,
// and only those marked as subscribed are asked.
class FakeValidationClient : public config_validation::ValidationClient {
public:
	void Subscribe(const string &component) {
		subscribed_.insert(component);
	}
	void Reject(const string &component, const string &message) {
		subscribed_.insert(component);
		rejections_[component] = message;
	}
	// Subscribed, but never answers.
	void Silence(const string &component) {
		subscribed_.insert(component);
		silent_.insert(component);
	}
	void FailRequest(const string &component) {
		failing_.insert(component);
	}

	expected::ExpectedBool RequestValidation(
		const string &component,
		const string &deployment_id,
		const config_tree::Value &configuration,
		ReportHandler handler) override;

	struct Request {
		string component;
		string deployment_id;
		string configuration;
	};
	vector<Request> requests;

private:
	set<string> subscribed_;
	map<string, string> rejections_;
	set<string> silent_;
	set<string> failing_;
};

// Plays both the component supervisor and the lifecycle feed. After an action is applied the
// component takes the first state of its outcome, and the remaining states are then delivered to
// subscribers, one event loop iteration at a time.
class FakeComponentRuntime : public executor::ComponentManager, public executor::LifecycleMonitor {
public:
	explicit FakeComponentRuntime(events::EventLoop &loop);
	~FakeComponentRuntime();

	void SetOutcome(const string &component, vector<executor::LifecycleState> states);
	// Takes precedence over the outcome of the component when that version is applied.
	void SetOutcome(
		const string &component, const string &version, vector<executor::LifecycleState> states);
	void FailApply(const string &component) {
		failing_.insert(component);
	}
	// Changes the state and tells subscribers, from the calling thread.
	void SetState(const string &component, executor::LifecycleState state);

	error::Error Apply(const executor::ComponentAction &action) override;
	executor::LifecycleState CurrentState(const string &component) override;
	executor::Subscription Subscribe(
		const string &component, executor::LifecycleHandler handler) override;

	size_t SubscriberCount(const string &component) const;

	// Applied actions, in order.
	vector<executor::ComponentAction> applied;
	// Installed components and their versions.
	map<string, string> installed;

private:
	void Deliver(const string &component, deque<executor::LifecycleState> states);

	events::EventLoop &loop_;
	map<string, vector<executor::LifecycleState>> outcomes_;
	set<string> failing_;

	mutable mutex mutex_;
	map<string, executor::LifecycleState> states_;
	uint64_t next_subscription_ {0};
	map<string, map<uint64_t, executor::LifecycleHandler>> subscribers_;

	shared_ptr<bool> destroyed_;
};

class RecordingStatusReporter : public status::StatusReporter {
public:
	struct Record {
		string deployment_id;
		deployment::DeploymentType type;
		deployment::DeploymentStatus status;
		status::StatusDetails details;
	};

	void ReportStatus(
		const string &deployment_id,
		deployment::DeploymentType type,
		deployment::DeploymentStatus status,
		const status::StatusDetails &details) override;

	// The last record for `deployment_id`. Fails the test if there is none.
	const Record &Last(const string &deployment_id) const;

	vector<Record> records;
};

// Adds a recipe with the given default configuration, given as JSON text.
void AddRecipe(
	catalog::InMemoryCatalog &catalog,
	const string &name,
	const string &version,
	map<string, string> dependencies = {},
	const string &default_configuration = "{}");

} // namespace testing
} // namespace core
} // namespace edgedeploy

#endif // EDGEDEPLOY_CORE_TESTING_HPP
