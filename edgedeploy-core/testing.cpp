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


#include <edgedeploy-core/testing.hpp>

#include <stdexcept>

#include <gtest/gtest.h>

#include <edgedeploy-core/config_tree.hpp>
#include <edgedeploy-core/semver.hpp>

namespace edgedeploy {
namespace core {
namespace testing {

namespace config_tree = edgedeploy::core::config_tree;
namespace semver = edgedeploy::core::semver;

void FakeSafetyCheckClient::Script(
	const string &component, vector<update_gate::SafetyDecision> decisions) {
	scripts_[component] = deque<update_gate::SafetyDecision>(decisions.begin(), decisions.end());
}

void FakeSafetyCheckClient::RequestSafetyCheck(
	const string &component,
	const string &deployment_id,
	DecisionHandler handler,
	ReleaseHandler release) {
	requests.push_back(component);
	release_handlers_[component] = release;
	if (silent_.count(component) != 0) {
		return;
	}
	auto &script = scripts_[component];
	if (script.empty()) {
		handler(update_gate::SafetyDecision {});
		return;
	}
	auto decision = script.front();
	script.pop_front();
	handler(decision);
}

void FakeSafetyCheckClient::NotifyReleased(
	const string &component, const string &deployment_id, update_gate::ReleaseReason reason) {
	releases.push_back(Release {component, deployment_id, reason});
}

void FakeSafetyCheckClient::ReleaseFrom(const string &component) {
	auto handler = release_handlers_.find(component);
	ASSERT_NE(handler, release_handlers_.end()) << component << " was never asked";
	handler->second();
}

expected::ExpectedBool FakeValidationClient::RequestValidation(
	const string &component,
	const string &deployment_id,
	const config_tree::Value &configuration,
	ReportHandler handler) {
	requests.push_back(Request {component, deployment_id, configuration.Dump()});
	if (failing_.count(component) != 0) {
		return expected::unexpected(
			error::Error(make_error_condition(errc::broken_pipe), component + " is not reachable"));
	}
	if (subscribed_.count(component) == 0) {
		return false;
	}
	if (silent_.count(component) != 0) {
		return true;
	}
	auto rejection = rejections_.find(component);
	if (rejection != rejections_.end()) {
		handler(config_validation::ValidityReport {false, rejection->second});
	} else {
		handler(config_validation::ValidityReport {true, ""});
	}
	return true;
}

FakeComponentRuntime::FakeComponentRuntime(events::EventLoop &loop) :
	loop_ {loop},
	destroyed_ {make_shared<bool>(false)} {
}

FakeComponentRuntime::~FakeComponentRuntime() {
	*destroyed_ = true;
}

void FakeComponentRuntime::SetOutcome(
	const string &component, vector<executor::LifecycleState> states) {
	outcomes_[component] = states;
}

void FakeComponentRuntime::SetOutcome(
	const string &component, const string &version, vector<executor::LifecycleState> states) {
	outcomes_[component + "@" + version] = states;
}

void FakeComponentRuntime::SetState(const string &component, executor::LifecycleState state) {
	vector<executor::LifecycleHandler> handlers;
	{
		lock_guard<mutex> lock(mutex_);
		states_[component] = state;
		for (const auto &sub : subscribers_[component]) {
			handlers.push_back(sub.second);
		}
	}
	for (auto &handler : handlers) {
		handler(state);
	}
}

error::Error FakeComponentRuntime::Apply(const executor::ComponentAction &action) {
	applied.push_back(action);
	if (failing_.count(action.component) != 0) {
		return error::MakeError(error::GenericError, "Could not start " + action.component);
	}

	if (action.type == executor::ActionType::Remove) {
		installed.erase(action.component);
		lock_guard<mutex> lock(mutex_);
		states_.erase(action.component);
		return error::NoError;
	}

	installed[action.component] = action.version.String();

	vector<executor::LifecycleState> outcome {executor::LifecycleState::Running};
	auto it = outcomes_.find(action.component + "@" + action.version.String());
	if (it == outcomes_.end()) {
		it = outcomes_.find(action.component);
	}
	if (it != outcomes_.end() && !it->second.empty()) {
		outcome = it->second;
	}
	{
		lock_guard<mutex> lock(mutex_);
		states_[action.component] = outcome.front();
	}
	Deliver(
		action.component, deque<executor::LifecycleState>(outcome.begin() + 1, outcome.end()));
	return error::NoError;
}

void FakeComponentRuntime::Deliver(const string &component, deque<executor::LifecycleState> states) {
	if (states.empty()) {
		return;
	}
	auto destroyed = destroyed_;
	loop_.Post([this, destroyed, component, states]() mutable {
		if (*destroyed) {
			return;
		}
		auto state = states.front();
		states.pop_front();
		SetState(component, state);
		Deliver(component, states);
	});
}

executor::LifecycleState FakeComponentRuntime::CurrentState(const string &component) {
	lock_guard<mutex> lock(mutex_);
	auto it = states_.find(component);
	if (it == states_.end()) {
		return executor::LifecycleState::New;
	}
	return it->second;
}

executor::Subscription FakeComponentRuntime::Subscribe(
	const string &component, executor::LifecycleHandler handler) {
	lock_guard<mutex> lock(mutex_);
	auto id = next_subscription_++;
	subscribers_[component][id] = handler;
	auto destroyed = destroyed_;
	return executor::Subscription([this, destroyed, component, id]() {
		if (*destroyed) {
			return;
		}
		lock_guard<mutex> lock(mutex_);
		subscribers_[component].erase(id);
	});
}

size_t FakeComponentRuntime::SubscriberCount(const string &component) const {
	lock_guard<mutex> lock(mutex_);
	auto it = subscribers_.find(component);
	return it == subscribers_.end() ? 0 : it->second.size();
}

void RecordingStatusReporter::ReportStatus(
	const string &deployment_id,
	deployment::DeploymentType type,
	deployment::DeploymentStatus status,
	const status::StatusDetails &details) {
	records.push_back(Record {deployment_id, type, status, details});
}

const RecordingStatusReporter::Record &RecordingStatusReporter::Last(
	const string &deployment_id) const {
	for (auto it = records.rbegin(); it != records.rend(); ++it) {
		if (it->deployment_id == deployment_id) {
			return *it;
		}
	}
	ADD_FAILURE() << "No status reported for " << deployment_id;
	throw runtime_error("No status reported for " + deployment_id);
}

void AddRecipe(
	catalog::InMemoryCatalog &catalog,
	const string &name,
	const string &version,
	map<string, string> dependencies,
	const string &default_configuration) {
	auto ver = semver::Version::Parse(version);
	ASSERT_TRUE(ver) << ver.error().String();
	auto defaults = config_tree::Value::FromJsonString(default_configuration);
	ASSERT_TRUE(defaults) << defaults.error().String();

	catalog::Recipe recipe;
	recipe.name = name;
	recipe.version = ver.value();
	recipe.dependencies = dependencies;
	recipe.default_configuration = defaults.value();
	catalog.AddRecipe(recipe);
}

} // namespace testing
} // namespace core
} // namespace edgedeploy
