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


#ifndef EDGEDEPLOY_CORE_EXECUTOR_HPP
#define EDGEDEPLOY_CORE_EXECUTOR_HPP

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include <common/error.hpp>
#include <common/events.hpp>
#include <common/log.hpp>

#include <edgedeploy-core/config_tree.hpp>
#include <edgedeploy-core/resolved_state.hpp>
#include <edgedeploy-core/semver.hpp>

namespace edgedeploy {
namespace core {
namespace executor {

using namespace std;

namespace error = edgedeploy::common::error;
namespace events = edgedeploy::common::events;
namespace log = edgedeploy::common::log;
namespace resolved_state = edgedeploy::core::resolved_state;

enum class LifecycleState {
	New,
	Installed,
	Starting,
	Running,
	Stopping,
	Finished,
	Errored,
	Broken,
};

string LifecycleStateToString(LifecycleState state);

// FINISHED, RUNNING and BROKEN. ERRORED is not terminal, the component may still recover.
bool IsTerminal(LifecycleState state);

enum class ActionType {
	Install,
	Update,
	Remove,
};

string ActionTypeToString(ActionType type);

struct ComponentAction {
	ActionType type;
	string component;
	semver::Version version;
	config_tree::Value configuration;
};

using Plan = vector<ComponentAction>;

// What it takes to go from `current` to `target`, ordered by component name: installs of new
// components, updates of components whose version or configuration differs, and removal of
// components `target` does not have.
Plan ComputePlan(const resolved_state::ResolvedState &current, const resolved_state::ResolvedState &target);

// Unsubscribes when destroyed.
class Subscription {
public:
	Subscription() = default;
	explicit Subscription(function<void()> unsubscribe) :
		unsubscribe_ {unsubscribe} {
	}
	~Subscription() {
		Unsubscribe();
	}

	Subscription(Subscription &&other) :
		unsubscribe_ {std::move(other.unsubscribe_)} {
		other.unsubscribe_ = nullptr;
	}
	Subscription &operator=(Subscription &&other) {
		Unsubscribe();
		unsubscribe_ = std::move(other.unsubscribe_);
		other.unsubscribe_ = nullptr;
		return *this;
	}
	Subscription(const Subscription &) = delete;
	Subscription &operator=(const Subscription &) = delete;

	void Unsubscribe() {
		if (unsubscribe_) {
			auto unsubscribe = std::move(unsubscribe_);
			unsubscribe_ = nullptr;
			unsubscribe();
		}
	}

private:
	function<void()> unsubscribe_;
};

using LifecycleHandler = function<void(LifecycleState)>;

// Lifecycle states are owned by whoever supervises the components.
class LifecycleMonitor {
public:
	virtual ~LifecycleMonitor() {
	}

	// `handler` is called, from any thread, for every state change after the subscription was
	// made, until the returned handle is destroyed.
	virtual Subscription Subscribe(const string &component, LifecycleHandler handler) = 0;
};

class ComponentManager {
public:
	virtual ~ComponentManager() {
	}

	// Starts the action. Once this returns, `CurrentState()` reflects the new version.
	virtual error::Error Apply(const ComponentAction &action) = 0;
	virtual LifecycleState CurrentState(const string &component) = 0;
};

using ExecutionHandler = function<void(error::Error)>;

class DeploymentExecutor {
public:
	DeploymentExecutor(
		events::EventLoop &loop,
		ComponentManager &manager,
		LifecycleMonitor &monitor,
		chrono::milliseconds component_timeout);
	~DeploymentExecutor();

	DeploymentExecutor(const DeploymentExecutor &) = delete;
	DeploymentExecutor &operator=(const DeploymentExecutor &) = delete;

	// Applies `plan` and waits for every installed or updated component to reach a terminal
	// state. `handler` gets `NoError`, `ComponentBrokenError` or `ComponentUpdateError`.
	void Execute(const string &deployment_id, const Plan &plan, ExecutionHandler handler);

	// Stops waiting. Actions already applied stay applied. The handler is not called.
	void Cancel();

	bool InProgress() const {
		return in_progress_;
	}

	void SetComponentTimeout(chrono::milliseconds timeout) {
		component_timeout_ = timeout;
	}

private:
	log::Logger Log() {
		return logger_.WithFields(log::LogField {"deployment_id", deployment_id_});
	}

	void OnStateChange(uint64_t generation, const string &component, LifecycleState state);
	void Finish(error::Error err);

	events::EventLoop &loop_;
	ComponentManager &manager_;
	LifecycleMonitor &monitor_;
	chrono::milliseconds component_timeout_;
	log::Logger logger_;

	bool in_progress_ {false};
	uint64_t generation_ {0};
	string deployment_id_;
	ExecutionHandler handler_;

	// Components not yet in a terminal state.
	set<string> waiting_for_;
	map<string, Subscription> subscriptions_;
	map<string, unique_ptr<events::Timer>> timers_;

	shared_ptr<bool> destroyed_;
};

} // namespace executor
} // namespace core
} // namespace edgedeploy

#endif // EDGEDEPLOY_CORE_EXECUTOR_HPP
