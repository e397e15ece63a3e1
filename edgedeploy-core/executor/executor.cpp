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

#include <cassert>

#include <edgedeploy-core/deployment.hpp>

namespace edgedeploy {
namespace core {
namespace executor {

namespace deployment = edgedeploy::core::deployment;

string LifecycleStateToString(LifecycleState state) {
	switch (state) {
	case LifecycleState::New:
		return "NEW";
	case LifecycleState::Installed:
		return "INSTALLED";
	case LifecycleState::Starting:
		return "STARTING";
	case LifecycleState::Running:
		return "RUNNING";
	case LifecycleState::Stopping:
		return "STOPPING";
	case LifecycleState::Finished:
		return "FINISHED";
	case LifecycleState::Errored:
		return "ERRORED";
	case LifecycleState::Broken:
		return "BROKEN";
	}
	assert(false);
	return "UNKNOWN";
}

bool IsTerminal(LifecycleState state) {
	return state == LifecycleState::Finished || state == LifecycleState::Running
		   || state == LifecycleState::Broken;
}

string ActionTypeToString(ActionType type) {
	switch (type) {
	case ActionType::Install:
		return "install";
	case ActionType::Update:
		return "update";
	case ActionType::Remove:
		return "remove";
	}
	assert(false);
	return "unknown";
}

Plan ComputePlan(
	const resolved_state::ResolvedState &current, const resolved_state::ResolvedState &target) {
	Plan plan;
	auto cur = current.components.begin();
	auto tgt = target.components.begin();

	// Both maps are ordered by name, so walk them side by side.
	while (cur != current.components.end() || tgt != target.components.end()) {
		if (tgt == target.components.end()
			|| (cur != current.components.end() && cur->first < tgt->first)) {
			plan.push_back(ComponentAction {
				ActionType::Remove, cur->first, cur->second.version, cur->second.configuration});
			++cur;
		} else if (
			cur == current.components.end()
			|| (tgt != target.components.end() && tgt->first < cur->first)) {
			plan.push_back(ComponentAction {
				ActionType::Install, tgt->first, tgt->second.version, tgt->second.configuration});
			++tgt;
		} else {
			if (cur->second.version != tgt->second.version
				|| cur->second.configuration != tgt->second.configuration) {
				plan.push_back(ComponentAction {
					ActionType::Update, tgt->first, tgt->second.version, tgt->second.configuration});
			}
			++cur;
			++tgt;
		}
	}
	return plan;
}

DeploymentExecutor::DeploymentExecutor(
	events::EventLoop &loop,
	ComponentManager &manager,
	LifecycleMonitor &monitor,
	chrono::milliseconds component_timeout) :
	loop_ {loop},
	manager_ {manager},
	monitor_ {monitor},
	component_timeout_ {component_timeout},
	logger_ {"executor"},
	destroyed_ {make_shared<bool>(false)} {
}

DeploymentExecutor::~DeploymentExecutor() {
	*destroyed_ = true;
}

void DeploymentExecutor::Execute(
	const string &deployment_id, const Plan &plan, ExecutionHandler handler) {
	if (in_progress_) {
		handler(error::MakeError(error::ProgrammingError, "Executor is already busy"));
		return;
	}

	generation_++;
	in_progress_ = true;
	deployment_id_ = deployment_id;
	handler_ = handler;
	waiting_for_.clear();
	subscriptions_.clear();
	timers_.clear();

	auto generation = generation_;
	auto destroyed = destroyed_;

	// Subscribe before acting, so that no state change is missed.
	for (const auto &action : plan) {
		if (action.type == ActionType::Remove) {
			continue;
		}
		const auto component = action.component;
		waiting_for_.insert(component);
		subscriptions_[component] = monitor_.Subscribe(
			component, [this, destroyed, generation, component](LifecycleState state) {
				loop_.Post([this, destroyed, generation, component, state]() {
					if (*destroyed) {
						return;
					}
					OnStateChange(generation, component, state);
				});
			});
	}

	for (const auto &action : plan) {
		Log().Info(
			"Applying " + ActionTypeToString(action.type) + " of " + action.component + " "
			+ action.version.String());
		auto err = manager_.Apply(action);
		if (err != error::NoError) {
			Finish(deployment::MakeError(
				deployment::ComponentUpdateError,
				"Failed to " + ActionTypeToString(action.type) + " " + action.component + ": "
					+ err.String()));
			return;
		}
	}

	auto components = waiting_for_;
	for (const auto &component : components) {
		auto state = manager_.CurrentState(component);
		if (state == LifecycleState::Broken) {
			Finish(deployment::MakeError(
				deployment::ComponentBrokenError, component + " is " + LifecycleStateToString(state)));
			return;
		}
		if (IsTerminal(state)) {
			Log().Debug(component + " is already " + LifecycleStateToString(state));
			waiting_for_.erase(component);
			continue;
		}

		auto timer = make_unique<events::Timer>(loop_);
		timer->AsyncWait(component_timeout_, [this, generation, component](error::Error err) {
			if (err.code == make_error_condition(errc::operation_canceled)
				|| generation != generation_ || !in_progress_) {
				return;
			}
			Log().Error("Timed out waiting for " + component + " to reach a terminal state");
			Finish(deployment::MakeError(
				deployment::ComponentUpdateError,
				"Timed out waiting for " + component + " to reach a terminal state"));
		});
		timers_[component] = std::move(timer);
	}

	if (waiting_for_.empty()) {
		Finish(error::NoError);
	}
}

void DeploymentExecutor::OnStateChange(
	uint64_t generation, const string &component, LifecycleState state) {
	if (generation != generation_ || !in_progress_ || waiting_for_.count(component) == 0) {
		return;
	}
	Log().Debug(component + " is now " + LifecycleStateToString(state));

	if (state == LifecycleState::Broken) {
		Log().Error(component + " broke during the deployment");
		Finish(deployment::MakeError(
			deployment::ComponentBrokenError, component + " is " + LifecycleStateToString(state)));
		return;
	}
	if (state == LifecycleState::Errored) {
		Log().Warning(component + " errored, waiting to see whether it recovers");
		return;
	}
	if (!IsTerminal(state)) {
		return;
	}

	waiting_for_.erase(component);
	auto timer = timers_.find(component);
	if (timer != timers_.end()) {
		timer->second->Cancel();
	}
	if (waiting_for_.empty()) {
		Finish(error::NoError);
	}
}

void DeploymentExecutor::Cancel() {
	if (!in_progress_) {
		return;
	}
	Log().Info("Execution canceled");
	generation_++;
	in_progress_ = false;
	handler_ = nullptr;
	for (auto &timer : timers_) {
		timer.second->Cancel();
	}
	waiting_for_.clear();
	subscriptions_.clear();
}

void DeploymentExecutor::Finish(error::Error err) {
	generation_++;
	in_progress_ = false;
	for (auto &timer : timers_) {
		timer.second->Cancel();
	}
	waiting_for_.clear();
	subscriptions_.clear();

	if (err == error::NoError) {
		Log().Info("All affected components reached a terminal state");
	}

	auto handler = std::move(handler_);
	handler_ = nullptr;
	if (handler) {
		handler(err);
	}
}

} // namespace executor
} // namespace core
} // namespace edgedeploy
