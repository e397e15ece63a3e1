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


#include <edgedeploy-core/update_gate.hpp>

#include <algorithm>
#include <cassert>

namespace edgedeploy {
namespace core {
namespace update_gate {

string GateStateToString(GateState state) {
	switch (state) {
	case GateState::Idle:
		return "IDLE";
	case GateState::Checking:
		return "CHECKING";
	case GateState::Waiting:
		return "WAITING";
	case GateState::Proceeding:
		return "PROCEEDING";
	case GateState::Canceled:
		return "CANCELED";
	}
	assert(false);
	return "UNKNOWN";
}

static bool IsCanceledError(const error::Error &err) {
	return err.code == make_error_condition(errc::operation_canceled);
}

UpdateGate::UpdateGate(events::EventLoop &loop, SafetyCheckClient &client) :
	loop_ {loop},
	client_ {client},
	logger_ {"update_gate"},
	recheck_timer_ {loop},
	timeout_timer_ {loop},
	cancellation_timer_ {loop},
	destroyed_ {make_shared<bool>(false)} {
}

UpdateGate::~UpdateGate() {
	*destroyed_ = true;
}

void UpdateGate::Start(
	const deployment::Deployment &deployment,
	const vector<string> &components,
	GateOptions options,
	GateHandler handler) {
	if (InProgress()) {
		handler(error::MakeError(
			error::ProgrammingError, "Update gate started while already in progress"));
		return;
	}

	generation_++;
	deployment_.reset(new deployment::Deployment(deployment));
	components_ = components;
	options_ = options;
	handler_ = handler;
	outstanding_.clear();
	released_.clear();
	pending_.clear();
	deferred_.clear();
	max_defer_ = chrono::milliseconds(0);

	state_ = GateState::Checking;

	if (deployment_->IsCancelled()) {
		Finish(GateState::Canceled, deployment::MakeError(deployment::CancellationError, ""));
		return;
	}

	if (options_.action == deployment::ComponentUpdatePolicyAction::SkipNotifyComponents) {
		Log().Info("Component update policy is SKIP_NOTIFY_COMPONENTS, not asking components");
		Finish(GateState::Proceeding, error::NoError);
		return;
	}
	if (components_.empty()) {
		Log().Debug("No running component affected, nobody to ask");
		Finish(GateState::Proceeding, error::NoError);
		return;
	}

	auto generation = generation_;
	timeout_timer_.AsyncWait(options_.timeout, [this, generation](error::Error err) {
		if (IsCanceledError(err) || generation != generation_) {
			return;
		}
		OnTimeout();
	});
	ScheduleCancellationCheck();

	AskAll();
}

void UpdateGate::AskAll() {
	state_ = GateState::Checking;
	max_defer_ = chrono::milliseconds(0);
	outstanding_.clear();
	for (const auto &component : components_) {
		if (released_.count(component) == 0) {
			outstanding_.insert(component);
		}
	}
	if (outstanding_.empty()) {
		EvaluateDecisions();
		return;
	}

	auto generation = generation_;
	auto destroyed = destroyed_;
	auto deployment_id = deployment_->Id();
	for (const auto &component : components_) {
		if (released_.count(component) != 0) {
			continue;
		}
		Log().Debug("Asking " + component + " whether it can be updated now");
		client_.RequestSafetyCheck(
			component,
			deployment_id,
			[this, destroyed, generation, component](SafetyDecision decision) {
				// Clients may answer from their own threads.
				loop_.Post([this, destroyed, generation, component, decision]() {
					if (*destroyed) {
						return;
					}
					OnDecision(generation, component, decision);
				});
			},
			[this, destroyed, generation, component]() {
				loop_.Post([this, destroyed, generation, component]() {
					if (*destroyed) {
						return;
					}
					OnRelease(generation, component);
				});
			});
		if (generation != generation_) {
			// Finished from within the request.
			return;
		}
	}
}

void UpdateGate::OnDecision(uint64_t generation, const string &component, SafetyDecision decision) {
	if (generation != generation_ || !InProgress()) {
		Log().Trace("Ignoring stale decision from " + component);
		return;
	}
	if (outstanding_.erase(component) == 0) {
		return;
	}

	if (decision.proceed) {
		pending_.erase(component);
	} else {
		Log().Info(
			component + " deferred the update by " + to_string(decision.defer_for.count())
			+ " ms");
		pending_[component] = PendingUpdateAction {
			deployment_->Id(), component, chrono::steady_clock::now() + decision.defer_for};
		deferred_.insert(component);
		max_defer_ = max(max_defer_, decision.defer_for);
	}

	EvaluateDecisions();
}

void UpdateGate::EvaluateDecisions() {
	if (!outstanding_.empty()) {
		return;
	}
	if (pending_.empty()) {
		Finish(GateState::Proceeding, error::NoError);
		return;
	}

	state_ = GateState::Waiting;
	Log().Info(
		to_string(pending_.size()) + " component(s) deferred the update, checking again in "
		+ to_string(max_defer_.count()) + " ms");

	auto generation = generation_;
	recheck_timer_.AsyncWait(max_defer_, [this, generation](error::Error err) {
		if (IsCanceledError(err) || generation != generation_ || state_ != GateState::Waiting) {
			return;
		}
		AskAll();
	});
}

void UpdateGate::ScheduleCancellationCheck() {
	auto generation = generation_;
	cancellation_timer_.AsyncWait(
		options_.cancellation_check_interval, [this, generation](error::Error err) {
			if (IsCanceledError(err) || generation != generation_ || !InProgress()) {
				return;
			}
			if (deployment_->IsCancelled()) {
				Log().Info("Deployment was canceled while waiting for components");
				Finish(
					GateState::Canceled,
					deployment::MakeError(deployment::CancellationError, "Canceled while waiting"));
				return;
			}
			ScheduleCancellationCheck();
		});
}

void UpdateGate::OnTimeout() {
	if (!InProgress()) {
		return;
	}
	string who;
	for (const auto &entry : pending_) {
		who += (who.empty() ? "" : ", ") + entry.first;
	}
	for (const auto &component : outstanding_) {
		who += (who.empty() ? "" : ", ") + component;
	}

	if (options_.fail_on_timeout) {
		Log().Error("Timed out waiting for " + who);
		Finish(
			GateState::Canceled,
			deployment::MakeError(deployment::GateTimeoutError, "Timed out waiting for " + who));
	} else {
		Log().Warning("Timed out waiting for " + who + ", updating anyway");
		Finish(GateState::Proceeding, error::NoError);
	}
}

void UpdateGate::Cancel() {
	auto destroyed = destroyed_;
	loop_.Post([this, destroyed]() {
		if (*destroyed || !InProgress()) {
			return;
		}
		Log().Info("Deployment canceled while waiting for components");
		Finish(
			GateState::Canceled,
			deployment::MakeError(deployment::CancellationError, "Deployment was superseded"));
	});
}

void UpdateGate::OnRelease(uint64_t generation, const string &component) {
	if (generation != generation_ || !InProgress()) {
		return;
	}
	Log().Debug(component + " released the update");
	released_.insert(component);
	outstanding_.erase(component);
	pending_.erase(component);
	if (state_ == GateState::Waiting) {
		if (pending_.empty()) {
			Finish(GateState::Proceeding, error::NoError);
		}
	} else {
		EvaluateDecisions();
	}
}

void UpdateGate::Finish(GateState state, error::Error err) {
	generation_++;
	state_ = state;
	recheck_timer_.Cancel();
	timeout_timer_.Cancel();
	cancellation_timer_.Cancel();

	auto reason = state == GateState::Proceeding ? ReleaseReason::Proceeding : ReleaseReason::Canceled;
	for (const auto &component : deferred_) {
		client_.NotifyReleased(component, deployment_->Id(), reason);
	}
	deferred_.clear();
	pending_.clear();
	outstanding_.clear();
	released_.clear();

	Log().Info("Update gate is " + GateStateToString(state));

	auto handler = std::move(handler_);
	handler_ = nullptr;
	if (handler) {
		handler(err);
	}
}

} // namespace update_gate
} // namespace core
} // namespace edgedeploy
