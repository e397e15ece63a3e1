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


#ifndef EDGEDEPLOY_CORE_UPDATE_GATE_HPP
#define EDGEDEPLOY_CORE_UPDATE_GATE_HPP

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

#include <edgedeploy-core/deployment.hpp>

namespace edgedeploy {
namespace core {
namespace update_gate {

using namespace std;

namespace deployment = edgedeploy::core::deployment;
namespace error = edgedeploy::common::error;
namespace events = edgedeploy::common::events;
namespace log = edgedeploy::common::log;

enum class GateState {
	Idle,
	Checking,
	Waiting,
	Proceeding,
	Canceled,
};

string GateStateToString(GateState state);

struct SafetyDecision {
	bool proceed {true};
	// How long the component wants the update to wait, when not proceeding.
	chrono::milliseconds defer_for {0};
};

enum class ReleaseReason {
	Canceled,
	Proceeding,
};

// The components' side of the "is it safe to update now" protocol.
class SafetyCheckClient {
public:
	using DecisionHandler = function<void(SafetyDecision)>;
	// Lets a component say it is done with whatever made it defer, so that it is not asked
	// again for this deployment.
	using ReleaseHandler = function<void()>;

	virtual ~SafetyCheckClient() {
	}

	// `handler` may be called from any thread, at most once. `release` may be called from any
	// thread, any number of times, while the deployment waits.
	virtual void RequestSafetyCheck(
		const string &component,
		const string &deployment_id,
		DecisionHandler handler,
		ReleaseHandler release) = 0;

	// Tells a component which deferred the update that the update is no longer pending.
	virtual void NotifyReleased(
		const string &component, const string &deployment_id, ReleaseReason reason) = 0;
};

// A component holding up a deployment.
struct PendingUpdateAction {
	string deployment_id;
	string component;
	chrono::steady_clock::time_point deferred_until;
};

struct GateOptions {
	deployment::ComponentUpdatePolicyAction action {
		deployment::ComponentUpdatePolicyAction::NotifyComponents};
	// How long the gate may stay closed in total.
	chrono::milliseconds timeout {chrono::seconds(60)};
	bool fail_on_timeout {false};
	chrono::milliseconds cancellation_check_interval {chrono::seconds(1)};
};

// Called with `NoError` when the update may go ahead, `CancellationError` when the deployment
// was canceled while waiting, and `GateTimeoutError` when the gate timed out and
// `fail_on_timeout` is set.
using GateHandler = function<void(error::Error)>;

// Must be used from the event loop thread only, except `Cancel()` which is posted onto it.
class UpdateGate {
public:
	UpdateGate(events::EventLoop &loop, SafetyCheckClient &client);
	~UpdateGate();

	UpdateGate(const UpdateGate &) = delete;
	UpdateGate &operator=(const UpdateGate &) = delete;

	void Start(
		const deployment::Deployment &deployment,
		const vector<string> &components,
		GateOptions options,
		GateHandler handler);

	void Cancel();

	GateState State() const {
		return state_;
	}

	const map<string, PendingUpdateAction> &PendingUpdateActions() const {
		return pending_;
	}

private:
	void AskAll();
	void OnDecision(uint64_t generation, const string &component, SafetyDecision decision);
	void OnRelease(uint64_t generation, const string &component);
	void EvaluateDecisions();
	void ScheduleCancellationCheck();
	void OnTimeout();
	void Finish(GateState state, error::Error err);

	log::Logger Log() {
		return logger_.WithFields(
			log::LogField {"deployment_id", deployment_ ? deployment_->Id() : ""});
	}

	bool InProgress() const {
		return state_ == GateState::Checking || state_ == GateState::Waiting;
	}

	events::EventLoop &loop_;
	SafetyCheckClient &client_;
	log::Logger logger_;

	GateState state_ {GateState::Idle};
	// Bumped whenever decisions from earlier requests must be ignored.
	uint64_t generation_ {0};

	unique_ptr<deployment::Deployment> deployment_;
	vector<string> components_;
	GateOptions options_;
	GateHandler handler_;

	set<string> outstanding_;
	// Components which released the update, and are not asked again.
	set<string> released_;
	map<string, PendingUpdateAction> pending_;
	// Everyone who deferred at some point, and must hear how it ended.
	set<string> deferred_;
	chrono::milliseconds max_defer_ {0};

	events::Timer recheck_timer_;
	events::Timer timeout_timer_;
	events::Timer cancellation_timer_;

	shared_ptr<bool> destroyed_;
};

} // namespace update_gate
} // namespace core
} // namespace edgedeploy

#endif // EDGEDEPLOY_CORE_UPDATE_GATE_HPP
