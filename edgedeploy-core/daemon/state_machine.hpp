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


#ifndef EDGEDEPLOY_CORE_DAEMON_STATE_MACHINE_HPP
#define EDGEDEPLOY_CORE_DAEMON_STATE_MACHINE_HPP

#include <memory>

#include <common/error.hpp>
#include <common/events.hpp>
#include <common/state_machine.hpp>

#include <edgedeploy-core/daemon/context.hpp>
#include <edgedeploy-core/daemon/state_events.hpp>
#include <edgedeploy-core/daemon/states.hpp>

namespace edgedeploy {
namespace core {
namespace daemon {

namespace error = edgedeploy::common::error;
namespace events = edgedeploy::common::events;
namespace sm = edgedeploy::common::state_machine;

class StateMachine {
public:
	StateMachine(Context &ctx, events::EventLoop &event_loop);
	~StateMachine();

	error::Error Run();

	// Mainly for tests and one-shot deployments.
	void StopAfterDeployment();

private:
	Context &ctx_;
	events::EventLoop &event_loop_;
	events::SignalHandler termination_handler_;

	error::Error RegisterSignalHandlers();

	EmptyState start_state_;
	InitState init_state_;
	IdleState idle_state_;
	PollQueueState poll_queue_state_;
	ResolveDocumentState resolve_document_state_;
	ResolveVersionsState resolve_versions_state_;
	ComputeConfigurationState compute_configuration_state_;
	ValidateConfigurationState validate_configuration_state_;
	SafetyGateState safety_gate_state_;
	ExecuteState execute_state_;
	RollbackState rollback_state_;
	ReportResultState report_result_state_;
	ExitState exit_state_;

	sm::StateMachine<Context, StateEvent> main_states_;

	sm::StateMachineRunner<Context, StateEvent> runner_;

	shared_ptr<bool> destroyed_;
};

} // namespace daemon
} // namespace core
} // namespace edgedeploy

#endif // EDGEDEPLOY_CORE_DAEMON_STATE_MACHINE_HPP
