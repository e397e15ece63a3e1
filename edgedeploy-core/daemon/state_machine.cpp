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

#include <csignal>

#include <common/log.hpp>

namespace edgedeploy {
namespace core {
namespace daemon {

namespace log = edgedeploy::common::log;

StateMachine::StateMachine(Context &ctx, events::EventLoop &event_loop) :
	ctx_(ctx),
	event_loop_(event_loop),
	termination_handler_(event_loop),
	exit_state_(event_loop),
	main_states_(start_state_),
	runner_(ctx),
	destroyed_(make_shared<bool>(false)) {
	runner_.AddStateMachine(main_states_);

	auto destroyed = destroyed_;
	ctx_.on_deployment_available = [this, destroyed]() {
		if (*destroyed) {
			return;
		}
		runner_.PostEvent(StateEvent::DeploymentAvailable);
	};

	using se = StateEvent;
	using tf = sm::TransitionFlag;

	// clang-format off
	main_states_.AddTransition(start_state_,                  se::Started,             init_state_,                   tf::Immediate);

	main_states_.AddTransition(init_state_,                   se::Success,             idle_state_,                   tf::Immediate);
	main_states_.AddTransition(init_state_,                   se::Failure,             exit_state_,                   tf::Immediate);

	main_states_.AddTransition(idle_state_,                   se::DeploymentAvailable, poll_queue_state_,             tf::Deferred );

	main_states_.AddTransition(poll_queue_state_,             se::Success,             resolve_document_state_,       tf::Immediate);
	main_states_.AddTransition(poll_queue_state_,             se::NothingToDo,         idle_state_,                   tf::Immediate);
	main_states_.AddTransition(poll_queue_state_,             se::Canceled,            report_result_state_,          tf::Immediate);

	main_states_.AddTransition(resolve_document_state_,       se::Success,             resolve_versions_state_,       tf::Immediate);
	main_states_.AddTransition(resolve_document_state_,       se::Failure,             report_result_state_,          tf::Immediate);
	main_states_.AddTransition(resolve_document_state_,       se::Canceled,            report_result_state_,          tf::Immediate);

	main_states_.AddTransition(resolve_versions_state_,       se::Success,             compute_configuration_state_,  tf::Immediate);
	main_states_.AddTransition(resolve_versions_state_,       se::Failure,             report_result_state_,          tf::Immediate);
	main_states_.AddTransition(resolve_versions_state_,       se::Canceled,            report_result_state_,          tf::Immediate);

	main_states_.AddTransition(compute_configuration_state_,  se::Success,             validate_configuration_state_, tf::Immediate);
	main_states_.AddTransition(compute_configuration_state_,  se::Failure,             report_result_state_,          tf::Immediate);
	main_states_.AddTransition(compute_configuration_state_,  se::Canceled,            report_result_state_,          tf::Immediate);

	main_states_.AddTransition(validate_configuration_state_, se::Success,             safety_gate_state_,            tf::Immediate);
	main_states_.AddTransition(validate_configuration_state_, se::Failure,             report_result_state_,          tf::Immediate);
	main_states_.AddTransition(validate_configuration_state_, se::Canceled,            report_result_state_,          tf::Immediate);

	main_states_.AddTransition(safety_gate_state_,            se::Success,             execute_state_,                tf::Immediate);
	main_states_.AddTransition(safety_gate_state_,            se::Failure,             report_result_state_,          tf::Immediate);
	main_states_.AddTransition(safety_gate_state_,            se::Canceled,            report_result_state_,          tf::Immediate);

	main_states_.AddTransition(execute_state_,                se::Success,             report_result_state_,          tf::Immediate);
	main_states_.AddTransition(execute_state_,                se::Failure,             report_result_state_,          tf::Immediate);
	main_states_.AddTransition(execute_state_,                se::Canceled,            report_result_state_,          tf::Immediate);
	main_states_.AddTransition(execute_state_,                se::RollbackStarted,     rollback_state_,               tf::Immediate);

	// A failed rollback is final.
	main_states_.AddTransition(rollback_state_,               se::Success,             report_result_state_,          tf::Immediate);
	main_states_.AddTransition(rollback_state_,               se::Failure,             report_result_state_,          tf::Immediate);

	main_states_.AddTransition(report_result_state_,          se::Success,             idle_state_,                   tf::Immediate);
	// clang-format on
}

StateMachine::~StateMachine() {
	*destroyed_ = true;
	ctx_.on_deployment_available = nullptr;
}

void StateMachine::StopAfterDeployment() {
	main_states_.AddTransition(
		report_result_state_, StateEvent::Success, exit_state_, sm::TransitionFlag::Immediate);
}

error::Error StateMachine::RegisterSignalHandlers() {
	return termination_handler_.RegisterHandler({SIGTERM, SIGINT}, [this](int signal) {
		log::Info("Caught signal " + to_string(signal) + ", shutting down");
		if (ctx_.deployment.deployment) {
			// Cooperative: whatever is being applied is left as it is, and the deployment
			// is started over after the restart.
			ctx_.Log().Warning("Interrupting the deployment in progress");
		}
		auto err = ctx_.SaveQueue();
		if (err != error::NoError) {
			log::Error("Could not save the deployment queue: " + err.String());
		}
		event_loop_.Stop();
	});
}

error::Error StateMachine::Run() {
	auto err = RegisterSignalHandlers();
	if (err != error::NoError) {
		return err;
	}

	runner_.AttachToEventLoop(event_loop_);
	runner_.PostEvent(StateEvent::Started);

	event_loop_.Run();
	if (init_state_.init_error != error::NoError) {
		return init_state_.init_error;
	}
	return exit_state_.exit_error;
}

} // namespace daemon
} // namespace core
} // namespace edgedeploy
