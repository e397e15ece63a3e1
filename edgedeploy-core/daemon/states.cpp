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


#include <edgedeploy-core/daemon/states.hpp>

#include <common/log.hpp>

#include <edgedeploy-core/daemon/context.hpp>

namespace edgedeploy {
namespace core {
namespace daemon {

namespace log = edgedeploy::common::log;

// Fails a deployment which has not touched the device.
static void FailWithoutChanges(
	Context &ctx, sm::EventPoster<StateEvent> &poster, const error::Error &err) {
	ctx.deployment.error = err;
	if (deployment::IsError(err, deployment::ConflictError)
		|| deployment::IsError(err, deployment::DocumentParseError)) {
		ctx.deployment.outcome = deployment::DetailedStatus::Rejected;
	} else {
		ctx.deployment.outcome = deployment::DetailedStatus::FailedNoStateChange;
	}
	ctx.Log().Error(err.String());
	poster.PostEvent(StateEvent::Failure);
}

void EmptyState::OnEnter(Context &ctx, sm::EventPoster<StateEvent> &poster) {
	// Keep this state truly empty.
}

void InitState::OnEnter(Context &ctx, sm::EventPoster<StateEvent> &poster) {
	auto err = ctx.LoadState();
	if (err != error::NoError) {
		log::Error("Could not load the persisted state: " + err.String());
		init_error = err;
		poster.PostEvent(StateEvent::Failure);
		return;
	}
	log::Info("Deployment service started");
	if (ctx.on_initialized) {
		ctx.on_initialized();
	}
	poster.PostEvent(StateEvent::Success);
}

void IdleState::OnEnter(Context &ctx, sm::EventPoster<StateEvent> &poster) {
	log::Debug("Entering Idle state");
}

void PollQueueState::OnEnter(Context &ctx, sm::EventPoster<StateEvent> &poster) {
	auto dep = ctx.deployment_queue.Poll();
	if (!dep) {
		log::Trace("No deployment to start");
		poster.PostEvent(StateEvent::NothingToDo);
		return;
	}

	ctx.deployment = {};
	ctx.deployment.deployment.reset(new deployment::Deployment(dep.value()));
	ctx.Log().Info(
		"Deployment of type " + deployment::DeploymentTypeToString(dep->Type()) + " for "
		+ dep->Document().group_name + " started");
	ctx.ReportStatus(deployment::DeploymentStatus::InProgress);

	if (ctx.CancelRequested("after polling")) {
		poster.PostEvent(StateEvent::Canceled);
		return;
	}
	poster.PostEvent(StateEvent::Success);
}

void ResolveDocumentState::OnEnter(Context &ctx, sm::EventPoster<StateEvent> &poster) {
	ctx.root_components_reader.AsyncRead(
		[&ctx, &poster](root_components::GroupToRootComponents groups) {
			auto desired =
				document_resolver::Resolve(ctx.deployment.deployment->Document(), groups);
			if (!desired) {
				FailWithoutChanges(ctx, poster, desired.error());
				return;
			}
			ctx.deployment.desired = desired.value();

			if (ctx.CancelRequested("after resolving the document")) {
				poster.PostEvent(StateEvent::Canceled);
				return;
			}
			poster.PostEvent(StateEvent::Success);
		});
}

void ResolveVersionsState::OnEnter(Context &ctx, sm::EventPoster<StateEvent> &poster) {
	auto versions = ctx.version_resolver.Resolve(
		ctx.deployment.desired.groups, ctx.deployment.deployment->Id());
	if (!versions) {
		FailWithoutChanges(ctx, poster, versions.error());
		return;
	}
	ctx.deployment.versions = versions.value();

	if (ctx.CancelRequested("after resolving versions")) {
		poster.PostEvent(StateEvent::Canceled);
		return;
	}
	poster.PostEvent(StateEvent::Success);
}

void ComputeConfigurationState::OnEnter(Context &ctx, sm::EventPoster<StateEvent> &poster) {
	auto target = ctx.config_delta_engine.Compute(
		ctx.deployment.versions,
		ctx.current_state,
		ctx.deployment.desired.configuration_updates,
		ctx.deployment.deployment->Id());
	if (!target) {
		FailWithoutChanges(ctx, poster, target.error());
		return;
	}
	ctx.deployment.target = target.value();

	if (ctx.CancelRequested("after computing the configuration")) {
		poster.PostEvent(StateEvent::Canceled);
		return;
	}
	poster.PostEvent(StateEvent::Success);
}

map<string, config_tree::Value> ValidateConfigurationState::ConfigurationsToValidate(
	Context &ctx) {
	map<string, config_tree::Value> configurations;
	for (const auto &entry : ctx.deployment.target.components) {
		auto current = ctx.current_state.Find(entry.first);
		if (current == nullptr || current->version != entry.second.version
			|| current->configuration == entry.second.configuration) {
			continue;
		}
		if (ctx.collaborators.component_manager.CurrentState(entry.first)
			!= executor::LifecycleState::Running) {
			continue;
		}
		configurations.insert({entry.first, entry.second.configuration});
	}
	return configurations;
}

void ValidateConfigurationState::OnEnter(Context &ctx, sm::EventPoster<StateEvent> &poster) {
	const auto &policies = ctx.deployment.deployment->Document().policies;
	ctx.configuration_validator.Start(
		ctx.deployment.deployment->Id(),
		ConfigurationsToValidate(ctx),
		chrono::seconds(policies.configuration_validation_timeout_seconds),
		[&ctx, &poster](error::Error err) {
			if (err != error::NoError) {
				FailWithoutChanges(ctx, poster, err);
				return;
			}
			if (ctx.CancelRequested("after validating the configuration")) {
				poster.PostEvent(StateEvent::Canceled);
				return;
			}
			poster.PostEvent(StateEvent::Success);
		});
}

vector<string> SafetyGateState::AffectedComponents(Context &ctx) {
	vector<string> affected;
	for (const auto &entry : ctx.deployment.target.components) {
		auto current = ctx.current_state.Find(entry.first);
		if (current == nullptr) {
			// Not installed, so not running either.
			continue;
		}
		if (current->version == entry.second.version
			&& current->configuration == entry.second.configuration) {
			continue;
		}
		if (ctx.collaborators.component_manager.CurrentState(entry.first)
			!= executor::LifecycleState::Running) {
			continue;
		}
		affected.push_back(entry.first);
	}
	return affected;
}

void SafetyGateState::OnEnter(Context &ctx, sm::EventPoster<StateEvent> &poster) {
	const auto &policies = ctx.deployment.deployment->Document().policies;

	update_gate::GateOptions options;
	options.action = policies.update_action;
	options.timeout = chrono::seconds(
		policies.update_timeout_seconds ? policies.update_timeout_seconds.value()
										: ctx.config.update_gate_default_timeout_seconds);
	options.fail_on_timeout = ctx.config.update_gate_fail_on_timeout;
	options.cancellation_check_interval =
		chrono::milliseconds(ctx.config.update_gate_cancellation_check_milliseconds);

	ctx.update_gate.Start(
		*ctx.deployment.deployment,
		AffectedComponents(ctx),
		options,
		[&ctx, &poster](error::Error err) {
			if (deployment::IsError(err, deployment::CancellationError)) {
				if (!ctx.CancelRequested("in the update gate")) {
					ctx.deployment.outcome = deployment::DetailedStatus::Canceled;
					ctx.deployment.error = err;
				}
				poster.PostEvent(StateEvent::Canceled);
				return;
			}
			if (err != error::NoError) {
				FailWithoutChanges(ctx, poster, err);
				return;
			}
			if (ctx.CancelRequested("after the update gate")) {
				poster.PostEvent(StateEvent::Canceled);
				return;
			}
			poster.PostEvent(StateEvent::Success);
		});
}

void ExecuteState::OnEnter(Context &ctx, sm::EventPoster<StateEvent> &poster) {
	// Last chance, nothing has been touched yet.
	if (ctx.CancelRequested("before applying the deployment")) {
		poster.PostEvent(StateEvent::Canceled);
		return;
	}

	ctx.rollback_manager.Capture(ctx.current_state);
	auto plan = executor::ComputePlan(ctx.current_state, ctx.deployment.target);
	ctx.deployment.executed = true;
	ctx.Log().Info("Applying " + to_string(plan.size()) + " component action(s)");

	ctx.deployment_executor.Execute(
		ctx.deployment.deployment->Id(), plan, [&ctx, &poster](error::Error err) {
			// Whatever happened, the device is no longer where it was.
			ctx.current_state = ctx.deployment.target;

			if (err == error::NoError) {
				ctx.deployment.outcome = deployment::DetailedStatus::Successful;
				poster.PostEvent(StateEvent::Success);
				return;
			}

			ctx.deployment.error = err;
			ctx.Log().Error("Deployment failed: " + err.String());
			if (ctx.deployment.deployment->Document().policies.failure_handling
				== deployment::FailureHandlingPolicy::Rollback) {
				poster.PostEvent(StateEvent::RollbackStarted);
				return;
			}
			ctx.deployment.outcome = deployment::DetailedStatus::FailedRollbackNotRequested;
			poster.PostEvent(StateEvent::Failure);
		});
}

void RollbackState::OnEnter(Context &ctx, sm::EventPoster<StateEvent> &poster) {
	ctx.rollback_manager.Rollback(
		ctx.deployment.deployment->Id(), ctx.current_state, [&ctx, &poster](error::Error err) {
			if (err != error::NoError) {
				ctx.deployment.outcome = deployment::DetailedStatus::FailedRollbackFailed;
				// Reported as a failed rollback, with what made it necessary.
				ctx.deployment.error = err.WithContext(ctx.deployment.error.String());
				poster.PostEvent(StateEvent::Failure);
				return;
			}
			ctx.current_state = ctx.rollback_manager.Snapshot();
			ctx.deployment.outcome = deployment::DetailedStatus::FailedRollbackComplete;
			poster.PostEvent(StateEvent::Success);
		});
}

void ReportResultState::OnEnter(Context &ctx, sm::EventPoster<StateEvent> &poster) {
	auto err = ctx.CommitOutcome();
	if (err != error::NoError) {
		ctx.Log().Error("Could not persist the deployment outcome: " + err.String());
	}

	ctx.Log().Info(
		"Deployment finished: " + deployment::DetailedStatusToString(ctx.deployment.outcome));
	ctx.ReportOutcome();

	auto id = ctx.deployment.deployment->Id();
	auto final_status = deployment::DetailedStatusToDeploymentStatus(ctx.deployment.outcome);
	ctx.deployment = {};

	err = ctx.deployment_queue.Complete(id, final_status);
	if (err != error::NoError) {
		log::Error(err.String());
	}
	poster.PostEvent(StateEvent::Success);
}

ExitState::ExitState(events::EventLoop &event_loop) :
	event_loop_(event_loop) {
}

void ExitState::OnEnter(Context &ctx, sm::EventPoster<StateEvent> &poster) {
	auto err = ctx.SaveQueue();
	if (err != error::NoError) {
		log::Error("Could not save the deployment queue: " + err.String());
		exit_error = err;
	}
	event_loop_.Stop();
}

} // namespace daemon
} // namespace core
} // namespace edgedeploy
