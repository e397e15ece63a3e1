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


#include <edgedeploy-core/daemon/context.hpp>

#include <common/common.hpp>
#include <common/json.hpp>

namespace edgedeploy {
namespace core {
namespace daemon {

namespace common = edgedeploy::common;
namespace json = edgedeploy::common::json;

const string Context::group_to_root_components_key {root_components::kGroupToRootComponentsKey};
const string Context::current_state_key {"current-state"};
const string Context::last_known_good_key {"last-known-good"};
const string Context::deployment_queue_key {"deployment-queue"};
const string Context::components_needing_remediation_key {"components-needing-remediation"};

Context::Context(
	const conf::EdgeDeployConfig &config,
	events::EventLoop &event_loop,
	kvdb::KeyValueDatabase &db,
	Collaborators collaborators) :
	config {config},
	event_loop {event_loop},
	db {db},
	collaborators {collaborators},
	deployment_queue {static_cast<size_t>(config.deployment_history_size)},
	root_components {event_loop, db},
	root_components_reader {root_components},
	version_resolver {collaborators.catalog},
	config_delta_engine {config.configuration_update_fail_fast},
	configuration_validator {event_loop, collaborators.validation_client},
	update_gate {event_loop, collaborators.safety_check_client},
	deployment_executor {
		event_loop,
		collaborators.component_manager,
		collaborators.lifecycle_monitor,
		chrono::seconds(config.component_terminal_state_timeout_seconds)},
	rollback_manager {deployment_executor},
	logger_ {"daemon"},
	destroyed_ {make_shared<bool>(false)} {
	auto destroyed = destroyed_;

	deployment_queue.SetAvailabilityHandler([this, destroyed]() {
		this->event_loop.Post([this, destroyed]() {
			if (*destroyed || !on_deployment_available) {
				return;
			}
			on_deployment_available();
		});
	});

	deployment_queue.SetSupersededHandler(
		[this, destroyed](const deployment::Deployment &dep, bool in_progress) {
			auto superseded = dep;
			this->event_loop.Post([this, destroyed, superseded, in_progress]() {
				if (*destroyed) {
					return;
				}
				if (in_progress) {
					// The gate is the only place where waiting can be cut short. Everywhere
					// else the cancellation flag is checked between stages.
					update_gate.Cancel();
					return;
				}
				this->collaborators.status_reporter.ReportStatus(
					superseded.Id(),
					superseded.Type(),
					deployment::DeploymentStatus::Canceled,
					status::MakeDetails(
						deployment::DetailedStatus::Canceled,
						deployment::MakeError(
							deployment::CancellationError, "Superseded by a newer deployment")));
			});
		});
}

Context::~Context() {
	*destroyed_ = true;
}

log::Logger Context::Log() {
	return logger_.WithFields(log::LogField {
		"deployment_id", deployment.deployment ? deployment.deployment->Id() : ""});
}

error::Error Context::LoadState() {
	auto err = root_components.Load();
	if (err != error::NoError) {
		return err.WithContext("Could not load the root components");
	}

	string queue_snapshot;
	err = db.ReadTransaction([this, &queue_snapshot](kvdb::Transaction &txn) {
		auto data = kvdb::ReadString(txn, current_state_key, true);
		if (!data) {
			return data.error();
		}
		if (data.value() != "") {
			auto state = resolved_state::ResolvedState::FromJsonString(data.value());
			if (!state) {
				return state.error().WithContext("Could not load " + current_state_key);
			}
			current_state = state.value();
		}

		data = kvdb::ReadString(txn, deployment_queue_key, true);
		if (!data) {
			return data.error();
		}
		queue_snapshot = data.value();
		return error::NoError;
	});
	if (err != error::NoError) {
		return err;
	}

	if (queue_snapshot != "") {
		err = deployment_queue.Restore(queue_snapshot);
		if (err != error::NoError) {
			// Not fatal, the sources deliver again.
			log::Warning("Could not restore the deployment queue: " + err.String());
		}
		err = db.Remove(deployment_queue_key);
		if (err != error::NoError) {
			return err;
		}
	}

	log::Info(
		"Loaded state: " + to_string(root_components.Get().size()) + " group(s), "
		+ to_string(current_state.components.size()) + " component(s), "
		+ to_string(deployment_queue.Size()) + " queued deployment(s)");
	return error::NoError;
}

queue::OfferResult Context::Submit(const deployment::Deployment &dep) {
	auto result = deployment_queue.Offer(dep);
	if (result == queue::OfferResult::Ignored) {
		return result;
	}

	auto destroyed = destroyed_;
	auto queued = dep;
	event_loop.Post([this, destroyed, queued]() {
		if (*destroyed) {
			return;
		}
		collaborators.status_reporter.ReportStatus(
			queued.Id(), queued.Type(), deployment::DeploymentStatus::Queued, {});
	});
	return result;
}

error::Error Context::SaveQueue() {
	// Written even when nothing is queued, the history keeps redelivered deployments out.
	return db.Write(
		deployment_queue_key, common::ByteVectorFromString(deployment_queue.Snapshot()));
}

bool Context::CancelRequested(const string &checkpoint) {
	if (!deployment.deployment || !deployment.deployment->IsCancelled()) {
		return false;
	}
	Log().Info("Deployment was canceled, noticed " + checkpoint);
	deployment.outcome = deployment::DetailedStatus::Canceled;
	deployment.error = deployment::MakeError(
		deployment::CancellationError, "Superseded by a newer deployment");
	return true;
}

static string RemediationList(const resolved_state::ResolvedState &state) {
	string list = "[";
	for (const auto &entry : state.components) {
		if (!entry.second.needs_remediation) {
			continue;
		}
		if (list.size() > 1) {
			list += ",";
		}
		list += "\"" + json::EscapeString(entry.first) + "\"";
	}
	return list + "]";
}

error::Error Context::CommitOutcome() {
	if (!deployment.executed) {
		// Failed or canceled before anything was touched.
		return error::NoError;
	}

	const auto outcome = deployment.outcome;
	return db.WriteTransaction([this, outcome](kvdb::Transaction &txn) {
		auto err = txn.Write(current_state_key, common::ByteVectorFromString(current_state.ToJson()));
		if (err != error::NoError) {
			return err;
		}
		err = txn.Write(
			components_needing_remediation_key,
			common::ByteVectorFromString(RemediationList(current_state)));
		if (err != error::NoError) {
			return err;
		}

		if (outcome == deployment::DetailedStatus::Successful) {
			err = txn.Write(
				last_known_good_key, common::ByteVectorFromString(current_state.ToJson()));
			if (err != error::NoError) {
				return err;
			}
		}
		if (outcome == deployment::DetailedStatus::Successful
			|| outcome == deployment::DetailedStatus::FailedRollbackNotRequested) {
			return root_components.Set(deployment.desired.groups, txn);
		}
		return error::NoError;
	});
}

void Context::ReportStatus(deployment::DeploymentStatus status) {
	collaborators.status_reporter.ReportStatus(
		deployment.deployment->Id(), deployment.deployment->Type(), status, {});
}

void Context::ReportOutcome() {
	auto details = status::MakeDetails(deployment.outcome, deployment.error);
	collaborators.status_reporter.ReportStatus(
		deployment.deployment->Id(),
		deployment.deployment->Type(),
		deployment::DetailedStatusToDeploymentStatus(deployment.outcome),
		details);
}

} // namespace daemon
} // namespace core
} // namespace edgedeploy
