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


#ifndef EDGEDEPLOY_CORE_DAEMON_CONTEXT_HPP
#define EDGEDEPLOY_CORE_DAEMON_CONTEXT_HPP

#include <memory>
#include <string>
#include <vector>

#include <common/conf.hpp>
#include <common/error.hpp>
#include <common/events.hpp>
#include <common/key_value_database.hpp>
#include <common/log.hpp>

#include <edgedeploy-core/catalog.hpp>
#include <edgedeploy-core/config_delta.hpp>
#include <edgedeploy-core/config_validation.hpp>
#include <edgedeploy-core/deployment.hpp>
#include <edgedeploy-core/document_resolver.hpp>
#include <edgedeploy-core/executor.hpp>
#include <edgedeploy-core/queue.hpp>
#include <edgedeploy-core/resolved_state.hpp>
#include <edgedeploy-core/rollback.hpp>
#include <edgedeploy-core/root_components.hpp>
#include <edgedeploy-core/status.hpp>
#include <edgedeploy-core/update_gate.hpp>
#include <edgedeploy-core/version_resolver.hpp>

namespace edgedeploy {
namespace core {
namespace daemon {

using namespace std;

namespace conf = edgedeploy::common::conf;
namespace error = edgedeploy::common::error;
namespace events = edgedeploy::common::events;
namespace kvdb = edgedeploy::common::key_value_database;
namespace log = edgedeploy::common::log;

namespace catalog = edgedeploy::core::catalog;
namespace config_delta = edgedeploy::core::config_delta;
namespace config_validation = edgedeploy::core::config_validation;
namespace deployment = edgedeploy::core::deployment;
namespace document_resolver = edgedeploy::core::document_resolver;
namespace executor = edgedeploy::core::executor;
namespace queue = edgedeploy::core::queue;
namespace resolved_state = edgedeploy::core::resolved_state;
namespace rollback = edgedeploy::core::rollback;
namespace root_components = edgedeploy::core::root_components;
namespace status = edgedeploy::core::status;
namespace update_gate = edgedeploy::core::update_gate;
namespace version_resolver = edgedeploy::core::version_resolver;

// The device side of the deployment protocol. None of these is owned by the daemon.
struct Collaborators {
	catalog::ComponentCatalog &catalog;
	update_gate::SafetyCheckClient &safety_check_client;
	config_validation::ValidationClient &validation_client;
	executor::ComponentManager &component_manager;
	executor::LifecycleMonitor &lifecycle_monitor;
	status::StatusReporter &status_reporter;
};

class Context {
public:
	Context(
		const conf::EdgeDeployConfig &config,
		events::EventLoop &event_loop,
		kvdb::KeyValueDatabase &db,
		Collaborators collaborators);
	~Context();

	Context(const Context &) = delete;
	Context &operator=(const Context &) = delete;

	// Reads everything persisted by an earlier run, and requeues the deployments which were
	// waiting when it stopped.
	error::Error LoadState();

	// Thread-safe intake from any source.
	queue::OfferResult Submit(const deployment::Deployment &dep);

	error::Error SaveQueue();

	// True if the deployment in progress was asked to cancel. Logs the checkpoint.
	bool CancelRequested(const string &checkpoint);

	// Persists the outcome of the deployment in progress.
	error::Error CommitOutcome();

	// Reports a status transition of the deployment in progress.
	void ReportStatus(deployment::DeploymentStatus status);
	void ReportOutcome();

	log::Logger Log();

	// DATABASE KEYS ------------------------------------------------------

	// GroupToRootComponents, owned by `root_components`.
	static const string group_to_root_components_key;
	// The ResolvedState the device was last driven to, whatever the outcome.
	static const string current_state_key;
	// The ResolvedState of the last successful deployment. Written only, for inspection.
	static const string last_known_good_key;
	// Queue snapshot saved on shutdown: unfinished deployments, history and newest timestamps.
	static const string deployment_queue_key;
	// JSON list of components whose last configuration update could not be applied.
	static const string components_needing_remediation_key;

	// END OF DATABASE KEYS -----------------------------------------------

	const conf::EdgeDeployConfig &config;
	events::EventLoop &event_loop;
	kvdb::KeyValueDatabase &db;
	Collaborators collaborators;

	queue::DeploymentQueue deployment_queue;
	root_components::RootComponentsOwner root_components;
	// What the deployment stages read the mapping through.
	root_components::RootComponentsHandle root_components_reader;
	version_resolver::VersionResolver version_resolver;
	config_delta::ConfigDeltaEngine config_delta_engine;
	config_validation::ConfigurationValidator configuration_validator;
	update_gate::UpdateGate update_gate;
	executor::DeploymentExecutor deployment_executor;
	rollback::RollbackManager rollback_manager;

	resolved_state::ResolvedState current_state;

	struct {
		unique_ptr<deployment::Deployment> deployment;
		document_resolver::DesiredState desired;
		version_resolver::ResolvedVersions versions;
		resolved_state::ResolvedState target;
		// Whether anything was applied to the device.
		bool executed {false};
		deployment::DetailedStatus outcome {deployment::DetailedStatus::Successful};
		error::Error error;
	} deployment;

	// Called on the event loop thread when the queue may have something to poll.
	function<void()> on_deployment_available;
	// Called once the persisted state is loaded. Sources of new deployments are started from
	// here, so that they come after the deployments restored from the last run.
	function<void()> on_initialized;

private:
	log::Logger logger_;
	shared_ptr<bool> destroyed_;
};

} // namespace daemon
} // namespace core
} // namespace edgedeploy

#endif // EDGEDEPLOY_CORE_DAEMON_CONTEXT_HPP
