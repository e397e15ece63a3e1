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


#include <edgedeploy-core/cli/actions.hpp>

#include <chrono>
#include <iostream>

#include <common/events.hpp>
#include <common/io.hpp>
#include <common/json.hpp>
#include <common/log.hpp>
#include <common/optional.hpp>
#include <common/path.hpp>

#include <edgedeploy-core/catalog.hpp>
#include <edgedeploy-core/cli/local_runtime.hpp>
#include <edgedeploy-core/config_delta.hpp>
#include <edgedeploy-core/daemon/context.hpp>
#include <edgedeploy-core/daemon/spool.hpp>
#include <edgedeploy-core/daemon/state_machine.hpp>
#include <edgedeploy-core/document_resolver.hpp>
#include <edgedeploy-core/resolved_state.hpp>
#include <edgedeploy-core/root_components.hpp>
#include <edgedeploy-core/status.hpp>
#include <edgedeploy-core/version_resolver.hpp>

namespace edgedeploy {
namespace core {
namespace cli {

namespace events = edgedeploy::common::events;
namespace io = edgedeploy::common::io;
namespace json = edgedeploy::common::json;
namespace log = edgedeploy::common::log;
namespace optional = edgedeploy::common::optional;
namespace path = edgedeploy::common::path;

namespace catalog = edgedeploy::core::catalog;
namespace config_delta = edgedeploy::core::config_delta;
namespace daemon = edgedeploy::core::daemon;
namespace document_resolver = edgedeploy::core::document_resolver;
namespace resolved_state = edgedeploy::core::resolved_state;
namespace root_components = edgedeploy::core::root_components;
namespace spool = edgedeploy::core::daemon::spool;
namespace status = edgedeploy::core::status;
namespace version_resolver = edgedeploy::core::version_resolver;

error::Error MainContext::Initialize() {
	auto err = path::CreateDirectories(config_.paths.GetDataStore());
	if (err != error::NoError) {
		return err;
	}
	return db_.Open(config_.paths.GetDatabaseFile());
}

expected::ExpectedString ReadDocument(const string &src) {
	if (src == "-") {
		return io::ReadAll(cin);
	}
	auto is = io::OpenIfstream(src);
	if (!is) {
		return expected::unexpected(is.error());
	}
	return io::ReadAll(is.value());
}

static int64_t NowMilliseconds() {
	auto now = chrono::system_clock::now().time_since_epoch();
	return chrono::duration_cast<chrono::milliseconds>(now).count();
}

static resolved_state::ExpectedResolvedState ReadResolvedState(
	kvdb::KeyValueDatabase &db, const string &key) {
	string data;
	auto err = db.ReadTransaction([&key, &data](kvdb::Transaction &txn) {
		auto value = kvdb::ReadString(txn, key, true);
		if (!value) {
			return value.error();
		}
		data = value.value();
		return error::NoError;
	});
	if (err != error::NoError) {
		return expected::unexpected(err);
	}
	if (data == "") {
		return resolved_state::ResolvedState();
	}
	return resolved_state::ResolvedState::FromJsonString(data);
}

// Logs like the daemon does, and stops the event loop once one deployment is final.
class ForegroundStatusReporter : public status::StatusReporter {
public:
	ForegroundStatusReporter(events::EventLoop &loop, const string &deployment_id) :
		loop_ {loop},
		deployment_id_ {deployment_id} {
	}

	void ReportStatus(
		const string &deployment_id,
		deployment::DeploymentType type,
		deployment::DeploymentStatus status,
		const status::StatusDetails &details) override {
		logging_reporter_.ReportStatus(deployment_id, type, status, details);
		if (deployment_id != deployment_id_ || !details.detailed_status) {
			return;
		}
		outcome = details;
		loop_.Stop();
	}

	optional::optional<status::StatusDetails> outcome;

private:
	events::EventLoop &loop_;
	string deployment_id_;
	status::LoggingStatusReporter logging_reporter_;
};

error::Error DaemonAction::Execute(MainContext &main_context) {
	auto &config = main_context.GetConfig();
	events::EventLoop event_loop;

	catalog::FileCatalog component_catalog(config.paths.GetRecipesDir());
	LocalSafetyCheckClient safety_check_client;
	LocalValidationClient validation_client;
	LocalComponentRuntime runtime;
	status::LoggingStatusReporter reporter;

	daemon::Context ctx(
		config,
		event_loop,
		main_context.GetDatabase(),
		daemon::Collaborators {
			component_catalog, safety_check_client, validation_client, runtime, runtime, reporter});
	daemon::StateMachine state_machine(ctx, event_loop);

	spool::SpoolListener spool_listener(
		event_loop,
		config.paths.GetSpoolDir(),
		chrono::seconds(config.spool_poll_interval_seconds),
		[&ctx](const deployment::Deployment &dep) { ctx.Submit(dep); });
	ctx.on_initialized = [&spool_listener]() { spool_listener.Start(); };

	return state_machine.Run();
}

error::Error DeployAction::Execute(MainContext &main_context) {
	auto &config = main_context.GetConfig();

	auto dep = ReadDocument(src_).and_then([](const string &document) {
		return deployment::Deployment::FromString(
			deployment::DeploymentType::Local, document, NowMilliseconds());
	});
	if (!dep) {
		return dep.error().WithContext("Could not read the deployment from '" + src_ + "'");
	}

	events::EventLoop event_loop;

	catalog::FileCatalog component_catalog(config.paths.GetRecipesDir());
	LocalSafetyCheckClient safety_check_client;
	LocalValidationClient validation_client;
	LocalComponentRuntime runtime;
	ForegroundStatusReporter reporter(event_loop, dep.value().Id());

	daemon::Context ctx(
		config,
		event_loop,
		main_context.GetDatabase(),
		daemon::Collaborators {
			component_catalog, safety_check_client, validation_client, runtime, runtime, reporter});
	daemon::StateMachine state_machine(ctx, event_loop);

	const auto &submitted = dep.value();
	ctx.on_initialized = [&ctx, &submitted]() { ctx.Submit(submitted); };

	auto err = state_machine.Run();
	if (err != error::NoError) {
		return err;
	}

	// Deployments which were waiting from an earlier run are left for the daemon.
	err = ctx.SaveQueue();
	if (err != error::NoError) {
		log::Error("Could not save the deployment queue: " + err.String());
	}

	if (!reporter.outcome) {
		cout << "Deployment " << submitted.Id() << " was interrupted." << endl;
		return error::MakeError(error::ExitWithFailureError, "");
	}

	const auto &outcome = reporter.outcome.value();
	auto detailed_status = outcome.detailed_status.value();
	cout << "Deployment " << submitted.Id() << ": "
		 << deployment::DetailedStatusToString(detailed_status) << endl;
	if (outcome.failure_cause != "") {
		cout << outcome.failure_cause << endl;
	}

	if (detailed_status != deployment::DetailedStatus::Successful) {
		return error::MakeError(error::ExitWithFailureError, "");
	}
	return error::NoError;
}

error::Error SubmitAction::Execute(MainContext &main_context) {
	auto document = ReadDocument(src_);
	if (!document) {
		return document.error();
	}

	auto written = spool::WriteSubmission(
		main_context.GetConfig().paths.GetSpoolDir(), type_, document.value());
	if (!written) {
		return written.error().WithContext("Could not submit '" + src_ + "'");
	}
	log::Info("Submitted as " + written.value());
	return error::NoError;
}

error::Error ResolveAction::Execute(MainContext &main_context) {
	auto &config = main_context.GetConfig();
	auto &db = main_context.GetDatabase();

	auto document = ReadDocument(src_).and_then([this](const string &data) {
		return deployment::ParseDocument(data, type_);
	});
	if (!document) {
		return document.error();
	}

	// Only needed to own the mapping, nothing is run on it.
	events::EventLoop event_loop;
	root_components::RootComponentsOwner roots(event_loop, db);
	auto err = roots.Load();
	if (err != error::NoError) {
		return err;
	}
	auto current = ReadResolvedState(db, daemon::Context::current_state_key);
	if (!current) {
		return current.error();
	}

	auto desired = document_resolver::Resolve(document.value(), roots.Get());
	if (!desired) {
		return desired.error();
	}

	catalog::FileCatalog component_catalog(config.paths.GetRecipesDir());
	version_resolver::VersionResolver resolver(component_catalog);
	auto versions = resolver.Resolve(desired.value().groups, document.value().deployment_id);
	if (!versions) {
		return versions.error();
	}

	config_delta::ConfigDeltaEngine engine(config.configuration_update_fail_fast);
	auto target = engine.Compute(
		versions.value(),
		current.value(),
		desired.value().configuration_updates,
		document.value().deployment_id);
	if (!target) {
		return target.error();
	}

	auto pretty = json::Load(target.value().ToJson());
	if (!pretty) {
		return pretty.error();
	}
	cout << pretty.value().Dump() << endl;
	return error::NoError;
}

error::Error ShowStateAction::Execute(MainContext &main_context) {
	string roots;
	string current;
	string last_known_good;
	auto err = main_context.GetDatabase().ReadTransaction([&](kvdb::Transaction &txn) {
		auto value = kvdb::ReadString(txn, daemon::Context::group_to_root_components_key, true);
		if (!value) {
			return value.error();
		}
		roots = value.value();

		value = kvdb::ReadString(txn, daemon::Context::current_state_key, true);
		if (!value) {
			return value.error();
		}
		current = value.value();

		value = kvdb::ReadString(txn, daemon::Context::last_known_good_key, true);
		if (!value) {
			return value.error();
		}
		last_known_good = value.value();
		return error::NoError;
	});
	if (err != error::NoError) {
		return err;
	}

	string state = R"({"groupToRootComponents":)" + (roots != "" ? roots : "{}")
				   + R"(,"currentState":)" + (current != "" ? current : "null")
				   + R"(,"lastKnownGood":)" + (last_known_good != "" ? last_known_good : "null")
				   + "}";
	auto pretty = json::Load(state);
	if (!pretty) {
		return pretty.error().WithContext("The persisted state is corrupt");
	}
	cout << pretty.value().Dump() << endl;
	return error::NoError;
}

} // namespace cli
} // namespace core
} // namespace edgedeploy
