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


#include <edgedeploy-core/rollback.hpp>

#include <edgedeploy-core/deployment.hpp>

namespace edgedeploy {
namespace core {
namespace rollback {

namespace deployment = edgedeploy::core::deployment;

void RollbackManager::Rollback(
	const string &deployment_id,
	const resolved_state::ResolvedState &partial,
	RollbackHandler handler) {
	auto logger = logger_.WithFields(log::LogField {"deployment_id", deployment_id});

	if (in_progress_) {
		handler(deployment::MakeError(
			deployment::RollbackError, "A rollback is already in progress, not nesting another"));
		return;
	}

	auto plan = executor::ComputePlan(partial, snapshot_);
	logger.Info(
		"Rolling back to the last known good state, " + to_string(plan.size()) + " action(s)");

	in_progress_ = true;
	executor_.Execute(deployment_id, plan, [this, logger, handler](error::Error err) mutable {
		in_progress_ = false;
		if (err != error::NoError) {
			logger.Error("Rollback failed: " + err.String());
			handler(deployment::MakeError(deployment::RollbackError, err.String()));
			return;
		}
		logger.Info("Rollback complete");
		handler(error::NoError);
	});
}

} // namespace rollback
} // namespace core
} // namespace edgedeploy
