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


#ifndef EDGEDEPLOY_CORE_ROLLBACK_HPP
#define EDGEDEPLOY_CORE_ROLLBACK_HPP

#include <functional>
#include <string>

#include <common/error.hpp>
#include <common/log.hpp>

#include <edgedeploy-core/executor.hpp>
#include <edgedeploy-core/resolved_state.hpp>

namespace edgedeploy {
namespace core {
namespace rollback {

using namespace std;

namespace error = edgedeploy::common::error;
namespace executor = edgedeploy::core::executor;
namespace log = edgedeploy::common::log;
namespace resolved_state = edgedeploy::core::resolved_state;

using RollbackHandler = function<void(error::Error)>;

class RollbackManager {
public:
	explicit RollbackManager(executor::DeploymentExecutor &executor) :
		executor_ {executor},
		logger_ {"rollback"} {
	}

	// Remembers the state to go back to. Called right before a deployment is applied.
	void Capture(const resolved_state::ResolvedState &last_known_good) {
		snapshot_ = last_known_good;
	}

	const resolved_state::ResolvedState &Snapshot() const {
		return snapshot_;
	}

	// Brings the device from `partial`, whatever the failed deployment left behind, back to the
	// captured state through the executor. `handler` gets `NoError` or a `RollbackError`. A
	// failed rollback is final, there is no rollback of the rollback.
	void Rollback(
		const string &deployment_id,
		const resolved_state::ResolvedState &partial,
		RollbackHandler handler);

	bool InProgress() const {
		return in_progress_;
	}

private:
	executor::DeploymentExecutor &executor_;
	log::Logger logger_;
	resolved_state::ResolvedState snapshot_;
	bool in_progress_ {false};
};

} // namespace rollback
} // namespace core
} // namespace edgedeploy

#endif // EDGEDEPLOY_CORE_ROLLBACK_HPP
