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


#ifndef EDGEDEPLOY_CORE_CLI_LOCAL_RUNTIME_HPP
#define EDGEDEPLOY_CORE_CLI_LOCAL_RUNTIME_HPP

#include <string>
#include <vector>

#include <common/error.hpp>
#include <common/expected.hpp>
#include <common/log.hpp>

#include <edgedeploy-core/config_tree.hpp>
#include <edgedeploy-core/config_validation.hpp>
#include <edgedeploy-core/executor.hpp>
#include <edgedeploy-core/update_gate.hpp>

namespace edgedeploy {
namespace core {
namespace cli {

using namespace std;

namespace error = edgedeploy::common::error;
namespace expected = edgedeploy::common::expected;
namespace log = edgedeploy::common::log;

namespace config_tree = edgedeploy::core::config_tree;
namespace config_validation = edgedeploy::core::config_validation;
namespace executor = edgedeploy::core::executor;
namespace update_gate = edgedeploy::core::update_gate;

// Stands in for the component supervisor when the binary runs on its own. Actions are only
// recorded, and every component reports RUNNING.
class LocalComponentRuntime : public executor::ComponentManager, public executor::LifecycleMonitor {
public:
	LocalComponentRuntime() :
		logger_ {"local-runtime"} {
	}

	error::Error Apply(const executor::ComponentAction &action) override;
	executor::LifecycleState CurrentState(const string &component) override;
	executor::Subscription Subscribe(
		const string &component, executor::LifecycleHandler handler) override;

	const vector<executor::ComponentAction> &Applied() const {
		return applied_;
	}

private:
	vector<executor::ComponentAction> applied_;
	log::Logger logger_;
};

// Every component is always safe to update.
class LocalSafetyCheckClient : public update_gate::SafetyCheckClient {
public:
	void RequestSafetyCheck(
		const string &component,
		const string &deployment_id,
		DecisionHandler handler,
		ReleaseHandler release) override;
	void NotifyReleased(
		const string &component,
		const string &deployment_id,
		update_gate::ReleaseReason reason) override;
};

// No component validates its configuration.
class LocalValidationClient : public config_validation::ValidationClient {
public:
	expected::ExpectedBool RequestValidation(
		const string &component,
		const string &deployment_id,
		const config_tree::Value &configuration,
		ReportHandler handler) override;
};

} // namespace cli
} // namespace core
} // namespace edgedeploy

#endif // EDGEDEPLOY_CORE_CLI_LOCAL_RUNTIME_HPP
