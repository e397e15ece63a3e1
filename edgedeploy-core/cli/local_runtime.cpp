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


#include <edgedeploy-core/cli/local_runtime.hpp>

namespace edgedeploy {
namespace core {
namespace cli {

error::Error LocalComponentRuntime::Apply(const executor::ComponentAction &action) {
	applied_.push_back(action);

	auto component_log = logger_.WithFields(log::LogField {"component", action.component});
	if (action.type == executor::ActionType::Remove) {
		component_log.Info("Removed");
	} else {
		component_log.Info(
			executor::ActionTypeToString(action.type) + " to version " + action.version.String()
			+ " with configuration " + action.configuration.Dump());
	}
	return error::NoError;
}

executor::LifecycleState LocalComponentRuntime::CurrentState(const string &component) {
	return executor::LifecycleState::Running;
}

executor::Subscription LocalComponentRuntime::Subscribe(
	const string &component, executor::LifecycleHandler handler) {
	// Nothing ever changes state.
	return executor::Subscription();
}

void LocalSafetyCheckClient::RequestSafetyCheck(
	const string &component,
	const string &deployment_id,
	DecisionHandler handler,
	ReleaseHandler release) {
	handler(update_gate::SafetyDecision {});
}

void LocalSafetyCheckClient::NotifyReleased(
	const string &component, const string &deployment_id, update_gate::ReleaseReason reason) {
}

expected::ExpectedBool LocalValidationClient::RequestValidation(
	const string &component,
	const string &deployment_id,
	const config_tree::Value &configuration,
	ReportHandler handler) {
	return false;
}

} // namespace cli
} // namespace core
} // namespace edgedeploy
