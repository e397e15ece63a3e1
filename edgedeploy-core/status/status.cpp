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


#include <edgedeploy-core/status.hpp>

#include <common/common.hpp>
#include <common/log.hpp>

namespace edgedeploy {
namespace core {
namespace status {

namespace common = edgedeploy::common;
namespace log = edgedeploy::common::log;

StatusDetails MakeDetails(deployment::DetailedStatus detailed_status) {
	StatusDetails details;
	details.detailed_status = detailed_status;
	return details;
}

StatusDetails MakeDetails(deployment::DetailedStatus detailed_status, const error::Error &cause) {
	auto details = MakeDetails(detailed_status);
	if (cause == error::NoError) {
		return details;
	}
	details.failure_cause = cause.String();
	auto report = deployment::ErrorToReport(cause);
	details.error_stack = report.error_stack;
	details.error_types = report.error_types;
	return details;
}

void LoggingStatusReporter::ReportStatus(
	const string &deployment_id,
	deployment::DeploymentType type,
	deployment::DeploymentStatus status,
	const StatusDetails &details) {
	auto logger = log::Logger("status").WithFields(
		log::LogField {"deployment_id", deployment_id},
		log::LogField {"deployment_type", deployment::DeploymentTypeToString(type)},
		log::LogField {"status", deployment::DeploymentStatusToString(status)});

	if (!details.detailed_status) {
		logger.Info("Deployment status changed");
		return;
	}

	auto detailed = deployment::DetailedStatusToString(details.detailed_status.value());
	if (details.failure_cause.empty()) {
		logger.WithFields(log::LogField {"detailed_status", detailed})
			.Info("Deployment status changed");
		return;
	}
	logger
		.WithFields(
			log::LogField {"detailed_status", detailed},
			log::LogField {"error_stack", common::JoinStrings(details.error_stack, ",")},
			log::LogField {"error_types", common::JoinStrings(details.error_types, ",")})
		.Error("Deployment status changed: " + details.failure_cause);
}

} // namespace status
} // namespace core
} // namespace edgedeploy
