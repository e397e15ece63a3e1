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


#ifndef EDGEDEPLOY_CORE_STATUS_HPP
#define EDGEDEPLOY_CORE_STATUS_HPP

#include <string>
#include <vector>

#include <common/error.hpp>
#include <common/optional.hpp>

#include <edgedeploy-core/deployment.hpp>

namespace edgedeploy {
namespace core {
namespace status {

using namespace std;

namespace deployment = edgedeploy::core::deployment;
namespace error = edgedeploy::common::error;
namespace optional = edgedeploy::common::optional;

struct StatusDetails {
	// Only set for terminal statuses.
	optional::optional<deployment::DetailedStatus> detailed_status;
	string failure_cause;
	vector<string> error_stack;
	vector<string> error_types;
};

StatusDetails MakeDetails(deployment::DetailedStatus detailed_status);
StatusDetails MakeDetails(deployment::DetailedStatus detailed_status, const error::Error &cause);

// Where status transitions go. Called on the event loop thread.
class StatusReporter {
public:
	virtual ~StatusReporter() {
	}

	virtual void ReportStatus(
		const string &deployment_id,
		deployment::DeploymentType type,
		deployment::DeploymentStatus status,
		const StatusDetails &details) = 0;
};

class LoggingStatusReporter : public StatusReporter {
public:
	void ReportStatus(
		const string &deployment_id,
		deployment::DeploymentType type,
		deployment::DeploymentStatus status,
		const StatusDetails &details) override;
};

} // namespace status
} // namespace core
} // namespace edgedeploy

#endif // EDGEDEPLOY_CORE_STATUS_HPP
