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


#ifndef EDGEDEPLOY_CORE_DEPLOYMENT_HPP
#define EDGEDEPLOY_CORE_DEPLOYMENT_HPP

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <common/error.hpp>
#include <common/expected.hpp>
#include <common/json.hpp>
#include <common/optional.hpp>

namespace edgedeploy {
namespace core {
namespace deployment {

using namespace std;

namespace error = edgedeploy::common::error;
namespace expected = edgedeploy::common::expected;
namespace json = edgedeploy::common::json;
namespace optional = edgedeploy::common::optional;

enum DeploymentErrorCode {
	NoError = 0,
	ConflictError,
	NoAvailableVersionError,
	CircularDependencyError,
	ConfigurationPatchError,
	ComponentBrokenError,
	ComponentUpdateError,
	GateTimeoutError,
	CancellationError,
	DocumentParseError,
	RollbackError,
	ConfigurationValidationError,
};

class DeploymentErrorCategoryClass : public std::error_category {
public:
	const char *name() const noexcept override;
	string message(int code) const override;
};
extern const DeploymentErrorCategoryClass DeploymentErrorCategory;

error::Error MakeError(DeploymentErrorCode code, const string &msg);

// True if `err` carries `code` from the deployment error category.
bool IsError(const error::Error &err, DeploymentErrorCode code);

// Root group used by local deployments.
extern const string kLocalDeploymentGroup;

enum class DeploymentType {
	CloudJob,
	Shadow,
	Local,
};

string DeploymentTypeToString(DeploymentType type);
expected::expected<DeploymentType, error::Error> DeploymentTypeFromString(const string &str);

enum class DeploymentStatus {
	Queued,
	InProgress,
	Succeeded,
	Failed,
	Canceled,
};

string DeploymentStatusToString(DeploymentStatus status);
expected::expected<DeploymentStatus, error::Error> DeploymentStatusFromString(const string &str);
bool IsTerminal(DeploymentStatus status);

enum class DetailedStatus {
	Successful,
	FailedNoStateChange,
	FailedRollbackNotRequested,
	FailedRollbackComplete,
	FailedRollbackFailed,
	Rejected,
	Canceled,
};

string DetailedStatusToString(DetailedStatus status);
DeploymentStatus DetailedStatusToDeploymentStatus(DetailedStatus status);

enum class FailureHandlingPolicy {
	DoNothing,
	Rollback,
};

enum class ComponentUpdatePolicyAction {
	NotifyComponents,
	SkipNotifyComponents,
};

// MERGE and RESET are mutually exclusive, but both are kept here so that a document which
// carries both can be rejected by the resolver.
struct ConfigurationUpdate {
	bool has_merge {false};
	// The patch as JSON text. Parsed only when it is applied.
	string merge;
	bool has_reset {false};
	vector<string> reset;

	bool Empty() const {
		return !has_merge && !has_reset;
	}
};

struct ComponentSpec {
	string name;
	string version_requirement;
	ConfigurationUpdate configuration_update;
};

struct DeploymentPolicies {
	FailureHandlingPolicy failure_handling {FailureHandlingPolicy::Rollback};
	ComponentUpdatePolicyAction update_action {ComponentUpdatePolicyAction::NotifyComponents};
	// Unset means the configured default.
	optional::optional<int> update_timeout_seconds;
	int configuration_validation_timeout_seconds {30};
};

struct DeploymentDocument {
	string deployment_id;
	// The addressed thing or group, as given in the document.
	string target;
	// Key in GroupToRootComponents, `thing/<name>`, `thinggroup/<name>` or
	// `LOCAL_DEPLOYMENT`.
	string group_name;
	int64_t timestamp {0};
	// Sorted by component name.
	map<string, ComponentSpec> components;
	vector<string> root_components_to_remove;
	DeploymentPolicies policies;
	// Whether the components replace the group's roots, or are applied on top of them.
	bool full_replacement {true};
};

using ExpectedDeploymentDocument = expected::expected<DeploymentDocument, error::Error>;

ExpectedDeploymentDocument ParseDocument(const json::Json &doc, DeploymentType type);
ExpectedDeploymentDocument ParseDocument(const string &doc, DeploymentType type);

class Deployment;
using ExpectedDeployment = expected::expected<Deployment, error::Error>;

// Copies share the cancellation flag, everything else is immutable after intake.
class Deployment {
public:
	Deployment(
		DeploymentType type, DeploymentDocument document, string raw_document, int64_t submitted_at);

	static ExpectedDeployment FromString(
		DeploymentType type, const string &raw_document, int64_t submitted_at);

	const string &Id() const {
		return document_.deployment_id;
	}
	DeploymentType Type() const {
		return type_;
	}
	const DeploymentDocument &Document() const {
		return document_;
	}
	const string &RawDocument() const {
		return raw_document_;
	}
	int64_t SubmittedAt() const {
		return submitted_at_;
	}

	void Cancel();
	bool IsCancelled() const;

	string ToJson() const;
	static ExpectedDeployment FromJson(const json::Json &json);

private:
	DeploymentType type_;
	DeploymentDocument document_;
	string raw_document_;
	int64_t submitted_at_;
	shared_ptr<atomic<bool>> cancelled_;
};

// What is reported upstream for a failed deployment.
struct ErrorReport {
	vector<string> error_stack;
	vector<string> error_types;
};

ErrorReport ErrorToReport(const error::Error &err);

} // namespace deployment
} // namespace core
} // namespace edgedeploy

#endif // EDGEDEPLOY_CORE_DEPLOYMENT_HPP
