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


#include <edgedeploy-core/deployment.hpp>

#include <cassert>
#include <sstream>
#include <string>

#include <common/common.hpp>

namespace edgedeploy {
namespace core {
namespace deployment {

namespace common = edgedeploy::common;

const string kLocalDeploymentGroup = "LOCAL_DEPLOYMENT";

const DeploymentErrorCategoryClass DeploymentErrorCategory;

const char *DeploymentErrorCategoryClass::name() const noexcept {
	return "DeploymentErrorCategory";
}

string DeploymentErrorCategoryClass::message(int code) const {
	switch (code) {
	case NoError:
		return "Success";
	case ConflictError:
		return "Conflicting deployment document";
	case NoAvailableVersionError:
		return "No available component version";
	case CircularDependencyError:
		return "Circular component dependency";
	case ConfigurationPatchError:
		return "Configuration update could not be applied";
	case ComponentBrokenError:
		return "Component broken";
	case ComponentUpdateError:
		return "Component update failed";
	case GateTimeoutError:
		return "Timed out waiting for components to allow the update";
	case CancellationError:
		return "Deployment canceled";
	case DocumentParseError:
		return "Deployment document could not be parsed";
	case RollbackError:
		return "Rollback failed";
	case ConfigurationValidationError:
		return "Configuration rejected by a component";
	}
	// Don't use "default" case. This should generate a warning if we ever add any enums. But
	// still assert here for safety.
	assert(false);
	return "Unknown";
}

error::Error MakeError(DeploymentErrorCode code, const string &msg) {
	return error::Error(error_condition(code, DeploymentErrorCategory), msg);
}

bool IsError(const error::Error &err, DeploymentErrorCode code) {
	return err.code == error_condition(code, DeploymentErrorCategory);
}

string DeploymentTypeToString(DeploymentType type) {
	switch (type) {
	case DeploymentType::CloudJob:
		return "cloud-job";
	case DeploymentType::Shadow:
		return "shadow";
	case DeploymentType::Local:
		return "local";
	}
	assert(false);
	return "unknown";
}

expected::expected<DeploymentType, error::Error> DeploymentTypeFromString(const string &str) {
	if (str == "cloud-job") {
		return DeploymentType::CloudJob;
	} else if (str == "shadow") {
		return DeploymentType::Shadow;
	} else if (str == "local") {
		return DeploymentType::Local;
	}
	return expected::unexpected(
		MakeError(DocumentParseError, "\"" + str + "\" is not a valid deployment type"));
}

string DeploymentStatusToString(DeploymentStatus status) {
	switch (status) {
	case DeploymentStatus::Queued:
		return "QUEUED";
	case DeploymentStatus::InProgress:
		return "IN_PROGRESS";
	case DeploymentStatus::Succeeded:
		return "SUCCEEDED";
	case DeploymentStatus::Failed:
		return "FAILED";
	case DeploymentStatus::Canceled:
		return "CANCELED";
	}
	assert(false);
	return "UNKNOWN";
}

expected::expected<DeploymentStatus, error::Error> DeploymentStatusFromString(const string &str) {
	for (auto status :
		 {DeploymentStatus::Queued,
		  DeploymentStatus::InProgress,
		  DeploymentStatus::Succeeded,
		  DeploymentStatus::Failed,
		  DeploymentStatus::Canceled}) {
		if (DeploymentStatusToString(status) == str) {
			return status;
		}
	}
	return expected::unexpected(
		MakeError(DocumentParseError, "\"" + str + "\" is not a valid deployment status"));
}

bool IsTerminal(DeploymentStatus status) {
	return status == DeploymentStatus::Succeeded || status == DeploymentStatus::Failed
		   || status == DeploymentStatus::Canceled;
}

string DetailedStatusToString(DetailedStatus status) {
	switch (status) {
	case DetailedStatus::Successful:
		return "SUCCESSFUL";
	case DetailedStatus::FailedNoStateChange:
		return "FAILED_NO_STATE_CHANGE";
	case DetailedStatus::FailedRollbackNotRequested:
		return "FAILED_ROLLBACK_NOT_REQUESTED";
	case DetailedStatus::FailedRollbackComplete:
		return "FAILED_ROLLBACK_COMPLETE";
	case DetailedStatus::FailedRollbackFailed:
		return "FAILED_ROLLBACK_FAILED";
	case DetailedStatus::Rejected:
		return "REJECTED";
	case DetailedStatus::Canceled:
		return "CANCELED";
	}
	assert(false);
	return "UNKNOWN";
}

DeploymentStatus DetailedStatusToDeploymentStatus(DetailedStatus status) {
	switch (status) {
	case DetailedStatus::Successful:
		return DeploymentStatus::Succeeded;
	case DetailedStatus::Canceled:
		return DeploymentStatus::Canceled;
	default:
		return DeploymentStatus::Failed;
	}
}

static expected::ExpectedString GroupNameFromArn(const string &arn) {
	// arn:aws:iot:<region>:<account>:thing/<name> or thinggroup/<name>
	auto resource = arn.substr(arn.rfind(':') + 1);
	if (common::StartsWith(resource, "thing/") || common::StartsWith(resource, "thinggroup/")) {
		return resource;
	}
	return expected::unexpected(
		MakeError(DocumentParseError, "Unrecognized target ARN \"" + arn + "\""));
}

static error::Error ParseTarget(const json::Json &doc, DeploymentDocument &result) {
	auto arn = json::Get<string>(doc, "targetArn", json::MissingOk::Yes);
	if (!arn) {
		return arn.error().WithContext("targetArn");
	}
	if (arn.value() != "") {
		auto group = GroupNameFromArn(arn.value());
		if (!group) {
			return group.error();
		}
		result.target = arn.value();
		result.group_name = group.value();
		return error::NoError;
	}

	auto name = json::Get<string>(doc, "targetName", json::MissingOk::Yes);
	auto type = json::Get<string>(doc, "targetType", json::MissingOk::Yes);
	if (!name || !type) {
		return MakeError(DocumentParseError, "targetName and targetType must be strings");
	}
	if (name.value() == "") {
		return MakeError(DocumentParseError, "Document has neither targetArn nor targetName");
	}
	if (type.value() != "thing" && type.value() != "thinggroup") {
		return MakeError(
			DocumentParseError, "\"" + type.value() + "\" is not a valid targetType");
	}
	result.target = name.value();
	result.group_name = type.value() + "/" + name.value();
	return error::NoError;
}

static error::Error ParseConfigurationUpdate(const json::Json &update, ConfigurationUpdate &result) {
	if (!update.IsObject()) {
		return MakeError(DocumentParseError, "configurationUpdate must be an object");
	}

	auto merge = update.Get("merge");
	if (merge) {
		if (merge.value().IsString()) {
			result.merge = merge.value().GetString().value();
		} else if (merge.value().IsObject()) {
			result.merge = merge.value().Dump(-1);
		} else {
			return MakeError(DocumentParseError, "merge must be a JSON string or an object");
		}
		result.has_merge = true;
	}

	auto reset = update.Get("reset");
	if (reset) {
		auto paths = json::ToStringVector(reset.value());
		if (!paths) {
			return MakeError(DocumentParseError, "reset must be a list of strings");
		}
		result.reset = paths.value();
		result.has_reset = true;
	}
	return error::NoError;
}

static error::Error ParseComponents(const json::Json &doc, DeploymentDocument &result) {
	auto components = doc.Get("components");
	if (!components) {
		return error::NoError;
	}
	auto children = components.value().GetChildren();
	if (!children) {
		return MakeError(DocumentParseError, "components must be an object");
	}

	for (const auto &child : children.value()) {
		ComponentSpec spec;
		spec.name = child.first;
		auto version = json::Get<string>(child.second, "version", json::MissingOk::No);
		if (!version) {
			return MakeError(
				DocumentParseError, "Component " + child.first + ": " + version.error().message);
		}
		spec.version_requirement = version.value();

		auto update = child.second.Get("configurationUpdate");
		if (update) {
			auto err = ParseConfigurationUpdate(update.value(), spec.configuration_update);
			if (err != error::NoError) {
				return err.WithContext("Component " + child.first);
			}
		}
		result.components[spec.name] = spec;
	}
	return error::NoError;
}

static error::Error ParsePolicies(const json::Json &doc, DeploymentPolicies &result) {
	auto policies = doc.Get("deploymentPolicies");
	if (!policies) {
		return error::NoError;
	}

	auto failure = json::Get<string>(policies.value(), "failureHandlingPolicy", json::MissingOk::Yes);
	if (!failure) {
		return MakeError(DocumentParseError, "failureHandlingPolicy must be a string");
	}
	if (failure.value() == "DO_NOTHING") {
		result.failure_handling = FailureHandlingPolicy::DoNothing;
	} else if (failure.value() == "ROLLBACK" || failure.value() == "") {
		result.failure_handling = FailureHandlingPolicy::Rollback;
	} else {
		return MakeError(
			DocumentParseError,
			"\"" + failure.value() + "\" is not a valid failureHandlingPolicy");
	}

	auto update_policy = policies.value().Get("componentUpdatePolicy");
	if (update_policy) {
		auto action = json::Get<string>(update_policy.value(), "action", json::MissingOk::Yes);
		if (!action) {
			return MakeError(DocumentParseError, "componentUpdatePolicy action must be a string");
		}
		if (action.value() == "SKIP_NOTIFY_COMPONENTS") {
			result.update_action = ComponentUpdatePolicyAction::SkipNotifyComponents;
		} else if (action.value() == "NOTIFY_COMPONENTS" || action.value() == "") {
			result.update_action = ComponentUpdatePolicyAction::NotifyComponents;
		} else {
			return MakeError(
				DocumentParseError,
				"\"" + action.value() + "\" is not a valid componentUpdatePolicy action");
		}

		auto timeout = update_policy.value().Get("timeout");
		if (timeout) {
			auto seconds = timeout.value().GetInt64();
			if (!seconds || seconds.value() < 0) {
				return MakeError(
					DocumentParseError,
					"componentUpdatePolicy timeout must be a non-negative integer");
			}
			result.update_timeout_seconds = static_cast<int>(seconds.value());
		}
	}

	auto validation_policy = policies.value().Get("configurationValidationPolicy");
	if (validation_policy) {
		auto timeout = validation_policy.value().Get("timeout");
		if (timeout) {
			auto seconds = timeout.value().GetInt64();
			if (!seconds || seconds.value() < 0) {
				return MakeError(
					DocumentParseError,
					"configurationValidationPolicy timeout must be a non-negative integer");
			}
			result.configuration_validation_timeout_seconds = static_cast<int>(seconds.value());
		}
	}
	return error::NoError;
}

ExpectedDeploymentDocument ParseDocument(const json::Json &doc, DeploymentType type) {
	if (!doc.IsObject()) {
		return expected::unexpected(
			MakeError(DocumentParseError, "Deployment document is not a JSON object"));
	}

	DeploymentDocument result;

	auto id = json::Get<string>(doc, "deploymentId", json::MissingOk::No);
	if (!id || id.value() == "") {
		return expected::unexpected(
			MakeError(DocumentParseError, "Deployment document has no deploymentId"));
	}
	result.deployment_id = id.value();

	auto timestamp = json::Get<int64_t>(doc, "timestamp", json::MissingOk::Yes);
	if (!timestamp) {
		return expected::unexpected(
			MakeError(DocumentParseError, "timestamp must be an integer"));
	}
	result.timestamp = timestamp.value();

	if (type == DeploymentType::Local) {
		result.target = kLocalDeploymentGroup;
		result.group_name = kLocalDeploymentGroup;
		result.full_replacement = false;

		auto to_remove =
			json::Get<vector<string>>(doc, "rootComponentsToRemove", json::MissingOk::Yes);
		if (!to_remove) {
			return expected::unexpected(
				MakeError(DocumentParseError, "rootComponentsToRemove must be a list of strings"));
		}
		result.root_components_to_remove = to_remove.value();
	} else {
		auto err = ParseTarget(doc, result);
		if (err != error::NoError) {
			return expected::unexpected(err);
		}
	}

	auto err = ParseComponents(doc, result);
	if (err != error::NoError) {
		return expected::unexpected(err);
	}

	err = ParsePolicies(doc, result.policies);
	if (err != error::NoError) {
		return expected::unexpected(err);
	}

	return result;
}

ExpectedDeploymentDocument ParseDocument(const string &doc, DeploymentType type) {
	auto parsed = json::Load(doc);
	if (!parsed) {
		return expected::unexpected(MakeError(DocumentParseError, parsed.error().String()));
	}
	return ParseDocument(parsed.value(), type);
}

Deployment::Deployment(
	DeploymentType type, DeploymentDocument document, string raw_document, int64_t submitted_at) :
	type_ {type},
	document_ {std::move(document)},
	raw_document_ {std::move(raw_document)},
	submitted_at_ {submitted_at},
	cancelled_ {make_shared<atomic<bool>>(false)} {
}

ExpectedDeployment Deployment::FromString(
	DeploymentType type, const string &raw_document, int64_t submitted_at) {
	auto doc = ParseDocument(raw_document, type);
	if (!doc) {
		return expected::unexpected(doc.error());
	}
	return Deployment(type, std::move(doc.value()), raw_document, submitted_at);
}

void Deployment::Cancel() {
	cancelled_->store(true);
}

bool Deployment::IsCancelled() const {
	return cancelled_->load();
}

string Deployment::ToJson() const {
	stringstream ss;
	ss << "{";
	ss << R"("id":")" << json::EscapeString(Id()) << R"(",)";
	ss << R"("type":")" << DeploymentTypeToString(type_) << R"(",)";
	ss << R"("submittedAt":)" << submitted_at_ << ",";
	ss << R"("cancelled":)" << (IsCancelled() ? "true" : "false") << ",";
	ss << R"("document":")" << json::EscapeString(raw_document_) << R"(")";
	ss << "}";
	return ss.str();
}

ExpectedDeployment Deployment::FromJson(const json::Json &j) {
	auto type_str = json::Get<string>(j, "type", json::MissingOk::No);
	if (!type_str) {
		return expected::unexpected(type_str.error());
	}
	auto type = DeploymentTypeFromString(type_str.value());
	if (!type) {
		return expected::unexpected(type.error());
	}
	auto submitted_at = json::Get<int64_t>(j, "submittedAt", json::MissingOk::Yes);
	if (!submitted_at) {
		return expected::unexpected(submitted_at.error());
	}
	auto raw = json::Get<string>(j, "document", json::MissingOk::No);
	if (!raw) {
		return expected::unexpected(raw.error());
	}

	auto result = FromString(type.value(), raw.value(), submitted_at.value());
	if (!result) {
		return result;
	}
	auto cancelled = json::Get<bool>(j, "cancelled", json::MissingOk::Yes);
	if (cancelled && cancelled.value()) {
		result.value().Cancel();
	}
	return result;
}

ErrorReport ErrorToReport(const error::Error &err) {
	if (err.code.category() != DeploymentErrorCategory) {
		if (err.code.category() == std::generic_category()) {
			return {{"DEPLOYMENT_FAILURE", "IO_ERROR"}, {"DEVICE_ERROR"}};
		}
		return {{"DEPLOYMENT_FAILURE"}, {"UNKNOWN_ERROR"}};
	}

	switch (static_cast<DeploymentErrorCode>(err.code.value())) {
	case NoError:
		return {};
	case ConflictError:
		return {{"DEPLOYMENT_REJECTED", "DEPLOYMENT_DOCUMENT_NOT_VALID"}, {"REQUEST_ERROR"}};
	case DocumentParseError:
		return {{"DEPLOYMENT_REJECTED", "DEPLOYMENT_DOCUMENT_PARSE_ERROR"}, {"REQUEST_ERROR"}};
	case NoAvailableVersionError:
		return {{"DEPLOYMENT_FAILURE", "NO_AVAILABLE_COMPONENT_VERSION"}, {"DEPENDENCY_ERROR"}};
	case CircularDependencyError:
		return {
			{"DEPLOYMENT_FAILURE",
			 "NO_AVAILABLE_COMPONENT_VERSION",
			 "COMPONENT_CIRCULAR_DEPENDENCY_ERROR"},
			{"REQUEST_ERROR"}};
	case ConfigurationPatchError:
		return {{"DEPLOYMENT_FAILURE", "COMPONENT_CONFIGURATION_NOT_VALID"}, {"REQUEST_ERROR"}};
	case ComponentBrokenError:
		return {
			{"DEPLOYMENT_FAILURE", "COMPONENT_UPDATE_ERROR", "COMPONENT_BROKEN"},
			{"COMPONENT_ERROR"}};
	case ComponentUpdateError:
		return {{"DEPLOYMENT_FAILURE", "COMPONENT_UPDATE_ERROR"}, {"COMPONENT_ERROR"}};
	case GateTimeoutError:
		return {
			{"DEPLOYMENT_FAILURE", "COMPONENT_UPDATE_ERROR", "UPDATE_GATE_TIMEOUT"},
			{"COMPONENT_ERROR"}};
	case CancellationError:
		return {{"DEPLOYMENT_INTERRUPTED"}, {}};
	case RollbackError:
		return {{"DEPLOYMENT_FAILURE", "ROLLBACK_FAILED"}, {"DEVICE_ERROR"}};
	case ConfigurationValidationError:
		return {
			{"DEPLOYMENT_FAILURE", "COMPONENT_UPDATE_ERROR", "COMPONENT_CONFIGURATION_NOT_VALID"},
			{"COMPONENT_ERROR"}};
	}
	assert(false);
	return {{"DEPLOYMENT_FAILURE"}, {"UNKNOWN_ERROR"}};
}

} // namespace deployment
} // namespace core
} // namespace edgedeploy
