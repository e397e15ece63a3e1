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

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <cerrno>

#include <common/json.hpp>

namespace deployment = edgedeploy::core::deployment;
namespace error = edgedeploy::common::error;
namespace json = edgedeploy::common::json;

using namespace std;

const string cloud_document = R"({
  "deploymentId": "job-1",
  "targetArn": "arn:aws:iot:us-east-1:123456789012:thinggroup/Fleet",
  "timestamp": 1700000000000,
  "components": {
    "com.example.Sensor": {
      "version": "1.2.0",
      "configurationUpdate": {
        "merge": "{\"interval\": 10}"
      }
    },
    "com.example.Logger": {
      "version": ">=2.0.0",
      "configurationUpdate": {
        "reset": ["/level", "/sinks/0"]
      }
    }
  },
  "deploymentPolicies": {
    "failureHandlingPolicy": "DO_NOTHING",
    "componentUpdatePolicy": {
      "action": "SKIP_NOTIFY_COMPONENTS",
      "timeout": 30
    },
    "configurationValidationPolicy": {
      "timeout": 15
    }
  }
})";

TEST(DeploymentDocumentTests, ParseCloudDocument) {
	auto doc = deployment::ParseDocument(cloud_document, deployment::DeploymentType::CloudJob);
	ASSERT_TRUE(doc) << doc.error().String();

	EXPECT_EQ(doc->deployment_id, "job-1");
	EXPECT_EQ(doc->group_name, "thinggroup/Fleet");
	EXPECT_EQ(doc->timestamp, 1700000000000);
	EXPECT_TRUE(doc->full_replacement);
	ASSERT_EQ(doc->components.size(), 2u);

	// Ordered by name.
	EXPECT_EQ(doc->components.begin()->first, "com.example.Logger");

	auto &sensor = doc->components["com.example.Sensor"];
	EXPECT_EQ(sensor.version_requirement, "1.2.0");
	EXPECT_TRUE(sensor.configuration_update.has_merge);
	EXPECT_FALSE(sensor.configuration_update.has_reset);
	EXPECT_EQ(sensor.configuration_update.merge, R"({"interval": 10})");

	auto &logger = doc->components["com.example.Logger"];
	EXPECT_FALSE(logger.configuration_update.has_merge);
	EXPECT_THAT(logger.configuration_update.reset, testing::ElementsAre("/level", "/sinks/0"));

	EXPECT_EQ(doc->policies.failure_handling, deployment::FailureHandlingPolicy::DoNothing);
	EXPECT_EQ(
		doc->policies.update_action, deployment::ComponentUpdatePolicyAction::SkipNotifyComponents);
	ASSERT_TRUE(doc->policies.update_timeout_seconds);
	EXPECT_EQ(doc->policies.update_timeout_seconds.value(), 30);
	EXPECT_EQ(doc->policies.configuration_validation_timeout_seconds, 15);
}

TEST(DeploymentDocumentTests, DefaultPolicies) {
	auto doc = deployment::ParseDocument(
		R"({"deploymentId": "d", "targetName": "Pump", "targetType": "thing"})",
		deployment::DeploymentType::Shadow);
	ASSERT_TRUE(doc) << doc.error().String();

	EXPECT_EQ(doc->group_name, "thing/Pump");
	EXPECT_TRUE(doc->components.empty());
	EXPECT_EQ(doc->policies.failure_handling, deployment::FailureHandlingPolicy::Rollback);
	EXPECT_EQ(
		doc->policies.update_action, deployment::ComponentUpdatePolicyAction::NotifyComponents);
	EXPECT_FALSE(doc->policies.update_timeout_seconds);
}

TEST(DeploymentDocumentTests, MergeGivenAsObject) {
	auto doc = deployment::ParseDocument(
		R"({
  "deploymentId": "d",
  "targetName": "Fleet",
  "targetType": "thinggroup",
  "components": {"a": {"version": "1.0.0", "configurationUpdate": {"merge": {"x": {"y": 1}}}}}
})",
		deployment::DeploymentType::CloudJob);
	ASSERT_TRUE(doc) << doc.error().String();

	auto merge = json::Load(doc->components["a"].configuration_update.merge);
	ASSERT_TRUE(merge);
	EXPECT_EQ(merge->Dump(-1), R"({"x":{"y":1}})");
}

TEST(DeploymentDocumentTests, LocalDocumentIsIncremental) {
	auto doc = deployment::ParseDocument(
		R"({
  "deploymentId": "local-1",
  "components": {"a": {"version": "1.0.0"}},
  "rootComponentsToRemove": ["b"]
})",
		deployment::DeploymentType::Local);
	ASSERT_TRUE(doc) << doc.error().String();

	EXPECT_EQ(doc->group_name, deployment::kLocalDeploymentGroup);
	EXPECT_FALSE(doc->full_replacement);
	EXPECT_THAT(doc->root_components_to_remove, testing::ElementsAre("b"));
}

TEST(DeploymentDocumentTests, ParseErrors) {
	vector<string> broken = {
		R"(not json)",
		R"([1, 2])",
		R"({"targetName": "Fleet", "targetType": "thinggroup"})",
		R"({"deploymentId": "d"})",
		R"({"deploymentId": "d", "targetName": "Fleet", "targetType": "planet"})",
		R"({"deploymentId": "d", "targetArn": "arn:aws:iot:r:1:rolealias/x"})",
		R"({"deploymentId": "d", "targetArn": "arn:x:thing/T", "components": []})",
		R"({"deploymentId": "d", "targetArn": "arn:x:thing/T", "components": {"a": {}}})",
		R"({"deploymentId": "d", "targetArn": "arn:x:thing/T",
		    "components": {"a": {"version": "1", "configurationUpdate": {"merge": 5}}}})",
		R"({"deploymentId": "d", "targetArn": "arn:x:thing/T",
		    "components": {"a": {"version": "1", "configurationUpdate": {"reset": [1]}}}})",
		R"({"deploymentId": "d", "targetArn": "arn:x:thing/T",
		    "deploymentPolicies": {"failureHandlingPolicy": "PANIC"}})",
		R"({"deploymentId": "d", "targetArn": "arn:x:thing/T",
		    "deploymentPolicies": {"componentUpdatePolicy": {"timeout": -1}}})",
	};

	for (auto &doc : broken) {
		auto result = deployment::ParseDocument(doc, deployment::DeploymentType::CloudJob);
		ASSERT_FALSE(result) << doc;
		EXPECT_TRUE(deployment::IsError(result.error(), deployment::DocumentParseError))
			<< doc << ": " << result.error().String();
	}
}

TEST(DeploymentTests, CancellationIsShared) {
	auto dep = deployment::Deployment::FromString(
		deployment::DeploymentType::CloudJob, cloud_document, 42);
	ASSERT_TRUE(dep) << dep.error().String();

	auto copy = dep.value();
	EXPECT_FALSE(copy.IsCancelled());
	dep->Cancel();
	EXPECT_TRUE(copy.IsCancelled());
}

TEST(DeploymentTests, PersistedForm) {
	auto dep = deployment::Deployment::FromString(
		deployment::DeploymentType::Shadow, cloud_document, 42);
	ASSERT_TRUE(dep) << dep.error().String();
	dep->Cancel();

	auto j = json::Load(dep->ToJson());
	ASSERT_TRUE(j) << j.error().String();

	auto restored = deployment::Deployment::FromJson(j.value());
	ASSERT_TRUE(restored) << restored.error().String();
	EXPECT_EQ(restored->Id(), "job-1");
	EXPECT_EQ(restored->Type(), deployment::DeploymentType::Shadow);
	EXPECT_EQ(restored->SubmittedAt(), 42);
	EXPECT_EQ(restored->RawDocument(), cloud_document);
	EXPECT_TRUE(restored->IsCancelled());
}

TEST(DeploymentTests, PersistedFormRejectsUnknownType) {
	auto j = json::Load(R"({"type": "carrier-pigeon", "document": "{}"})");
	ASSERT_TRUE(j);
	EXPECT_FALSE(deployment::Deployment::FromJson(j.value()));
}

TEST(DeploymentTests, StatusStrings) {
	using deployment::DetailedStatus;
	EXPECT_EQ(
		deployment::DetailedStatusToString(DetailedStatus::FailedRollbackComplete),
		"FAILED_ROLLBACK_COMPLETE");
	EXPECT_EQ(
		deployment::DetailedStatusToDeploymentStatus(DetailedStatus::Rejected),
		deployment::DeploymentStatus::Failed);
	EXPECT_EQ(
		deployment::DetailedStatusToDeploymentStatus(DetailedStatus::Canceled),
		deployment::DeploymentStatus::Canceled);
	EXPECT_EQ(
		deployment::DeploymentStatusToString(deployment::DeploymentStatus::InProgress),
		"IN_PROGRESS");
	EXPECT_FALSE(deployment::IsTerminal(deployment::DeploymentStatus::Queued));
	EXPECT_TRUE(deployment::IsTerminal(deployment::DeploymentStatus::Canceled));
}

TEST(DeploymentTests, ErrorReports) {
	auto report = deployment::ErrorToReport(
		deployment::MakeError(deployment::CircularDependencyError, "a -> b -> a"));
	EXPECT_THAT(
		report.error_stack,
		testing::ElementsAre(
			"DEPLOYMENT_FAILURE",
			"NO_AVAILABLE_COMPONENT_VERSION",
			"COMPONENT_CIRCULAR_DEPENDENCY_ERROR"));
	EXPECT_THAT(report.error_types, testing::ElementsAre("REQUEST_ERROR"));

	report = deployment::ErrorToReport(
		deployment::MakeError(deployment::ConflictError, "merge and reset"));
	EXPECT_THAT(
		report.error_stack,
		testing::ElementsAre("DEPLOYMENT_REJECTED", "DEPLOYMENT_DOCUMENT_NOT_VALID"));

	report = deployment::ErrorToReport(error::Error(
		std::generic_category().default_error_condition(ENOSPC), "No space left on device"));
	EXPECT_THAT(report.error_stack, testing::ElementsAre("DEPLOYMENT_FAILURE", "IO_ERROR"));
	EXPECT_THAT(report.error_types, testing::ElementsAre("DEVICE_ERROR"));

	report = deployment::ErrorToReport(error::MakeError(error::GenericError, "Huh"));
	EXPECT_THAT(report.error_types, testing::ElementsAre("UNKNOWN_ERROR"));
}
