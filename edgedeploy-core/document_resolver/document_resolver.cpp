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


#include <edgedeploy-core/document_resolver.hpp>

#include <common/log.hpp>

#include <edgedeploy-core/semver.hpp>

namespace edgedeploy {
namespace core {
namespace document_resolver {

namespace log = edgedeploy::common::log;

error::Error ValidateDocument(const deployment::DeploymentDocument &doc) {
	for (const auto &entry : doc.components) {
		const auto &spec = entry.second;
		if (spec.name.empty()) {
			return deployment::MakeError(
				deployment::ConflictError, "Component with an empty name in the document");
		}
		if (spec.configuration_update.has_merge && spec.configuration_update.has_reset) {
			return deployment::MakeError(
				deployment::ConflictError,
				"Component " + spec.name + " has both MERGE and RESET configuration updates");
		}
		auto req = semver::Requirement::Parse(spec.version_requirement);
		if (!req) {
			return deployment::MakeError(
				deployment::ConflictError,
				"Component " + spec.name + ": " + req.error().message);
		}
	}

	for (const auto &name : doc.root_components_to_remove) {
		if (doc.components.count(name) != 0) {
			return deployment::MakeError(
				deployment::ConflictError,
				"Component " + name + " is both deployed and removed by the document");
		}
	}
	return error::NoError;
}

ExpectedDesiredState Resolve(
	const deployment::DeploymentDocument &doc,
	const root_components::GroupToRootComponents &current) {
	auto logger = log::Logger("document_resolver")
					  .WithFields(log::LogField {"deployment_id", doc.deployment_id});

	auto err = ValidateDocument(doc);
	if (err != error::NoError) {
		return expected::unexpected(err);
	}

	DesiredState result;
	result.groups = current;

	root_components::GroupRoots roots;
	if (!doc.full_replacement) {
		auto it = current.find(doc.group_name);
		if (it != current.end()) {
			roots = it->second;
		}
		for (const auto &name : doc.root_components_to_remove) {
			if (roots.erase(name) == 0) {
				logger.Warning(
					"Component " + name + " is not a root of " + doc.group_name
					+ ", nothing to remove");
			}
		}
	}

	for (const auto &entry : doc.components) {
		roots[entry.first] = entry.second.version_requirement;
		if (!entry.second.configuration_update.Empty()) {
			result.configuration_updates[entry.first] = entry.second.configuration_update;
		}
	}

	if (roots.empty()) {
		logger.Info("Group " + doc.group_name + " no longer has any root components");
		result.groups.erase(doc.group_name);
	} else {
		result.groups[doc.group_name] = roots;
	}

	logger.Debug(
		"Desired state has " + to_string(result.groups.size()) + " group(s), "
		+ to_string(result.configuration_updates.size()) + " configuration update(s)");
	return result;
}

} // namespace document_resolver
} // namespace core
} // namespace edgedeploy
