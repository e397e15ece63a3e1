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


#include <edgedeploy-core/config_delta.hpp>

#include <common/log.hpp>

namespace edgedeploy {
namespace core {
namespace config_delta {

namespace log = edgedeploy::common::log;

config_tree::Value EffectiveConfiguration(
	const config_tree::Value &defaults,
	const config_tree::Value &local_layer,
	const config_tree::Value &deployment_layer) {
	config_tree::Value ret = defaults.IsMap() ? defaults : config_tree::EmptyMap();
	ret.Merge(local_layer);
	ret.Merge(deployment_layer);
	return ret;
}

static error::Error PatchError(const string &component, const string &msg) {
	return deployment::MakeError(
		deployment::ConfigurationPatchError, "Component " + component + ": " + msg);
}

error::Error ConfigDeltaEngine::Apply(
	const deployment::ConfigurationUpdate &update,
	const config_tree::Value &defaults,
	resolved_state::ResolvedComponent &component) const {
	auto local = component.local_layer;
	auto layer = component.deployment_layer;

	if (update.has_reset) {
		for (const auto &path : update.reset) {
			auto pointer = config_tree::ParsePointer(path);
			if (!pointer) {
				return PatchError(component.name, pointer.error().message);
			}
			if (pointer.value().empty()) {
				local = config_tree::EmptyMap();
				layer = config_tree::EmptyMap();
				continue;
			}

			auto effective = EffectiveConfiguration(defaults, local, layer);
			if (!effective.Contains(pointer.value()) && !defaults.Contains(pointer.value())) {
				return PatchError(
					component.name, "Cannot reset " + path + ", no such configuration path");
			}

			// Undo what deployments did first, so that a value set locally comes back.
			auto removed = layer.RemovePath(pointer.value());
			if (!removed) {
				return PatchError(component.name, removed.error().message);
			}
			if (!removed.value()) {
				auto removed_local = local.RemovePath(pointer.value());
				if (!removed_local) {
					return PatchError(component.name, removed_local.error().message);
				}
			}
		}
	}

	if (update.has_merge) {
		auto patch = config_tree::Value::FromJsonString(update.merge);
		if (!patch) {
			return PatchError(component.name, "Invalid MERGE: " + patch.error().message);
		}
		if (!patch.value().IsMap()) {
			return PatchError(component.name, "MERGE must be a JSON object");
		}
		layer.Merge(patch.value());
	}

	component.local_layer = std::move(local);
	component.deployment_layer = std::move(layer);
	return error::NoError;
}

resolved_state::ExpectedResolvedState ConfigDeltaEngine::Compute(
	const version_resolver::ResolvedVersions &versions,
	const resolved_state::ResolvedState &current,
	const map<string, deployment::ConfigurationUpdate> &updates,
	const string &deployment_id) const {
	auto logger = log::Logger("config_delta")
					  .WithFields(log::LogField {"deployment_id", deployment_id});

	resolved_state::ResolvedState target;
	for (const auto &entry : versions) {
		const auto &recipe = entry.second;

		resolved_state::ResolvedComponent component;
		auto previous = current.Find(recipe.name);
		if (previous != nullptr) {
			component = *previous;
		}
		component.name = recipe.name;
		component.version = recipe.version;
		component.dependencies = recipe.dependencies;

		auto update = updates.find(recipe.name);
		if (update != updates.end() && !update->second.Empty()) {
			auto err = Apply(update->second, recipe.default_configuration, component);
			if (err != error::NoError) {
				if (fail_fast_) {
					logger.Error(err.String());
					return expected::unexpected(err);
				}
				logger.Warning(
					err.String() + ". Keeping the previous configuration, the component needs "
					"remediation");
				component.needs_remediation = true;
			} else {
				component.needs_remediation = false;
			}
		}

		component.configuration = EffectiveConfiguration(
			recipe.default_configuration, component.local_layer, component.deployment_layer);
		logger.Debug(
			"Configuration of " + component.name + ": " + component.configuration.Dump());
		target.components[component.name] = std::move(component);
	}
	return target;
}

} // namespace config_delta
} // namespace core
} // namespace edgedeploy
