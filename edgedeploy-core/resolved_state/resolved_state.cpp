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


#include <edgedeploy-core/resolved_state.hpp>

#include <sstream>

namespace edgedeploy {
namespace core {
namespace resolved_state {

bool ResolvedComponent::operator==(const ResolvedComponent &other) const {
	return name == other.name && version == other.version && dependencies == other.dependencies
		   && local_layer == other.local_layer && deployment_layer == other.deployment_layer
		   && configuration == other.configuration
		   && needs_remediation == other.needs_remediation;
}

const ResolvedComponent *ResolvedState::Find(const string &name) const {
	auto it = components.find(name);
	if (it == components.end()) {
		return nullptr;
	}
	return &it->second;
}

string ResolvedState::ToJson() const {
	stringstream ss;
	ss << R"({"components":{)";
	bool first = true;
	for (const auto &entry : components) {
		const auto &c = entry.second;
		if (!first) {
			ss << ",";
		}
		first = false;

		ss << "\"" << json::EscapeString(c.name) << "\":{";
		ss << R"("version":")" << json::EscapeString(c.version.String()) << R"(",)";
		ss << R"("dependencies":{)";
		bool first_dep = true;
		for (const auto &dep : c.dependencies) {
			if (!first_dep) {
				ss << ",";
			}
			first_dep = false;
			ss << "\"" << json::EscapeString(dep.first) << "\":\""
			   << json::EscapeString(dep.second) << "\"";
		}
		ss << "},";
		ss << R"("localConfiguration":)" << c.local_layer.Dump() << ",";
		ss << R"("deploymentConfiguration":)" << c.deployment_layer.Dump() << ",";
		ss << R"("configuration":)" << c.configuration.Dump() << ",";
		ss << R"("needsRemediation":)" << (c.needs_remediation ? "true" : "false");
		ss << "}";
	}
	ss << "}}";
	return ss.str();
}

static expected::expected<config_tree::Value, error::Error> GetTree(
	const json::Json &j, const string &key) {
	auto child = j.Get(key);
	if (!child) {
		// Older states may lack a layer.
		return config_tree::EmptyMap();
	}
	return config_tree::Value::FromJson(child.value());
}

ExpectedResolvedState ResolvedState::FromJson(const json::Json &j) {
	ResolvedState state;

	auto components = j.Get("components");
	if (!components) {
		return expected::unexpected(components.error());
	}
	auto children = components.value().GetChildren();
	if (!children) {
		return expected::unexpected(children.error());
	}

	for (const auto &child : children.value()) {
		ResolvedComponent c;
		c.name = child.first;

		auto version_str = json::Get<string>(child.second, "version", json::MissingOk::No);
		if (!version_str) {
			return expected::unexpected(version_str.error().WithContext(c.name));
		}
		auto version = semver::Version::Parse(version_str.value());
		if (!version) {
			return expected::unexpected(version.error().WithContext(c.name));
		}
		c.version = version.value();

		auto deps = child.second.Get("dependencies");
		if (deps) {
			auto dep_children = deps.value().GetChildren();
			if (!dep_children) {
				return expected::unexpected(dep_children.error().WithContext(c.name));
			}
			for (const auto &dep : dep_children.value()) {
				auto req = dep.second.GetString();
				if (!req) {
					return expected::unexpected(req.error().WithContext(c.name));
				}
				c.dependencies[dep.first] = req.value();
			}
		}

		auto local = GetTree(child.second, "localConfiguration");
		auto layer = GetTree(child.second, "deploymentConfiguration");
		auto config = GetTree(child.second, "configuration");
		if (!local || !layer || !config) {
			return expected::unexpected(error::MakeError(
				error::GenericError, "Invalid configuration of component " + c.name));
		}
		c.local_layer = local.value();
		c.deployment_layer = layer.value();
		c.configuration = config.value();

		auto remediation = json::Get<bool>(child.second, "needsRemediation", json::MissingOk::Yes);
		if (!remediation) {
			return expected::unexpected(remediation.error().WithContext(c.name));
		}
		c.needs_remediation = remediation.value();

		state.components[c.name] = c;
	}
	return state;
}

ExpectedResolvedState ResolvedState::FromJsonString(const string &str) {
	auto j = json::Load(str);
	if (!j) {
		return expected::unexpected(j.error());
	}
	return FromJson(j.value());
}

} // namespace resolved_state
} // namespace core
} // namespace edgedeploy
