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


#include <edgedeploy-core/version_resolver.hpp>

#include <deque>
#include <set>

#include <common/log.hpp>

#include <edgedeploy-core/deployment.hpp>
#include <edgedeploy-core/semver.hpp>

namespace edgedeploy {
namespace core {
namespace version_resolver {

namespace deployment = edgedeploy::core::deployment;
namespace log = edgedeploy::common::log;
namespace semver = edgedeploy::core::semver;

string ConstraintsToString(const Constraints &constraints) {
	string ret = "{";
	bool first = true;
	for (const auto &c : constraints) {
		if (!first) {
			ret += ", ";
		}
		first = false;
		ret += c.first + ": " + c.second;
	}
	return ret + "}";
}

catalog::ExpectedRecipe VersionResolver::ResolveComponent(
	const string &name, const Constraints &constraints) {
	vector<semver::Requirement> requirements;
	for (const auto &c : constraints) {
		auto req = semver::Requirement::Parse(c.second);
		if (!req) {
			return expected::unexpected(deployment::MakeError(
				deployment::ConflictError,
				c.first + " places an invalid requirement on " + name + ": "
					+ req.error().message));
		}
		requirements.push_back(req.value());
	}

	auto versions = catalog_.AvailableVersions(name);
	if (!versions) {
		return expected::unexpected(versions.error());
	}

	for (auto it = versions.value().rbegin(); it != versions.value().rend(); ++it) {
		bool satisfied = true;
		for (const auto &req : requirements) {
			if (!req.IsSatisfiedBy(*it)) {
				satisfied = false;
				break;
			}
		}
		if (satisfied) {
			return catalog_.GetRecipe(name, *it);
		}
	}

	return expected::unexpected(deployment::MakeError(
		deployment::NoAvailableVersionError,
		"There is no version of component " + name + " satisfying "
			+ ConstraintsToString(constraints)));
}

// A version was dropped from the tree: drop the constraints it placed, and whatever nothing
// else depends on any more.
static void RemoveDependencies(
	const catalog::Recipe &removed_version,
	ResolvedVersions &resolved,
	map<string, int> &reference_count,
	map<string, Constraints> &constraints) {
	deque<catalog::Recipe> to_remove {removed_version};
	while (!to_remove.empty()) {
		auto removed = to_remove.front();
		to_remove.pop_front();

		for (const auto &dep : removed.dependencies) {
			constraints[dep.first].erase(removed.name);

			auto count = reference_count.find(dep.first);
			if (count == reference_count.end()) {
				continue;
			}
			if (count->second > 1) {
				count->second--;
				continue;
			}
			reference_count.erase(count);
			auto component = resolved.find(dep.first);
			if (component != resolved.end()) {
				log::Debug("Removing component " + dep.first + " from the dependency tree");
				to_remove.push_back(component->second);
				resolved.erase(component);
			}
		}
	}
}

static error::Error DetectCircularDependency(
	const string &root, const ResolvedVersions &resolved) {
	map<string, set<string>> graph;
	deque<string> to_visit {root};
	while (!to_visit.empty()) {
		auto name = to_visit.front();
		to_visit.pop_front();
		if (graph.count(name) != 0) {
			continue;
		}
		auto &deps = graph[name];
		auto it = resolved.find(name);
		if (it == resolved.end()) {
			continue;
		}
		for (const auto &dep : it->second.dependencies) {
			deps.insert(dep.first);
			to_visit.push_back(dep.first);
		}
	}

	// Peel off components whose dependencies are all ordered already. Anything left over is
	// part of a cycle.
	set<string> ordered;
	bool progress = true;
	while (progress) {
		progress = false;
		for (const auto &node : graph) {
			if (ordered.count(node.first) != 0) {
				continue;
			}
			bool ready = true;
			for (const auto &dep : node.second) {
				if (ordered.count(dep) == 0) {
					ready = false;
					break;
				}
			}
			if (ready) {
				ordered.insert(node.first);
				progress = true;
			}
		}
	}

	if (ordered.size() != graph.size()) {
		auto it = resolved.find(root);
		return deployment::MakeError(
			deployment::CircularDependencyError,
			"Circular dependency detected for component " + root + "-"
				+ (it != resolved.end() ? it->second.version.String() : "?"));
	}
	return error::NoError;
}

ExpectedResolvedVersions VersionResolver::Resolve(
	const root_components::GroupToRootComponents &groups, const string &deployment_id) {
	auto logger = log::Logger("version_resolver")
					  .WithFields(log::LogField {"deployment_id", deployment_id});

	map<string, Constraints> constraints;
	set<string> roots;
	for (const auto &group : groups) {
		for (const auto &root : group.second) {
			constraints[root.first][group.first] = root.second;
			roots.insert(root.first);
		}
	}

	ResolvedVersions resolved;
	map<string, int> reference_count;

	for (const auto &root : roots) {
		deque<string> to_resolve {root};
		while (!to_resolve.empty()) {
			auto name = to_resolve.front();
			to_resolve.pop_front();

			auto recipe = ResolveComponent(name, constraints[name]);
			if (!recipe) {
				logger.Error(recipe.error().String());
				return expected::unexpected(recipe.error());
			}
			reference_count[name]++;
			logger.Debug("Resolved " + name + " to " + recipe.value().version.String());

			auto previous = resolved.find(name);
			bool unchanged = false;
			if (previous != resolved.end()) {
				if (previous->second.version == recipe.value().version) {
					unchanged = true;
				} else {
					logger.Debug(
						"Version of " + name + " changed from "
						+ previous->second.version.String() + ", updating the dependency tree");
					auto old = previous->second;
					resolved.erase(previous);
					RemoveDependencies(old, resolved, reference_count, constraints);
				}
			}
			resolved[name] = recipe.value();
			if (unchanged) {
				continue;
			}

			for (const auto &dep : recipe.value().dependencies) {
				constraints[dep.first][name] = dep.second;
				to_resolve.push_back(dep.first);
			}
		}
	}

	for (const auto &root : roots) {
		auto err = DetectCircularDependency(root, resolved);
		if (err != error::NoError) {
			logger.Error(err.String());
			return expected::unexpected(err);
		}
	}

	logger.Info("Resolved " + to_string(resolved.size()) + " component(s)");
	return resolved;
}

} // namespace version_resolver
} // namespace core
} // namespace edgedeploy
