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


#include <edgedeploy-core/catalog.hpp>

#include <algorithm>
#include <cassert>
#include <cerrno>

#include <common/common.hpp>
#include <common/log.hpp>
#include <common/path.hpp>

namespace edgedeploy {
namespace core {
namespace catalog {

namespace common = edgedeploy::common;
namespace log = edgedeploy::common::log;
namespace path = edgedeploy::common::path;

const CatalogErrorCategoryClass CatalogErrorCategory;

const char *CatalogErrorCategoryClass::name() const noexcept {
	return "CatalogErrorCategory";
}

string CatalogErrorCategoryClass::message(int code) const {
	switch (code) {
	case NoError:
		return "Success";
	case RecipeParseError:
		return "Invalid component recipe";
	case RecipeNotFoundError:
		return "Component recipe not found";
	}
	assert(false);
	return "Unknown";
}

error::Error MakeError(CatalogErrorCode code, const string &msg) {
	return error::Error(error_condition(code, CatalogErrorCategory), msg);
}

ExpectedRecipe ParseRecipe(const json::Json &j) {
	Recipe recipe;

	auto name = json::Get<string>(j, "componentName", json::MissingOk::No);
	if (!name) {
		return expected::unexpected(MakeError(RecipeParseError, name.error().String()));
	}
	recipe.name = name.value();

	auto version_str = json::Get<string>(j, "componentVersion", json::MissingOk::No);
	if (!version_str) {
		return expected::unexpected(MakeError(RecipeParseError, version_str.error().String()));
	}
	auto version = semver::Version::Parse(version_str.value());
	if (!version) {
		return expected::unexpected(MakeError(RecipeParseError, version.error().String()));
	}
	recipe.version = version.value();

	auto deps = j.Get("componentDependencies");
	if (deps) {
		auto children = deps.value().GetChildren();
		if (!children) {
			return expected::unexpected(
				MakeError(RecipeParseError, "componentDependencies must be an object"));
		}
		for (const auto &dep : children.value()) {
			auto req = json::Get<string>(dep.second, "versionRequirement", json::MissingOk::Yes);
			if (!req) {
				return expected::unexpected(MakeError(
					RecipeParseError,
					"Dependency " + dep.first + ": versionRequirement must be a string"));
			}
			recipe.dependencies[dep.first] = req.value();
		}
	}

	auto configuration = j.Get("componentConfiguration");
	if (configuration) {
		auto defaults = configuration.value().Get("defaultConfiguration");
		if (defaults) {
			auto value = config_tree::Value::FromJson(defaults.value());
			if (!value || !value.value().IsMap()) {
				return expected::unexpected(
					MakeError(RecipeParseError, "defaultConfiguration must be an object"));
			}
			recipe.default_configuration = value.value();
		}
	}

	return recipe;
}

void InMemoryCatalog::AddRecipe(Recipe recipe) {
	auto &versions = recipes_[recipe.name];
	versions[recipe.version] = std::move(recipe);
}

ExpectedVersionList InMemoryCatalog::AvailableVersions(const string &component) {
	vector<semver::Version> ret;
	auto it = recipes_.find(component);
	if (it != recipes_.end()) {
		for (const auto &entry : it->second) {
			ret.push_back(entry.first);
		}
	}
	return ret;
}

ExpectedRecipe InMemoryCatalog::GetRecipe(const string &component, const semver::Version &version) {
	auto it = recipes_.find(component);
	if (it != recipes_.end()) {
		auto v = it->second.find(version);
		if (v != it->second.end()) {
			return v->second;
		}
	}
	return expected::unexpected(MakeError(
		RecipeNotFoundError, "No recipe for " + component + " version " + version.String()));
}

ExpectedVersionList FileCatalog::AvailableVersions(const string &component) {
	const string prefix = component + "-";
	const string suffix = ".json";

	auto files = path::ListFiles(directory_, [&prefix, &suffix](const string &file) {
		auto base = path::BaseName(file);
		return common::StartsWith(base, prefix) && common::EndsWith(base, suffix);
	});
	if (!files) {
		if (files.error().IsErrno(ENOENT)) {
			return vector<semver::Version> {};
		}
		return expected::unexpected(files.error());
	}

	vector<semver::Version> ret;
	for (const auto &file : files.value()) {
		auto base = path::BaseName(file);
		auto version_str =
			base.substr(prefix.size(), base.size() - prefix.size() - suffix.size());
		auto version = semver::Version::Parse(version_str);
		if (!version) {
			// Probably a component whose name has this one as a prefix.
			log::Trace("Skipping recipe file " + file + ": " + version.error().String());
			continue;
		}
		ret.push_back(version.value());
	}
	sort(ret.begin(), ret.end());
	return ret;
}

ExpectedRecipe FileCatalog::GetRecipe(const string &component, const semver::Version &version) {
	auto file = path::Join(directory_, component + "-" + version.String() + ".json");
	auto j = json::LoadFromFile(file);
	if (!j) {
		if (j.error().IsErrno(ENOENT)) {
			return expected::unexpected(MakeError(
				RecipeNotFoundError,
				"No recipe for " + component + " version " + version.String()));
		}
		return expected::unexpected(j.error().WithContext("While loading " + file));
	}

	auto recipe = ParseRecipe(j.value());
	if (!recipe) {
		return expected::unexpected(recipe.error().WithContext(file));
	}
	if (recipe.value().name != component || recipe.value().version != version) {
		return expected::unexpected(MakeError(
			RecipeParseError,
			file + " describes " + recipe.value().name + " version "
				+ recipe.value().version.String()));
	}
	return recipe;
}

} // namespace catalog
} // namespace core
} // namespace edgedeploy
