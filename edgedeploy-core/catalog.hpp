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


#ifndef EDGEDEPLOY_CORE_CATALOG_HPP
#define EDGEDEPLOY_CORE_CATALOG_HPP

#include <map>
#include <string>
#include <vector>

#include <common/error.hpp>
#include <common/expected.hpp>
#include <common/json.hpp>

#include <edgedeploy-core/config_tree.hpp>
#include <edgedeploy-core/semver.hpp>

namespace edgedeploy {
namespace core {
namespace catalog {

using namespace std;

namespace error = edgedeploy::common::error;
namespace expected = edgedeploy::common::expected;
namespace json = edgedeploy::common::json;

enum CatalogErrorCode {
	NoError = 0,
	RecipeParseError,
	RecipeNotFoundError,
};

class CatalogErrorCategoryClass : public std::error_category {
public:
	const char *name() const noexcept override;
	string message(int code) const override;
};
extern const CatalogErrorCategoryClass CatalogErrorCategory;

error::Error MakeError(CatalogErrorCode code, const string &msg);

struct Recipe {
	string name;
	semver::Version version;
	// Dependency name to version requirement.
	map<string, string> dependencies;
	config_tree::Value default_configuration {config_tree::EmptyMap()};
};

using ExpectedRecipe = expected::expected<Recipe, error::Error>;
using ExpectedVersionList = expected::expected<vector<semver::Version>, error::Error>;

ExpectedRecipe ParseRecipe(const json::Json &j);

class ComponentCatalog {
public:
	virtual ~ComponentCatalog() {
	}

	// In ascending order. A component the catalog does not know has no versions.
	virtual ExpectedVersionList AvailableVersions(const string &component) = 0;
	virtual ExpectedRecipe GetRecipe(const string &component, const semver::Version &version) = 0;
};

class InMemoryCatalog : public ComponentCatalog {
public:
	void AddRecipe(Recipe recipe);

	ExpectedVersionList AvailableVersions(const string &component) override;
	ExpectedRecipe GetRecipe(const string &component, const semver::Version &version) override;

private:
	map<string, map<semver::Version, Recipe>> recipes_;
};

// Reads `<name>-<version>.json` recipe files from one directory.
class FileCatalog : public ComponentCatalog {
public:
	explicit FileCatalog(const string &directory) :
		directory_ {directory} {
	}

	ExpectedVersionList AvailableVersions(const string &component) override;
	ExpectedRecipe GetRecipe(const string &component, const semver::Version &version) override;

private:
	string directory_;
};

} // namespace catalog
} // namespace core
} // namespace edgedeploy

#endif // EDGEDEPLOY_CORE_CATALOG_HPP
