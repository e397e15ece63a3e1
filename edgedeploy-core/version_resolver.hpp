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


#ifndef EDGEDEPLOY_CORE_VERSION_RESOLVER_HPP
#define EDGEDEPLOY_CORE_VERSION_RESOLVER_HPP

#include <map>
#include <string>

#include <common/error.hpp>
#include <common/expected.hpp>

#include <edgedeploy-core/catalog.hpp>
#include <edgedeploy-core/root_components.hpp>

namespace edgedeploy {
namespace core {
namespace version_resolver {

using namespace std;

namespace catalog = edgedeploy::core::catalog;
namespace error = edgedeploy::common::error;
namespace expected = edgedeploy::common::expected;
namespace root_components = edgedeploy::core::root_components;

// Component name to the recipe of the chosen version, covering roots and their dependencies.
using ResolvedVersions = map<string, catalog::Recipe>;
using ExpectedResolvedVersions = expected::expected<ResolvedVersions, error::Error>;

// Who constrains a component (group name or dependent component) to the requirement.
using Constraints = map<string, string>;

// `{thinggroup/A: ==1.0.0, thinggroup/B: ==2.0.0}`
string ConstraintsToString(const Constraints &constraints);

class VersionResolver {
public:
	explicit VersionResolver(catalog::ComponentCatalog &catalog) :
		catalog_ {catalog} {
	}

	// Picks, for every root of every group and everything they depend on, the highest version
	// satisfying all constraints placed on it. Fails as a whole, nothing is partially
	// resolved.
	ExpectedResolvedVersions Resolve(
		const root_components::GroupToRootComponents &groups, const string &deployment_id = "");

private:
	catalog::ExpectedRecipe ResolveComponent(const string &name, const Constraints &constraints);

	catalog::ComponentCatalog &catalog_;
};

} // namespace version_resolver
} // namespace core
} // namespace edgedeploy

#endif // EDGEDEPLOY_CORE_VERSION_RESOLVER_HPP
