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


#ifndef EDGEDEPLOY_CORE_DOCUMENT_RESOLVER_HPP
#define EDGEDEPLOY_CORE_DOCUMENT_RESOLVER_HPP

#include <map>
#include <string>

#include <common/error.hpp>
#include <common/expected.hpp>

#include <edgedeploy-core/deployment.hpp>
#include <edgedeploy-core/root_components.hpp>

namespace edgedeploy {
namespace core {
namespace document_resolver {

using namespace std;

namespace deployment = edgedeploy::core::deployment;
namespace error = edgedeploy::common::error;
namespace expected = edgedeploy::common::expected;
namespace root_components = edgedeploy::core::root_components;

struct DesiredState {
	// The groups' roots after this deployment; roots of groups the deployment does not touch
	// are carried over unchanged.
	root_components::GroupToRootComponents groups;
	// Configuration updates the deployment asks for, by component.
	map<string, deployment::ConfigurationUpdate> configuration_updates;
};

using ExpectedDesiredState = expected::expected<DesiredState, error::Error>;

// Rejects documents which contradict themselves, with a `ConflictError`.
error::Error ValidateDocument(const deployment::DeploymentDocument &doc);

ExpectedDesiredState Resolve(
	const deployment::DeploymentDocument &doc,
	const root_components::GroupToRootComponents &current);

} // namespace document_resolver
} // namespace core
} // namespace edgedeploy

#endif // EDGEDEPLOY_CORE_DOCUMENT_RESOLVER_HPP
