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


#ifndef EDGEDEPLOY_CORE_CONFIG_DELTA_HPP
#define EDGEDEPLOY_CORE_CONFIG_DELTA_HPP

#include <map>
#include <string>

#include <common/error.hpp>
#include <common/expected.hpp>

#include <edgedeploy-core/config_tree.hpp>
#include <edgedeploy-core/deployment.hpp>
#include <edgedeploy-core/resolved_state.hpp>
#include <edgedeploy-core/version_resolver.hpp>

namespace edgedeploy {
namespace core {
namespace config_delta {

using namespace std;

namespace deployment = edgedeploy::core::deployment;
namespace error = edgedeploy::common::error;
namespace expected = edgedeploy::common::expected;
namespace resolved_state = edgedeploy::core::resolved_state;
namespace version_resolver = edgedeploy::core::version_resolver;

config_tree::Value EffectiveConfiguration(
	const config_tree::Value &defaults,
	const config_tree::Value &local_layer,
	const config_tree::Value &deployment_layer);

class ConfigDeltaEngine {
public:
	// With `fail_fast`, a configuration update which cannot be applied fails the whole
	// deployment instead of only marking the component for remediation.
	explicit ConfigDeltaEngine(bool fail_fast) :
		fail_fast_ {fail_fast} {
	}

	// Builds the target state: the resolved versions, with configuration layers carried over
	// from `current` and this deployment's updates applied on top of them.
	resolved_state::ExpectedResolvedState Compute(
		const version_resolver::ResolvedVersions &versions,
		const resolved_state::ResolvedState &current,
		const map<string, deployment::ConfigurationUpdate> &updates,
		const string &deployment_id = "") const;

	// Applies one update to the layers of `component`. `component` is only modified on
	// success. Errors are `ConfigurationPatchError`s.
	error::Error Apply(
		const deployment::ConfigurationUpdate &update,
		const config_tree::Value &defaults,
		resolved_state::ResolvedComponent &component) const;

private:
	bool fail_fast_;
};

} // namespace config_delta
} // namespace core
} // namespace edgedeploy

#endif // EDGEDEPLOY_CORE_CONFIG_DELTA_HPP
