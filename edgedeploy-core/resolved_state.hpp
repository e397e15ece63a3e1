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


#ifndef EDGEDEPLOY_CORE_RESOLVED_STATE_HPP
#define EDGEDEPLOY_CORE_RESOLVED_STATE_HPP

#include <map>
#include <string>

#include <common/error.hpp>
#include <common/expected.hpp>
#include <common/json.hpp>

#include <edgedeploy-core/config_tree.hpp>
#include <edgedeploy-core/semver.hpp>

namespace edgedeploy {
namespace core {
namespace resolved_state {

using namespace std;

namespace error = edgedeploy::common::error;
namespace expected = edgedeploy::common::expected;
namespace json = edgedeploy::common::json;

struct ResolvedComponent {
	string name;
	semver::Version version;
	map<string, string> dependencies;
	// Values set outside of any deployment.
	config_tree::Value local_layer {config_tree::EmptyMap()};
	// What MERGE and RESET directives of past deployments have left behind.
	config_tree::Value deployment_layer {config_tree::EmptyMap()};
	// Defaults, then the local layer, then the deployment layer.
	config_tree::Value configuration {config_tree::EmptyMap()};
	// The last configuration update could not be applied.
	bool needs_remediation {false};

	bool operator==(const ResolvedComponent &other) const;
	bool operator!=(const ResolvedComponent &other) const {
		return !(*this == other);
	}
};

class ResolvedState;
using ExpectedResolvedState = expected::expected<ResolvedState, error::Error>;

class ResolvedState {
public:
	map<string, ResolvedComponent> components;

	// nullptr if not part of the state.
	const ResolvedComponent *Find(const string &name) const;

	string ToJson() const;
	static ExpectedResolvedState FromJson(const json::Json &j);
	static ExpectedResolvedState FromJsonString(const string &str);

	bool operator==(const ResolvedState &other) const {
		return components == other.components;
	}
	bool operator!=(const ResolvedState &other) const {
		return !(*this == other);
	}
};

} // namespace resolved_state
} // namespace core
} // namespace edgedeploy

#endif // EDGEDEPLOY_CORE_RESOLVED_STATE_HPP
