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

#include <gtest/gtest.h>

namespace config_tree = edgedeploy::core::config_tree;
namespace resolved_state = edgedeploy::core::resolved_state;
namespace semver = edgedeploy::core::semver;

using namespace std;

TEST(ResolvedStateTests, PersistedForm) {
	resolved_state::ResolvedState state;
	resolved_state::ResolvedComponent app;
	app.name = "CustomerApp";
	app.version = semver::Version(1, 0, 0);
	app.dependencies = {{"Lib", "^2"}};
	auto layer = config_tree::Value::FromJsonString(R"({"sampleText": "This is a test"})");
	ASSERT_TRUE(layer);
	app.deployment_layer = layer.value();
	app.configuration = layer.value();
	app.needs_remediation = true;
	state.components[app.name] = app;

	resolved_state::ResolvedComponent lib;
	lib.name = "Lib";
	lib.version = semver::Version(2, 1, 0, {"rc", "1"});
	state.components[lib.name] = lib;

	auto str = state.ToJson();
	auto restored = resolved_state::ResolvedState::FromJsonString(str);
	ASSERT_TRUE(restored) << restored.error().String() << "\n" << str;
	EXPECT_EQ(restored.value(), state);

	ASSERT_NE(restored->Find("CustomerApp"), nullptr);
	EXPECT_TRUE(restored->Find("CustomerApp")->needs_remediation);
	EXPECT_EQ(restored->Find("Lib")->version.String(), "2.1.0-rc.1");
	EXPECT_EQ(restored->Find("Nope"), nullptr);
}

TEST(ResolvedStateTests, MissingLayersAreEmpty) {
	auto state = resolved_state::ResolvedState::FromJsonString(
		R"({"components": {"a": {"version": "1.0.0"}}})");
	ASSERT_TRUE(state) << state.error().String();
	EXPECT_EQ(state->Find("a")->configuration.Dump(), "{}");
	EXPECT_FALSE(state->Find("a")->needs_remediation);
}

TEST(ResolvedStateTests, InvalidData) {
	EXPECT_FALSE(resolved_state::ResolvedState::FromJsonString("{}"));
	EXPECT_FALSE(resolved_state::ResolvedState::FromJsonString(
		R"({"components": {"a": {"version": "one"}}})"));
	EXPECT_FALSE(resolved_state::ResolvedState::FromJsonString(
		R"({"components": {"a": {"version": "1.0.0", "dependencies": {"b": 1}}}})"));
}
