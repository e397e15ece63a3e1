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

#include <gtest/gtest.h>

#include <edgedeploy-core/deployment.hpp>

namespace catalog = edgedeploy::core::catalog;
namespace deployment = edgedeploy::core::deployment;
namespace semver = edgedeploy::core::semver;
namespace version_resolver = edgedeploy::core::version_resolver;

using namespace std;

class VersionResolverTests : public testing::Test {
protected:
	void Add(const string &name, const string &version, map<string, string> deps = {}) {
		auto v = semver::Version::Parse(version);
		ASSERT_TRUE(v);
		catalog_.AddRecipe({name, v.value(), deps, {}});
	}

	string VersionOf(const version_resolver::ResolvedVersions &resolved, const string &name) {
		auto it = resolved.find(name);
		if (it == resolved.end()) {
			return "<none>";
		}
		return it->second.version.String();
	}

	catalog::InMemoryCatalog catalog_;
};

TEST_F(VersionResolverTests, PicksHighestSatisfyingVersion) {
	Add("ComponentX", "1.0.0");
	Add("ComponentX", "1.5.0");
	Add("ComponentX", "2.0.0");

	version_resolver::VersionResolver resolver(catalog_);
	auto resolved = resolver.Resolve({{"thinggroup/A", {{"ComponentX", "^1.0.0"}}}});
	ASSERT_TRUE(resolved) << resolved.error().String();
	EXPECT_EQ(VersionOf(resolved.value(), "ComponentX"), "1.5.0");

	// Same answer every time.
	auto again = resolver.Resolve({{"thinggroup/A", {{"ComponentX", "^1.0.0"}}}});
	ASSERT_TRUE(again);
	EXPECT_EQ(VersionOf(again.value(), "ComponentX"), "1.5.0");
}

TEST_F(VersionResolverTests, IntersectsConstraintsOfAllGroups) {
	Add("ComponentX", "1.0.0");
	Add("ComponentX", "1.5.0");
	Add("ComponentX", "2.0.0");

	version_resolver::VersionResolver resolver(catalog_);
	auto resolved = resolver.Resolve({
		{"thinggroup/A", {{"ComponentX", ">=1.0.0"}}},
		{"thinggroup/B", {{"ComponentX", "<2.0.0"}}},
	});
	ASSERT_TRUE(resolved) << resolved.error().String();
	EXPECT_EQ(VersionOf(resolved.value(), "ComponentX"), "1.5.0");
}

TEST_F(VersionResolverTests, ConflictNamesAllConstraints) {
	Add("ComponentX", "1.0.0");
	Add("ComponentX", "2.0.0");

	version_resolver::VersionResolver resolver(catalog_);
	auto resolved = resolver.Resolve({
		{"thinggroup/A", {{"ComponentX", "==1.0.0"}}},
		{"thinggroup/B", {{"ComponentX", "==2.0.0"}}},
	});
	ASSERT_FALSE(resolved);
	EXPECT_TRUE(deployment::IsError(resolved.error(), deployment::NoAvailableVersionError));
	EXPECT_EQ(
		resolved.error().message,
		"There is no version of component ComponentX satisfying "
		"{thinggroup/A: ==1.0.0, thinggroup/B: ==2.0.0}");
}

TEST_F(VersionResolverTests, UnknownComponent) {
	version_resolver::VersionResolver resolver(catalog_);
	auto resolved = resolver.Resolve({{"thing/T", {{"Ghost", "1.0.0"}}}});
	ASSERT_FALSE(resolved);
	EXPECT_TRUE(deployment::IsError(resolved.error(), deployment::NoAvailableVersionError));
}

TEST_F(VersionResolverTests, ResolvesDependencies) {
	Add("App", "1.0.0", {{"Lib", "^2.0.0"}});
	Add("Lib", "2.0.0", {{"Base", "1.0.0"}});
	Add("Lib", "2.3.0", {{"Base", "1.0.0"}});
	Add("Lib", "3.0.0");
	Add("Base", "1.0.0");

	version_resolver::VersionResolver resolver(catalog_);
	auto resolved = resolver.Resolve({{"thing/T", {{"App", "1.0.0"}}}});
	ASSERT_TRUE(resolved) << resolved.error().String();
	EXPECT_EQ(resolved->size(), 3u);
	EXPECT_EQ(VersionOf(resolved.value(), "Lib"), "2.3.0");
	EXPECT_EQ(VersionOf(resolved.value(), "Base"), "1.0.0");
}

TEST_F(VersionResolverTests, DependencyConstraintCombinesWithRootConstraint) {
	// Lib is a root of its own, and App narrows it down.
	Add("App", "1.0.0", {{"Lib", "<2.3.0"}});
	Add("Lib", "2.0.0");
	Add("Lib", "2.3.0");

	version_resolver::VersionResolver resolver(catalog_);
	auto resolved = resolver.Resolve({{"thing/T", {{"App", "1.0.0"}, {"Lib", "^2"}}}});
	ASSERT_TRUE(resolved) << resolved.error().String();
	EXPECT_EQ(VersionOf(resolved.value(), "Lib"), "2.0.0");
}

TEST_F(VersionResolverTests, ReResolutionDropsStaleDependencies) {
	// A is resolved first and picks B 2.0.0, which needs Old. Z then narrows B down to 1.0.0,
	// which does not.
	Add("A", "1.0.0", {{"B", "*"}});
	Add("B", "1.0.0");
	Add("B", "2.0.0", {{"Old", "1.0.0"}});
	Add("Old", "1.0.0");
	Add("Z", "1.0.0", {{"B", "1.0.0"}});

	version_resolver::VersionResolver resolver(catalog_);
	auto resolved = resolver.Resolve({{"thing/T", {{"A", "1.0.0"}, {"Z", "1.0.0"}}}});
	ASSERT_TRUE(resolved) << resolved.error().String();
	EXPECT_EQ(VersionOf(resolved.value(), "B"), "1.0.0");
	EXPECT_EQ(resolved->count("Old"), 0u);
}

TEST_F(VersionResolverTests, CircularDependency) {
	Add("A", "1.0.0", {{"B", "1.0.0"}});
	Add("B", "1.0.0", {{"C", "1.0.0"}});
	Add("C", "1.0.0", {{"A", "1.0.0"}});

	version_resolver::VersionResolver resolver(catalog_);
	auto resolved = resolver.Resolve({{"thing/T", {{"A", "1.0.0"}}}});
	ASSERT_FALSE(resolved);
	EXPECT_TRUE(deployment::IsError(resolved.error(), deployment::CircularDependencyError))
		<< resolved.error().String();
}

TEST_F(VersionResolverTests, EmptyRootsResolveToNothing) {
	version_resolver::VersionResolver resolver(catalog_);
	auto resolved = resolver.Resolve({});
	ASSERT_TRUE(resolved);
	EXPECT_TRUE(resolved->empty());
}
