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


#ifndef EDGEDEPLOY_CORE_ROOT_COMPONENTS_HPP
#define EDGEDEPLOY_CORE_ROOT_COMPONENTS_HPP

#include <functional>
#include <map>
#include <string>

#include <common/error.hpp>
#include <common/events.hpp>
#include <common/expected.hpp>
#include <common/json.hpp>
#include <common/key_value_database.hpp>

namespace edgedeploy {
namespace core {
namespace root_components {

using namespace std;

namespace error = edgedeploy::common::error;
namespace events = edgedeploy::common::events;
namespace expected = edgedeploy::common::expected;
namespace json = edgedeploy::common::json;
namespace kvdb = edgedeploy::common::key_value_database;

// Component name to the version requirement the group places on it.
using GroupRoots = map<string, string>;
// Group name (`thing/<name>`, `thinggroup/<name>`, `LOCAL_DEPLOYMENT`) to its roots.
using GroupToRootComponents = map<string, GroupRoots>;
using ExpectedGroupToRootComponents = expected::expected<GroupToRootComponents, error::Error>;

extern const string kGroupToRootComponentsKey;

string ToJson(const GroupToRootComponents &groups);
ExpectedGroupToRootComponents FromJson(const json::Json &j);

// Owns the mapping. Only to be used from the event loop thread; everyone else goes through a
// `RootComponentsHandle`.
class RootComponentsOwner {
public:
	RootComponentsOwner(events::EventLoop &loop, kvdb::KeyValueDatabase &db) :
		loop_ {loop},
		db_ {db} {
	}

	// Reads the persisted mapping. A missing key leaves the mapping empty.
	error::Error Load();

	const GroupToRootComponents &Get() const {
		return groups_;
	}

	// Replaces and persists the mapping. On error the in-memory mapping is left untouched.
	error::Error Set(GroupToRootComponents groups);

	// Same, but as part of a bigger write transaction.
	error::Error Set(GroupToRootComponents groups, kvdb::Transaction &txn);

	events::EventLoop &Loop() {
		return loop_;
	}

private:
	events::EventLoop &loop_;
	kvdb::KeyValueDatabase &db_;
	GroupToRootComponents groups_;
};

class RootComponentsHandle {
public:
	using ReadHandler = function<void(GroupToRootComponents)>;

	explicit RootComponentsHandle(RootComponentsOwner &owner) :
		owner_ {owner} {
	}

	// `handler` is called on the event loop thread with a copy of the mapping.
	void AsyncRead(ReadHandler handler);

private:
	RootComponentsOwner &owner_;
};

} // namespace root_components
} // namespace core
} // namespace edgedeploy

#endif // EDGEDEPLOY_CORE_ROOT_COMPONENTS_HPP
