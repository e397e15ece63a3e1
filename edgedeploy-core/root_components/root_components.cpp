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


#include <edgedeploy-core/root_components.hpp>

#include <sstream>

#include <common/common.hpp>
#include <common/log.hpp>

namespace edgedeploy {
namespace core {
namespace root_components {

namespace common = edgedeploy::common;
namespace log = edgedeploy::common::log;

const string kGroupToRootComponentsKey = "group-to-root-components";

string ToJson(const GroupToRootComponents &groups) {
	stringstream ss;
	ss << "{";
	bool first_group = true;
	for (const auto &group : groups) {
		if (!first_group) {
			ss << ",";
		}
		first_group = false;
		ss << "\"" << json::EscapeString(group.first) << "\":{";
		bool first = true;
		for (const auto &root : group.second) {
			if (!first) {
				ss << ",";
			}
			first = false;
			ss << "\"" << json::EscapeString(root.first) << "\":\""
			   << json::EscapeString(root.second) << "\"";
		}
		ss << "}";
	}
	ss << "}";
	return ss.str();
}

ExpectedGroupToRootComponents FromJson(const json::Json &j) {
	auto groups = j.GetChildren();
	if (!groups) {
		return expected::unexpected(groups.error().WithContext("Root component mapping"));
	}

	GroupToRootComponents ret;
	for (const auto &group : groups.value()) {
		auto roots = group.second.GetChildren();
		if (!roots) {
			return expected::unexpected(roots.error().WithContext("Group " + group.first));
		}
		auto &group_roots = ret[group.first];
		for (const auto &root : roots.value()) {
			auto req = root.second.GetString();
			if (!req) {
				return expected::unexpected(
					req.error().WithContext("Group " + group.first + ", root " + root.first));
			}
			group_roots[root.first] = req.value();
		}
	}
	return ret;
}

error::Error RootComponentsOwner::Load() {
	auto data = kvdb::ReadString(db_, kGroupToRootComponentsKey, true);
	if (!data) {
		return data.error();
	}
	if (data.value() == "") {
		groups_.clear();
		return error::NoError;
	}

	auto j = json::Load(data.value());
	if (!j) {
		return j.error().WithContext("Could not parse " + kGroupToRootComponentsKey);
	}
	auto groups = FromJson(j.value());
	if (!groups) {
		return groups.error();
	}
	groups_ = std::move(groups.value());
	log::Debug("Loaded root components of " + to_string(groups_.size()) + " group(s)");
	return error::NoError;
}

error::Error RootComponentsOwner::Set(GroupToRootComponents groups) {
	return db_.WriteTransaction(
		[this, &groups](kvdb::Transaction &txn) { return Set(std::move(groups), txn); });
}

error::Error RootComponentsOwner::Set(GroupToRootComponents groups, kvdb::Transaction &txn) {
	auto err = txn.Write(kGroupToRootComponentsKey, common::ByteVectorFromString(ToJson(groups)));
	if (err != error::NoError) {
		return err;
	}
	groups_ = std::move(groups);
	return error::NoError;
}

void RootComponentsHandle::AsyncRead(ReadHandler handler) {
	auto &owner = owner_;
	owner_.Loop().Post([&owner, handler]() { handler(owner.Get()); });
}

} // namespace root_components
} // namespace core
} // namespace edgedeploy
