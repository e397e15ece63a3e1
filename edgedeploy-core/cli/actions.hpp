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


#ifndef EDGEDEPLOY_CORE_CLI_ACTIONS_HPP
#define EDGEDEPLOY_CORE_CLI_ACTIONS_HPP

#include <memory>
#include <string>

#include <common/conf.hpp>
#include <common/error.hpp>
#include <common/expected.hpp>
#include <common/key_value_database_lmdb.hpp>

#include <edgedeploy-core/deployment.hpp>

namespace edgedeploy {
namespace core {
namespace cli {

using namespace std;

namespace conf = edgedeploy::common::conf;
namespace error = edgedeploy::common::error;
namespace expected = edgedeploy::common::expected;
namespace kvdb = edgedeploy::common::key_value_database;

namespace deployment = edgedeploy::core::deployment;

// The configuration, and the database every command works on.
class MainContext {
public:
	MainContext(conf::EdgeDeployConfig &config) :
		config_ {config} {
	}

	error::Error Initialize();

	conf::EdgeDeployConfig &GetConfig() {
		return config_;
	}
	kvdb::KeyValueDatabase &GetDatabase() {
		return db_;
	}

private:
	conf::EdgeDeployConfig &config_;
	kvdb::KeyValueDatabaseLmdb db_;
};

class Action {
public:
	virtual ~Action() {};

	virtual error::Error Execute(MainContext &main_context) = 0;
};
using ActionPtr = shared_ptr<Action>;
using ExpectedActionPtr = expected::expected<ActionPtr, error::Error>;

class DaemonAction : virtual public Action {
public:
	error::Error Execute(MainContext &main_context) override;
};

class DeployAction : virtual public Action {
public:
	DeployAction(const string &src) :
		src_ {src} {
	}

	error::Error Execute(MainContext &main_context) override;

private:
	string src_;
};

class SubmitAction : virtual public Action {
public:
	SubmitAction(const string &src, deployment::DeploymentType type) :
		src_ {src},
		type_ {type} {
	}

	error::Error Execute(MainContext &main_context) override;

private:
	string src_;
	deployment::DeploymentType type_;
};

class ResolveAction : virtual public Action {
public:
	ResolveAction(const string &src, deployment::DeploymentType type) :
		src_ {src},
		type_ {type} {
	}

	error::Error Execute(MainContext &main_context) override;

private:
	string src_;
	deployment::DeploymentType type_;
};

class ShowStateAction : virtual public Action {
public:
	error::Error Execute(MainContext &main_context) override;
};

// Reads a deployment document from a file, or from standard input if `src` is "-".
expected::ExpectedString ReadDocument(const string &src);

} // namespace cli
} // namespace core
} // namespace edgedeploy

#endif // EDGEDEPLOY_CORE_CLI_ACTIONS_HPP
