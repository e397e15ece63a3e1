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


#ifndef EDGEDEPLOY_COMMON_CONF_HPP
#define EDGEDEPLOY_COMMON_CONF_HPP

#include <iostream>
#include <string>
#include <unordered_set>
#include <vector>

#include <common/config_parser.hpp>
#include <common/error.hpp>
#include <common/expected.hpp>
#include <common/path.hpp>

namespace edgedeploy {
namespace common {
namespace conf {

using namespace std;
namespace error = edgedeploy::common::error;
namespace expected = edgedeploy::common::expected;
namespace cfg_parser = edgedeploy::common::config_parser;

extern const string kEdgeDeployVersion;

enum ConfigErrorCode {
	NoError = 0,
	InvalidOptionsError,
};

class ConfigErrorCategoryClass : public std::error_category {
public:
	const char *name() const noexcept override;
	string message(int code) const override;
};
extern const ConfigErrorCategoryClass ConfigErrorCategory;

error::Error MakeError(ConfigErrorCode code, const string &msg);


string GetEnv(const string &var_name, const string &default_value);

struct OptionValue {
	string option;
	string value;
};

using OptsSet = unordered_set<string>;
using ExpectedOptionValue = expected::expected<OptionValue, error::Error>;

enum class ArgumentsMode {
	AcceptBareArguments,
	RejectBareArguments,
	StopAtBareArguments,
};

// Walks a command line one option at a time. `Next()` returns an empty option and value once
// the arguments are exhausted.
class CmdlineOptionsIterator {
public:
	CmdlineOptionsIterator(
		vector<string>::const_iterator start,
		vector<string>::const_iterator end,
		const OptsSet &opts_with_value,
		const OptsSet &opts_without_value) :
		start_ {start},
		end_ {end},
		opts_with_value_ {opts_with_value},
		opts_wo_value_ {opts_without_value} {};
	ExpectedOptionValue Next();

	size_t GetPos() const {
		return pos_;
	}

	void SetArgumentsMode(ArgumentsMode mode) {
		mode_ = mode;
	}

private:
	vector<string>::const_iterator start_;
	vector<string>::const_iterator end_;
	OptsSet opts_with_value_;
	OptsSet opts_wo_value_;
	size_t pos_ = 0;
	bool past_double_dash_ = false;
	ArgumentsMode mode_ {ArgumentsMode::RejectBareArguments};
};

// Derived paths follow their directory when it is changed.
class Paths {
private:
	string path_conf_dir = conf::GetEnv("EDGEDEPLOY_CONF_DIR", path::Join("/etc", "edgedeploy"));
	string conf_file = path::Join(path_conf_dir, "edgedeploy.conf");

	string path_data_dir =
		conf::GetEnv("EDGEDEPLOY_DATA_DIR", path::Join("/usr/share", "edgedeploy"));
	string recipes_dir = path::Join(path_data_dir, "recipes");

	string data_store =
		conf::GetEnv("EDGEDEPLOY_DATASTORE_DIR", path::Join("/var/lib", "edgedeploy"));
	string fallback_conf_file = path::Join(data_store, "edgedeploy.conf");
	string spool_dir = path::Join(data_store, "deployments");
	string database_file = path::Join(data_store, "edgedeploy-store");

public:
	string GetPathConfDir() const {
		return path_conf_dir;
	}
	void SetPathConfDir(const string &conf_dir) {
		this->path_conf_dir = conf_dir;
		this->conf_file = path::Join(path_conf_dir, "edgedeploy.conf");
	}

	string GetPathDataDir() const {
		return path_data_dir;
	}
	void SetPathDataDir(const string &path_data_dir) {
		this->path_data_dir = path_data_dir;
		this->recipes_dir = path::Join(path_data_dir, "recipes");
	}

	string GetDataStore() const {
		return data_store;
	}
	void SetDataStore(const string &data_store) {
		this->data_store = data_store;
		this->fallback_conf_file = path::Join(data_store, "edgedeploy.conf");
		this->spool_dir = path::Join(data_store, "deployments");
		this->database_file = path::Join(data_store, "edgedeploy-store");
	}

	string GetConfFile() const {
		return conf_file;
	}
	void SetConfFile(const string &conf_file) {
		this->conf_file = conf_file;
	}

	string GetFallbackConfFile() const {
		return fallback_conf_file;
	}
	void SetFallbackConfFile(const string &fallback_conf_file) {
		this->fallback_conf_file = fallback_conf_file;
	}

	string GetRecipesDir() const {
		return recipes_dir;
	}
	void SetRecipesDir(const string &recipes_dir) {
		this->recipes_dir = recipes_dir;
	}

	string GetSpoolDir() const {
		return spool_dir;
	}
	void SetSpoolDir(const string &spool_dir) {
		this->spool_dir = spool_dir;
	}

	string GetDatabaseFile() const {
		return database_file;
	}
};

struct CliOption {
	string long_option;
	string short_option;
	string description;
	string default_value;
	string parameter;
};

struct CliArgument {
	string name;
	bool mandatory;
};

struct CliCommand {
	string name;
	string description;
	CliArgument argument;
	vector<CliOption> options;
};

struct CliApp {
	string name;
	string short_description;
	string long_description;
	vector<CliCommand> commands;
};

void PrintCliHelp(const CliApp &cli, ostream &stream = std::cout);
void PrintCliCommandHelp(
	const CliApp &cli, const string &command_name, ostream &stream = std::cout);

bool FindCmdlineHelpArg(vector<string>::const_iterator start, vector<string>::const_iterator end);

const OptsSet GlobalOptsSetWithValue();
const OptsSet GlobalOptsSetWithoutValue();
const OptsSet CommandOptsSetWithValue(const vector<CliOption> &options);
const OptsSet CommandOptsSetWithoutValue(const vector<CliOption> &options);

class EdgeDeployConfig : public cfg_parser::EdgeDeployConfigFromFile {
public:
	Paths paths {};

	// On success, returns the index of the first argument after the global options.
	expected::ExpectedSize ProcessCmdlineArgs(
		vector<string>::const_iterator start,
		vector<string>::const_iterator end,
		const CliApp &app);

private:
	error::Error LoadConfigFile_(const string &path, bool required);
};

} // namespace conf
} // namespace common
} // namespace edgedeploy

#endif // EDGEDEPLOY_COMMON_CONF_HPP
