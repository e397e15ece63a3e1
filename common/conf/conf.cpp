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


#include <common/conf.hpp>

#include <cerrno>
#include <cstdlib>
#include <string>
#include <utility>

#include <edgedeploy-version.h>

#include <common/error.hpp>
#include <common/expected.hpp>
#include <common/log.hpp>

namespace edgedeploy {
namespace common {
namespace conf {

using namespace std;
namespace error = edgedeploy::common::error;
namespace expected = edgedeploy::common::expected;
namespace log = edgedeploy::common::log;

const string kEdgeDeployVersion = EDGEDEPLOY_VERSION;

const ConfigErrorCategoryClass ConfigErrorCategory;

const char *ConfigErrorCategoryClass::name() const noexcept {
	return "ConfigErrorCategory";
}

string ConfigErrorCategoryClass::message(int code) const {
	switch (code) {
	case NoError:
		return "Success";
	case InvalidOptionsError:
		return "Invalid options given";
	default:
		return "Unknown";
	}
}

error::Error MakeError(ConfigErrorCode code, const string &msg) {
	return error::Error(error_condition(code, ConfigErrorCategory), msg);
}


string GetEnv(const string &var_name, const string &default_value) {
	const char *value = getenv(var_name.c_str());
	if (value == nullptr) {
		return string(default_value);
	}
	return string(value);
}

ExpectedOptionValue CmdlineOptionsIterator::Next() {
	string option = "";
	string value = "";

	if (start_ + pos_ >= end_) {
		return ExpectedOptionValue({"", ""});
	}

	if (past_double_dash_) {
		OptionValue opt_val {"", start_[pos_]};
		pos_++;
		return ExpectedOptionValue(opt_val);
	}

	if (start_[pos_] == "--") {
		past_double_dash_ = true;
		pos_++;
		return ExpectedOptionValue({"--", ""});
	}

	if (start_[pos_][0] == '-') {
		auto eq_idx = start_[pos_].find('=');
		if (eq_idx != string::npos) {
			option = start_[pos_].substr(0, eq_idx);
			value = start_[pos_].substr(eq_idx + 1, start_[pos_].size() - eq_idx - 1);
			pos_++;
		} else {
			option = start_[pos_];
			pos_++;
		}

		if (opts_with_value_.count(option) != 0) {
			if ((value == "") && ((start_ + pos_ >= end_) || (start_[pos_][0] == '-'))) {
				return expected::unexpected(MakeError(
					ConfigErrorCode::InvalidOptionsError, "Option " + option + " missing value"));
			} else if (value == "") {
				// Value in the next argument rather than as `--opt=value`.
				value = start_[pos_];
				pos_++;
			}
		} else if (opts_wo_value_.count(option) == 0) {
			return expected::unexpected(MakeError(
				ConfigErrorCode::InvalidOptionsError, "Unrecognized option '" + option + "'"));
		} else if (value != "") {
			return expected::unexpected(MakeError(
				ConfigErrorCode::InvalidOptionsError,
				"Option " + option + " doesn't expect a value"));
		}
	} else {
		switch (mode_) {
		case ArgumentsMode::AcceptBareArguments:
			value = start_[pos_];
			pos_++;
			break;
		case ArgumentsMode::RejectBareArguments:
			return expected::unexpected(MakeError(
				ConfigErrorCode::InvalidOptionsError,
				"Unexpected argument '" + start_[pos_] + "'"));
		case ArgumentsMode::StopAtBareArguments:
			return ExpectedOptionValue({"", ""});
		}
	}

	return ExpectedOptionValue({std::move(option), std::move(value)});
}

namespace {

struct GlobalOptions {
	string config_file;
	string fallback_config_file;
	string data_store;
	string log_file;
	string log_level;
	bool version {false};
	bool help {false};
	int count {0};
};

error::Error ApplyGlobalOption(const OptionValue &opt_val, GlobalOptions &opts) {
	const auto &opt = opt_val.option;
	if (opt == "--config" || opt == "-c") {
		opts.config_file = opt_val.value;
	} else if (opt == "--fallback-config" || opt == "-b") {
		opts.fallback_config_file = opt_val.value;
	} else if (opt == "--data" || opt == "-d") {
		opts.data_store = opt_val.value;
	} else if (opt == "--log-file" || opt == "-L") {
		opts.log_file = opt_val.value;
	} else if (opt == "--log-level" || opt == "-l") {
		opts.log_level = opt_val.value;
	} else if (opt == "--version" || opt == "-v") {
		opts.version = true;
	} else if (opt == "--help" || opt == "-h") {
		opts.help = true;
	} else {
		return error::MakeError(error::ProgrammingError, "Unhandled global option " + opt);
	}
	opts.count++;
	return error::NoError;
}

error::Error SetLogLevel(const string &level) {
	auto ex_level = log::StringToLogLevel(level);
	if (!ex_level) {
		return ex_level.error();
	}
	log::SetLevel(ex_level.value());
	return error::NoError;
}

} // namespace

expected::ExpectedSize EdgeDeployConfig::ProcessCmdlineArgs(
	vector<string>::const_iterator start, vector<string>::const_iterator end, const CliApp &app) {
	GlobalOptions opts;

	CmdlineOptionsIterator opts_iter(
		start, end, GlobalOptsSetWithValue(), GlobalOptsSetWithoutValue());
	opts_iter.SetArgumentsMode(ArgumentsMode::StopAtBareArguments);
	while (!opts.help) {
		auto ex_opt_val = opts_iter.Next();
		if (!ex_opt_val) {
			return expected::unexpected(ex_opt_val.error());
		}
		if (ex_opt_val.value().option == "" && ex_opt_val.value().value == "") {
			break;
		}
		auto err = ApplyGlobalOption(ex_opt_val.value(), opts);
		if (err != error::NoError) {
			return expected::unexpected(err);
		}
	}

	if (opts.version) {
		if (opts.count > 1 || opts_iter.GetPos() < static_cast<size_t>(end - start)) {
			return expected::unexpected(error::Error(
				make_error_condition(errc::invalid_argument),
				"--version can not be combined with other commands and arguments"));
		}
		cout << kEdgeDeployVersion << endl;
		return expected::unexpected(error::MakeError(error::ExitWithSuccessError, ""));
	}

	if (opts.help) {
		PrintCliHelp(app);
		return expected::unexpected(error::MakeError(error::ExitWithSuccessError, ""));
	}

	// The data store moves the default fallback file, so it goes first.
	if (opts.data_store != "") {
		paths.SetDataStore(opts.data_store);
	}
	if (opts.config_file != "") {
		paths.SetConfFile(opts.config_file);
	}
	if (opts.fallback_config_file != "") {
		paths.SetFallbackConfFile(opts.fallback_config_file);
	}

	if (opts.log_file != "") {
		auto err = log::SetupFileLogging(opts.log_file, true);
		if (err != error::NoError) {
			return expected::unexpected(err);
		}
	}

	log::SetLevel(log::kDefaultLogLevel);
	if (opts.log_level != "") {
		auto err = SetLogLevel(opts.log_level);
		if (err != error::NoError) {
			return expected::unexpected(err);
		}
	}

	// Keys set in the fallback file override the main file.
	for (const auto &file : {
			 make_pair(paths.GetConfFile(), opts.config_file != ""),
			 make_pair(paths.GetFallbackConfFile(), opts.fallback_config_file != ""),
		 }) {
		auto err = LoadConfigFile_(file.first, file.second);
		if (err != error::NoError) {
			Reset();
			return expected::unexpected(err);
		}
	}

	auto valid = ValidateConfig();
	if (!valid) {
		return expected::unexpected(valid.error());
	}

	if (component_recipes_dir != "") {
		paths.SetRecipesDir(component_recipes_dir);
	}
	if (deployment_spool_dir != "") {
		paths.SetSpoolDir(deployment_spool_dir);
	}

	if (opts.log_level == "" && daemon_log_level != "") {
		auto err = SetLogLevel(daemon_log_level);
		if (err != error::NoError) {
			return expected::unexpected(err);
		}
	}

	return opts_iter.GetPos();
}

error::Error EdgeDeployConfig::LoadConfigFile_(const string &path, bool required) {
	auto ret = this->LoadFile(path);
	if (ret) {
		return error::NoError;
	}

	if (required) {
		log::Error("Failed to load config from '" + path + "': " + ret.error().message);
		return ret.error();
	} else if (ret.error().IsErrno(ENOENT)) {
		log::Debug("Failed to load config from '" + path + "': " + ret.error().message);
		return error::NoError;
	} else {
		// A broken file in a default location is not fatal.
		log::Warning("Failed to load config from '" + path + "': " + ret.error().message);
		return error::NoError;
	}
}

} // namespace conf
} // namespace common
} // namespace edgedeploy
