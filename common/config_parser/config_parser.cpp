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


#include <common/config_parser.hpp>

#include <string>

#include <common/json.hpp>

namespace edgedeploy {
namespace common {
namespace config_parser {

using namespace std;
namespace json = edgedeploy::common::json;
namespace expected = edgedeploy::common::expected;

const ConfigParserErrorCategoryClass ConfigParserErrorCategory;

const char *ConfigParserErrorCategoryClass::name() const noexcept {
	return "ConfigParserErrorCategory";
}

string ConfigParserErrorCategoryClass::message(int code) const {
	switch (code) {
	case NoError:
		return "Success";
	case ParseError:
		return "Parse error";
	case ValidationError:
		return "Validation error";
	default:
		return "Unknown";
	}
}

error::Error MakeError(ConfigParserErrorCode code, const string &msg) {
	return error::Error(error_condition(code, ConfigParserErrorCategory), msg);
}

static bool ApplyString(const json::Json &cfg_json, const char *key, string &field) {
	auto e_cfg_value = cfg_json.Get(key);
	if (!e_cfg_value) {
		return false;
	}
	auto e_cfg_string = e_cfg_value.value().GetString();
	if (!e_cfg_string) {
		return false;
	}
	field = e_cfg_string.value();
	return true;
}

static bool ApplyInt(const json::Json &cfg_json, const char *key, int &field) {
	auto e_cfg_value = cfg_json.Get(key);
	if (!e_cfg_value) {
		return false;
	}
	auto e_cfg_int = e_cfg_value.value().GetInt64();
	if (!e_cfg_int) {
		return false;
	}
	field = static_cast<int>(e_cfg_int.value());
	return true;
}

static bool ApplyBool(const json::Json &cfg_json, const char *key, bool &field) {
	auto e_cfg_value = cfg_json.Get(key);
	if (!e_cfg_value) {
		return false;
	}
	auto e_cfg_bool = e_cfg_value.value().GetBool();
	if (!e_cfg_bool) {
		return false;
	}
	field = e_cfg_bool.value();
	return true;
}

ExpectedBool EdgeDeployConfigFromFile::LoadFile(const string &path) {
	const json::ExpectedJson e_cfg_json = json::LoadFromFile(path);
	if (!e_cfg_json) {
		auto err = e_cfg_json.error();
		return expected::unexpected(err);
	}

	const json::Json cfg_json = e_cfg_json.value();
	if (!cfg_json.IsObject()) {
		return expected::unexpected(
			MakeError(ParseError, "Configuration in '" + path + "' is not a JSON object"));
	}

	bool applied = false;

	applied |= ApplyString(cfg_json, "DaemonLogLevel", this->daemon_log_level);
	applied |= ApplyString(cfg_json, "ComponentRecipesDir", this->component_recipes_dir);
	applied |= ApplyString(cfg_json, "DeploymentSpoolDir", this->deployment_spool_dir);

	applied |=
		ApplyInt(cfg_json, "SpoolPollIntervalSeconds", this->spool_poll_interval_seconds);
	applied |= ApplyInt(
		cfg_json,
		"ComponentTerminalStateTimeoutSeconds",
		this->component_terminal_state_timeout_seconds);
	applied |= ApplyInt(
		cfg_json, "UpdateGateDefaultTimeoutSeconds", this->update_gate_default_timeout_seconds);
	applied |=
		ApplyBool(cfg_json, "UpdateGateFailOnTimeout", this->update_gate_fail_on_timeout);
	applied |= ApplyInt(
		cfg_json,
		"UpdateGateCancellationCheckMilliseconds",
		this->update_gate_cancellation_check_milliseconds);

	applied |= ApplyBool(
		cfg_json, "ConfigurationUpdateFailFast", this->configuration_update_fail_fast);
	applied |= ApplyInt(cfg_json, "DeploymentHistorySize", this->deployment_history_size);

	return applied;
}

void EdgeDeployConfigFromFile::Reset() {
	*this = EdgeDeployConfigFromFile();
}

ExpectedBool EdgeDeployConfigFromFile::ValidateConfig() const {
	auto positive = [](int value, const string &name) -> error::Error {
		if (value <= 0) {
			return MakeError(
				ValidationError, "'" + name + "' must be positive, got " + to_string(value));
		}
		return error::NoError;
	};

	for (auto err : {
			 positive(spool_poll_interval_seconds, "SpoolPollIntervalSeconds"),
			 positive(
				 component_terminal_state_timeout_seconds,
				 "ComponentTerminalStateTimeoutSeconds"),
			 positive(update_gate_default_timeout_seconds, "UpdateGateDefaultTimeoutSeconds"),
			 positive(
				 update_gate_cancellation_check_milliseconds,
				 "UpdateGateCancellationCheckMilliseconds"),
		 }) {
		if (err != error::NoError) {
			return expected::unexpected(err);
		}
	}

	if (deployment_history_size < 0) {
		return expected::unexpected(
			MakeError(ValidationError, "'DeploymentHistorySize' can not be negative"));
	}
	return true;
}

} // namespace config_parser
} // namespace common
} // namespace edgedeploy
