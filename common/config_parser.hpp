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


#ifndef EDGEDEPLOY_COMMON_CONFIG_PARSER_HPP
#define EDGEDEPLOY_COMMON_CONFIG_PARSER_HPP

#include <string>

#include <common/error.hpp>
#include <common/expected.hpp>

namespace edgedeploy {
namespace common {
namespace config_parser {

using namespace std;

using edgedeploy::common::expected::ExpectedBool;

namespace error = edgedeploy::common::error;

enum ConfigParserErrorCode {
	NoError = 0,
	ParseError,
	ValidationError,
};

class ConfigParserErrorCategoryClass : public std::error_category {
public:
	const char *name() const noexcept override;
	string message(int code) const override;
};
extern const ConfigParserErrorCategoryClass ConfigParserErrorCategory;

error::Error MakeError(ConfigParserErrorCode code, const string &msg);

class EdgeDeployConfigFromFile {
public:
	/** Log level which takes effect right before daemon startup */
	string daemon_log_level;

	/** Directory holding the `<name>-<version>.json` component recipes */
	string component_recipes_dir;

	/** Directory where deployment submissions are dropped for the daemon */
	string deployment_spool_dir;

	/** How often the daemon scans the spool directory */
	int spool_poll_interval_seconds = 5;

	/** How long a component may take to reach a terminal lifecycle state */
	int component_terminal_state_timeout_seconds = 120;

	/* Update gate parameters */
	/** Used when the document has no `componentUpdatePolicy.timeout` */
	int update_gate_default_timeout_seconds = 60;
	/** Fail the deployment instead of proceeding when the gate times out */
	bool update_gate_fail_on_timeout = false;
	int update_gate_cancellation_check_milliseconds = 1000;

	/** Fail the whole deployment on the first configuration patch error */
	bool configuration_update_fail_fast = false;

	/** Number of finished deployment ids remembered for duplicate detection */
	int deployment_history_size = 1000;

	/**
	 * Loads values from the given file and overrides the current values of the
	 * respective above fields with them.
	 *
	 * @return whether some new values were actually applied or not
	 * @note Extra fields and fields of unexpected types are ignored. A file that can't
	 *       be read keeps its original (errno) error, so that callers can tell a
	 *       missing file from a broken one.
	 */
	ExpectedBool LoadFile(const string &path);

	void Reset();

	ExpectedBool ValidateConfig() const;
};

} // namespace config_parser
} // namespace common
} // namespace edgedeploy

#endif // EDGEDEPLOY_COMMON_CONFIG_PARSER_HPP
