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

#include <algorithm>
#include <utility>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include <common/common.hpp>

namespace edgedeploy {
namespace common {
namespace conf {

using namespace std;

namespace common = edgedeploy::common;

const size_t max_width = 78;
const string indent = "   ";   // 3 spaces
const string separator = "  "; // 2 spaces

const Paths default_paths = Paths {};

const CliOption help_option = {
	.long_option = "help",
	.short_option = "h",
	.description = "Show help and exit",
};

const vector<CliOption> common_global_options = {
	CliOption {
		.long_option = "config",
		.short_option = "c",
		.description = "Configuration FILE path",
		.default_value = default_paths.GetConfFile(),
		.parameter = "FILE",
	},
	CliOption {
		.long_option = "fallback-config",
		.short_option = "b",
		.description = "Fallback configuration FILE path",
		.default_value = default_paths.GetFallbackConfFile(),
		.parameter = "FILE",
	},
	CliOption {
		.long_option = "data",
		.short_option = "d",
		.description = "Deployment state DIRECTORY path",
		.default_value = default_paths.GetDataStore(),
		.parameter = "DIR",
	},
	CliOption {
		.long_option = "log-file",
		.short_option = "L",
		.description = "FILE to log to",
		.parameter = "FILE",
	},
	CliOption {
		.long_option = "log-level",
		.short_option = "l",
		.description = "Set logging level",
		.default_value = "info",
		.parameter = "LEVEL",
	},
	CliOption {
		.long_option = "version",
		.short_option = "v",
		.description = "Print version and exit",
	},
	help_option,
};

const string common_description_append = R"(Global flag remarks:
   - Supported log levels are 'trace', 'debug', 'info', 'warning', 'error' and 'fatal'.

Environment variables:
   - EDGEDEPLOY_CONF_DIR - configuration (default: )"
										 + default_paths.GetPathConfDir() + R"().
   - EDGEDEPLOY_DATA_DIR - component recipes (default: )"
										 + default_paths.GetPathDataDir() + R"().
   - EDGEDEPLOY_DATASTORE_DIR - deployment state and spool (default: )"
										 + default_paths.GetDataStore() + R"().)";

using HelpRow = pair<string, string>;

// Prints `rows` as an indented table. The second column is wrapped at `max_width` and stays
// aligned.
static void PrintTable(const vector<HelpRow> &rows, ostream &stream) {
	size_t first_width = 0;
	for (const auto &row : rows) {
		first_width = max(first_width, row.first.size());
	}

	const size_t wrap_indent = indent.size() + first_width + separator.size();
	const size_t second_width = max_width > wrap_indent ? max_width - wrap_indent : 1;
	for (const auto &row : rows) {
		auto lines = common::JoinStringsMaxWidth(
			common::SplitString(row.second, " "), " ", second_width);
		stream << indent << setw(first_width) << left << row.first << separator
			   << lines.front() << endl;
		for (auto line = lines.begin() + 1; line != lines.end(); ++line) {
			stream << string(wrap_indent, ' ') << *line << endl;
		}
	}
}

// --long-option[ PARAM][, -l[ PARAM]]
static string OptionSynopsis(const CliOption &option) {
	string str = "--" + option.long_option;
	if (!option.parameter.empty()) {
		str += " " + option.parameter;
	}
	if (!option.short_option.empty()) {
		str += ", -" + option.short_option;
		if (!option.parameter.empty()) {
			str += " " + option.parameter;
		}
	}
	return str;
}

static void PrintOptions(const vector<CliOption> &options, ostream &stream) {
	vector<HelpRow> rows;
	for (const auto &option : options) {
		string description = option.description;
		if (!option.default_value.empty()) {
			description += " (default: " + option.default_value + ")";
		}
		rows.emplace_back(OptionSynopsis(option), description);
	}
	PrintTable(rows, stream);
}

static void PrintCommandHelp(const string &cli_name, const CliCommand &command, ostream &stream) {
	stream << "NAME:" << endl;
	stream << indent << cli_name << " " << command.name;
	if (!command.description.empty()) {
		stream << " - " << command.description;
	}
	stream << endl << endl;

	if (!command.argument.name.empty()) {
		stream << "USAGE:" << endl << indent << cli_name << " " << command.name;
		if (!command.options.empty()) {
			stream << " [command options]";
		}
		if (command.argument.mandatory) {
			stream << " <" << command.argument.name << ">";
		} else {
			stream << " [" << command.argument.name << "]";
		}
		stream << endl << endl;
	}

	vector<CliOption> options_with_help = command.options;
	options_with_help.push_back(help_option);
	stream << "OPTIONS:" << endl;
	PrintOptions(options_with_help, stream);
}

void PrintCliHelp(const CliApp &cli, ostream &stream) {
	stream << "NAME:" << endl;
	stream << indent << cli.name;
	if (!cli.short_description.empty()) {
		stream << " - " << cli.short_description;
	}
	stream << endl << endl;

	stream << "USAGE:" << endl
		   << indent << cli.name << " [global options] command [command options] [arguments...]";
	stream << endl << endl;

	stream << "VERSION:" << endl << indent << kEdgeDeployVersion;
	stream << endl << endl;

	if (!cli.long_description.empty()) {
		stream << "DESCRIPTION:" << endl << indent << cli.long_description << endl;
		stream << common_description_append;
		stream << endl << endl;
	}

	stream << "COMMANDS:" << endl;
	vector<HelpRow> commands;
	for (const auto &command : cli.commands) {
		commands.emplace_back(command.name, command.description);
	}
	PrintTable(commands, stream);
	stream << endl;

	stream << "GLOBAL OPTIONS:" << endl;
	PrintOptions(common_global_options, stream);
}

bool FindCmdlineHelpArg(vector<string>::const_iterator start, vector<string>::const_iterator end) {
	// Only look for the flag. Anything else is validated by the command parser.
	for (auto it = start; it != end; ++it) {
		if (*it == "--") {
			break;
		}
		if (*it == "--help" || *it == "-h") {
			return true;
		}
	}
	return false;
}

void PrintCliCommandHelp(const CliApp &cli, const string &command_name, ostream &stream) {
	auto match_on_name = [command_name](const CliCommand &cmd) { return cmd.name == command_name; };

	auto cmd = std::find_if(cli.commands.begin(), cli.commands.end(), match_on_name);
	if (cmd != cli.commands.end()) {
		PrintCommandHelp(cli.name, *cmd, stream);
	} else {
		PrintCliHelp(cli, stream);
	}
}

static OptsSet OptsSetFromCliOpts(const vector<CliOption> &options, bool without_value) {
	OptsSet opts {};
	for (auto const &opt : options) {
		if ((without_value && opt.parameter.empty())
			|| (!without_value && !opt.parameter.empty())) {
			if (!opt.long_option.empty()) {
				opts.insert("--" + opt.long_option);
			}
			if (!opt.short_option.empty()) {
				opts.insert("-" + opt.short_option);
			}
		}
	}
	return opts;
}

const OptsSet GlobalOptsSetWithValue() {
	return OptsSetFromCliOpts(common_global_options, false);
}

const OptsSet GlobalOptsSetWithoutValue() {
	return OptsSetFromCliOpts(common_global_options, true);
}

const OptsSet CommandOptsSetWithValue(const vector<CliOption> &options) {
	return OptsSetFromCliOpts(options, false);
}

const OptsSet CommandOptsSetWithoutValue(const vector<CliOption> &options) {
	return OptsSetFromCliOpts(options, true);
}

} // namespace conf
} // namespace common
} // namespace edgedeploy
