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


#include <edgedeploy-core/cli/cli.hpp>

#include <iostream>

#include <common/conf.hpp>
#include <common/error.hpp>
#include <common/expected.hpp>

namespace edgedeploy {
namespace core {
namespace cli {

namespace conf = edgedeploy::common::conf;
namespace error = edgedeploy::common::error;
namespace expected = edgedeploy::common::expected;

const conf::CliOption opt_type {
	.long_option = "type",
	.short_option = "t",
	.description = "Source of the deployment: local, shadow or cloud-job",
	.default_value = "local",
	.parameter = "TYPE",
};

const conf::CliCommand cmd_daemon {
	.name = "daemon",
	.description = "Start the deployment service",
};

const conf::CliCommand cmd_deploy {
	.name = "deploy",
	.description =
		"Run one local deployment in the foreground. Returns (1) unless it succeeds, "
		"with the deployment service stopped",
	.argument =
		conf::CliArgument {
			.name = "document",
			.mandatory = true,
		},
};

const conf::CliCommand cmd_resolve {
	.name = "resolve",
	.description = "Print the state a deployment would lead to, without applying anything",
	.argument =
		conf::CliArgument {
			.name = "document",
			.mandatory = true,
		},
	.options = {opt_type},
};

const conf::CliCommand cmd_show_state {
	.name = "show-state",
	.description = "Print the root components and the current state of the device",
};

const conf::CliCommand cmd_submit {
	.name = "submit",
	.description = "Hand a deployment document over to the running deployment service",
	.argument =
		conf::CliArgument {
			.name = "document",
			.mandatory = true,
		},
	.options = {opt_type},
};

const conf::CliApp cli_edgedeploy = {
	.name = "edgedeploy",
	.short_description = "deploy components to edge devices",
	.long_description =
		R"(edgedeploy drives the components of the device to the state described by
   deployment documents. Documents are read from a FILE, or from standard input with "-".)",
	.commands =
		{
			cmd_daemon,
			cmd_deploy,
			cmd_resolve,
			cmd_show_state,
			cmd_submit,
		},
};

static error::Error NoExtraArguments(
	vector<string>::const_iterator start, vector<string>::const_iterator end) {
	conf::CmdlineOptionsIterator iter(start, end, {}, {});
	auto arg = iter.Next();
	if (!arg) {
		return arg.error();
	}
	return error::NoError;
}

struct DocumentArguments {
	string src;
	deployment::DeploymentType type {deployment::DeploymentType::Local};
};
using ExpectedDocumentArguments = expected::expected<DocumentArguments, error::Error>;

static ExpectedDocumentArguments ParseDocumentArguments(
	const conf::CliCommand &cmd,
	vector<string>::const_iterator start,
	vector<string>::const_iterator end) {
	conf::CmdlineOptionsIterator iter(start, end, conf::CommandOptsSetWithValue(cmd.options), {});
	iter.SetArgumentsMode(conf::ArgumentsMode::AcceptBareArguments);

	DocumentArguments result;
	while (true) {
		auto arg = iter.Next();
		if (!arg) {
			return expected::unexpected(arg.error());
		}

		auto value = arg.value();
		if (value.option == "--type" || value.option == "-t") {
			auto type = deployment::DeploymentTypeFromString(value.value);
			if (!type) {
				return expected::unexpected(conf::MakeError(
					conf::InvalidOptionsError, "Invalid deployment type: " + value.value));
			}
			result.type = type.value();
			continue;
		} else if (value.option != "") {
			return expected::unexpected(
				conf::MakeError(conf::InvalidOptionsError, "No such option: " + value.option));
		}

		if (value.value != "") {
			if (result.src != "") {
				return expected::unexpected(conf::MakeError(
					conf::InvalidOptionsError, "Too many arguments: " + value.value));
			}
			result.src = value.value;
		} else {
			if (result.src == "") {
				return expected::unexpected(conf::MakeError(
					conf::InvalidOptionsError, "Need a path to a deployment document"));
			}
			break;
		}
	}
	return result;
}

ExpectedActionPtr ParseCommandArguments(
	vector<string>::const_iterator start, vector<string>::const_iterator end) {
	if (start == end) {
		return expected::unexpected(conf::MakeError(conf::InvalidOptionsError, "Need a command"));
	}

	bool help_arg = conf::FindCmdlineHelpArg(start + 1, end);
	if (help_arg) {
		conf::PrintCliCommandHelp(cli_edgedeploy, start[0]);
		return expected::unexpected(error::MakeError(error::ExitWithSuccessError, ""));
	}

	if (start[0] == "daemon") {
		auto err = NoExtraArguments(start + 1, end);
		if (err != error::NoError) {
			return expected::unexpected(err);
		}
		return make_shared<DaemonAction>();
	} else if (start[0] == "show-state") {
		auto err = NoExtraArguments(start + 1, end);
		if (err != error::NoError) {
			return expected::unexpected(err);
		}
		return make_shared<ShowStateAction>();
	} else if (start[0] == "deploy") {
		auto args = ParseDocumentArguments(cmd_deploy, start + 1, end);
		if (!args) {
			return expected::unexpected(args.error());
		}
		return make_shared<DeployAction>(args.value().src);
	} else if (start[0] == "submit") {
		auto args = ParseDocumentArguments(cmd_submit, start + 1, end);
		if (!args) {
			return expected::unexpected(args.error());
		}
		return make_shared<SubmitAction>(args.value().src, args.value().type);
	} else if (start[0] == "resolve") {
		auto args = ParseDocumentArguments(cmd_resolve, start + 1, end);
		if (!args) {
			return expected::unexpected(args.error());
		}
		return make_shared<ResolveAction>(args.value().src, args.value().type);
	} else {
		return expected::unexpected(
			conf::MakeError(conf::InvalidOptionsError, "No such command: " + start[0]));
	}
}

static error::Error DoMain(const vector<string> &args, function<void(MainContext &ctx)> test_hook) {
	conf::EdgeDeployConfig config;

	auto args_pos = config.ProcessCmdlineArgs(args.begin(), args.end(), cli_edgedeploy);
	if (!args_pos) {
		if (args_pos.error().code != error::MakeError(error::ExitWithSuccessError, "").code) {
			conf::PrintCliHelp(cli_edgedeploy);
		}
		return args_pos.error();
	}

	auto action = ParseCommandArguments(args.begin() + args_pos.value(), args.end());
	if (!action) {
		if (action.error().code != error::MakeError(error::ExitWithSuccessError, "").code) {
			if (args.size() > args_pos.value()) {
				conf::PrintCliCommandHelp(cli_edgedeploy, args[args_pos.value()]);
			} else {
				conf::PrintCliHelp(cli_edgedeploy);
			}
		}
		return action.error();
	}

	MainContext main_context(config);

	test_hook(main_context);

	auto err = main_context.Initialize();
	if (error::NoError != err) {
		return err;
	}

	return action.value()->Execute(main_context);
}

int Main(const vector<string> &args, function<void(MainContext &ctx)> test_hook) {
	auto err = DoMain(args, test_hook);

	if (err != error::NoError) {
		if (err.code == error::MakeError(error::ExitWithSuccessError, "").code) {
			return 0;
		} else if (err.code != error::MakeError(error::ExitWithFailureError, "").code) {
			cerr << "Could not fulfill request: " + err.String() << endl;
		}
		return 1;
	}

	return 0;
}

} // namespace cli
} // namespace core
} // namespace edgedeploy
