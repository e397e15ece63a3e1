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


#ifndef EDGEDEPLOY_CORE_CLI_HPP
#define EDGEDEPLOY_CORE_CLI_HPP

#include <functional>
#include <string>
#include <vector>

#include <edgedeploy-core/cli/actions.hpp>

namespace edgedeploy {
namespace core {
namespace cli {

using namespace std;

ExpectedActionPtr ParseCommandArguments(
	vector<string>::const_iterator start, vector<string>::const_iterator end);

// Use `test_hook` to modify the context during tests that test the command line directly.
int Main(
	const vector<string> &args,
	function<void(MainContext &ctx)> test_hook = [](MainContext &ctx) {});

} // namespace cli
} // namespace core
} // namespace edgedeploy

#endif // EDGEDEPLOY_CORE_CLI_HPP
