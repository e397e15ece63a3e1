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


#ifndef EDGEDEPLOY_CORE_DAEMON_SPOOL_HPP
#define EDGEDEPLOY_CORE_DAEMON_SPOOL_HPP

#include <chrono>
#include <functional>
#include <string>

#include <common/error.hpp>
#include <common/events.hpp>
#include <common/expected.hpp>
#include <common/log.hpp>

#include <edgedeploy-core/deployment.hpp>

namespace edgedeploy {
namespace core {
namespace daemon {
namespace spool {

using namespace std;

namespace error = edgedeploy::common::error;
namespace events = edgedeploy::common::events;
namespace expected = edgedeploy::common::expected;
namespace log = edgedeploy::common::log;

namespace deployment = edgedeploy::core::deployment;

// Extension of the files picked up from the spool directory.
extern const string kSubmissionSuffix;

// Parses a submission file: `{"type": "local", "document": {...}}`.
deployment::ExpectedDeployment ParseSubmission(const string &content, int64_t submitted_at);

// Validates `document` and drops it into `dir` for a running daemon. Returns the path of the
// new submission.
expected::ExpectedString WriteSubmission(
	const string &dir, deployment::DeploymentType type, const string &document);

using SubmitFunc = function<void(const deployment::Deployment &)>;

// Polls the spool directory on the event loop. Every submission found is handed to `submit` and
// deleted, whether it could be parsed or not.
class SpoolListener {
public:
	SpoolListener(
		events::EventLoop &loop, const string &dir, chrono::seconds interval, SubmitFunc submit);
	~SpoolListener();

	// Scans once right away and then every `interval`.
	void Start();
	void Stop();

	// Returns the number of deployments submitted.
	expected::ExpectedSize ScanOnce();

private:
	void ScheduleNext();

	string dir_;
	chrono::seconds interval_;
	SubmitFunc submit_;
	events::Timer timer_;
	bool running_ {false};
	log::Logger logger_;
};

} // namespace spool
} // namespace daemon
} // namespace core
} // namespace edgedeploy

#endif // EDGEDEPLOY_CORE_DAEMON_SPOOL_HPP
