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


#include <edgedeploy-core/daemon/spool.hpp>

#include <cerrno>
#include <fstream>

#include <common/common.hpp>
#include <common/io.hpp>
#include <common/json.hpp>
#include <common/path.hpp>

namespace edgedeploy {
namespace core {
namespace daemon {
namespace spool {

namespace common = edgedeploy::common;
namespace io = edgedeploy::common::io;
namespace json = edgedeploy::common::json;
namespace path = edgedeploy::common::path;

const string kSubmissionSuffix {".json"};

deployment::ExpectedDeployment ParseSubmission(const string &content, int64_t submitted_at) {
	auto submission = json::Load(content);
	if (!submission) {
		return expected::unexpected(submission.error());
	}
	auto type_str = json::Get<string>(submission.value(), "type", json::MissingOk::No);
	if (!type_str) {
		return expected::unexpected(type_str.error());
	}
	auto type = deployment::DeploymentTypeFromString(type_str.value());
	if (!type) {
		return expected::unexpected(type.error());
	}
	auto document = submission.value().Get("document");
	if (!document) {
		return expected::unexpected(document.error());
	}
	if (!document.value().IsObject()) {
		return expected::unexpected(deployment::MakeError(
			deployment::DocumentParseError, "The submitted document is not a JSON object"));
	}
	return deployment::Deployment::FromString(type.value(), document.value().Dump(-1), submitted_at);
}

expected::ExpectedString WriteSubmission(
	const string &dir, deployment::DeploymentType type, const string &document) {
	auto doc = json::Load(document);
	if (!doc) {
		return expected::unexpected(doc.error());
	}
	auto parsed = deployment::ParseDocument(doc.value(), type);
	if (!parsed) {
		return expected::unexpected(parsed.error());
	}

	auto err = path::CreateDirectories(dir);
	if (err != error::NoError) {
		return expected::unexpected(err);
	}

	auto now = chrono::system_clock::now().time_since_epoch();
	auto file_name =
		to_string(chrono::duration_cast<chrono::nanoseconds>(now).count()) + kSubmissionSuffix;
	auto file_path = path::Join(dir, file_name);

	string content = R"({"type":")" + deployment::DeploymentTypeToString(type)
					 + R"(","document":)" + doc.value().Dump(-1) + "}";
	err = io::WriteFileAtomically(file_path, content);
	if (err != error::NoError) {
		return expected::unexpected(err);
	}
	return file_path;
}

SpoolListener::SpoolListener(
	events::EventLoop &loop, const string &dir, chrono::seconds interval, SubmitFunc submit) :
	dir_ {dir},
	interval_ {interval},
	submit_ {submit},
	timer_ {loop},
	logger_ {"spool"} {
}

SpoolListener::~SpoolListener() {
	Stop();
}

void SpoolListener::Start() {
	if (running_) {
		return;
	}
	running_ = true;
	logger_.Info("Watching '" + dir_ + "' for deployment submissions");

	auto scanned = ScanOnce();
	if (!scanned) {
		logger_.Error(scanned.error().String());
	}
	ScheduleNext();
}

void SpoolListener::Stop() {
	running_ = false;
	timer_.Cancel();
}

void SpoolListener::ScheduleNext() {
	timer_.AsyncWait(interval_, [this](error::Error err) {
		if (err.code == make_error_condition(errc::operation_canceled) || !running_) {
			return;
		}
		if (err != error::NoError) {
			logger_.Error("Spool timer failed: " + err.String());
		} else {
			auto scanned = ScanOnce();
			if (!scanned) {
				logger_.Error(scanned.error().String());
			}
		}
		ScheduleNext();
	});
}

expected::ExpectedSize SpoolListener::ScanOnce() {
	auto files = path::ListFiles(dir_, [](const string &file) {
		return common::EndsWith(file, kSubmissionSuffix);
	});
	if (!files) {
		if (files.error().IsErrno(ENOENT)) {
			logger_.Trace("Spool directory '" + dir_ + "' does not exist yet");
			return 0;
		}
		return expected::unexpected(files.error().WithContext("While scanning the spool"));
	}

	size_t submitted = 0;
	for (const auto &file : files.value()) {
		auto file_log = logger_.WithFields(log::LogField {"file", file});

		auto now = chrono::system_clock::now().time_since_epoch();
		auto submitted_at = chrono::duration_cast<chrono::milliseconds>(now).count();
		auto dep = io::OpenIfstream(file)
					   .and_then([](ifstream is) { return io::ReadAll(is); })
					   .and_then([submitted_at](const string &data) {
						   return ParseSubmission(data, submitted_at);
					   });
		if (dep) {
			file_log.Info(
				"Picked up " + deployment::DeploymentTypeToString(dep.value().Type())
				+ " deployment " + dep.value().Id());
			submit_(dep.value());
			++submitted;
		} else {
			file_log.Error("Discarding invalid submission: " + dep.error().String());
		}

		auto err = path::FileDelete(file);
		if (err != error::NoError) {
			// The queue ignores it if it is offered again.
			file_log.Warning("Could not remove the submission: " + err.String());
		}
	}
	return submitted;
}

} // namespace spool
} // namespace daemon
} // namespace core
} // namespace edgedeploy
