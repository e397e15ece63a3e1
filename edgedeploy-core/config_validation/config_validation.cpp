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


#include <edgedeploy-core/config_validation.hpp>

#include <edgedeploy-core/deployment.hpp>

namespace edgedeploy {
namespace core {
namespace config_validation {

namespace deployment = edgedeploy::core::deployment;

static string Join(const vector<string> &items) {
	string ret;
	for (const auto &item : items) {
		ret += (ret.empty() ? "" : ", ") + item;
	}
	return ret;
}

ConfigurationValidator::ConfigurationValidator(events::EventLoop &loop, ValidationClient &client) :
	loop_ {loop},
	client_ {client},
	logger_ {"config_validation"},
	timeout_timer_ {loop},
	destroyed_ {make_shared<bool>(false)} {
}

ConfigurationValidator::~ConfigurationValidator() {
	*destroyed_ = true;
}

void ConfigurationValidator::Start(
	const string &deployment_id,
	const map<string, config_tree::Value> &configurations,
	chrono::milliseconds timeout,
	ValidationHandler handler) {
	if (InProgress()) {
		handler(error::MakeError(
			error::ProgrammingError, "Configuration validation started while already in progress"));
		return;
	}

	generation_++;
	handler_ = handler;
	outstanding_.clear();
	rejections_.clear();
	deployment_id_ = deployment_id;

	auto generation = generation_;
	auto destroyed = destroyed_;
	for (const auto &entry : configurations) {
		const auto &component = entry.first;
		auto asked = client_.RequestValidation(
			component,
			deployment_id,
			entry.second,
			[this, destroyed, generation, component](ValidityReport report) {
				loop_.Post([this, destroyed, generation, component, report]() {
					if (*destroyed) {
						return;
					}
					OnReport(generation, component, report);
				});
			});
		if (!asked) {
			Finish(deployment::MakeError(
				deployment::ConfigurationValidationError,
				"Could not request validation from " + component + ": " + asked.error().String()));
			return;
		}
		if (asked.value()) {
			Log().Debug("Asked " + component + " to validate its new configuration");
			outstanding_.insert(component);
		}
	}

	if (outstanding_.empty()) {
		Log().Debug("No component validates its configuration");
		Finish(error::NoError);
		return;
	}

	timeout_timer_.AsyncWait(timeout, [this, generation](error::Error err) {
		if (err.code == make_error_condition(errc::operation_canceled) || generation != generation_) {
			return;
		}
		OnTimeout();
	});
}

void ConfigurationValidator::OnReport(
	uint64_t generation, const string &component, ValidityReport report) {
	if (generation != generation_ || !InProgress() || outstanding_.erase(component) == 0) {
		return;
	}

	if (report.accepted) {
		Log().Debug(component + " accepted its new configuration");
	} else {
		Log().Warning(component + " rejected its new configuration: " + report.message);
		rejections_.push_back(component + " (" + report.message + ")");
	}

	if (!outstanding_.empty()) {
		return;
	}
	if (rejections_.empty()) {
		Finish(error::NoError);
		return;
	}
	Finish(deployment::MakeError(
		deployment::ConfigurationValidationError,
		"Components reported that their new configuration is invalid: " + Join(rejections_)));
}

void ConfigurationValidator::OnTimeout() {
	if (!InProgress()) {
		return;
	}
	vector<string> waiting(outstanding_.begin(), outstanding_.end());
	Log().Error("Timed out waiting for the validation of " + Join(waiting));
	Finish(deployment::MakeError(
		deployment::ConfigurationValidationError,
		"Timed out waiting for the validation of " + Join(waiting)));
}

void ConfigurationValidator::Finish(error::Error err) {
	generation_++;
	timeout_timer_.Cancel();
	outstanding_.clear();

	auto handler = std::move(handler_);
	handler_ = nullptr;
	if (handler) {
		handler(err);
	}
}

} // namespace config_validation
} // namespace core
} // namespace edgedeploy
