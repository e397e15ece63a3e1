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


#ifndef EDGEDEPLOY_CORE_CONFIG_VALIDATION_HPP
#define EDGEDEPLOY_CORE_CONFIG_VALIDATION_HPP

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include <common/error.hpp>
#include <common/events.hpp>
#include <common/expected.hpp>
#include <common/log.hpp>

#include <edgedeploy-core/config_tree.hpp>

namespace edgedeploy {
namespace core {
namespace config_validation {

using namespace std;

namespace config_tree = edgedeploy::core::config_tree;
namespace error = edgedeploy::common::error;
namespace events = edgedeploy::common::events;
namespace expected = edgedeploy::common::expected;
namespace log = edgedeploy::common::log;

struct ValidityReport {
	bool accepted {true};
	// Why the configuration was rejected.
	string message;
};

// The components' side of configuration validation.
class ValidationClient {
public:
	using ReportHandler = function<void(ValidityReport)>;

	virtual ~ValidationClient() {
	}

	// Hands the configuration a running component is about to get to the component. Returns
	// false if the component does not validate configurations, and then `handler` is never
	// called. Otherwise `handler` may be called from any thread, at most once.
	virtual expected::ExpectedBool RequestValidation(
		const string &component,
		const string &deployment_id,
		const config_tree::Value &configuration,
		ReportHandler handler) = 0;
};

// Called with `NoError` once every asked component accepted, and with
// `ConfigurationValidationError` if one rejected, could not be asked, or did not answer in time.
using ValidationHandler = function<void(error::Error)>;

// Must be used from the event loop thread only.
class ConfigurationValidator {
public:
	ConfigurationValidator(events::EventLoop &loop, ValidationClient &client);
	~ConfigurationValidator();

	ConfigurationValidator(const ConfigurationValidator &) = delete;
	ConfigurationValidator &operator=(const ConfigurationValidator &) = delete;

	// `configurations` maps each component to the configuration it is going to get.
	void Start(
		const string &deployment_id,
		const map<string, config_tree::Value> &configurations,
		chrono::milliseconds timeout,
		ValidationHandler handler);

	bool InProgress() const {
		return handler_ != nullptr;
	}

private:
	void OnReport(uint64_t generation, const string &component, ValidityReport report);
	void OnTimeout();
	void Finish(error::Error err);

	log::Logger Log() {
		return logger_.WithFields(log::LogField {"deployment_id", deployment_id_});
	}

	events::EventLoop &loop_;
	ValidationClient &client_;
	log::Logger logger_;

	uint64_t generation_ {0};
	string deployment_id_;
	ValidationHandler handler_;
	set<string> outstanding_;
	// "<component> (<message>)" of every rejection.
	vector<string> rejections_;

	events::Timer timeout_timer_;

	shared_ptr<bool> destroyed_;
};

} // namespace config_validation
} // namespace core
} // namespace edgedeploy

#endif // EDGEDEPLOY_CORE_CONFIG_VALIDATION_HPP
