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


#ifndef EDGEDEPLOY_LOG_HPP
#define EDGEDEPLOY_LOG_HPP

#include <config.h>

#ifdef EDGEDEPLOY_LOG_BOOST
#include <boost/log/common.hpp>
#include <boost/log/sources/logger.hpp>
#endif

#include <string>

#include <common/error.hpp>
#include <common/expected.hpp>

namespace edgedeploy {
namespace common {
namespace log {

using namespace std;

namespace error = edgedeploy::common::error;
namespace expected = edgedeploy::common::expected;

enum LogErrorCode {
	NoError = 0,
	InvalidLogLevelError,
	LogFileError,
};

class LogErrorCategoryClass : public std::error_category {
public:
	const char *name() const noexcept override;
	string message(int code) const override;
};
extern const LogErrorCategoryClass LogErrorCategory;

error::Error MakeError(LogErrorCode code, const string &msg);

// A key/value pair rendered into every record of a logger, e.g. the id of the deployment
// being processed.
struct LogField {
	LogField(const string &key, const string &value) :
		key(key),
		value(value) {
	}

	string key;
	string value;
};

enum class LogLevel {
	Fatal = 0,
	Error = 1,
	Warning = 2,
	Info = 3,
	Debug = 4,
	Trace = 5,
};

const LogLevel kDefaultLogLevel = LogLevel::Info;

using ExpectedLogLevel = expected::expected<LogLevel, error::Error>;

string ToStringLogLevel(LogLevel lvl);
ExpectedLogLevel StringToLogLevel(const string &level_str);

class Logger {
public:
	explicit Logger(const string &name);
	Logger(const string &name, LogLevel level);

	void SetLevel(LogLevel level);
	LogLevel Level();

	// Returns a copy of this logger that adds the given fields to its records.
	template <typename... Fields>
	Logger WithFields(const Fields &...fields) {
		auto l = *this;
		for (const auto &f : {fields...}) {
			l.AddField(f);
		}
		return l;
	}

	void Log(LogLevel level, const string &message) {
		if (level <= level_) {
			Log_(level, message);
		}
	}

	void Error(const string &message) {
		Log(LogLevel::Error, message);
	}
	void Warning(const string &message) {
		Log(LogLevel::Warning, message);
	}
	void Info(const string &message) {
		Log(LogLevel::Info, message);
	}
	void Debug(const string &message) {
		Log(LogLevel::Debug, message);
	}
	void Trace(const string &message) {
		Log(LogLevel::Trace, message);
	}

private:
	void AddField(const LogField &field);
	void Log_(LogLevel level, const string &message);

#ifdef EDGEDEPLOY_LOG_BOOST
	boost::log::sources::severity_logger<LogLevel> logger_;
#endif
	string name_;
	LogLevel level_;
};

// Process wide logger. Named loggers start out at its level.

extern Logger global_logger_;

// Replaces all sinks with the default stderr sink.
void Setup();

void SetLevel(LogLevel level);
LogLevel Level();

// Adds a sink writing to `log_file_path`. With `exclusive` it replaces the other sinks.
error::Error SetupFileLogging(const string &log_file_path, bool exclusive);

template <typename... Fields>
Logger WithFields(const Fields &...fields) {
	return global_logger_.WithFields(fields...);
}

void Error(const string &message);
void Warning(const string &message);
void Info(const string &message);
void Debug(const string &message);
void Trace(const string &message);

} // namespace log
} // namespace common
} // namespace edgedeploy

#endif // EDGEDEPLOY_LOG_HPP
