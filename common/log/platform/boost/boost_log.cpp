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


#include <common/log.hpp>

#include <boost/smart_ptr/shared_ptr.hpp>
#include <boost/smart_ptr/make_shared_object.hpp>
#include <boost/core/null_deleter.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/log/common.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/attributes.hpp>
#include <boost/log/sinks.hpp>
#include <boost/log/sources/logger.hpp>
#include <boost/log/support/date_time.hpp>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iostream>
#include <string>
#include <utility>

namespace edgedeploy {
namespace common {
namespace log {

namespace logging = boost::log;
namespace expr = boost::log::expressions;
namespace sinks = boost::log::sinks;
namespace attrs = boost::log::attributes;
namespace src = boost::log::sources;

using namespace std;

using TextSink = sinks::synchronous_sink<sinks::text_ostream_backend>;

const LogErrorCategoryClass LogErrorCategory;

const char *LogErrorCategoryClass::name() const noexcept {
	return "LogErrorCategory";
}

string LogErrorCategoryClass::message(int code) const {
	switch (code) {
	case NoError:
		return "Success";
	case InvalidLogLevelError:
		return "Invalid log level given";
	case LogFileError:
		return "Bad log file";
	}
	return "Unknown";
}

error::Error MakeError(LogErrorCode code, const string &msg) {
	return error::Error(error_condition(code, LogErrorCategory), msg);
}

static const pair<LogLevel, const char *> kLevelNames[] = {
	{LogLevel::Fatal, "fatal"},
	{LogLevel::Error, "error"},
	{LogLevel::Warning, "warning"},
	{LogLevel::Info, "info"},
	{LogLevel::Debug, "debug"},
	{LogLevel::Trace, "trace"},
};

string ToStringLogLevel(LogLevel lvl) {
	for (const auto &entry : kLevelNames) {
		if (entry.first == lvl) {
			return entry.second;
		}
	}
	return "unknown";
}

ExpectedLogLevel StringToLogLevel(const string &level_str) {
	for (const auto &entry : kLevelNames) {
		if (level_str == entry.second) {
			return entry.first;
		}
	}
	return expected::unexpected(MakeError(
		LogErrorCode::InvalidLogLevelError, "'" + level_str + "' is not a valid log level"));
}

// Quotes and line breaks in a value would split a logfmt record. Messages regularly carry
// JSON, so they are escaped.
static void WriteQuoted(logging::formatting_ostream &strm, const string &value) {
	strm << '"';
	for (auto c : value) {
		switch (c) {
		case '"':
			strm << "\\\"";
			break;
		case '\\':
			strm << "\\\\";
			break;
		case '\n':
			strm << "\\n";
			break;
		case '\r':
			strm << "\\r";
			break;
		case '\t':
			strm << "\\t";
			break;
		default:
			strm << c;
		}
	}
	strm << '"';
}

static void LogfmtFormatter(logging::record_view const &rec, logging::formatting_ostream &strm) {
	strm << "record_id=" << logging::extract<unsigned int>("RecordID", rec) << " ";

	auto level = logging::extract<LogLevel>("Severity", rec);
	if (level) {
		strm << "severity=" << ToStringLogLevel(level.get()) << " ";
	}

	auto stamp = logging::extract<boost::posix_time::ptime>("TimeStamp", rec);
	if (stamp) {
		strm << "time=\"" << stamp.get() << "\" ";
	}

	auto name = logging::extract<string>("Name", rec);
	if (name) {
		strm << "name=";
		WriteQuoted(strm, name.get());
		strm << " ";
	}

	for (const auto &attr : rec.attribute_values()) {
		auto field = logging::extract<LogField>(attr.first.string(), rec);
		if (field) {
			strm << field.get().key << "=";
			WriteQuoted(strm, field.get().value);
			strm << " ";
		}
	}

	auto message = rec[expr::smessage];
	strm << "msg=";
	WriteQuoted(strm, message ? message.get() : string());
}

static void AddStreamSink(boost::shared_ptr<ostream> stream) {
	auto sink = boost::make_shared<TextSink>();
	{
		auto backend = sink->locked_backend();
		backend->add_stream(stream);
		backend->auto_flush(true);
	}
	sink->set_formatter(&LogfmtFormatter);
	logging::core::get()->add_sink(sink);
}

static void AddStderrSink() {
	AddStreamSink(boost::shared_ptr<ostream>(&clog, boost::null_deleter()));
}

static Logger InitGlobalLogger() {
	AddStderrSink();

	auto core = logging::core::get();
	core->add_global_attribute("RecordID", attrs::counter<unsigned int>(1));
	core->add_global_attribute("TimeStamp", attrs::local_clock());

	return Logger("Global", kDefaultLogLevel);
}

Logger global_logger_ = InitGlobalLogger();

Logger::Logger(const string &name) :
	Logger {name, global_logger_.Level()} {
}

Logger::Logger(const string &name, LogLevel level) :
	name_ {name},
	level_ {level} {
	logger_.add_attribute("Name", attrs::constant<string>(name));
}

void Logger::Log_(LogLevel level, const string &message) {
	BOOST_LOG_SEV(logger_, level) << message;
}

void Logger::SetLevel(LogLevel level) {
	level_ = level;
}

LogLevel Logger::Level() {
	return level_;
}

void Logger::AddField(const LogField &field) {
	auto added = logger_.add_attribute(field.key, attrs::constant<LogField>(field));
	if (!added.second) {
		// Boost keeps the first value of a key. The newest one wins here.
		logger_.remove_attribute(added.first);
		logger_.add_attribute(field.key, attrs::constant<LogField>(field));
	}
}

void Setup() {
	logging::core::get()->remove_all_sinks();
	AddStderrSink();
}

void SetLevel(LogLevel level) {
	global_logger_.SetLevel(level);
}

LogLevel Level() {
	return global_logger_.Level();
}

error::Error SetupFileLogging(const string &log_file_path, bool exclusive) {
	auto log_stream = boost::make_shared<ofstream>();
	errno = 0;
	log_stream->open(log_file_path, ios::out | ios::app);
	if (!*log_stream) {
		auto io_errno = errno;
		return MakeError(
			LogErrorCode::LogFileError,
			"Failed to open '" + log_file_path + "' for logging: " + strerror(io_errno));
	}

	if (exclusive) {
		logging::core::get()->remove_all_sinks();
	}
	AddStreamSink(log_stream);

	return error::NoError;
}

void Error(const string &message) {
	global_logger_.Error(message);
}
void Warning(const string &message) {
	global_logger_.Warning(message);
}
void Info(const string &message) {
	global_logger_.Info(message);
}
void Debug(const string &message) {
	global_logger_.Debug(message);
}
void Trace(const string &message) {
	global_logger_.Trace(message);
}

} // namespace log
} // namespace common
} // namespace edgedeploy
