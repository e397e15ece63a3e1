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


#include <common/io.hpp>

#include <cerrno>
#include <sstream>
#include <system_error>

#include <common/path.hpp>

namespace edgedeploy {
namespace common {
namespace io {

namespace path = edgedeploy::common::path;

ExpectedIfstream OpenIfstream(const string &path) {
	ifstream is;
	errno = 0;
	is.open(path);
	if (!is) {
		int io_errno = errno;
		return ExpectedIfstream(expected::unexpected(error::Error(
			generic_category().default_error_condition(io_errno),
			"Failed to open '" + path + "' for reading")));
	}
	return ExpectedIfstream(std::move(is));
}

ExpectedOfstream OpenOfstream(const string &path) {
	ofstream os;
	errno = 0;
	os.open(path);
	if (!os) {
		int io_errno = errno;
		return ExpectedOfstream(expected::unexpected(error::Error(
			generic_category().default_error_condition(io_errno),
			"Failed to open '" + path + "' for writing")));
	}
	return ExpectedOfstream(std::move(os));
}

error::Error WriteStringIntoOfstream(ofstream &os, const string &data) {
	errno = 0;
	os.write(data.data(), data.size());
	if (os.bad() || os.fail()) {
		int io_errno = errno;
		return error::Error(
			std::generic_category().default_error_condition(io_errno),
			"Failed to write data into the stream");
	}

	return error::NoError;
}

expected::ExpectedString ReadAll(istream &is) {
	stringstream ss;
	errno = 0;
	ss << is.rdbuf();
	if (is.bad()) {
		int io_errno = errno;
		return expected::unexpected(error::Error(
			std::generic_category().default_error_condition(io_errno),
			"Failed to read from the stream"));
	}
	return ss.str();
}

error::Error WriteFileAtomically(const string &file_path, const string &data) {
	const string tmp_path = file_path + ".tmp";
	{
		auto os = OpenOfstream(tmp_path);
		if (!os) {
			return os.error();
		}
		auto err = WriteStringIntoOfstream(os.value(), data);
		if (err == error::NoError) {
			os.value().close();
			if (!os.value()) {
				err = error::Error(
					make_error_condition(errc::io_error), "Failed to close '" + tmp_path + "'");
			}
		}
		if (err != error::NoError) {
			return err.WithContext("While writing '" + tmp_path + "'")
				.FollowedBy(path::FileDelete(tmp_path));
		}
	}
	return path::Rename(tmp_path, file_path);
}

} // namespace io
} // namespace common
} // namespace edgedeploy
