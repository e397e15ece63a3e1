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


#ifndef EDGEDEPLOY_COMMON_LMDB_HPP
#define EDGEDEPLOY_COMMON_LMDB_HPP

#include <common/error.hpp>
#include <common/expected.hpp>
#include <common/key_value_database.hpp>

#include <memory>
#include <string>

namespace lmdb {
class env;
}

namespace edgedeploy {
namespace common {
namespace key_value_database {

namespace error = edgedeploy::common::error;
namespace expected = edgedeploy::common::expected;

// One instance must not be shared between threads. Separate instances may open the same file.
class KeyValueDatabaseLmdb : public KeyValueDatabase {
public:
	KeyValueDatabaseLmdb();
	~KeyValueDatabaseLmdb();

	// Opens, or creates, the single file database at `path`. An unreadable file is moved
	// aside to `path` + "-broken" and a fresh database is created in its place.
	error::Error Open(const string &path);
	void Close();

	expected::ExpectedBytes Read(const string &key) override;
	error::Error Write(const string &key, const vector<uint8_t> &value) override;
	error::Error Remove(const string &key) override;
	error::Error WriteTransaction(function<error::Error(Transaction &)> txnFunc) override;
	error::Error ReadTransaction(function<error::Error(Transaction &)> txnFunc) override;

private:
	error::Error OpenInternal(const string &path, bool try_recovery);

	unique_ptr<lmdb::env> env_;
};

} // namespace key_value_database
} // namespace common
} // namespace edgedeploy

#endif // EDGEDEPLOY_COMMON_LMDB_HPP
