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


#ifndef EDGEDEPLOY_COMMON_KEY_VALUE_DATABASE_HPP
#define EDGEDEPLOY_COMMON_KEY_VALUE_DATABASE_HPP

#include <common/error.hpp>
#include <common/expected.hpp>
#include <config.h>

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace edgedeploy {
namespace common {
namespace key_value_database {

using namespace std;

namespace expected = edgedeploy::common::expected;

class KeyValueDatabaseErrorCategoryClass : public std::error_category {
public:
	const char *name() const noexcept override;
	string message(int code) const override;
};
extern const KeyValueDatabaseErrorCategoryClass KeyValueDatabaseErrorCategory;

enum ErrorCode {
	NoError = 0,
	ParseError,
	KeyError,
	LmdbError,
	AlreadyExistsError,
};
using Error = edgedeploy::common::error::Error;

using ExpectedBytes = expected::ExpectedBytes;

class Transaction {
public:
	virtual ~Transaction() {};

	virtual ExpectedBytes Read(const string &key) = 0;
	virtual Error Write(const string &key, const vector<uint8_t> &value) = 0;
	virtual Error Remove(const string &key) = 0;
};

// Also usable as a plain Transaction, in which case every operation runs in its own
// transaction.
class KeyValueDatabase : virtual public Transaction {
public:
	// Changes are committed only if `txnFunc` returns NoError.
	virtual Error WriteTransaction(function<Error(Transaction &)> txnFunc) = 0;
	virtual Error ReadTransaction(function<Error(Transaction &)> txnFunc) = 0;
};

Error MakeError(ErrorCode code, const string &msg);

// Reads `key` as a string. A missing key gives an empty string when `missing_ok` is set.
expected::ExpectedString ReadString(Transaction &txn, const string &key, bool missing_ok);

} // namespace key_value_database
} // namespace common
} // namespace edgedeploy

#endif // EDGEDEPLOY_COMMON_KEY_VALUE_DATABASE_HPP
