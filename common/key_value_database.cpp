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


#include <common/key_value_database.hpp>

#include <common/common.hpp>

namespace edgedeploy {
namespace common {
namespace key_value_database {

const KeyValueDatabaseErrorCategoryClass KeyValueDatabaseErrorCategory;

const char *KeyValueDatabaseErrorCategoryClass::name() const noexcept {
	return "KeyValueDatabaseErrorCategory";
}

string KeyValueDatabaseErrorCategoryClass::message(int code) const {
	switch (code) {
	case NoError:
		return "Success";
	case ParseError:
		return "Parse error";
	case KeyError:
		return "Key error";
	case LmdbError:
		return "LMDB error";
	case AlreadyExistsError:
		return "Key already exists";
	default:
		return "Unknown";
	}
}

Error MakeError(ErrorCode code, const string &msg) {
	return Error(error_condition(code, KeyValueDatabaseErrorCategory), msg);
}

expected::ExpectedString ReadString(Transaction &txn, const string &key, bool missing_ok) {
	auto data = txn.Read(key);
	if (!data) {
		if (missing_ok && data.error().code == MakeError(KeyError, "").code) {
			return string();
		}
		return expected::unexpected(data.error());
	}
	return common::StringFromByteVector(data.value());
}

} // namespace key_value_database
} // namespace common
} // namespace edgedeploy
