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


#include <common/key_value_database_lmdb.hpp>

#include <string_view>

#include <lmdb++.h>

#include <common/common.hpp>
#include <common/log.hpp>
#include <common/path.hpp>

namespace edgedeploy {
namespace common {
namespace key_value_database {

namespace log = edgedeploy::common::log;
namespace path = edgedeploy::common::path;

const string kBrokenSuffix {"-broken"};

class LmdbTransaction : public Transaction {
public:
	LmdbTransaction(lmdb::txn &txn, lmdb::dbi &dbi);

	expected::ExpectedBytes Read(const string &key) override;
	error::Error Write(const string &key, const vector<uint8_t> &value) override;
	error::Error Remove(const string &key) override;

private:
	lmdb::txn &txn_;
	lmdb::dbi &dbi_;
};

LmdbTransaction::LmdbTransaction(lmdb::txn &txn, lmdb::dbi &dbi) :
	txn_ {txn},
	dbi_ {dbi} {
}

expected::ExpectedBytes LmdbTransaction::Read(const string &key) {
	try {
		std::string_view value;
		bool exists = dbi_.get(txn_, key, value);
		if (!exists) {
			return expected::unexpected(
				MakeError(KeyError, "Key " + key + " not found in database"));
		}

		return common::ByteVectorFromString(value);
	} catch (std::runtime_error &e) {
		return expected::unexpected(MakeError(LmdbError, e.what()));
	}
}

error::Error LmdbTransaction::Write(const string &key, const vector<uint8_t> &value) {
	try {
		std::string_view data(reinterpret_cast<const char *>(value.data()), value.size());
		bool written = dbi_.put(txn_, key, data);
		if (!written) {
			return MakeError(AlreadyExistsError, "Key " + key + " already exists");
		}

		return error::NoError;
	} catch (std::runtime_error &e) {
		return MakeError(LmdbError, e.what());
	}
}

error::Error LmdbTransaction::Remove(const string &key) {
	try {
		// Removing an absent key is fine.
		dbi_.del(txn_, key);

		return error::NoError;
	} catch (std::runtime_error &e) {
		return MakeError(LmdbError, e.what());
	}
}

KeyValueDatabaseLmdb::KeyValueDatabaseLmdb() {
}

KeyValueDatabaseLmdb::~KeyValueDatabaseLmdb() {
	Close();
}

error::Error KeyValueDatabaseLmdb::Open(const string &path) {
	return OpenInternal(path, true);
}

error::Error KeyValueDatabaseLmdb::OpenInternal(const string &db_path, bool try_recovery) {
	Close();

	env_.reset(new lmdb::env(lmdb::env::create()));

	try {
		env_->open(db_path.c_str(), MDB_NOSUBDIR, 0600);
	} catch (std::runtime_error &e) {
		auto err {MakeError(LmdbError, e.what()).WithContext("Opening LMDB database failed")};
		env_.reset();

		if (!try_recovery || !path::FileExists(db_path)) {
			return err;
		}

		log::Warning(
			"Could not open the deployment store, starting with an empty one. The original is kept at `"
			+ db_path + kBrokenSuffix + "`");

		auto rename_err = path::Rename(db_path, db_path + kBrokenSuffix);
		if (rename_err != error::NoError) {
			return err.FollowedBy(rename_err);
		}

		auto err2 = OpenInternal(db_path, false);
		if (err2 != error::NoError) {
			return err.FollowedBy(err2);
		}
	}

	return error::NoError;
}

void KeyValueDatabaseLmdb::Close() {
	env_.reset();
}

expected::ExpectedBytes KeyValueDatabaseLmdb::Read(const string &key) {
	vector<uint8_t> ret;
	auto err = ReadTransaction([&key, &ret](Transaction &txn) -> error::Error {
		auto result = txn.Read(key);
		if (!result) {
			return result.error();
		}
		ret = std::move(result.value());
		return error::NoError;
	});
	if (err != error::NoError) {
		return expected::unexpected(err);
	}
	return ret;
}

error::Error KeyValueDatabaseLmdb::Write(const string &key, const vector<uint8_t> &value) {
	return WriteTransaction(
		[&key, &value](Transaction &txn) -> error::Error { return txn.Write(key, value); });
}

error::Error KeyValueDatabaseLmdb::Remove(const string &key) {
	return WriteTransaction([&key](Transaction &txn) -> error::Error { return txn.Remove(key); });
}

error::Error KeyValueDatabaseLmdb::WriteTransaction(function<error::Error(Transaction &)> txnFunc) {
	AssertOrReturnError(env_);

	try {
		lmdb::txn lmdb_txn = lmdb::txn::begin(*env_, nullptr, 0);
		lmdb::dbi lmdb_dbi = lmdb::dbi::open(lmdb_txn, nullptr, 0);
		LmdbTransaction txn(lmdb_txn, lmdb_dbi);
		auto err = txnFunc(txn);
		if (err != error::NoError) {
			lmdb_txn.abort();
		} else {
			lmdb_txn.commit();
		}
		return err;
	} catch (std::runtime_error &e) {
		return MakeError(LmdbError, e.what());
	}
}

error::Error KeyValueDatabaseLmdb::ReadTransaction(function<error::Error(Transaction &)> txnFunc) {
	AssertOrReturnError(env_);

	try {
		lmdb::txn lmdb_txn = lmdb::txn::begin(*env_, nullptr, MDB_RDONLY);
		lmdb::dbi lmdb_dbi = lmdb::dbi::open(lmdb_txn, nullptr, 0);
		LmdbTransaction txn(lmdb_txn, lmdb_dbi);
		return txnFunc(txn);
	} catch (std::runtime_error &e) {
		return MakeError(LmdbError, e.what());
	}
}

} // namespace key_value_database
} // namespace common
} // namespace edgedeploy
