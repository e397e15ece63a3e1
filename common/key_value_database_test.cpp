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


#include <common/common.hpp>
#include <common/key_value_database.hpp>
#include <common/key_value_database_in_memory.hpp>
#include <common/key_value_database_lmdb.hpp>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <memory>
#include <string>

#include <common/path.hpp>
#include <common/testing.hpp>

using namespace std;

namespace common = edgedeploy::common;
namespace error = edgedeploy::common::error;
namespace kvdb = edgedeploy::common::key_value_database;
namespace path = edgedeploy::common::path;
namespace mtesting = edgedeploy::common::testing;

enum class Backend {
	InMemory,
	Lmdb,
};

class KeyValueDatabaseTest : public testing::TestWithParam<Backend> {
protected:
	void SetUp() override {
		if (GetParam() == Backend::InMemory) {
			db_.reset(new kvdb::KeyValueDatabaseInMemory);
		} else {
			auto lmdb = new kvdb::KeyValueDatabaseLmdb;
			db_.reset(lmdb);
			auto err = lmdb->Open(path::Join(tmpdir_.Path(), "edgedeploy-store"));
			ASSERT_EQ(err, error::NoError) << err.String();
		}
	}

	mtesting::TemporaryDirectory tmpdir_;
	unique_ptr<kvdb::KeyValueDatabase> db_;
};

INSTANTIATE_TEST_SUITE_P(
	Backends, KeyValueDatabaseTest, testing::Values(Backend::InMemory, Backend::Lmdb));

TEST_P(KeyValueDatabaseTest, ReadWriteRemove) {
	kvdb::KeyValueDatabase &db = *db_;

	auto err = db.Write("current-state", common::ByteVectorFromString("{}"));
	EXPECT_EQ(err, error::NoError);

	auto entry = db.Read("current-state");
	ASSERT_TRUE(entry) << entry.error().String();
	EXPECT_EQ(common::StringFromByteVector(entry.value()), "{}");

	err = db.Remove("current-state");
	EXPECT_EQ(err, error::NoError);
	entry = db.Read("current-state");
	ASSERT_FALSE(entry);
	EXPECT_EQ(entry.error().code, kvdb::MakeError(kvdb::KeyError, "").code);

	// Removing again is not an error.
	EXPECT_EQ(db.Remove("current-state"), error::NoError);
}

TEST_P(KeyValueDatabaseTest, WriteTransactionCommitsAllKeys) {
	kvdb::KeyValueDatabase &db = *db_;

	auto err = db.WriteTransaction([](kvdb::Transaction &txn) -> error::Error {
		auto data = txn.Read("current-state");
		EXPECT_FALSE(data);

		auto err = txn.Write("current-state", common::ByteVectorFromString("state"));
		if (err != error::NoError) {
			return err;
		}

		// Visible inside the transaction already.
		data = txn.Read("current-state");
		EXPECT_TRUE(data);

		return txn.Write("last-known-good", common::ByteVectorFromString("good"));
	});
	ASSERT_EQ(err, error::NoError);

	EXPECT_EQ(common::StringFromByteVector(db.Read("current-state").value()), "state");
	EXPECT_EQ(common::StringFromByteVector(db.Read("last-known-good").value()), "good");
}

TEST_P(KeyValueDatabaseTest, FailedWriteTransactionRollsBack) {
	kvdb::KeyValueDatabase &db = *db_;
	ASSERT_EQ(db.Write("current-state", common::ByteVectorFromString("old")), error::NoError);

	auto failure = error::MakeError(error::GenericError, "persisting failed");
	auto err = db.WriteTransaction([&failure](kvdb::Transaction &txn) -> error::Error {
		txn.Write("current-state", common::ByteVectorFromString("new"));
		txn.Write("deployment-queue", common::ByteVectorFromString("[]"));
		txn.Remove("current-state");
		return failure;
	});
	EXPECT_EQ(err, failure);

	EXPECT_EQ(common::StringFromByteVector(db.Read("current-state").value()), "old");
	EXPECT_FALSE(db.Read("deployment-queue"));
}

TEST_P(KeyValueDatabaseTest, ReadTransactionPropagatesError) {
	kvdb::KeyValueDatabase &db = *db_;
	ASSERT_EQ(db.Write("a", common::ByteVectorFromString("1")), error::NoError);

	string seen;
	auto err = db.ReadTransaction([&seen](kvdb::Transaction &txn) -> error::Error {
		auto a = kvdb::ReadString(txn, "a", false);
		if (!a) {
			return a.error();
		}
		seen = a.value();
		auto b = txn.Read("b");
		if (!b) {
			return b.error();
		}
		return error::NoError;
	});
	EXPECT_EQ(seen, "1");
	EXPECT_EQ(err.code, kvdb::MakeError(kvdb::KeyError, "").code);
}

TEST_P(KeyValueDatabaseTest, ReadString) {
	kvdb::KeyValueDatabase &db = *db_;

	auto missing = kvdb::ReadString(db, "group-to-root-components", true);
	ASSERT_TRUE(missing);
	EXPECT_EQ(missing.value(), "");

	auto required = kvdb::ReadString(db, "group-to-root-components", false);
	EXPECT_FALSE(required);
}

TEST(KeyValueDatabaseLmdbTest, DataSurvivesReopen) {
	mtesting::TemporaryDirectory tmpdir;
	auto db_path = path::Join(tmpdir.Path(), "edgedeploy-store");

	{
		kvdb::KeyValueDatabaseLmdb db;
		ASSERT_EQ(db.Open(db_path), error::NoError);
		ASSERT_EQ(
			db.Write("last-known-good", common::ByteVectorFromString("v1")), error::NoError);
	}

	kvdb::KeyValueDatabaseLmdb db;
	ASSERT_EQ(db.Open(db_path), error::NoError);
	auto data = db.Read("last-known-good");
	ASSERT_TRUE(data);
	EXPECT_EQ(common::StringFromByteVector(data.value()), "v1");
}

TEST(KeyValueDatabaseLmdbTest, BrokenFileIsMovedAside) {
	mtesting::TemporaryDirectory tmpdir;
	auto db_path = path::Join(tmpdir.Path(), "edgedeploy-store");
	mtesting::WriteFile(db_path, "this is not an LMDB file, not even close to one");

	kvdb::KeyValueDatabaseLmdb db;
	auto err = db.Open(db_path);
	ASSERT_EQ(err, error::NoError) << err.String();
	EXPECT_TRUE(path::FileExists(db_path + "-broken"));
	EXPECT_FALSE(db.Read("current-state"));
}
