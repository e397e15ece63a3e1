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


#include <edgedeploy-core/queue.hpp>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

namespace deployment = edgedeploy::core::deployment;
namespace error = edgedeploy::common::error;
namespace queue = edgedeploy::core::queue;

using namespace std;

deployment::Deployment MakeDeployment(
	const string &id,
	const string &group = "thinggroup/Fleet",
	deployment::DeploymentType type = deployment::DeploymentType::CloudJob) {
	string doc = R"({"deploymentId": ")" + id + R"(", "targetArn": "arn:aws:iot:eu-west-1:1:)"
				 + group + R"(", "components": {}})";
	auto dep = deployment::Deployment::FromString(type, doc, 0);
	EXPECT_TRUE(dep) << dep.error().String();
	return dep.value();
}

deployment::Deployment StampedDeployment(const string &id, const string &group, int64_t timestamp) {
	string doc = R"({"deploymentId": ")" + id + R"(", "targetArn": "arn:aws:iot:eu-west-1:1:)"
				 + group + R"(", "timestamp": )" + to_string(timestamp) + R"(, "components": {}})";
	auto dep = deployment::Deployment::FromString(deployment::DeploymentType::CloudJob, doc, 0);
	EXPECT_TRUE(dep) << dep.error().String();
	return dep.value();
}

TEST(DeploymentQueueTests, FifoAndOneInProgress) {
	queue::DeploymentQueue q;
	EXPECT_EQ(q.Offer(MakeDeployment("a", "thing/One")), queue::OfferResult::Queued);
	EXPECT_EQ(q.Offer(MakeDeployment("b", "thing/Two")), queue::OfferResult::Queued);
	EXPECT_EQ(q.Size(), 2u);

	auto first = q.Poll();
	ASSERT_TRUE(first);
	EXPECT_EQ(first->Id(), "a");
	EXPECT_FALSE(q.Poll());
	EXPECT_EQ(q.StatusOf("a"), deployment::DeploymentStatus::InProgress);
	EXPECT_EQ(q.StatusOf("b"), deployment::DeploymentStatus::Queued);

	EXPECT_EQ(q.Complete("a", deployment::DeploymentStatus::Succeeded), error::NoError);
	auto second = q.Poll();
	ASSERT_TRUE(second);
	EXPECT_EQ(second->Id(), "b");
	EXPECT_EQ(q.StatusOf("a"), deployment::DeploymentStatus::Succeeded);
	EXPECT_FALSE(q.StatusOf("unknown"));
}

TEST(DeploymentQueueTests, NewerDeploymentSupersedesQueuedOne) {
	queue::DeploymentQueue q;
	vector<pair<string, bool>> superseded;
	q.SetSupersededHandler([&superseded](const deployment::Deployment &dep, bool in_progress) {
		superseded.push_back({dep.Id(), in_progress});
	});

	EXPECT_EQ(q.Offer(MakeDeployment("d1")), queue::OfferResult::Queued);
	EXPECT_EQ(q.Offer(MakeDeployment("d2")), queue::OfferResult::Superseded);

	EXPECT_EQ(q.Size(), 1u);
	EXPECT_EQ(q.StatusOf("d1"), deployment::DeploymentStatus::Canceled);
	ASSERT_EQ(superseded.size(), 1u);
	EXPECT_EQ(superseded[0], make_pair(string("d1"), false));

	auto next = q.Poll();
	ASSERT_TRUE(next);
	EXPECT_EQ(next->Id(), "d2");

	// A superseded deployment that shows up again stays canceled.
	EXPECT_EQ(q.Offer(MakeDeployment("d1")), queue::OfferResult::Ignored);
}

TEST(DeploymentQueueTests, DifferentSourcesDoNotSupersede) {
	queue::DeploymentQueue q;
	EXPECT_EQ(q.Offer(MakeDeployment("job")), queue::OfferResult::Queued);
	EXPECT_EQ(
		q.Offer(MakeDeployment("shadow", "thinggroup/Fleet", deployment::DeploymentType::Shadow)),
		queue::OfferResult::Queued);
	EXPECT_EQ(q.Size(), 2u);
}

TEST(DeploymentQueueTests, NewerDeploymentCancelsTheOneInProgress) {
	queue::DeploymentQueue q;
	vector<pair<string, bool>> superseded;
	q.SetSupersededHandler([&superseded](const deployment::Deployment &dep, bool in_progress) {
		superseded.push_back({dep.Id(), in_progress});
	});

	q.Offer(MakeDeployment("d1"));
	auto running = q.Poll();
	ASSERT_TRUE(running);
	EXPECT_FALSE(running->IsCancelled());

	EXPECT_EQ(q.Offer(MakeDeployment("d2")), queue::OfferResult::CancelRequested);
	EXPECT_TRUE(running->IsCancelled());
	ASSERT_EQ(superseded.size(), 1u);
	EXPECT_EQ(superseded[0], make_pair(string("d1"), true));

	// Still in progress until the consumer finishes it.
	EXPECT_FALSE(q.Poll());
	EXPECT_EQ(q.Complete("d1", deployment::DeploymentStatus::Canceled), error::NoError);
	auto next = q.Poll();
	ASSERT_TRUE(next);
	EXPECT_EQ(next->Id(), "d2");
}

TEST(DeploymentQueueTests, RepeatedOffersAreIgnored) {
	queue::DeploymentQueue q;
	EXPECT_EQ(q.Offer(MakeDeployment("a")), queue::OfferResult::Queued);
	EXPECT_EQ(q.Offer(MakeDeployment("a")), queue::OfferResult::Ignored);
	EXPECT_EQ(q.Size(), 1u);

	q.Poll();
	EXPECT_EQ(q.Offer(MakeDeployment("a")), queue::OfferResult::Ignored);

	EXPECT_EQ(q.Complete("a", deployment::DeploymentStatus::Failed), error::NoError);
	EXPECT_EQ(q.Offer(MakeDeployment("a")), queue::OfferResult::Ignored);
	EXPECT_TRUE(q.Empty());
}

TEST(DeploymentQueueTests, CompleteChecksItsArguments) {
	queue::DeploymentQueue q;
	q.Offer(MakeDeployment("a"));
	q.Poll();

	auto err = q.Complete("a", deployment::DeploymentStatus::InProgress);
	EXPECT_EQ(err.code, error::MakeError(error::ProgrammingError, "").code);
	err = q.Complete("b", deployment::DeploymentStatus::Succeeded);
	EXPECT_EQ(err.code, error::MakeError(error::ProgrammingError, "").code);
	EXPECT_EQ(q.Complete("a", deployment::DeploymentStatus::Succeeded), error::NoError);
}

TEST(DeploymentQueueTests, HistoryIsBounded) {
	queue::DeploymentQueue q(2);
	for (auto id : {"a", "b", "c"}) {
		q.Offer(MakeDeployment(id));
		q.Poll();
		EXPECT_EQ(q.Complete(id, deployment::DeploymentStatus::Succeeded), error::NoError);
	}
	EXPECT_FALSE(q.StatusOf("a"));
	EXPECT_EQ(q.StatusOf("b"), deployment::DeploymentStatus::Succeeded);
	EXPECT_EQ(q.StatusOf("c"), deployment::DeploymentStatus::Succeeded);

	// Forgotten, so it is accepted again.
	EXPECT_EQ(q.Offer(MakeDeployment("a")), queue::OfferResult::Queued);
}

TEST(DeploymentQueueTests, AvailabilityHandlerIsCalled) {
	queue::DeploymentQueue q;
	int calls = 0;
	q.SetAvailabilityHandler([&calls]() { calls++; });

	q.Offer(MakeDeployment("a", "thing/One"));
	q.Offer(MakeDeployment("b", "thing/Two"));
	EXPECT_EQ(calls, 2);

	q.Poll();
	EXPECT_EQ(q.Complete("a", deployment::DeploymentStatus::Succeeded), error::NoError);
	// "b" is still waiting.
	EXPECT_EQ(calls, 3);

	q.Poll();
	EXPECT_EQ(q.Complete("b", deployment::DeploymentStatus::Succeeded), error::NoError);
	EXPECT_EQ(calls, 3);
}

TEST(DeploymentQueueTests, SnapshotAndRestore) {
	queue::DeploymentQueue q;
	q.Offer(MakeDeployment("running", "thing/One"));
	q.Poll();
	q.Offer(MakeDeployment("waiting", "thing/Two"));
	auto dropped = MakeDeployment("dropped", "thing/Three");
	q.Offer(dropped);
	dropped.Cancel();

	queue::DeploymentQueue restored;
	ASSERT_EQ(restored.Restore(q.Snapshot()), error::NoError);

	EXPECT_EQ(restored.Size(), 2u);
	auto first = restored.Poll();
	ASSERT_TRUE(first);
	EXPECT_EQ(first->Id(), "running");
	EXPECT_EQ(restored.StatusOf("waiting"), deployment::DeploymentStatus::Queued);
	EXPECT_FALSE(restored.StatusOf("dropped"));

	EXPECT_NE(restored.Restore("not json"), error::NoError);
}

TEST(DeploymentQueueTests, OlderDeploymentForTheSameTargetIsDropped) {
	queue::DeploymentQueue q;
	int superseded = 0;
	q.SetSupersededHandler(
		[&superseded](const deployment::Deployment &dep, bool in_progress) { superseded++; });

	auto newer = StampedDeployment("newer", "thinggroup/A", 200);
	EXPECT_EQ(q.Offer(newer), queue::OfferResult::Queued);
	EXPECT_EQ(q.Offer(StampedDeployment("older", "thinggroup/A", 100)), queue::OfferResult::Ignored);

	EXPECT_EQ(superseded, 0);
	EXPECT_FALSE(newer.IsCancelled());
	EXPECT_FALSE(q.StatusOf("older"));
	EXPECT_EQ(q.Size(), 1u);

	auto next = q.Poll();
	ASSERT_TRUE(next);
	EXPECT_EQ(next->Id(), "newer");

	// Also while the newer one runs, and after it finished.
	EXPECT_EQ(q.Offer(StampedDeployment("older2", "thinggroup/A", 150)), queue::OfferResult::Ignored);
	EXPECT_FALSE(newer.IsCancelled());
	EXPECT_EQ(q.Complete("newer", deployment::DeploymentStatus::Succeeded), error::NoError);
	EXPECT_EQ(q.Offer(StampedDeployment("older3", "thinggroup/A", 199)), queue::OfferResult::Ignored);
	EXPECT_TRUE(q.Empty());

	// Other targets and equal timestamps are not affected.
	EXPECT_EQ(q.Offer(StampedDeployment("other", "thinggroup/B", 100)), queue::OfferResult::Queued);
	EXPECT_EQ(q.Offer(StampedDeployment("same", "thinggroup/A", 200)), queue::OfferResult::Queued);
}

TEST(DeploymentQueueTests, HistorySurvivesSnapshotAndRestore) {
	queue::DeploymentQueue q;
	q.Offer(StampedDeployment("done", "thinggroup/A", 300));
	q.Poll();
	ASSERT_EQ(q.Complete("done", deployment::DeploymentStatus::Failed), error::NoError);

	queue::DeploymentQueue restored;
	ASSERT_EQ(restored.Restore(q.Snapshot()), error::NoError);
	EXPECT_TRUE(restored.Empty());
	EXPECT_EQ(restored.StatusOf("done"), deployment::DeploymentStatus::Failed);

	EXPECT_EQ(
		restored.Offer(StampedDeployment("done", "thinggroup/A", 300)), queue::OfferResult::Ignored);
	EXPECT_EQ(
		restored.Offer(StampedDeployment("stale", "thinggroup/A", 10)), queue::OfferResult::Ignored);
	EXPECT_TRUE(restored.Empty());
}

TEST(DeploymentQueueTests, RestoresBareDeploymentArray) {
	auto waiting = MakeDeployment("waiting", "thing/Two");
	queue::DeploymentQueue restored;
	ASSERT_EQ(restored.Restore("[" + waiting.ToJson() + "]"), error::NoError);
	EXPECT_EQ(restored.StatusOf("waiting"), deployment::DeploymentStatus::Queued);

	EXPECT_NE(restored.Restore(R"({"deployments": 1})"), error::NoError);
	EXPECT_NE(restored.Restore(R"({"deployments": [], "history": [{"id": "x"}]})"), error::NoError);
}
