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


#ifndef EDGEDEPLOY_CORE_QUEUE_HPP
#define EDGEDEPLOY_CORE_QUEUE_HPP

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include <common/error.hpp>
#include <common/json.hpp>
#include <common/optional.hpp>

#include <edgedeploy-core/deployment.hpp>

namespace edgedeploy {
namespace core {
namespace queue {

using namespace std;

namespace deployment = edgedeploy::core::deployment;
namespace error = edgedeploy::common::error;
namespace json = edgedeploy::common::json;
namespace optional = edgedeploy::common::optional;

enum class OfferResult {
	Queued,
	// Queued, and replaced a queued deployment for the same source and target.
	Superseded,
	// Queued, and asked the deployment in progress for the same source and target to cancel.
	CancelRequested,
	// Already known, or older than the newest deployment seen for the same source and target.
	// Nothing was done.
	Ignored,
};

// Called from the offering thread, without the queue lock held.
using AvailabilityHandler = function<void()>;
// A deployment was superseded. `in_progress` tells whether it was running, in which case only
// its cancellation flag is set and it still needs to reach a terminal status; otherwise it was
// dropped from the queue and is CANCELED.
using SupersededHandler = function<void(const deployment::Deployment &dep, bool in_progress)>;

// Thread-safe intake of deployments from all sources. At most one deployment is in progress.
class DeploymentQueue {
public:
	explicit DeploymentQueue(size_t history_size = 1000) :
		history_size_ {history_size} {
	}

	void SetAvailabilityHandler(AvailabilityHandler handler);
	void SetSupersededHandler(SupersededHandler handler);

	// Never blocks on the consumer.
	OfferResult Offer(const deployment::Deployment &dep);

	// The oldest queued deployment, which is now in progress. Nothing while another deployment
	// is in progress.
	optional::optional<deployment::Deployment> Poll();

	// The deployment in progress reached `status`, which must be terminal.
	error::Error Complete(const string &deployment_id, deployment::DeploymentStatus status);

	size_t Size() const;
	bool Empty() const {
		return Size() == 0;
	}
	optional::optional<deployment::Deployment> InProgress() const;
	// Queued, in progress, or one of the remembered terminal statuses.
	optional::optional<deployment::DeploymentStatus> StatusOf(const string &deployment_id) const;

	// JSON object with the deployment in progress, if any, followed by the queued ones, the
	// remembered terminal statuses and the newest timestamp per source and target.
	string Snapshot() const;
	// Loads the history of a `Snapshot()` and queues its deployments, skipping canceled ones.
	// A bare JSON array of deployments is accepted too.
	error::Error Restore(const string &snapshot);

private:
	static string Key(const deployment::Deployment &dep);
	void Remember(const string &deployment_id, deployment::DeploymentStatus status);

	error::Error RestoreHistory(const json::Json &snapshot);

	const size_t history_size_;

	mutable mutex mutex_;
	deque<deployment::Deployment> queued_;
	optional::optional<deployment::Deployment> in_progress_;
	map<string, deployment::DeploymentStatus> history_;
	deque<string> history_order_;
	map<string, int64_t> latest_timestamp_;

	AvailabilityHandler availability_handler_;
	SupersededHandler superseded_handler_;
};

} // namespace queue
} // namespace core
} // namespace edgedeploy

#endif // EDGEDEPLOY_CORE_QUEUE_HPP
