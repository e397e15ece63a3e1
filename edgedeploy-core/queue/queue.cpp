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

#include <algorithm>

#include <common/json.hpp>
#include <common/log.hpp>

namespace edgedeploy {
namespace core {
namespace queue {

namespace json = edgedeploy::common::json;
namespace log = edgedeploy::common::log;

string DeploymentQueue::Key(const deployment::Deployment &dep) {
	return deployment::DeploymentTypeToString(dep.Type()) + "|" + dep.Document().group_name;
}

void DeploymentQueue::SetAvailabilityHandler(AvailabilityHandler handler) {
	lock_guard<mutex> lock(mutex_);
	availability_handler_ = handler;
}

void DeploymentQueue::SetSupersededHandler(SupersededHandler handler) {
	lock_guard<mutex> lock(mutex_);
	superseded_handler_ = handler;
}

OfferResult DeploymentQueue::Offer(const deployment::Deployment &dep) {
	auto logger = log::Logger("queue").WithFields(log::LogField {"deployment_id", dep.Id()});

	OfferResult result = OfferResult::Queued;
	vector<deployment::Deployment> dropped;
	optional::optional<deployment::Deployment> cancelled;
	AvailabilityHandler availability;
	SupersededHandler superseded;
	{
		unique_lock<mutex> lock(mutex_);

		auto known = history_.find(dep.Id());
		if (known != history_.end()) {
			logger.Info(
				"Deployment already finished with status "
				+ deployment::DeploymentStatusToString(known->second) + ", ignoring");
			return OfferResult::Ignored;
		}
		if (in_progress_ && in_progress_->Id() == dep.Id()) {
			logger.Info("Deployment is already in progress, ignoring");
			return OfferResult::Ignored;
		}
		auto same_id = find_if(queued_.begin(), queued_.end(), [&dep](const deployment::Deployment &d) {
			return d.Id() == dep.Id();
		});
		if (same_id != queued_.end()) {
			logger.Debug("Deployment is already queued, ignoring");
			return OfferResult::Ignored;
		}

		auto key = Key(dep);
		auto latest = latest_timestamp_.find(key);
		if (latest != latest_timestamp_.end() && dep.Document().timestamp < latest->second) {
			logger.Info(
				"Older than the deployment from " + to_string(latest->second)
				+ " for the same target, ignoring");
			return OfferResult::Ignored;
		}

		for (auto it = queued_.begin(); it != queued_.end();) {
			if (Key(*it) == key) {
				it->Cancel();
				dropped.push_back(*it);
				Remember(it->Id(), deployment::DeploymentStatus::Canceled);
				it = queued_.erase(it);
				result = OfferResult::Superseded;
			} else {
				++it;
			}
		}
		if (in_progress_ && Key(*in_progress_) == key && !in_progress_->IsCancelled()) {
			in_progress_->Cancel();
			cancelled = in_progress_;
			result = OfferResult::CancelRequested;
		}

		queued_.push_back(dep);
		latest_timestamp_[key] = dep.Document().timestamp;
		availability = availability_handler_;
		superseded = superseded_handler_;
	}

	for (const auto &old : dropped) {
		logger.Info("Supersedes queued deployment " + old.Id());
		if (superseded) {
			superseded(old, false);
		}
	}
	if (cancelled) {
		logger.Info("Supersedes the deployment in progress, asking it to cancel");
		if (superseded) {
			superseded(cancelled.value(), true);
		}
	}

	logger.Info("Deployment queued");
	if (availability) {
		availability();
	}
	return result;
}

optional::optional<deployment::Deployment> DeploymentQueue::Poll() {
	lock_guard<mutex> lock(mutex_);
	if (in_progress_ || queued_.empty()) {
		return optional::nullopt;
	}
	in_progress_ = queued_.front();
	queued_.pop_front();
	return in_progress_;
}

error::Error DeploymentQueue::Complete(
	const string &deployment_id, deployment::DeploymentStatus status) {
	if (!deployment::IsTerminal(status)) {
		return error::MakeError(
			error::ProgrammingError,
			deployment::DeploymentStatusToString(status) + " is not a terminal status");
	}

	AvailabilityHandler availability;
	{
		lock_guard<mutex> lock(mutex_);
		if (!in_progress_ || in_progress_->Id() != deployment_id) {
			return error::MakeError(
				error::ProgrammingError, deployment_id + " is not the deployment in progress");
		}
		in_progress_.reset();
		Remember(deployment_id, status);
		if (!queued_.empty()) {
			availability = availability_handler_;
		}
	}

	if (availability) {
		availability();
	}
	return error::NoError;
}

size_t DeploymentQueue::Size() const {
	lock_guard<mutex> lock(mutex_);
	return queued_.size();
}

optional::optional<deployment::Deployment> DeploymentQueue::InProgress() const {
	lock_guard<mutex> lock(mutex_);
	return in_progress_;
}

optional::optional<deployment::DeploymentStatus> DeploymentQueue::StatusOf(
	const string &deployment_id) const {
	lock_guard<mutex> lock(mutex_);
	if (in_progress_ && in_progress_->Id() == deployment_id) {
		return deployment::DeploymentStatus::InProgress;
	}
	for (const auto &dep : queued_) {
		if (dep.Id() == deployment_id) {
			return deployment::DeploymentStatus::Queued;
		}
	}
	auto it = history_.find(deployment_id);
	if (it != history_.end()) {
		return it->second;
	}
	return optional::nullopt;
}

void DeploymentQueue::Remember(const string &deployment_id, deployment::DeploymentStatus status) {
	if (history_size_ == 0) {
		return;
	}
	if (history_.count(deployment_id) == 0) {
		history_order_.push_back(deployment_id);
	}
	history_[deployment_id] = status;
	while (history_order_.size() > history_size_) {
		history_.erase(history_order_.front());
		history_order_.pop_front();
	}
}

string DeploymentQueue::Snapshot() const {
	lock_guard<mutex> lock(mutex_);
	string ret = R"({"deployments":[)";
	bool first = true;
	auto add = [&ret, &first](const deployment::Deployment &dep) {
		if (!first) {
			ret += ",";
		}
		first = false;
		ret += dep.ToJson();
	};
	if (in_progress_) {
		add(in_progress_.value());
	}
	for (const auto &dep : queued_) {
		add(dep);
	}

	ret += R"(],"history":[)";
	first = true;
	for (const auto &id : history_order_) {
		if (!first) {
			ret += ",";
		}
		first = false;
		ret += R"({"id":")" + json::EscapeString(id) + R"(","status":")"
			   + deployment::DeploymentStatusToString(history_.at(id)) + R"("})";
	}

	ret += R"(],"latestTimestamps":{)";
	first = true;
	for (const auto &entry : latest_timestamp_) {
		if (!first) {
			ret += ",";
		}
		first = false;
		ret += "\"" + json::EscapeString(entry.first) + "\":" + to_string(entry.second);
	}
	return ret + "}}";
}

error::Error DeploymentQueue::RestoreHistory(const json::Json &snapshot) {
	auto history = snapshot.Get("history");
	if (history) {
		auto size = history.value().GetArraySize();
		if (!size) {
			return size.error().WithContext("Deployment history");
		}
		for (size_t i = 0; i < size.value(); i++) {
			auto entry = history.value().Get(i);
			if (!entry) {
				return entry.error().WithContext("Deployment history");
			}
			auto id = json::Get<string>(entry.value(), "id", json::MissingOk::No);
			if (!id) {
				return id.error().WithContext("Deployment history");
			}
			auto status = json::Get<string>(entry.value(), "status", json::MissingOk::No)
							  .and_then(deployment::DeploymentStatusFromString);
			if (!status) {
				return status.error().WithContext("Deployment history");
			}
			lock_guard<mutex> lock(mutex_);
			Remember(id.value(), status.value());
		}
	}

	auto timestamps = snapshot.Get("latestTimestamps");
	if (timestamps) {
		auto children = timestamps.value().GetChildren();
		if (!children) {
			return children.error().WithContext("Deployment timestamps");
		}
		for (const auto &child : children.value()) {
			auto timestamp = child.second.GetInt64();
			if (!timestamp) {
				return timestamp.error().WithContext("Deployment timestamps");
			}
			lock_guard<mutex> lock(mutex_);
			latest_timestamp_[child.first] = timestamp.value();
		}
	}
	return error::NoError;
}

error::Error DeploymentQueue::Restore(const string &snapshot) {
	auto j = json::Load(snapshot);
	if (!j) {
		return j.error().WithContext("Could not parse the deployment queue");
	}

	json::Json deployments = j.value();
	if (j.value().IsObject()) {
		auto err = RestoreHistory(j.value());
		if (err != error::NoError) {
			return err;
		}
		auto listed = j.value().Get("deployments");
		if (!listed) {
			return listed.error().WithContext("Deployment queue");
		}
		deployments = listed.value();
	}

	auto size = deployments.GetArraySize();
	if (!size) {
		return size.error().WithContext("Deployment queue");
	}

	for (size_t i = 0; i < size.value(); i++) {
		auto dep = deployments.Get(i).and_then(deployment::Deployment::FromJson);
		if (!dep) {
			log::Warning("Dropping unreadable queued deployment: " + dep.error().String());
			continue;
		}
		if (dep.value().IsCancelled()) {
			continue;
		}
		Offer(dep.value());
	}
	return error::NoError;
}

} // namespace queue
} // namespace core
} // namespace edgedeploy
