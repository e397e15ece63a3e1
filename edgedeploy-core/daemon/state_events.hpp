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


#ifndef EDGEDEPLOY_CORE_DAEMON_STATE_EVENTS_HPP
#define EDGEDEPLOY_CORE_DAEMON_STATE_EVENTS_HPP

#include <cassert>
#include <string>

namespace edgedeploy {
namespace core {
namespace daemon {

enum class StateEvent {
	Started,
	Success,
	Failure,
	Canceled,
	NothingToDo,
	DeploymentAvailable,
	RollbackStarted,
};

inline std::string StateEventToString(const StateEvent &event) {
	switch (event) {
	case StateEvent::Started:
		return "Started";
	case StateEvent::Success:
		return "Success";
	case StateEvent::Failure:
		return "Failure";
	case StateEvent::Canceled:
		return "Canceled";
	case StateEvent::NothingToDo:
		return "NothingToDo";
	case StateEvent::DeploymentAvailable:
		return "DeploymentAvailable";
	case StateEvent::RollbackStarted:
		return "RollbackStarted";
	}
	assert(false);
	return "MissingStateInSwitchStatement";
}

} // namespace daemon
} // namespace core
} // namespace edgedeploy

#endif // EDGEDEPLOY_CORE_DAEMON_STATE_EVENTS_HPP
