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


#ifndef EDGEDEPLOY_CORE_DAEMON_STATES_HPP
#define EDGEDEPLOY_CORE_DAEMON_STATES_HPP

#include <map>
#include <string>
#include <vector>

#include <common/error.hpp>
#include <common/events.hpp>
#include <common/state_machine.hpp>

#include <edgedeploy-core/config_tree.hpp>
#include <edgedeploy-core/daemon/context.hpp>
#include <edgedeploy-core/daemon/state_events.hpp>

namespace edgedeploy {
namespace core {
namespace daemon {

using namespace std;

namespace error = edgedeploy::common::error;
namespace events = edgedeploy::common::events;
namespace sm = edgedeploy::common::state_machine;

namespace config_tree = edgedeploy::core::config_tree;

using StateType = sm::State<Context, StateEvent>;

class EmptyState : virtual public StateType {
public:
	void OnEnter(Context &ctx, sm::EventPoster<StateEvent> &poster) override;
};

// Loads the persisted state.
class InitState : virtual public StateType {
public:
	void OnEnter(Context &ctx, sm::EventPoster<StateEvent> &poster) override;

	error::Error init_error;
};

class IdleState : virtual public StateType {
public:
	void OnEnter(Context &ctx, sm::EventPoster<StateEvent> &poster) override;
};

class PollQueueState : virtual public StateType {
public:
	void OnEnter(Context &ctx, sm::EventPoster<StateEvent> &poster) override;
};

class ResolveDocumentState : virtual public StateType {
public:
	void OnEnter(Context &ctx, sm::EventPoster<StateEvent> &poster) override;
};

class ResolveVersionsState : virtual public StateType {
public:
	void OnEnter(Context &ctx, sm::EventPoster<StateEvent> &poster) override;
};

class ComputeConfigurationState : virtual public StateType {
public:
	void OnEnter(Context &ctx, sm::EventPoster<StateEvent> &poster) override;
};

// Lets running components reject the configuration they are about to get.
class ValidateConfigurationState : virtual public StateType {
public:
	void OnEnter(Context &ctx, sm::EventPoster<StateEvent> &poster) override;

private:
	// Running components which keep their version, but get a new configuration.
	static map<string, config_tree::Value> ConfigurationsToValidate(Context &ctx);
};

class SafetyGateState : virtual public StateType {
public:
	void OnEnter(Context &ctx, sm::EventPoster<StateEvent> &poster) override;

private:
	// Running components which the deployment changes.
	static vector<string> AffectedComponents(Context &ctx);
};

class ExecuteState : virtual public StateType {
public:
	void OnEnter(Context &ctx, sm::EventPoster<StateEvent> &poster) override;
};

class RollbackState : virtual public StateType {
public:
	void OnEnter(Context &ctx, sm::EventPoster<StateEvent> &poster) override;
};

class ReportResultState : virtual public StateType {
public:
	void OnEnter(Context &ctx, sm::EventPoster<StateEvent> &poster) override;
};

class ExitState : virtual public StateType {
public:
	ExitState(events::EventLoop &event_loop);
	void OnEnter(Context &ctx, sm::EventPoster<StateEvent> &poster) override;

	error::Error exit_error;

private:
	events::EventLoop &event_loop_;
};

} // namespace daemon
} // namespace core
} // namespace edgedeploy

#endif // EDGEDEPLOY_CORE_DAEMON_STATES_HPP
