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


#ifndef EDGEDEPLOY_COMMON_STATE_MACHINE_HPP
#define EDGEDEPLOY_COMMON_STATE_MACHINE_HPP

#include <memory>
#include <queue>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <common/events.hpp>
#include <common/log.hpp>

namespace edgedeploy {
namespace common {
namespace state_machine {

using namespace std;

namespace events = edgedeploy::common::events;
namespace log = edgedeploy::common::log;

template <typename ContextType, typename EventType>
class StateMachineRunner;

template <typename EventType>
class EventPoster {
public:
	virtual ~EventPoster() {
	}

	virtual void PostEvent(EventType event) = 0;
};

template <typename ContextType, typename EventType>
class State {
public:
	virtual ~State() {
	}

	virtual void OnEnter(ContextType &ctx, EventPoster<EventType> &poster) = 0;
};

enum class TransitionFlag {
	// The event is dropped if the current state has no transition for it.
	Immediate,
	// The event stays queued until a state which accepts it is reached.
	Deferred,
};

template <typename ContextType, typename EventType>
class StateMachine {
public:
	using StateType = State<ContextType, EventType>;

	StateMachine(StateType &start_state) :
		current_state_(&start_state) {
	}
	StateMachine(StateMachine &) = delete;

	void AddTransition(
		StateType &source_state, EventType event, StateType &target_state, TransitionFlag flag) {
		transitions_[TransitionCondition {&source_state, event}] = &target_state;
		if (flag == TransitionFlag::Deferred) {
			deferred_events_.insert(event);
		}
	}

	const StateType *CurrentState() const {
		return current_state_;
	}

private:
	struct TransitionCondition {
		// Identity of the state object, not its value.
		StateType *state;
		EventType event;

		bool operator==(const TransitionCondition &t) const {
			return state == t.state && event == t.event;
		}
	};

	class Hasher {
	public:
		size_t operator()(const TransitionCondition &obj) const {
			return std::hash<StateType *>()(obj.state) ^ std::hash<int>()(static_cast<int>(obj.event));
		}
	};

	StateType *current_state_;
	unordered_map<TransitionCondition, StateType *, Hasher> transitions_;
	unordered_set<EventType> deferred_events_;

	friend class StateMachineRunner<ContextType, EventType>;
};

// Drives one or more state machines from a shared event queue, one event per event loop
// iteration.
template <typename ContextType, typename EventType>
class StateMachineRunner : virtual public EventPoster<EventType> {
public:
	StateMachineRunner(ContextType &ctx) :
		ctx_(ctx) {
	}
	StateMachineRunner(StateMachineRunner &) = delete;
	~StateMachineRunner() {
		DetachFromEventLoop();
	}

	void PostEvent(EventType event) override {
		event_queue_.push(event);
		PostToEventLoop();
	}

	void AttachToEventLoop(events::EventLoop &event_loop) {
		DetachFromEventLoop();

		cancelled_ = make_shared<bool>(false);

		// Not owned, the null deleter only gives us a nullable reference.
		event_loop_.reset(&event_loop, [](events::EventLoop *loop) {});

		PostToEventLoop();
	}

	void DetachFromEventLoop() {
		if (cancelled_) {
			*cancelled_ = true;
			cancelled_.reset();
		}
		event_loop_.reset();
	}

	void AddStateMachine(StateMachine<ContextType, EventType> &machine) {
		machines_.push_back(&machine);
	}

private:
	void RunOne() {
		const size_t size = event_queue_.size();
		vector<State<ContextType, EventType> *> to_run;

		for (size_t count = 0; count < size; count++) {
			bool deferred = false;
			auto event = event_queue_.front();
			event_queue_.pop();
			to_run.clear();

			for (auto machine : machines_) {
				typename StateMachine<ContextType, EventType>::TransitionCondition cond {
					machine->current_state_, event};
				if (machine->deferred_events_.count(event) != 0) {
					deferred = true;
				}

				auto match = machine->transitions_.find(cond);
				if (match == machine->transitions_.end()) {
					continue;
				}

				auto &target = match->second;
				to_run.push_back(target);
				machine->current_state_ = target;
			}

			if (to_run.empty()) {
				if (deferred) {
					// Retried after some machine changes state, never twice in this
					// pass since only `size` attempts are made.
					event_queue_.push(event);
				} else {
					log::Error(
						"State machine event " + to_string(static_cast<int>(event))
						+ " was not handled by any state");
				}
			} else {
				for (auto &state : to_run) {
					state->OnEnter(ctx_, *this);
				}
				// If nothing ran, everything left is deferred and waits for a state
				// change. Otherwise keep going.
				if (!event_queue_.empty()) {
					PostToEventLoop();
				}
				break;
			}
		}
	}

	void PostToEventLoop() {
		if (!event_loop_ || event_queue_.empty()) {
			return;
		}

		auto cancelled = cancelled_;
		event_loop_->Post([cancelled, this]() {
			if (!*cancelled) {
				RunOne();
			}
		});
	}

	ContextType &ctx_;

	shared_ptr<bool> cancelled_;
	vector<StateMachine<ContextType, EventType> *> machines_;

	queue<EventType> event_queue_;

	shared_ptr<events::EventLoop> event_loop_;
};

} // namespace state_machine
} // namespace common
} // namespace edgedeploy

#endif // EDGEDEPLOY_COMMON_STATE_MACHINE_HPP
