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


#ifndef EDGEDEPLOY_COMMON_EVENTS_HPP
#define EDGEDEPLOY_COMMON_EVENTS_HPP

#include <config.h>

#include <functional>
#include <memory>
#include <system_error>
#include <vector>

#include <common/error.hpp>

#ifdef EDGEDEPLOY_USE_BOOST_ASIO
#include <boost/asio.hpp>
#endif // EDGEDEPLOY_USE_BOOST_ASIO

namespace edgedeploy {
namespace common {
namespace events {

using namespace std;

using EventHandler = function<void(edgedeploy::common::error::Error err)>;

#ifdef EDGEDEPLOY_USE_BOOST_ASIO
namespace asio = boost::asio;
#endif // EDGEDEPLOY_USE_BOOST_ASIO

namespace error = edgedeploy::common::error;

class EventLoop {
public:
	// Can be used recursively. Each invocation of `Run()` needs to be matched by an invocation
	// of `Stop()`.
	void Run();
	void Stop();

	// Runs the function on the event loop. There is no way to cancel a posted function, so it
	// must check for cancellation itself if it needs it.
	//
	// Thread-safe.
	void Post(function<void()> func);

	// True if the calling thread is currently executing inside `Run()`.
	bool RunningInThisThread();

private:
#ifdef EDGEDEPLOY_USE_BOOST_ASIO
	asio::io_context ctx_;
#endif // EDGEDEPLOY_USE_BOOST_ASIO

	friend class EventLoopObject;
};

class EventLoopObject {
#ifdef EDGEDEPLOY_USE_BOOST_ASIO
protected:
	static asio::io_context &GetAsioIoContext(EventLoop &loop) {
		return loop.ctx_;
	}
#endif // EDGEDEPLOY_USE_BOOST_ASIO
};

class Timer : public EventLoopObject {
public:
	Timer(EventLoop &loop);
	~Timer() {
		if (destroying_ == nullptr) {
			// Moved from.
			return;
		}

		*destroying_ = true;
		Cancel();
	}

	Timer(Timer &&other) = default;

#ifdef EDGEDEPLOY_USE_BOOST_ASIO
	// Fires `handler` once after `duration`. A cancelled wait calls `handler` with
	// `errc::operation_canceled`, unless the timer is being destroyed.
	template <typename Duration>
	void AsyncWait(Duration duration, EventHandler handler) {
		*active_ = true;
		timer_.expires_after(duration);
		auto destroying = destroying_;
		auto active = active_;
		timer_.async_wait([destroying, handler, active](boost::system::error_code ec) {
			*active = false;
			if (*destroying) {
				return;
			}

			if (ec) {
				auto err = ec.default_error_condition();
				if (err == make_error_condition(boost::system::errc::operation_canceled)) {
					handler(error::Error(make_error_condition(errc::operation_canceled), ""));
				} else {
					handler(error::Error(err, "Timer error"));
				}
			} else {
				handler(error::NoError);
			}
		});
	}
#endif // EDGEDEPLOY_USE_BOOST_ASIO

	void Cancel();

	bool GetActive() {
		return *active_;
	};

private:
#ifdef EDGEDEPLOY_USE_BOOST_ASIO
	asio::steady_timer timer_;
	shared_ptr<bool> destroying_;
	shared_ptr<bool> active_;
#endif // EDGEDEPLOY_USE_BOOST_ASIO
};

using SignalNumber = int;
using SignalSet = vector<SignalNumber>;
using SignalHandlerFn = function<void(SignalNumber)>;

class SignalHandler : public EventLoopObject {
public:
	SignalHandler(EventLoop &loop);
	~SignalHandler() {
		Cancel();
	};
	error::Error RegisterHandler(const SignalSet &set, SignalHandlerFn handler_fn);
	void Cancel();

#ifdef EDGEDEPLOY_USE_BOOST_ASIO
private:
	asio::signal_set signal_set_;
#endif // EDGEDEPLOY_USE_BOOST_ASIO
};

} // namespace events
} // namespace common
} // namespace edgedeploy

#endif // EDGEDEPLOY_COMMON_EVENTS_HPP
