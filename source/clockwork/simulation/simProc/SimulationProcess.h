/*  This file is part of Clockwork, a library for circuit design.
	Copyright (C) 2021 Michael Offel, Andreas Ley

	Clockwork is free software; you can redistribute it and/or
	modify it under the terms of the GNU Lesser General Public
	License as published by the Free Software Foundation; either
	version 3 of the License, or (at your option) any later version.

	Clockwork is distributed in the hope that it will be useful,
	but WITHOUT ANY WARRANTY; without even the implied warranty of
	MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
	Lesser General Public License for more details.

	You should have received a copy of the GNU Lesser General Public
	License along with this library; if not, write to the Free Software
	Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301  USA
*/
#pragma once

#include <coroutine>
#include "../../utils/Exceptions.h"
#include "../../utils/Preprocessor.h"

#include <concepts>
#include <cstdint>
#include <cstdlib>
#include <functional>
#include <memory>
#include <queue>
#include <type_traits>
#include <vector>

namespace cwk::sim {

namespace internal {

/**
 * @brief Coroutine handle with reference counting to automatically destroy the coroutine.
 */
template<typename PromiseType>
class SmartCoroutineHandle
{
	public:
		SmartCoroutineHandle() = default;
		~SmartCoroutineHandle() { reset(); }

		SmartCoroutineHandle(std::coroutine_handle<PromiseType> handle) : m_handle(handle) {
			if (m_handle)
				m_handle.promise().registerHandle();
		}

		SmartCoroutineHandle(const SmartCoroutineHandle &other) : SmartCoroutineHandle(other.m_handle) { }

		SmartCoroutineHandle &operator=(const SmartCoroutineHandle &other) {
			if (m_handle == other.m_handle) return *this;

			reset();
			m_handle = other.m_handle;
			if (m_handle)
				m_handle.promise().registerHandle();
			return *this;
		}

		void reset() {
			if (m_handle) {
				m_handle.promise().deregisterHandle();
				if (!m_handle.promise().referenced()) // last reference, destroy coroutine frame
					m_handle.destroy();
				m_handle = {};
			}
		}

		explicit operator bool() const { return (bool) m_handle; }

		auto &promise() const { return m_handle.promise(); }

		void resume() const {
			if (m_handle)
				m_handle.resume();
		}

		bool done() const {
			if (!m_handle)
				return true;
			return m_handle.done();
		}

		const std::coroutine_handle<PromiseType> &rawHandle() const { return m_handle; }
	protected:
		std::coroutine_handle<PromiseType> m_handle = {};
};

class SmartPromiseType
{
	public:
		void registerHandle() { m_numHandles++; }
		void deregisterHandle() { CWK_ASSERT(m_numHandles > 0); m_numHandles--; }
		bool referenced() const { return m_numHandles != 0; }
	protected:
		size_t m_numHandles = 0;
};

template<typename ReturnValue>
struct BasePromise : public SmartPromiseType {
	ReturnValue returnValue = {};
	template<std::convertible_to<ReturnValue> From>
	void return_value(From &&from) { returnValue = std::forward<From>(from); }
};

template<>
struct BasePromise<void> : public SmartPromiseType {
	void return_void() { }
};

}

class SimulationCoroutineHandler;

/**
 * @brief Return type of all simulation coroutines.
 * @details A SimulationFunction does not start executing on creation. It either gets co_awaited by another
 * simulation coroutine, in which case it runs like a regular function call and yields its return value, or
 * it gets started as an independent process through fork or Simulator::addSimulationProcess.
 *
 * Exceptions thrown inside a simulation coroutine propagate to whoever resumed it, which for top level
 * processes is the call that advances the simulation.
 */
template<typename ReturnValue = void>
class SimulationFunction {
	public:
		struct promise_type : public internal::BasePromise<ReturnValue> {
			promise_type() = default;
			promise_type(const promise_type &) = delete;
			void operator=(const promise_type &) = delete;

			auto get_return_object() { return std::coroutine_handle<promise_type>::from_promise(*this); }
			auto initial_suspend() { return std::suspend_always(); }
			void unhandled_exception() { throw; }

			/// Hands everything that joined on this coroutine over to the ready queue of the active handler.
			struct FinalSuspendAwaiter {
				bool await_ready() noexcept { return false; }
				void await_suspend(std::coroutine_handle<promise_type> handle) noexcept;
				void await_resume() noexcept { }
			};
			auto final_suspend() noexcept { return FinalSuspendAwaiter{}; }

			std::vector<std::coroutine_handle<>> awaitingFinalSuspend;
			/// Keeps a forked lambda (and thus its captures) alive for as long as the coroutine exists.
			std::unique_ptr<std::function<SimulationFunction<ReturnValue>()>> functorInstance;
		};
		using Handle = internal::SmartCoroutineHandle<promise_type>;

		SimulationFunction() = default;
		SimulationFunction(const std::coroutine_handle<promise_type> &handle) : m_handle(handle) { }

		const Handle &getHandle() const { return m_handle; }

		struct Join {
			Handle called;

			bool await_ready() noexcept { return called.done(); }
			void await_suspend(std::coroutine_handle<> caller) { called.promise().awaitingFinalSuspend.push_back(caller); }
			ReturnValue await_resume() {
				if constexpr (!std::is_void_v<ReturnValue>)
					return called.promise().returnValue;
			}
		};

		/// Runs this function as a sub-process of the awaiting coroutine.
		Join operator co_await() {
			m_handle.resume();
			return Join{m_handle};
		}
	protected:
		Handle m_handle;
};

using SimProcess = SimulationFunction<void>;

/**
 * @brief Owns all running top level simulation processes and resumes those that are ready.
 */
class SimulationCoroutineHandler {
	public:
		static thread_local SimulationCoroutineHandler *activeHandler;

		~SimulationCoroutineHandler();

		void start(const SimProcess &process, bool runImmediate = false);
		void stopAll();

		void readyToResume(std::coroutine_handle<> handle) { m_readyToResume.push(handle); }
		void run();

		void coroutineFinalSuspending(std::coroutine_handle<> handle);
		size_t numRunning() const { return m_processes.size(); }
	protected:
		std::vector<SimProcess::Handle> m_processes;
		std::vector<SimProcess::Handle> m_finished;
		std::queue<std::coroutine_handle<>> m_readyToResume;
};

template<typename ReturnValue>
void SimulationFunction<ReturnValue>::promise_type::FinalSuspendAwaiter::await_suspend(std::coroutine_handle<promise_type> handle) noexcept
{
	auto *handler = SimulationCoroutineHandler::activeHandler;
	for (const auto &coro : handle.promise().awaitingFinalSuspend)
		handler->readyToResume(coro);
	handler->coroutineFinalSuspending(handle);
}

/// Starts a process that runs in parallel to the calling one. The forked process runs until its first suspension immediately.
inline SimProcess::Handle forkFunc(const SimProcess &process)
{
	SimulationCoroutineHandler::activeHandler->start(process, true);
	return process.getHandle();
}

inline SimProcess::Handle forkFunc(std::function<SimProcess()> &&functor)
{
	auto functorInstance = std::make_unique<std::function<SimProcess()>>(std::move(functor));
	// invoke the stored copy, so that captured references refer to the copy that lives in the promise
	auto process = (*functorInstance)();
	process.getHandle().promise().functorInstance = std::move(functorInstance);
	return forkFunc(process);
}

extern template class SimulationFunction<void>;
extern template class SimulationFunction<bool>;
extern template class SimulationFunction<std::uint64_t>;

}
