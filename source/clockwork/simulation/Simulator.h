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

#include "Circuit.h"
#include "ClockRational.h"
#include "simProc/SimulationProcess.h"
#include "simProc/Awaitables.h"

#include <array>
#include <functional>
#include <map>
#include <optional>
#include <queue>
#include <vector>

namespace cwk::sim {

/**
 * @brief Event driven, cycle based simulator for a Circuit.
 * @details Time advances from event to event, where events are clock edges and expiring WaitFor timers.
 * All clock domains with an edge at the same instant tick together. Each edge is processed in the phases
 * of WaitClock::TimingPhase:
 * - resume BEFORE waiters and settle combinational logic,
 * - let every ticking domain sample, then resume DURING waiters which still see the pre-edge state,
 * - commit registers, settle, resume AFTER waiters, settle.
 *
 * Only one simulator can be active per thread at a time; it is the one created last.
 */
class Simulator
{
	public:
		Simulator(Circuit &circuit);
		~Simulator();
		Simulator(const Simulator&) = delete;
		void operator=(const Simulator&) = delete;

		static Simulator &active();
		static bool hasActive() { return m_active != nullptr; }

		Circuit &getCircuit() { return m_circuit; }

		/// Adds a process that gets started on power on.
		void addSimulationProcess(std::function<SimProcess()> simProc);

		void powerOn();
		bool poweredOn() const { return m_poweredOn; }

		/// Processes the next event (clock edges or timers). Returns false if there is nothing left to simulate.
		bool advanceEvent();
		/// Processes all events within the given amount of time.
		void advance(const ClockRational &seconds);

		/// Stops the simulation, all running simulation processes are destroyed.
		void abort();
		bool abortCalled() const { return m_abortCalled; }

		const ClockRational &getCurrentSimulationTime() const { return m_now; }
		std::optional<ClockRational> nextEventTime() const;

		/// Settles combinational logic if any signal changed since the last evaluation.
		void ensureStable();

		void waitClock(const ClockDomain *clock, WaitClock::TimingPhase phase, std::coroutine_handle<> handle);
		void waitFor(const ClockRational &seconds, std::coroutine_handle<> handle);
		void waitStable(std::coroutine_handle<> handle);
	protected:
		static thread_local Simulator *m_active;
		Simulator *m_previouslyActive;

		struct Timer {
			ClockRational time;
			size_t order;
			std::coroutine_handle<> handle;
			bool operator<(const Timer &rhs) const;
		};

		Circuit &m_circuit;
		ClockRational m_now = ClockRational(0, 1);
		bool m_poweredOn = false;
		bool m_abortCalled = false;
		size_t m_stableChangeCounter = ~size_t(0);

		std::vector<std::function<SimProcess()>> m_simProcs;
		SimulationCoroutineHandler m_coroutineHandler;

		std::priority_queue<Timer> m_timers;
		size_t m_timerOrder = 0;
		std::map<const ClockDomain*, std::array<std::vector<std::coroutine_handle<>>, 3>> m_clockWaiters;

		void resumeClockWaiters(const std::vector<ClockDomain*> &ticking, WaitClock::TimingPhase phase);
		void runProcesses();
};

}
