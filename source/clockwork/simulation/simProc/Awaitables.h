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

#include "../ClockRational.h"

#include <coroutine>

namespace cwk::sim {

class ClockDomain;

/**
 * @brief co_awaiting on a WaitClock continues the simulation until the next rising edge of the clock.
 * @details If the edge of the current time step has already been handled in the requested phase, the coroutine
 * waits for the following edge. Repeatedly co_awaiting a clock thus advances in clock ticks.
 */
class WaitClock {
	public:
		/**
		 * @brief How the resumption relates to the registers clocked by the same edge.
		 * @details Stimuli and checks usually happen before or after the edge. A process that emulates a register
		 * (reading values from before the edge, driving values that only become relevant afterwards) uses DURING.
		 */
		enum TimingPhase {
			BEFORE, /// Resume before registers sample. Registers capture the values set by the process.
			DURING, /// Resume after registers sampled but before they update. The process sees pre-edge values.
			AFTER,  /// Resume after registers updated. The process sees post-edge values.
		};

		WaitClock(const ClockDomain *clock, TimingPhase timing = AFTER) : m_clock(clock), m_timing(timing) { }

		bool await_ready() noexcept { return false; }
		void await_suspend(std::coroutine_handle<> handle);
		void await_resume() noexcept { }

		const ClockDomain *getClock() const { return m_clock; }
		TimingPhase getTimingPhase() const { return m_timing; }
	protected:
		const ClockDomain *m_clock;
		TimingPhase m_timing;
};

/// Resumes after the given amount of simulated seconds, interleaved with the clock edges in between.
class WaitFor {
	public:
		WaitFor(const ClockRational &seconds) : m_seconds(seconds) { }

		bool await_ready() noexcept { return false; }
		void await_suspend(std::coroutine_handle<> handle);
		void await_resume() noexcept { }
	protected:
		ClockRational m_seconds;
};

/// Resumes in the same time step once the combinational logic settled.
class WaitStable {
	public:
		bool await_ready() noexcept { return false; }
		void await_suspend(std::coroutine_handle<> handle);
		void await_resume() noexcept { }
};

}
