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

#include "Signal.h"
#include "Clock.h"

#include "../simulation/Simulator.h"
#include "../simulation/simProc/SimulationProcess.h"
#include "../simulation/simProc/Awaitables.h"

#include <concepts>
#include <functional>
#include <ostream>

namespace cwk {

/**
 * @addtogroup cwk_frontend_simulation
 * @{
 */

	/**
	 * @brief Access to a signal from within simulation processes.
	 * @details Reading lets combinational logic settle first, so a value driven by the process is
	 * visible in dependent signals right away. Bits can be driven and compared with '0' and '1'.
	 */
	template<SignalValue T>
	class SigHandle
	{
		public:
			SigHandle(Signal<T> &signal) : m_signal(signal) { }

			template<std::integral V>
			SigHandle &operator=(V v) {
				if constexpr (std::is_same_v<T, bool> && std::is_same_v<V, char>) {
					CWK_DESIGNCHECK_HINT(v == '0' || v == '1', "Bits can only be driven with '0' or '1'.");
					m_signal = v == '1';
				} else
					m_signal = T(v);
				return *this;
			}

			template<std::integral V>
			bool operator==(V v) const {
				if constexpr (std::is_same_v<T, bool> && std::is_same_v<V, char>)
					return value() == (v == '1');
				else
					return value() == T(v);
			}

			operator T() const { return value(); }

			T value() const {
				if (sim::Simulator::hasActive())
					sim::Simulator::active().ensureStable();
				return m_signal.value();
			}
		protected:
			Signal<T> &m_signal;
	};

	template<SignalValue T>
	inline SigHandle<T> simu(Signal<T> &signal) { return SigHandle<T>(signal); }

	template<SignalValue T>
	inline std::ostream& operator<<(std::ostream& stream, const SigHandle<T>& handle) { return stream << handle.value(); }

	using SimProcess = sim::SimulationFunction<void>;
	template<typename ReturnValue = void>
	using SimFunction = sim::SimulationFunction<ReturnValue>;
	using WaitFor = sim::WaitFor;
	using WaitStable = sim::WaitStable;
	using Seconds = ClockRational;

	Seconds getCurrentSimulationTime();
	inline double nowNs() { return sim::toNanoseconds(getCurrentSimulationTime()); }

	/// Resumes after the next rising edge of clk when all registers have taken their new values.
	sim::WaitClock AfterClk(const Clock& clk);
	/// Resumes on the next rising edge of clk, while registers still show the values from before the edge.
	sim::WaitClock OnClk(const Clock& clk);

	/**
	 * @brief Starts another simulation process that runs in parallel to the calling one.
	 * @details The forked process runs immediately until it suspends for the first time, then the calling process continues.
	 */
	inline auto fork(const SimProcess& simProc) {
		return sim::forkFunc(simProc);
	}

	/**
	 * @brief Starts another simulation process from a lambda.
	 * @details The lambda is copied and kept alive for as long as the process runs, so it may hold captures.
	 */
	template<std::invocable Functor>
	auto fork(Functor simProcLambda) {
		return sim::forkFunc(std::function<SimProcess()>(std::move(simProcLambda)));
	}

/**@}*/

}
