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

#include "DesignScope.h"
#include "Clock.h"

#include "../simulation/Simulator.h"

#include <functional>
#include <memory>

namespace cwk {

	/**
	 * @brief Helper class to facilitate writing unit tests
	 * @details Holds a design scope for the test to build its design in and a simulator for it.
	 * The design is kept alive longer than the simulator, so that simulation processes may refer to blocks of the design.
	 */
	class UnitTestSimulationFixture
	{
		public:
			UnitTestSimulationFixture();
			~UnitTestSimulationFixture();

			/// Adds a simulation process that starts on power on.
			void addSimulationProcess(std::function<sim::SimProcess()> simProc);

			/// Powers on and lets combinational logic settle once.
			void eval();
			/// Powers on and runs the simulation for a specified amount of ticks (rising edges) of the given clock.
			void runTicks(const Clock &clock, unsigned numTicks);

			/// Stops an ongoing simulation (to be used during runHitsTimeout)
			void stopTest();

			/// Powers on and runs the simulation until the timeout (in simulation time) is reached or stopTest is called
			/// @return returns true if the timeout was reached.
			bool runHitsTimeout(const ClockRational &timeoutSeconds);

			sim::Simulator &getSimulator() { return *m_simulator; }
			DesignScope &getDesign() { return design; }

			DesignScope design;
		protected:
			std::unique_ptr<sim::Simulator> m_simulator;
			bool m_stopTestCalled = false;
	};

	/**
	 * @brief Helper class to facilitate writing boost unit tests
	 */
	class BoostUnitTestSimulationFixture : public UnitTestSimulationFixture {
		public:
			BoostUnitTestSimulationFixture();
			/// Runs until stopTest is called and fails the test if the timeout is hit first.
			void runTest(const ClockRational &timeoutSeconds);
	};

}
