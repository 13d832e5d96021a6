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
#include "clockwork/pch.h"
#include "FrontendUnitTestSimulationFixture.h"

#include "../debug/DebugInterface.h"

#include <boost/test/unit_test.hpp>

namespace cwk {

UnitTestSimulationFixture::UnitTestSimulationFixture()
{
	m_simulator = std::make_unique<sim::Simulator>(design.getCircuit());
}

UnitTestSimulationFixture::~UnitTestSimulationFixture()
{
	// Force destruct of simulator (and all coroutines referring to the design) before destruction of the design.
	m_simulator.reset();
}

void UnitTestSimulationFixture::addSimulationProcess(std::function<sim::SimProcess()> simProc)
{
	m_simulator->addSimulationProcess(std::move(simProc));
}

void UnitTestSimulationFixture::eval()
{
	m_simulator->powerOn();
}

void UnitTestSimulationFixture::runTicks(const Clock &clock, unsigned numTicks)
{
	m_stopTestCalled = false;
	m_simulator->powerOn();
	size_t target = clock.ticks() + numTicks;
	while (clock.ticks() < target && !m_simulator->abortCalled())
		if (!m_simulator->advanceEvent())
			break;
}

void UnitTestSimulationFixture::stopTest()
{
	m_simulator->abort();
	m_stopTestCalled = true;
}

bool UnitTestSimulationFixture::runHitsTimeout(const ClockRational &timeoutSeconds)
{
	m_stopTestCalled = false;
	m_simulator->powerOn();
	m_simulator->advance(timeoutSeconds);
	return !m_stopTestCalled;
}

BoostUnitTestSimulationFixture::BoostUnitTestSimulationFixture()
{
	auto& testSuite = boost::unit_test::framework::master_test_suite();
	for (int i = 1; i < testSuite.argc; i++) {
		std::string_view arg(testSuite.argv[i]);
		if (arg == "--log")
			dbg::logConsole(dbg::LogMessage::LOG_INFO);
	}
}

void BoostUnitTestSimulationFixture::runTest(const ClockRational &timeoutSeconds)
{
	BOOST_CHECK_MESSAGE(!runHitsTimeout(timeoutSeconds), "Simulation timed out without being called to a stop by any simulation process!");
}

}
