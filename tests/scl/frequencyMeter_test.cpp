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
#include "scl/pch.h"
#include "scl/LogCapture.h"

#include <boost/test/unit_test.hpp>
#include <boost/test/data/dataset.hpp>
#include <boost/test/data/test_case.hpp>
#include <boost/test/data/monomorphic.hpp>

#include <cmath>

using namespace cwk;
using namespace boost::unit_test;

BOOST_DATA_TEST_CASE_F(BoostUnitTestSimulationFixture, FrequencyMeter_Accuracy, data::make({ 50'000'000, 133'000'000, 7'500'000 }), measuredHz)
{
	Clock systemClock({ .absoluteFrequency = 100'000'000, .name = "sys" });
	Clock measuredClock({ .absoluteFrequency = measuredHz, .name = "measured" });
	scl::FrequencyMeter meter(systemClock, measuredClock, { .gateTicks = 1024 });

	const double expected = 1024.0 * measuredHz / 100'000'000;

	addSimulationProcess([&]()->SimProcess {
		BOOST_TEST(!simu(meter.valid));

		// the first window after power on only starts the measurement
		for (size_t i = 0; i < 1024; ++i) {
			co_await AfterClk(systemClock);
			BOOST_TEST(!simu(meter.valid));
		}

		while (!simu(meter.valid))
			co_await AfterClk(systemClock);

		for (size_t window = 0; window < 4; ++window) {
			BOOST_TEST(simu(meter.valid));
			BOOST_TEST(std::abs(double(simu(meter.frequency).value()) - expected) <= 1.0);

			double hz = scl::FrequencyMeter::toHz(simu(meter.frequency), systemClock.absoluteFrequency(), 1024);
			BOOST_TEST(std::abs(hz - measuredHz) <= 100'000'000.0 / 1024);

			for (size_t i = 0; i < 1024; ++i)
				co_await AfterClk(systemClock);
		}

		BOOST_TEST(meter.skippedGates() == 0);
		stopTest();
	});

	runTest({ 1, 1000 });
}

BOOST_FIXTURE_TEST_CASE(FrequencyMeter_SkipsGatesOfSlowClocks, BoostUnitTestSimulationFixture)
{
	Clock systemClock({ .absoluteFrequency = 100'000'000, .name = "sys" });
	Clock measuredClock({ .absoluteFrequency = 1'000'000, .name = "measured" });
	scl::FrequencyMeter meter(systemClock, measuredClock, { .gateTicks = 16 });

	test::LogCapture capture;

	addSimulationProcess([&]()->SimProcess {
		for (size_t i = 0; i < 20'000; ++i) {
			co_await AfterClk(systemClock);
			BOOST_TEST(!simu(meter.valid));
		}

		BOOST_TEST(meter.skippedGates() > 0);
		BOOST_TEST(capture.log().count(dbg::LogMessage::LOG_WARNING) >= meter.skippedGates());
		stopTest();
	});

	runTest({ 1, 1000 });
}

BOOST_FIXTURE_TEST_CASE(FrequencyMeter_ToHz, BoostUnitTestSimulationFixture)
{
	BOOST_TEST(scl::FrequencyMeter::toHz(512, ClockRational(100'000'000, 1), 1024) == 50'000'000.0);
	BOOST_TEST(scl::FrequencyMeter::toHz(0, ClockRational(100'000'000, 1), 1024) == 0.0);
}

BOOST_FIXTURE_TEST_CASE(FrequencyMeter_Config, BoostUnitTestSimulationFixture)
{
	design.loadConfigString(
		"top/frequency_meter0:\n"
		"  gate_ticks: 64\n"
		"  counter_width: 16\n"
		"  sync:\n"
		"    out_stages: 3\n"
	);

	Clock systemClock({ .absoluteFrequency = 100'000'000, .name = "sys" });
	Clock measuredClock({ .absoluteFrequency = 25'000'000, .name = "measured" });
	scl::FrequencyMeter meter(systemClock, measuredClock);

	BOOST_TEST(meter.getConfig().gateTicks == 64);
	BOOST_TEST(meter.getConfig().counterWidth == 16_b);
	BOOST_TEST(meter.getConfig().sync.outStages == 3);
	BOOST_TEST(meter.frequency.width() == 16_b);

	BOOST_CHECK_THROW(scl::FrequencyMeter(systemClock, measuredClock, { .gateTicks = 8 }), utils::DesignError);
}
