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

using namespace cwk;
using namespace boost::unit_test;

namespace {

	/// Sends count events through the relay, each one as soon as the relay is ready.
	SimProcess sendEvents(scl::EventRelay &relay, const Clock &inClock, size_t count)
	{
		for (size_t i = 0; i < count; ++i) {
			while (!simu(relay.ready))
				co_await AfterClk(inClock);

			simu(relay.eventIn) = '1';
			co_await AfterClk(inClock);
			BOOST_TEST(!simu(relay.ready));
			simu(relay.eventIn) = '0';
			co_await AfterClk(inClock);
		}
	}

	/// Counts eventOut pulses, checking that never more than one event is in flight.
	SimProcess countEvents(scl::EventRelay &relay, const Clock &outClock, size_t &received)
	{
		while (true) {
			co_await OnClk(outClock);
			if (simu(relay.eventOut)) {
				received++;
				BOOST_TEST(received <= relay.accepted());
			}
			BOOST_TEST(relay.accepted() <= received + 1);
		}
	}

	ClockRational periodNs(size_t ns)
	{
		return ClockRational(1'000'000'000, ns);
	}

}

BOOST_DATA_TEST_CASE_F(BoostUnitTestSimulationFixture, EventRelay_ClockRatios, data::make({ 10, 10, 70, 13, 3 }) ^ data::make({ 10, 70, 10, 3, 13 }), inPeriod, outPeriod)
{
	Clock inClock({ .absoluteFrequency = periodNs(inPeriod), .name = "in" });
	Clock outClock({ .absoluteFrequency = periodNs(outPeriod), .name = "out" });
	scl::EventRelay relay(inClock, outClock);

	const size_t eventsToSend = 25;
	size_t received = 0;

	addSimulationProcess([&]() { return countEvents(relay, outClock, received); });
	addSimulationProcess([&]()->SimProcess {
		co_await sendEvents(relay, inClock, eventsToSend);

		while (!simu(relay.ready))
			co_await AfterClk(inClock);

		BOOST_TEST(received == eventsToSend);
		BOOST_TEST(relay.accepted() == eventsToSend);
		BOOST_TEST(relay.violations() == 0);
		BOOST_TEST((relay.state() == scl::EventRelay::State::READY));
		stopTest();
	});

	runTest({ 1, 1000 });
}

BOOST_FIXTURE_TEST_CASE(EventRelay_FrequencySweep, BoostUnitTestSimulationFixture)
{
	const size_t eventsToSend = 10;

	std::vector<std::unique_ptr<Clock>> clocks;
	std::vector<std::unique_ptr<scl::EventRelay>> relays;
	std::vector<std::unique_ptr<size_t>> received;
	size_t finished = 0;

	Clock inClock({ .absoluteFrequency = 100'000'000, .name = "in" });

	for (std::uint64_t clockIncrement = 0; clockIncrement < 500'000'000; clockIncrement += 16'180'398) {
		clocks.push_back(std::make_unique<Clock>(ClockConfig{ .absoluteFrequency = 10'000'000 + clockIncrement, .name = "out_" + std::to_string(clockIncrement) }));
		relays.push_back(std::make_unique<scl::EventRelay>(inClock, *clocks.back()));
		received.push_back(std::make_unique<size_t>(0));

		scl::EventRelay &relay = *relays.back();
		const Clock &outClock = *clocks.back();
		size_t &count = *received.back();

		addSimulationProcess([&relay, &outClock, &count]() { return countEvents(relay, outClock, count); });
		addSimulationProcess([&, &relay = relay, &count = count]()->SimProcess {
			co_await sendEvents(relay, inClock, eventsToSend);
			while (!simu(relay.ready))
				co_await AfterClk(inClock);

			BOOST_TEST(count == eventsToSend);
			if (++finished == relays.size())
				stopTest();
		});
	}

	runTest({ 1, 1000 });
}

BOOST_FIXTURE_TEST_CASE(EventRelay_ViolationThrows, BoostUnitTestSimulationFixture)
{
	Clock inClock({ .absoluteFrequency = 100'000'000, .name = "in" });
	Clock outClock({ .absoluteFrequency = 3'000'000, .name = "out" });
	scl::EventRelay relay(inClock, outClock, {}, ViolationPolicy::THROW);

	addSimulationProcess([&]()->SimProcess {
		simu(relay.eventIn) = '1';
		co_await AfterClk(inClock);
		simu(relay.eventIn) = '0';
		co_await AfterClk(inClock);
		BOOST_TEST(!simu(relay.ready));

		simu(relay.eventIn) = '1';
		co_await AfterClk(inClock);
		stopTest();
	});

	BOOST_CHECK_EXCEPTION(runHitsTimeout({ 1, 1000 }), utils::ProtocolError, [](const utils::ProtocolError &e) {
		return e.instancePath() == "top/event_relay0";
	});
	BOOST_TEST(relay.accepted() == 1);
	BOOST_TEST(relay.violations() == 1);
}

BOOST_FIXTURE_TEST_CASE(EventRelay_ViolationLogged, BoostUnitTestSimulationFixture)
{
	Clock inClock({ .absoluteFrequency = 100'000'000, .name = "in" });
	Clock outClock({ .absoluteFrequency = 3'000'000, .name = "out" });
	scl::EventRelay relay(inClock, outClock, {}, ViolationPolicy::LOG);

	test::LogCapture capture;
	size_t received = 0;

	addSimulationProcess([&]() { return countEvents(relay, outClock, received); });
	addSimulationProcess([&]()->SimProcess {
		simu(relay.eventIn) = '1';
		co_await AfterClk(inClock);
		simu(relay.eventIn) = '0';
		co_await AfterClk(inClock);

		// dropped, the relay is still busy with the first event
		simu(relay.eventIn) = '1';
		co_await AfterClk(inClock);
		simu(relay.eventIn) = '0';

		while (!simu(relay.ready))
			co_await AfterClk(inClock);

		BOOST_TEST(relay.accepted() == 1);
		BOOST_TEST(relay.violations() == 1);
		BOOST_TEST(received == 1);

		BOOST_TEST(capture.log().count(dbg::LogMessage::LOG_ERROR) == 1);
		for (const auto &msg : capture.log().messages)
			if (msg.severity() == dbg::LogMessage::LOG_ERROR) {
				BOOST_TEST(msg.anchor() == &relay);
				BOOST_TEST(msg.text().find("top/event_relay0") != std::string::npos);
			}

		stopTest();
	});

	runTest({ 1, 1000 });
}

BOOST_FIXTURE_TEST_CASE(EventRelay_HeldEventInIsOneEvent, BoostUnitTestSimulationFixture)
{
	Clock inClock({ .absoluteFrequency = 100'000'000, .name = "in" });
	Clock outClock({ .absoluteFrequency = 40'000'000, .name = "out" });
	scl::EventRelay relay(inClock, outClock, {}, ViolationPolicy::THROW);

	size_t received = 0;
	addSimulationProcess([&]() { return countEvents(relay, outClock, received); });
	addSimulationProcess([&]()->SimProcess {
		simu(relay.eventIn) = '1';
		for (size_t i = 0; i < 200; ++i)
			co_await AfterClk(inClock);

		BOOST_TEST(simu(relay.ready));
		BOOST_TEST(relay.accepted() == 1);
		BOOST_TEST(relay.violations() == 0);
		BOOST_TEST(received == 1);
		stopTest();
	});

	runTest({ 1, 1000 });
}

BOOST_DATA_TEST_CASE_F(BoostUnitTestSimulationFixture, EventRelay_Metastability, data::make({ 1u, 7u, 42u }) * data::make({ 3, 13 }), seed, inPeriod)
{
	Clock inClock({ .absoluteFrequency = periodNs(inPeriod), .name = "in" });
	Clock outClock({ .absoluteFrequency = periodNs(16 - inPeriod), .name = "out" });

	scl::SynchronizeParams params{ .metastabilityProbability = 0.5, .seed = seed };
	scl::EventRelay relay(inClock, outClock, params);

	const size_t eventsToSend = 40;
	size_t received = 0;

	addSimulationProcess([&]() { return countEvents(relay, outClock, received); });
	addSimulationProcess([&]()->SimProcess {
		co_await sendEvents(relay, inClock, eventsToSend);
		while (!simu(relay.ready))
			co_await AfterClk(inClock);

		BOOST_TEST(received == eventsToSend);
		BOOST_TEST(relay.accepted() == eventsToSend);
		stopTest();
	});

	runTest({ 1, 1000 });
}

BOOST_FIXTURE_TEST_CASE(EventRelay_ResetIsolation, BoostUnitTestSimulationFixture)
{
	Clock inClock({ .absoluteFrequency = 100'000'000, .name = "in" });
	Clock outClock({ .absoluteFrequency = 30'000'000, .name = "out" });
	scl::EventRelay relay(inClock, outClock);

	size_t received = 0;
	addSimulationProcess([&]() { return countEvents(relay, outClock, received); });
	addSimulationProcess([&]()->SimProcess {
		outClock.assertReset();

		simu(relay.eventIn) = '1';
		co_await AfterClk(inClock);
		simu(relay.eventIn) = '0';

		// the output domain is held in reset, the event stays in flight
		for (size_t i = 0; i < 50; ++i) {
			co_await AfterClk(inClock);
			BOOST_TEST(!simu(relay.ready));
			BOOST_TEST((relay.state() == scl::EventRelay::State::WAITING));
		}
		BOOST_TEST(received == 0);
		BOOST_TEST(relay.accepted() == 1);

		outClock.releaseReset();
		while (!simu(relay.ready))
			co_await AfterClk(inClock);
		BOOST_TEST(received == 1);

		// resetting the input domain leaves the output domain running
		inClock.assertReset();
		size_t outTicks = outClock.ticks();
		for (size_t i = 0; i < 10; ++i)
			co_await AfterClk(inClock);
		BOOST_TEST(outClock.ticks() > outTicks);
		BOOST_TEST(simu(relay.ready));
		inClock.releaseReset();

		co_await sendEvents(relay, inClock, 3);
		while (!simu(relay.ready))
			co_await AfterClk(inClock);
		BOOST_TEST(received == 4);

		stopTest();
	});

	runTest({ 1, 1000 });
}

BOOST_DATA_TEST_CASE_F(BoostUnitTestSimulationFixture, Synchronizer_Latency, data::make({ 2, 3, 5 }), stages)
{
	Clock clock({ .absoluteFrequency = 100'000'000 });
	scl::Synchronizer sync(clock, { .outStages = size_t(stages) });

	addSimulationProcess([&]()->SimProcess {
		simu(sync.in) = '1';
		for (int i = 1; i <= stages; ++i) {
			co_await AfterClk(clock);
			BOOST_TEST(simu(sync.out) == (i == stages));
			BOOST_TEST(simu(sync.rising) == (i == stages));
		}
		co_await AfterClk(clock);
		BOOST_TEST(simu(sync.out) == '1');
		BOOST_TEST(simu(sync.rising) == '0');

		simu(sync.in) = '0';
		for (int i = 1; i <= stages; ++i) {
			co_await AfterClk(clock);
			BOOST_TEST(simu(sync.out) == (i != stages));
			BOOST_TEST(simu(sync.falling) == (i == stages));
		}
		co_await AfterClk(clock);
		BOOST_TEST(simu(sync.falling) == '0');

		stopTest();
	});

	runTest({ 1, 1000 });
}

BOOST_FIXTURE_TEST_CASE(Synchronizer_Reset, BoostUnitTestSimulationFixture)
{
	Clock clock({ .absoluteFrequency = 100'000'000 });
	scl::Synchronizer sync(clock);

	addSimulationProcess([&]()->SimProcess {
		simu(sync.in) = '1';
		for (size_t i = 0; i < 4; ++i)
			co_await AfterClk(clock);
		BOOST_TEST(simu(sync.out) == '1');

		clock.assertReset();
		co_await AfterClk(clock);
		BOOST_TEST(simu(sync.out) == '0');
		BOOST_TEST(simu(sync.rising) == '0');
		BOOST_TEST(simu(sync.falling) == '0');

		clock.releaseReset();
		co_await AfterClk(clock);
		co_await AfterClk(clock);
		BOOST_TEST(simu(sync.out) == '1');

		stopTest();
	});

	runTest({ 1, 1000 });
}

BOOST_FIXTURE_TEST_CASE(Synchronizer_Config, BoostUnitTestSimulationFixture)
{
	design.loadConfigString(
		"top/synchronizer0:\n"
		"  out_stages: 4\n"
		"  reset_value: true\n"
	);

	Clock clock({ .absoluteFrequency = 100'000'000 });
	scl::Synchronizer configured(clock);
	scl::Synchronizer plain(clock);

	BOOST_TEST(configured.params().outStages == 4);
	BOOST_TEST(configured.params().resetValue);
	BOOST_TEST(plain.params().outStages == 2);

	eval();
	BOOST_TEST(configured.out.value());
	BOOST_TEST(!plain.out.value());
}

BOOST_FIXTURE_TEST_CASE(Synchronizer_InvalidParams, BoostUnitTestSimulationFixture)
{
	Clock clock({ .absoluteFrequency = 100'000'000 });
	BOOST_CHECK_THROW(scl::Synchronizer(clock, { .outStages = 1 }), utils::DesignError);
	BOOST_CHECK_THROW(scl::Synchronizer(clock, { .metastabilityProbability = 1.0 }), utils::DesignError);
}
