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
#include "FrequencyMeter.h"

#include "../debug/DebugInterface.h"

namespace cwk::scl
{
	void FrequencyMeterConfig::loadConfig(const utils::ConfigTree &config)
	{
		if (config["gate_ticks"])
			gateTicks = config["gate_ticks"].as<size_t>();
		if (config["counter_width"])
			counterWidth = config["counter_width"].as<BitWidth>();
		if (config["sync"])
			sync.loadConfig(config["sync"]);
	}

	FrequencyMeter::FrequencyMeter(const Clock &systemClock, const Clock &measuredClock, FrequencyMeterConfig config) :
		Block("frequency_meter"),
		m_config(withInstanceConfig(std::move(config))),
		frequency(m_config.counterWidth),
		m_gateCounter(systemClock, 0),
		m_gate(systemClock, false),
		m_gateSkipped(systemClock, false),
		m_frequency(systemClock, 0, m_config.counterWidth),
		m_valid(systemClock, false),
		m_count(measuredClock, 0, m_config.counterWidth),
		m_result(measuredClock, 0, m_config.counterWidth),
		m_counting(measuredClock, false),
		m_resultEvent(measuredClock, false)
	{
		auto scope = enter();

		CWK_DESIGNCHECK_HINT(m_config.gateTicks >= 16, "The gate window must be at least 16 system ticks long to give the relays time to complete.");

		frequency.setName(instancePath() + ".frequency");
		valid.setName(instancePath() + ".valid");

		m_gateRelay.emplace(systemClock, measuredClock, m_config.sync, ViolationPolicy::THROW);
		m_gateRelay->eventIn.connect(m_gate);
		m_resultRelay.emplace(measuredClock, systemClock, m_config.sync, ViolationPolicy::THROW);
		m_resultRelay->eventIn.connect(m_resultEvent);

		frequency.connect(m_frequency);
		valid.connect(m_valid);

		sequential(systemClock, [this]() { systemTick(); });
		sequential(measuredClock, [this]() { measuredTick(); });
	}

	FrequencyMeterConfig FrequencyMeter::withInstanceConfig(FrequencyMeterConfig config) const
	{
		config.loadConfig(Block::config());
		return config;
	}

	void FrequencyMeter::systemTick()
	{
		bool gateDue = m_gateCounter.value() + 1 == m_config.gateTicks;
		m_gateCounter.setNext(gateDue ? 0 : m_gateCounter.value() + 1);

		bool skipping = false;
		m_gate.setNext(false);
		if (gateDue) {
			if (m_gateRelay->ready.value())
				m_gate.setNext(true);
			else {
				skipping = true;
				m_skippedGates++;
				dbg::log(dbg::LogMessage(this) << dbg::LogMessage::LOG_WARNING << dbg::LogMessage::LOG_SIMULATION
					<< "Skipping gate of " << this << " because the previous gate is still in flight, the measured clock is too slow for the gate window.");
			}
		}

		if (m_resultRelay->eventOut.value()) {
			m_frequency.setNext(m_result.value());
			m_valid.setNext(!m_gateSkipped.value());
			m_gateSkipped.setNext(skipping);
		} else if (skipping)
			m_gateSkipped.setNext(true);
	}

	void FrequencyMeter::measuredTick()
	{
		m_resultEvent.setNext(false);

		if (!m_gateRelay->eventOut.value()) {
			if (m_counting.value())
				m_count.setNext(m_count.value() + 1);
			return;
		}

		// gate arrival ends the current window and starts the next one
		m_count.setNext(0);
		if (m_counting.value()) {
			m_result.setNext(m_count.value() + 1);
			if (m_resultRelay->ready.value())
				m_resultEvent.setNext(true);
			else
				dbg::log(dbg::LogMessage(this) << dbg::LogMessage::LOG_WARNING << dbg::LogMessage::LOG_SIMULATION
					<< "Dropping measurement of " << this << " because the previous result is still in flight.");
		}
		m_counting.setNext(true);
	}

	double FrequencyMeter::toHz(std::uint64_t count, ClockRational systemFrequency, size_t gateTicks)
	{
		return count * sim::toDouble(systemFrequency) / gateTicks;
	}
}
