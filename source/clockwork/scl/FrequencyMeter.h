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

#include "cdc.h"

#include "../frontend/BitWidth.h"
#include "../frontend/Block.h"
#include "../frontend/Clock.h"
#include "../frontend/Reg.h"

#include <optional>

namespace cwk::scl
{
	struct FrequencyMeterConfig {
		/// Length of a measurement window in ticks of the system clock.
		size_t gateTicks = 1024;
		/// Width of the measurement counter and the result.
		BitWidth counterWidth = BitWidth{ 32 };
		/// Parameters of the synchronizers in both event relays.
		SynchronizeParams sync;

		void loadConfig(const utils::ConfigTree &config);
	};

	/**
	 * @brief Measures the frequency of a clock relative to a known system clock.
	 * @details Every gateTicks system ticks a gate event is relayed into the measured domain, which counts its own ticks
	 * between two gate arrivals and relays the count back. The result in frequency is the number of measured ticks per
	 * gate window, valid is high once a complete window has been measured.
	 * If the gate relay is still busy when the next gate is due, the gate is skipped and the next result is marked invalid.
	 */
	class FrequencyMeter : public Block
	{
	protected:
		FrequencyMeterConfig m_config;
	public:
		FrequencyMeter(const Clock &systemClock, const Clock &measuredClock, FrequencyMeterConfig config = {});

		/// System domain: number of measured ticks in the last complete gate window.
		UInt frequency;
		/// System domain: frequency holds a valid measurement.
		Bit valid;

		size_t skippedGates() const { return m_skippedGates; }
		const FrequencyMeterConfig &getConfig() const { return m_config; }

		/// Converts a measured count back into Hz.
		static double toHz(std::uint64_t count, ClockRational systemFrequency, size_t gateTicks);
	protected:
		// system domain
		Reg<std::uint64_t> m_gateCounter;
		Reg<bool> m_gate;
		Reg<bool> m_gateSkipped;
		Reg<std::uint64_t> m_frequency;
		Reg<bool> m_valid;

		// measured domain
		Reg<std::uint64_t> m_count;
		Reg<std::uint64_t> m_result;
		Reg<bool> m_counting;
		Reg<bool> m_resultEvent;

		std::optional<EventRelay> m_gateRelay;
		std::optional<EventRelay> m_resultRelay;

		size_t m_skippedGates = 0;

		FrequencyMeterConfig withInstanceConfig(FrequencyMeterConfig config) const;
		void systemTick();
		void measuredTick();
	};
}
