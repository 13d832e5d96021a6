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

#include "../simulation/ClockDomain.h"
#include "../utils/ConfigTree.h"

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace cwk {

/**
 * @addtogroup cwk_frontend
 * @{
 */

	using sim::ClockRational;

	/// Parses frequencies and periods such as "125 MHz" or "8 ns" into a frequency.
	ClockRational clockFromString(std::string text);

	class ClockConfig
	{
	public:
		using ResetType = sim::ClockDomain::ResetType;
		using ResetActive = sim::ClockDomain::ResetActive;

		void loadConfig(const utils::ConfigTree& config);
		void print(std::ostream& s) const;

		std::optional<ClockRational> absoluteFrequency;
		std::optional<ClockRational> phase;
		std::optional<std::string> name;
		std::optional<ResetType> resetType;
		std::optional<ResetActive> resetActive;
	};

	std::ostream& operator << (std::ostream&, const ClockConfig&);

	/**
	 * @brief Handle to a clock domain of the current design.
	 * @details Copies refer to the same clock domain. The reset is synchronous and active-low unless configured otherwise.
	 */
	class Clock
	{
		public:
			using ResetType = sim::ClockDomain::ResetType;
			using ResetActive = sim::ClockDomain::ResetActive;

			Clock(const ClockConfig &config);
			Clock(sim::ClockDomain *clock) : m_clock(clock) { }

			sim::ClockDomain *getClk() const { return m_clock; }
			ClockRational absoluteFrequency() const { return m_clock->absoluteFrequency(); }
			ClockRational period() const { return m_clock->period(); }
			std::string_view name() const { return m_clock->getName(); }

			/// Drives the reset line to its active level.
			void assertReset() const;
			/// Drives the reset line to its inactive level.
			void releaseReset() const;
			bool resetAsserted() const { return m_clock->resetAsserted(); }
			size_t ticks() const { return m_clock->ticks(); }

			bool operator==(const Clock &rhs) const { return m_clock == rhs.m_clock; }
		protected:
			sim::ClockDomain *m_clock = nullptr;
	};

/**@}*/

}
