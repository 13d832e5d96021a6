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

#include "Clock.h"
#include "Scope.h"

#include "../simulation/Circuit.h"
#include "../utils/ConfigTree.h"

#include <functional>
#include <map>
#include <string>
#include <string_view>

namespace cwk {

/**
 * @addtogroup cwk_frontend
 * @{
 */

/**
 * @brief Base class of all hardware blocks.
 * @details A block has combinational behavior (evaluate(), by default none) and any number of sequential processes
 * that compute the next values of its registers on every tick of their clock.
 *
 * Blocks form a hierarchy through their instance names. Blocks created while another block is entered
 * (see enter()) become its children:
 * @code
 * FrequencyMeter::FrequencyMeter(...) : Block("frequency_meter")
 * {
 *     auto scope = enter();
 *     m_gateRelay.emplace(systemClock, measuredClock); // instance path "top/frequency_meter0/event_relay0"
 * }
 * @endcode
 */
class Block : public sim::Component
{
	public:
		/// RAII guard that makes a block the parent of all blocks created while it exists.
		class Scope : public ScopeStack<Scope>
		{
			public:
				Scope(Block *block) : m_block(block) { }
				static Block *current() { return innermost() == nullptr ? nullptr : innermost()->m_block; }
			protected:
				Block *m_block;
		};

		Block(std::string_view name);
		virtual ~Block();
		Block(const Block&) = delete;
		void operator=(const Block&) = delete;

		void evaluate() override { }

		const std::string &instanceName() const { return m_instanceName; }
		/// Slash separated path of instance names, starting with the name of the design.
		std::string instancePath() const;
		const Block *parent() const { return m_parent; }

		/// Looks up an attribute of this block instance in the design configuration.
		utils::ConfigTree config(std::string_view attribute) const;
		/// All settings of this block instance in the design configuration.
		utils::ConfigTree config() const;

		[[nodiscard]] Scope enter() { return Scope(this); }
	protected:
		/// Registers a process that runs on every tick of the clock while its reset is not asserted.
		void sequential(const Clock &clock, std::function<void()> process);

		sim::Circuit *m_circuit;
		Block *m_parent;
		std::string m_instanceName;
		std::map<std::string, size_t> m_childInstanceCounter;
		std::vector<sim::ClockDomain*> m_clocks;
};

/**@}*/

}
