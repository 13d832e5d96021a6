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

#include "ClockDomain.h"

#include <memory>
#include <string>
#include <vector>

namespace cwk::sim {

/**
 * @brief Anything with combinational behavior, i.e. outputs that are a function of inputs and register state.
 */
class Component
{
	public:
		virtual ~Component() = default;
		virtual void evaluate() = 0;
};

/// Incremented whenever any signal changes its value, used to detect when combinational evaluation has settled.
size_t &signalChangeCounter();

class Circuit
{
	public:
		/// Upper bound for the rounds of combinational evaluation until all signals must be stable.
		static constexpr size_t MAX_EVALUATION_ROUNDS = 1000;

		Circuit() = default;
		Circuit(const Circuit&) = delete;
		void operator=(const Circuit&) = delete;

		ClockDomain *createClockDomain(std::string name, ClockRational absoluteFrequency, ClockRational phase,
								ClockDomain::ResetType resetType, ClockDomain::ResetActive resetActive);
		const std::vector<std::unique_ptr<ClockDomain>> &getClockDomains() const { return m_clockDomains; }

		void addComponent(Component *component);
		void removeComponent(Component *component);
		const std::vector<Component*> &getComponents() const { return m_components; }

		void powerOn();
		/// Evaluates all components until no signal changes anymore.
		void reevaluate();
	protected:
		std::vector<std::unique_ptr<ClockDomain>> m_clockDomains;
		std::vector<Component*> m_components;
};

}
