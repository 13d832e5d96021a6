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
#include "Circuit.h"

#include "../utils/Exceptions.h"

#include <algorithm>

namespace cwk::sim {

size_t &signalChangeCounter()
{
	thread_local size_t counter = 0;
	return counter;
}

ClockDomain *Circuit::createClockDomain(std::string name, ClockRational absoluteFrequency, ClockRational phase,
								ClockDomain::ResetType resetType, ClockDomain::ResetActive resetActive)
{
	m_clockDomains.push_back(std::make_unique<ClockDomain>(std::move(name), absoluteFrequency, phase, resetType, resetActive));
	return m_clockDomains.back().get();
}

void Circuit::addComponent(Component *component)
{
	m_components.push_back(component);
}

void Circuit::removeComponent(Component *component)
{
	auto it = std::find(m_components.begin(), m_components.end(), component);
	CWK_ASSERT(it != m_components.end());
	m_components.erase(it);
}

void Circuit::powerOn()
{
	for (auto &domain : m_clockDomains)
		domain->powerOn();
	reevaluate();
}

void Circuit::reevaluate()
{
	for (size_t round = 0; round < MAX_EVALUATION_ROUNDS; round++) {
		size_t changesBefore = signalChangeCounter();
		for (auto *component : m_components)
			component->evaluate();
		if (signalChangeCounter() == changesBefore)
			return;
	}
	CWK_DESIGNCHECK_HINT(false, "Signals did not settle after " + std::to_string(MAX_EVALUATION_ROUNDS) + " rounds of evaluation, the design contains a combinational loop.");
}

}
