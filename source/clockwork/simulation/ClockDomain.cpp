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
#include "ClockDomain.h"

#include "../utils/Exceptions.h"

#include <algorithm>

namespace cwk::sim {

ClockDomain::ClockDomain(std::string name, ClockRational absoluteFrequency, ClockRational phase, ResetType resetType, ResetActive resetActive) :
	m_name(std::move(name)),
	m_absoluteFrequency(absoluteFrequency),
	m_phase(phase),
	m_resetType(resetType),
	m_resetActive(resetActive)
{
	CWK_DESIGNCHECK_HINT(m_absoluteFrequency.numerator() != 0, "Clock " + m_name + " needs a non zero frequency.");
	m_resetLine = m_resetActive == ResetActive::LOW;
}

void ClockDomain::setResetLine(bool level)
{
	m_resetLine = level;

	if (m_resetType == ResetType::ASYNCHRONOUS && resetAsserted())
		for (auto *reg : m_registers)
			reg->powerOn();
}

bool ClockDomain::resetAsserted() const
{
	if (m_resetType == ResetType::NONE)
		return false;
	return m_resetLine == (m_resetActive == ResetActive::HIGH);
}

void ClockDomain::addRegister(RegisterBase *reg)
{
	m_registers.push_back(reg);
}

void ClockDomain::removeRegister(RegisterBase *reg)
{
	auto it = std::find(m_registers.begin(), m_registers.end(), reg);
	CWK_ASSERT(it != m_registers.end());
	m_registers.erase(it);
}

void ClockDomain::addProcess(const Component *owner, std::function<void()> process)
{
	m_processes.emplace_back(owner, std::move(process));
}

void ClockDomain::removeProcesses(const Component *owner)
{
	std::erase_if(m_processes, [owner](const auto &p) { return p.first == owner; });
}

void ClockDomain::powerOn()
{
	m_ticks = 0;
	for (auto *reg : m_registers)
		reg->powerOn();
}

ClockRational ClockDomain::nextEdge() const
{
	return m_phase + ClockRational(m_ticks + 1, 1) / m_absoluteFrequency;
}

void ClockDomain::sample()
{
	if (resetAsserted()) {
		for (auto *reg : m_registers)
			reg->loadReset();
		return;
	}

	for (auto &process : m_processes)
		process.second();
}

void ClockDomain::commit()
{
	for (auto *reg : m_registers)
		reg->commit();
	m_ticks++;
}

}
