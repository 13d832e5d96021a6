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
#include "Block.h"

#include "DesignScope.h"

namespace cwk {

Block::Block(std::string_view name) : m_parent(Scope::current())
{
	auto &design = DesignScope::require();

	if (m_parent)
		m_instanceName = std::string(name) + std::to_string(m_parent->m_childInstanceCounter[std::string(name)]++);
	else
		m_instanceName = design.allocateInstanceName(std::string(name));

	m_circuit = &design.getCircuit();
	m_circuit->addComponent(this);
}

Block::~Block()
{
	for (auto *clock : m_clocks)
		clock->removeProcesses(this);
	m_circuit->removeComponent(this);
}

std::string Block::instancePath() const
{
	std::string ret = m_instanceName;
	for (const Block *block = m_parent; block; block = block->m_parent)
		ret = block->m_instanceName + '/' + ret;

	if (auto *design = DesignScope::get())
		ret = design->topName() + '/' + ret;
	return ret;
}

utils::ConfigTree Block::config(std::string_view attribute) const
{
	return DesignScope::require().config(instancePath() + '/' + std::string(attribute));
}

utils::ConfigTree Block::config() const
{
	return DesignScope::require().config(instancePath());
}

void Block::sequential(const Clock &clock, std::function<void()> process)
{
	clock.getClk()->addProcess(this, std::move(process));
	m_clocks.push_back(clock.getClk());
}

}
