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

#include "ClockRational.h"

#include <functional>
#include <string>
#include <vector>

namespace cwk::sim {

class Component;

/**
 * @brief Interface of everything that holds state across clock ticks of one domain.
 */
class RegisterBase
{
	public:
		virtual ~RegisterBase() = default;

		/// Loads the reset value immediately, used on power on and for asynchronous resets.
		virtual void powerOn() = 0;
		/// Schedules the reset value to be taken over on the next commit.
		virtual void loadReset() = 0;
		/// Takes over the scheduled next value, if any.
		virtual void commit() = 0;
};

/**
 * @brief A clock together with its reset line and everything that is clocked by it.
 * @details Edges are placed at phase + k * period for k = 1, 2, ... relative to power on.
 * The reset line is modelled at its physical level, i.e. an active-low reset is asserted by driving it to false.
 */
class ClockDomain
{
	public:
		enum class ResetType {
			SYNCHRONOUS,
			ASYNCHRONOUS,
			NONE
		};
		enum class ResetActive {
			LOW,
			HIGH
		};

		ClockDomain(std::string name, ClockRational absoluteFrequency, ClockRational phase, ResetType resetType, ResetActive resetActive);
		ClockDomain(const ClockDomain&) = delete;
		void operator=(const ClockDomain&) = delete;

		const std::string &getName() const { return m_name; }
		const ClockRational &absoluteFrequency() const { return m_absoluteFrequency; }
		ClockRational period() const { return ClockRational(1, 1) / m_absoluteFrequency; }
		const ClockRational &phase() const { return m_phase; }
		ResetType resetType() const { return m_resetType; }
		ResetActive resetActive() const { return m_resetActive; }

		void setResetLine(bool level);
		bool resetLine() const { return m_resetLine; }
		bool resetAsserted() const;

		void addRegister(RegisterBase *reg);
		void removeRegister(RegisterBase *reg);

		/// Registers a process that computes next register values whenever this clock ticks.
		void addProcess(const Component *owner, std::function<void()> process);
		void removeProcesses(const Component *owner);

		void powerOn();
		/// Number of rising edges since power on.
		size_t ticks() const { return m_ticks; }
		ClockRational nextEdge() const;

		/// First half of a clock edge: all state is still the pre-edge state while next values get computed.
		void sample();
		/// Second half of a clock edge: next values become visible.
		void commit();
	protected:
		std::string m_name;
		ClockRational m_absoluteFrequency;
		ClockRational m_phase;
		ResetType m_resetType;
		ResetActive m_resetActive;
		bool m_resetLine;

		size_t m_ticks = 0;

		std::vector<RegisterBase*> m_registers;
		std::vector<std::pair<const Component*, std::function<void()>>> m_processes;
};

}
